#include "server/policy/guardrails_manager.h"

#include "server/logging/audit_logger.h"
#include "server/logging/logger.h"

#include <utility>

namespace jdguard {

GuardrailsManager::GuardrailsManager(const GuardrailConfig& config, AuditLogger* audit,
                                     MetricsRegistry* metrics, RateLimiter::Clock clock)
    : config_(config),
      rate_limiter_(config.rate_limit.max_requests, config.rate_limit.window_seconds,
                    config.rate_limit.max_tracked_identities, std::move(clock)),
      content_filter_(config.malicious_patterns, config.inappropriate_patterns,
                      config.features.malicious_patterns,
                      config.features.inappropriate_patterns),
      input_validator_(config.input.min_length, config.input.max_length),
      output_validator_(config.output.min_length, config.output.max_length),
      audit_(audit),
      metrics_(metrics) {
  log::Info("guardrails", "Guardrails manager initialized",
            "rate_limit=" + std::to_string(config.rate_limit.max_requests) + "/" +
                std::to_string(config.rate_limit.window_seconds) + "s" +
                " rate_limiting=" + (config.features.rate_limiting ? "on" : "off") +
                " content_filtering=" + (config.features.content_filtering ? "on" : "off") +
                " input_validation=" + (config.features.input_validation ? "on" : "off") +
                " output_validation=" + (config.features.output_validation ? "on" : "off"));
}

ValidationOutcome GuardrailsManager::RejectRequest(const std::string& identity,
                                                   RequestStage stage,
                                                   const std::string& raw_text,
                                                   ValidationOutcome outcome) {
  log::Warn("guardrails", "Request rejected",
            "identity=" + identity + " stage=" + StageLabel(stage) +
                " reason=" + outcome.reason);
  if (metrics_) {
    metrics_->RecordRejected(stage);
  }
  if (audit_) {
    audit_->LogDecision(identity, StageLabel(stage), "rejected", outcome.reason, raw_text);
  }
  return outcome;
}

ValidationOutcome GuardrailsManager::ValidateRequest(const std::string& identity,
                                                     const std::string& raw_text) {
  std::string reason;

  if (config_.features.rate_limiting && !rate_limiter_.IsAllowed(identity, &reason)) {
    return RejectRequest(identity, RequestStage::kRateLimit, raw_text,
                         ValidationOutcome::Reject(RejectionKind::kRateLimitExceeded,
                                                   RejectionDetail::kRateLimit, reason));
  }

  // Unconditional: the content filter cannot scan unbounded text.
  if (raw_text.size() > kMaxRequestBytes) {
    return RejectRequest(
        identity, RequestStage::kInputValidation, raw_text,
        ValidationOutcome::Reject(RejectionKind::kInvalidInput, RejectionDetail::kTooLong,
                                  "Role details too long. Maximum " +
                                      std::to_string(kMaxRequestBytes) +
                                      " characters allowed"));
  }

  if (config_.features.input_validation) {
    RejectionDetail detail = RejectionDetail::kNone;
    if (!input_validator_.Validate(raw_text, &reason, &detail)) {
      return RejectRequest(identity, RequestStage::kInputValidation, raw_text,
                           ValidationOutcome::Reject(RejectionKind::kInvalidInput, detail,
                                                     reason));
    }
  }

  if (config_.features.content_filtering) {
    ContentCategory category = ContentCategory::kNone;
    if (!content_filter_.IsSafe(raw_text, &reason, &category)) {
      auto detail = category == ContentCategory::kMalicious
                        ? RejectionDetail::kMaliciousPattern
                        : RejectionDetail::kInappropriatePattern;
      return RejectRequest(identity, RequestStage::kContentFilter, raw_text,
                           ValidationOutcome::Reject(RejectionKind::kUnsafeContent, detail,
                                                     reason));
    }
  }

  // Sanitizing has no toggle: a disabled filter counts as a pass.
  auto text = content_filter_.Sanitize(raw_text);

  log::Info("guardrails", "Request validated", "identity=" + identity);
  if (metrics_) {
    metrics_->RecordAdmitted();
  }
  if (audit_) {
    audit_->LogDecision(identity, "pipeline", "accepted", "", raw_text);
  }
  return ValidationOutcome::Accept(std::move(text));
}

ValidationOutcome GuardrailsManager::ValidateOutput(const std::string& generated_text,
                                                    const std::string& identity) {
  std::string text = generated_text;
  if (config_.features.output_validation) {
    auto check = output_validator_.Validate(generated_text);
    if (check.truncated && metrics_) {
      metrics_->RecordOutputTruncated();
    }
    if (!check.valid) {
      log::Error("guardrails", "Output validation failed",
                 "identity=" + identity + " reason=" + check.reason +
                     " length=" + std::to_string(generated_text.size()));
      if (metrics_) {
        metrics_->RecordOutputRejected();
      }
      if (audit_) {
        audit_->LogDecision(identity, "output_validation", "rejected", check.reason,
                            generated_text);
      }
      return ValidationOutcome::Reject(RejectionKind::kOutputFormatInvalid, check.detail,
                                       check.reason);
    }
    text = std::move(check.text);
  }

  auto quality = output_validator_.Quality(text);
  log::Info("guardrails", "Output validated",
            "identity=" + identity + " quality_score=" + std::to_string(quality.quality_score) +
                " sections=" + std::to_string(quality.sections_found.size()));
  if (metrics_) {
    metrics_->RecordOutputAccepted();
  }
  if (audit_) {
    audit_->LogDecision(identity, "output_validation", "accepted", "", text);
  }
  auto outcome = ValidationOutcome::Accept(std::move(text));
  outcome.metrics = std::move(quality);
  return outcome;
}

}  // namespace jdguard
