#pragma once

#include "server/auth/rate_limiter.h"
#include "server/config/guardrail_config.h"
#include "server/metrics/metrics.h"
#include "server/policy/content_filter.h"
#include "server/policy/input_validator.h"
#include "server/policy/output_validator.h"
#include "server/policy/validation_outcome.h"

#include <string>

namespace jdguard {

class AuditLogger;

// Runs the pre-generation and post-generation guardrail pipelines. Built once
// at startup from an immutable config and shared by reference; the rate
// limiter is the only state that changes between calls.
class GuardrailsManager {
 public:
  // `audit` and `metrics` are optional and must outlive the manager.
  // Throws ConfigError when a configured pattern does not compile.
  explicit GuardrailsManager(const GuardrailConfig& config,
                             AuditLogger* audit = nullptr,
                             MetricsRegistry* metrics = nullptr,
                             RateLimiter::Clock clock = {});

  GuardrailsManager(const GuardrailsManager&) = delete;
  GuardrailsManager& operator=(const GuardrailsManager&) = delete;

  // Rate limit -> size ceiling -> input validation -> content filter ->
  // sanitize. Stops at the first rejection; an accepted outcome carries the
  // sanitized text. The kMaxRequestBytes ceiling applies whatever the toggles.
  ValidationOutcome ValidateRequest(const std::string& identity, const std::string& raw_text);

  // Output validation -> quality metrics. An accepted outcome carries the
  // validated (possibly truncated) text and its metrics. `identity` is only
  // used for the audit trail.
  ValidationOutcome ValidateOutput(const std::string& generated_text,
                                   const std::string& identity = {});

  const GuardrailConfig& Config() const { return config_; }
  RateLimiter& Limiter() { return rate_limiter_; }
  const ContentFilter& Filter() const { return content_filter_; }
  // Shared with the generation step so its failures land in the same trail.
  AuditLogger* Audit() const { return audit_; }

 private:
  ValidationOutcome RejectRequest(const std::string& identity, RequestStage stage,
                                  const std::string& raw_text, ValidationOutcome outcome);

  const GuardrailConfig config_;
  RateLimiter rate_limiter_;
  ContentFilter content_filter_;
  InputValidator input_validator_;
  OutputValidator output_validator_;
  AuditLogger* audit_{nullptr};
  MetricsRegistry* metrics_{nullptr};
};

}  // namespace jdguard
