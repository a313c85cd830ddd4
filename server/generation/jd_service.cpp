#include "server/generation/jd_service.h"

#include "server/logging/audit_logger.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <chrono>
#include <utility>

namespace jdguard {

namespace {
RejectionDetail DetailFor(GenerationError::Kind kind) {
  switch (kind) {
    case GenerationError::Kind::kTimeout:
      return RejectionDetail::kBackendTimeout;
    case GenerationError::Kind::kConnection:
      return RejectionDetail::kBackendConnection;
    case GenerationError::Kind::kFailure:
      break;
  }
  return RejectionDetail::kBackendFailure;
}

FailureKind MetricKindFor(GenerationError::Kind kind) {
  switch (kind) {
    case GenerationError::Kind::kTimeout:
      return FailureKind::kTimeout;
    case GenerationError::Kind::kConnection:
      return FailureKind::kConnection;
    case GenerationError::Kind::kFailure:
      break;
  }
  return FailureKind::kFailure;
}

std::string MessageFor(GenerationError::Kind kind) {
  switch (kind) {
    case GenerationError::Kind::kTimeout:
      return "Generation timed out";
    case GenerationError::Kind::kConnection:
      return "Generation backend unavailable";
    case GenerationError::Kind::kFailure:
      break;
  }
  return "Generation failed";
}
}  // namespace

JobDescriptionService::JobDescriptionService(GuardrailsManager& guardrails,
                                             GenerationBackend& backend,
                                             MetricsRegistry* metrics)
    : guardrails_(guardrails), backend_(backend), metrics_(metrics) {}

ServiceResult JobDescriptionService::Generate(const std::string& identity,
                                              const std::string& role_details) {
  ServiceResult result;
  auto admitted = guardrails_.ValidateRequest(identity, role_details);
  if (!admitted.accepted) {
    result.outcome = std::move(admitted);
    return result;
  }

  result.generation_attempted = true;
  auto start = std::chrono::steady_clock::now();
  auto elapsed_ms = [&start]() {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
        .count();
  };
  try {
    result.generated = backend_.Generate(admitted.text);
  } catch (const GenerationError& e) {
    result.generation_ms = elapsed_ms();
    log::Error("generation", MessageFor(e.kind()),
               "identity=" + identity + " backend=" + backend_.Name() + " error=" + e.what());
    if (metrics_) {
      metrics_->RecordGenerationLatency(result.generation_ms);
      metrics_->RecordGenerationFailure(MetricKindFor(e.kind()));
    }
    if (auto* audit = guardrails_.Audit()) {
      audit->LogDecision(identity, "generation", "rejected", MessageFor(e.kind()), admitted.text);
    }
    result.outcome = ValidationOutcome::Reject(RejectionKind::kGenerationFailure,
                                               DetailFor(e.kind()), MessageFor(e.kind()));
    return result;
  }
  result.generation_ms = elapsed_ms();
  if (metrics_) {
    metrics_->RecordGenerationLatency(result.generation_ms);
  }

  result.outcome = guardrails_.ValidateOutput(result.generated, identity);
  return result;
}

}  // namespace jdguard
