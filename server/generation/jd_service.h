#pragma once

#include "runtime/backends/generation_backend.h"
#include "server/policy/guardrails_manager.h"
#include "server/policy/validation_outcome.h"

#include <string>

namespace jdguard {

struct ServiceResult {
  ValidationOutcome outcome;
  // Raw backend text, empty when generation never ran or failed.
  std::string generated;
  double generation_ms{0.0};
  bool generation_attempted{false};

  int HttpStatus() const { return outcome.HttpStatus(); }
};

// validate request -> generate -> validate output. A backend failure becomes
// a kGenerationFailure outcome so callers can tell rejected input from a
// failed generation.
class JobDescriptionService {
 public:
  // Both references must outlive the service.
  JobDescriptionService(GuardrailsManager& guardrails, GenerationBackend& backend,
                        MetricsRegistry* metrics = nullptr);

  ServiceResult Generate(const std::string& identity, const std::string& role_details);

 private:
  GuardrailsManager& guardrails_;
  GenerationBackend& backend_;
  MetricsRegistry* metrics_{nullptr};
};

}  // namespace jdguard
