#pragma once

#include "net/http_client.h"
#include "runtime/backends/generation_backend.h"

#include <string>

namespace jdguard {

struct OllamaConfig {
  std::string base_url{"http://localhost:11434"};
  std::string model{"mistral"};
  double temperature{0.3};
  int max_tokens{1500};
  int timeout_seconds{60};
};

// Non-streaming client for an Ollama-compatible /api/generate endpoint.
class OllamaBackend : public GenerationBackend {
 public:
  explicit OllamaBackend(OllamaConfig config);

  std::string Generate(const std::string& role_details) override;
  std::string Name() const override { return "ollama:" + config_.model; }

  static std::string BuildPrompt(const std::string& role_details);
  // Invalid UTF-8 in `role_details` is replaced with U+FFFD.
  std::string BuildPayload(const std::string& role_details) const;
  // Extracts "response" from a /api/generate reply. Throws GenerationError
  // (kFailure) on a non-2xx status or a body without a string "response".
  static std::string ParseReply(const HttpResponse& reply);

 private:
  OllamaConfig config_;
  HttpClient client_;
};

}  // namespace jdguard
