#include "runtime/backends/ollama_backend.h"

#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <utility>

using json = nlohmann::json;

namespace jdguard {

OllamaBackend::OllamaBackend(OllamaConfig config)
    : config_(std::move(config)), client_(std::chrono::seconds(config_.timeout_seconds)) {}

std::string OllamaBackend::BuildPrompt(const std::string& role_details) {
  return "You are an HR expert.\n\n"
         "Generate a professional job description with these sections:\n"
         "- Job Title\n"
         "- Job Summary\n"
         "- Responsibilities\n"
         "- Skills\n\n"
         "Role details:\n" +
         role_details + "\n";
}

std::string OllamaBackend::BuildPayload(const std::string& role_details) const {
  json j;
  j["model"] = config_.model;
  j["prompt"] = BuildPrompt(role_details);
  j["stream"] = false;
  j["options"] = {{"temperature", config_.temperature}, {"num_predict", config_.max_tokens}};
  // Role details are only byte-checked upstream and may hold invalid UTF-8.
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string OllamaBackend::ParseReply(const HttpResponse& reply) {
  if (reply.status < 200 || reply.status >= 300) {
    throw GenerationError(GenerationError::Kind::kFailure,
                          "backend returned HTTP " + std::to_string(reply.status));
  }
  json body = json::parse(reply.body, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    throw GenerationError(GenerationError::Kind::kFailure, "backend reply is not a JSON object");
  }
  auto it = body.find("response");
  if (it == body.end() || !it->is_string()) {
    if (body.contains("error") && body["error"].is_string()) {
      throw GenerationError(GenerationError::Kind::kFailure,
                            "backend error: " + body["error"].get<std::string>());
    }
    throw GenerationError(GenerationError::Kind::kFailure, "backend reply has no response text");
  }
  return it->get<std::string>();
}

std::string OllamaBackend::Generate(const std::string& role_details) {
  auto url = config_.base_url + "/api/generate";
  log::Debug("backend", "calling generation backend", "url=" + url + " model=" + config_.model);
  HttpResponse reply;
  try {
    reply = client_.Post(url, BuildPayload(role_details));
  } catch (const HttpError& e) {
    switch (e.kind()) {
      case HttpError::Kind::kTimeout:
        throw GenerationError(GenerationError::Kind::kTimeout, e.what());
      case HttpError::Kind::kConnect:
        throw GenerationError(GenerationError::Kind::kConnection, e.what());
      case HttpError::Kind::kProtocol:
        break;
    }
    throw GenerationError(GenerationError::Kind::kFailure, e.what());
  }
  return ParseReply(reply);
}

}  // namespace jdguard
