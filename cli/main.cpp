#include "runtime/backends/ollama_backend.h"
#include "server/auth/client_identity.h"
#include "server/config/guardrail_config.h"
#include "server/generation/jd_service.h"
#include "server/logging/audit_logger.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"
#include "server/policy/guardrails_manager.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

using json = nlohmann::json;

namespace {

constexpr int kExitAccepted = 0;
constexpr int kExitError = 1;
constexpr int kExitRejected = 2;

void PrintUsage() {
  std::cout
      << "Usage:\n"
      << "  jdguardctl check --text 'role details' [--identity ID]\n"
         "                   [--forwarded-for HEADER] [--peer ADDR] [--repeat N]\n"
      << "      Run the request guardrails and print the outcome.\n"
      << "  jdguardctl validate-output (--text TEXT | --file PATH)\n"
      << "      Run the output guardrails on generated text.\n"
      << "  jdguardctl generate --text 'role details' [--identity ID]\n"
      << "      Validate, generate through the configured backend, validate "
         "the output.\n"
      << "  jdguardctl config\n"
      << "      Print the effective configuration.\n"
      << "Options:\n"
      << "  --config PATH   YAML config (default config/guardrails.yaml)\n"
      << "  --log-json      JSON log lines on stderr\n"
      << "  --metrics       Print Prometheus metrics to stderr on exit\n";
}

json MetricsToJson(const jdguard::QualityMetrics &metrics) {
  json j;
  j["length"] = metrics.length;
  j["word_count"] = metrics.word_count;
  j["sections_found"] = metrics.sections_found;
  j["has_bullet_points"] = metrics.has_bullet_points;
  j["quality_score"] = metrics.quality_score;
  j["job_title"] = metrics.job_title;
  j["job_title_valid"] = metrics.job_title_valid;
  return j;
}

json OutcomeToJson(const jdguard::ValidationOutcome &outcome) {
  json j;
  j["accepted"] = outcome.accepted;
  j["status"] = jdguard::StatusCategoryName(outcome.Status());
  j["http_status"] = outcome.HttpStatus();
  if (outcome.accepted) {
    j["text"] = outcome.text;
    if (outcome.metrics) {
      j["quality"] = MetricsToJson(*outcome.metrics);
    }
  } else {
    j["kind"] = jdguard::RejectionKindName(outcome.kind);
    j["detail"] = jdguard::RejectionDetailName(outcome.detail);
    j["reason"] = outcome.reason;
  }
  return j;
}

json ConfigToJson(const jdguard::GuardrailConfig &config) {
  json j;
  j["rate_limit"] = {{"max_requests", config.rate_limit.max_requests},
                     {"window_seconds", config.rate_limit.window_seconds},
                     {"max_tracked_identities",
                      config.rate_limit.max_tracked_identities}};
  j["input"] = {{"min_length", config.input.min_length},
                {"max_length", config.input.max_length}};
  j["output"] = {{"min_length", config.output.min_length},
                 {"max_length", config.output.max_length}};
  j["features"] = {{"rate_limiting", config.features.rate_limiting},
                   {"content_filtering", config.features.content_filtering},
                   {"input_validation", config.features.input_validation},
                   {"output_validation", config.features.output_validation}};
  j["patterns"] = {
      {"malicious", config.malicious_patterns},
      {"inappropriate", config.inappropriate_patterns},
      {"malicious_enabled", config.features.malicious_patterns},
      {"inappropriate_enabled", config.features.inappropriate_patterns}};
  j["model"] = {{"name", config.model.name},
                {"temperature", config.model.temperature},
                {"timeout_seconds", config.model.timeout_seconds},
                {"max_tokens", config.model.max_tokens},
                {"base_url", config.model.base_url}};
  j["logging"] = {{"level", config.log_level},
                  {"format", config.log_json ? "json" : "text"}};
  j["audit"] = {{"path", config.audit_path}, {"debug", config.audit_debug}};
  return j;
}

bool ReadFile(const std::string &path, std::string *contents) {
  std::ifstream in(path, std::ios::binary);
  if (!in.good()) {
    return false;
  }
  contents->assign((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  return true;
}

void PrintJson(const json &j) {
  std::cout << j.dump(2, ' ', false, json::error_handler_t::replace)
            << std::endl;
}

} // namespace

int main(int argc, char **argv) {
  // A backend that drops the connection mid-request surfaces as HttpError.
  std::signal(SIGPIPE, SIG_IGN);
  if (argc < 2) {
    PrintUsage();
    return kExitError;
  }
  std::string command = argv[1];
  std::string config_path = "config/guardrails.yaml";
  std::string text;
  bool have_text = false;
  std::string file_path;
  std::string identity;
  std::string forwarded_for;
  std::string peer;
  int repeat = 1;
  bool log_json_flag = false;
  bool print_metrics = false;

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--text" && i + 1 < argc) {
      text = argv[++i];
      have_text = true;
    } else if (arg == "--file" && i + 1 < argc) {
      file_path = argv[++i];
    } else if (arg == "--identity" && i + 1 < argc) {
      identity = argv[++i];
    } else if (arg == "--forwarded-for" && i + 1 < argc) {
      forwarded_for = argv[++i];
    } else if (arg == "--peer" && i + 1 < argc) {
      peer = argv[++i];
    } else if (arg == "--repeat" && i + 1 < argc) {
      try {
        repeat = std::stoi(argv[++i]);
      } catch (const std::exception &) {
        std::cerr << "--repeat expects an integer\n";
        return kExitError;
      }
    } else if (arg == "--log-json") {
      log_json_flag = true;
    } else if (arg == "--metrics") {
      print_metrics = true;
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage();
      return kExitAccepted;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      PrintUsage();
      return kExitError;
    }
  }

  jdguard::GuardrailConfig config;
  try {
    config = jdguard::LoadGuardrailConfig(config_path);
  } catch (const jdguard::ConfigError &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return kExitError;
  }

  jdguard::log::SetJsonMode(config.log_json || log_json_flag);
  jdguard::log::Level level = jdguard::log::Level::INFO;
  if (!jdguard::log::ParseLevel(config.log_level, &level)) {
    jdguard::log::Warn("cli", "unknown log level, using INFO",
                       "level=" + config.log_level);
  }
  jdguard::log::SetMinLevel(level);

  if (command == "config") {
    PrintJson(ConfigToJson(config));
    return kExitAccepted;
  }

  if (identity.empty()) {
    identity = jdguard::ResolveClientIdentity(forwarded_for, peer);
  }

  jdguard::MetricsRegistry metrics;
  jdguard::AuditLogger audit(config.audit_path, config.audit_debug);
  int exit_code = kExitError;

  try {
    jdguard::GuardrailsManager guardrails(
        config, audit.Enabled() ? &audit : nullptr, &metrics);

    if (command == "check") {
      if (!have_text) {
        std::cerr << "check requires --text\n";
        return kExitError;
      }
      json results = json::array();
      bool all_accepted = true;
      for (int i = 0; i < std::max(1, repeat); ++i) {
        auto outcome = guardrails.ValidateRequest(identity, text);
        all_accepted = all_accepted && outcome.accepted;
        auto j = OutcomeToJson(outcome);
        j["identity"] = identity;
        if (outcome.kind == jdguard::RejectionKind::kRateLimitExceeded &&
            !outcome.accepted) {
          j["retry_after_seconds"] =
              guardrails.Limiter().RetryAfterSeconds(identity);
        }
        results.push_back(j);
      }
      PrintJson(results.size() == 1 ? results[0] : results);
      exit_code = all_accepted ? kExitAccepted : kExitRejected;
    } else if (command == "validate-output") {
      if (!file_path.empty()) {
        if (!ReadFile(file_path, &text)) {
          std::cerr << "Cannot read " << file_path << "\n";
          return kExitError;
        }
      } else if (!have_text) {
        std::cerr << "validate-output requires --text or --file\n";
        return kExitError;
      }
      auto outcome = guardrails.ValidateOutput(text, identity);
      PrintJson(OutcomeToJson(outcome));
      exit_code = outcome.accepted ? kExitAccepted : kExitRejected;
    } else if (command == "generate") {
      if (!have_text) {
        std::cerr << "generate requires --text\n";
        return kExitError;
      }
      jdguard::OllamaConfig backend_config;
      backend_config.base_url = config.model.base_url;
      backend_config.model = config.model.name;
      backend_config.temperature = config.model.temperature;
      backend_config.max_tokens = config.model.max_tokens;
      backend_config.timeout_seconds = config.model.timeout_seconds;
      jdguard::OllamaBackend backend(backend_config);
      jdguard::JobDescriptionService service(guardrails, backend, &metrics);
      auto result = service.Generate(identity, text);
      auto j = OutcomeToJson(result.outcome);
      j["identity"] = identity;
      if (result.generation_attempted) {
        j["generation_ms"] = result.generation_ms;
      }
      PrintJson(j);
      exit_code = result.outcome.accepted ? kExitAccepted : kExitRejected;
    } else {
      std::cerr << "Unknown command: " << command << "\n";
      PrintUsage();
      return kExitError;
    }
  } catch (const jdguard::ConfigError &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return kExitError;
  }

  if (print_metrics) {
    std::cerr << metrics.RenderPrometheus();
  }
  return exit_code;
}
