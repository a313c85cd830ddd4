#include "server/config/guardrail_config.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace jdguard {

namespace {

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

bool ParseBool(const std::string& value) {
  auto lowered = ToLower(value);
  return lowered == "true" || lowered == "1" || lowered == "yes";
}

int EnvInt(const char* name, const std::string& value) {
  try {
    std::size_t used = 0;
    int parsed = std::stoi(value, &used);
    if (used != value.size()) {
      throw ConfigError(std::string(name) + ": trailing characters in '" + value + "'");
    }
    return parsed;
  } catch (const std::invalid_argument&) {
    throw ConfigError(std::string(name) + ": not an integer: '" + value + "'");
  } catch (const std::out_of_range&) {
    throw ConfigError(std::string(name) + ": out of range: '" + value + "'");
  }
}

std::size_t EnvSize(const char* name, const std::string& value) {
  int parsed = EnvInt(name, value);
  if (parsed < 0) {
    throw ConfigError(std::string(name) + ": must not be negative");
  }
  return static_cast<std::size_t>(parsed);
}

double EnvDouble(const char* name, const std::string& value) {
  try {
    return std::stod(value);
  } catch (const std::exception&) {
    throw ConfigError(std::string(name) + ": not a number: '" + value + "'");
  }
}

std::size_t YamlSize(const YAML::Node& node, const char* key) {
  auto value = node.as<long long>();
  if (value < 0) {
    throw ConfigError(std::string(key) + " must not be negative");
  }
  return static_cast<std::size_t>(value);
}

std::vector<std::string> YamlStringList(const YAML::Node& node, const char* key) {
  if (!node.IsSequence()) {
    throw ConfigError(std::string(key) + " must be a list of strings");
  }
  std::vector<std::string> values;
  for (const auto& item : node) {
    values.push_back(item.as<std::string>());
  }
  return values;
}

void ApplyYamlNode(const YAML::Node& root, GuardrailConfig* config) {
  if (!root || root.IsNull()) {
    return;
  }
  if (!root.IsMap()) {
    throw ConfigError("top-level config must be a mapping");
  }

  if (auto rate = root["rate_limit"]) {
    if (rate["max_requests"]) config->rate_limit.max_requests = rate["max_requests"].as<int>();
    if (rate["window_seconds"]) config->rate_limit.window_seconds = rate["window_seconds"].as<int>();
    if (rate["max_tracked_identities"]) {
      config->rate_limit.max_tracked_identities =
          YamlSize(rate["max_tracked_identities"], "rate_limit.max_tracked_identities");
    }
  }

  if (auto input = root["input"]) {
    if (input["min_length"]) config->input.min_length = YamlSize(input["min_length"], "input.min_length");
    if (input["max_length"]) config->input.max_length = YamlSize(input["max_length"], "input.max_length");
  }

  if (auto output = root["output"]) {
    if (output["min_length"]) config->output.min_length = YamlSize(output["min_length"], "output.min_length");
    if (output["max_length"]) config->output.max_length = YamlSize(output["max_length"], "output.max_length");
  }

  if (auto features = root["features"]) {
    if (features["rate_limiting"]) config->features.rate_limiting = features["rate_limiting"].as<bool>();
    if (features["content_filtering"]) config->features.content_filtering = features["content_filtering"].as<bool>();
    if (features["input_validation"]) config->features.input_validation = features["input_validation"].as<bool>();
    if (features["output_validation"]) config->features.output_validation = features["output_validation"].as<bool>();
  }

  if (auto patterns = root["patterns"]) {
    if (patterns["malicious"]) {
      config->malicious_patterns = YamlStringList(patterns["malicious"], "patterns.malicious");
    }
    if (patterns["malicious_enabled"]) {
      config->features.malicious_patterns = patterns["malicious_enabled"].as<bool>();
    }
    if (patterns["inappropriate_enabled"]) {
      config->features.inappropriate_patterns = patterns["inappropriate_enabled"].as<bool>();
    }
    if (patterns["inappropriate"]) {
      config->inappropriate_patterns = YamlStringList(patterns["inappropriate"], "patterns.inappropriate");
    }
  }

  if (auto model = root["model"]) {
    if (model["name"]) config->model.name = model["name"].as<std::string>();
    if (model["temperature"]) config->model.temperature = model["temperature"].as<double>();
    if (model["timeout_seconds"]) config->model.timeout_seconds = model["timeout_seconds"].as<int>();
    if (model["max_tokens"]) config->model.max_tokens = model["max_tokens"].as<int>();
    if (model["base_url"]) config->model.base_url = model["base_url"].as<std::string>();
  }

  if (auto logging = root["logging"]) {
    if (logging["level"]) config->log_level = logging["level"].as<std::string>();
    if (logging["format"]) config->log_json = ToLower(logging["format"].as<std::string>()) == "json";
  }

  if (auto audit = root["audit"]) {
    if (audit["path"]) config->audit_path = audit["path"].as<std::string>();
    if (audit["debug"]) config->audit_debug = audit["debug"].as<bool>();
  }
}

}  // namespace

std::vector<std::string> DefaultMaliciousPatterns() {
  return {
      R"(\b(hack|exploit|inject|sql|script|xss|malware)\b)",
      R"(<script.*?>.*?</script>)",
      R"((javascript:|data:text/html))",
      R"((\bDROP\b|\bDELETE\b|\bINSERT\b)\s+(TABLE|FROM|INTO))",
  };
}

std::vector<std::string> DefaultInappropriatePatterns() {
  return {
      R"(\b(porn|xxx|sex|nude|nsfw)\b)",
      R"(\b(violence|kill|murder|terrorist)\b)",
  };
}

GuardrailConfig GuardrailConfig::Defaults() {
  GuardrailConfig config;
  config.malicious_patterns = DefaultMaliciousPatterns();
  config.inappropriate_patterns = DefaultInappropriatePatterns();
  return config;
}

void ApplyYamlConfig(const std::string& yaml_text, GuardrailConfig* config) {
  try {
    ApplyYamlNode(YAML::Load(yaml_text), config);
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("invalid config: ") + e.what());
  }
}

void ApplyEnvironmentOverrides(GuardrailConfig* config) {
  if (const char* env = std::getenv("JDGUARD_RATE_LIMIT_MAX_REQUESTS")) {
    config->rate_limit.max_requests = EnvInt("JDGUARD_RATE_LIMIT_MAX_REQUESTS", env);
  }
  if (const char* env = std::getenv("JDGUARD_RATE_LIMIT_WINDOW_SECONDS")) {
    config->rate_limit.window_seconds = EnvInt("JDGUARD_RATE_LIMIT_WINDOW_SECONDS", env);
  }
  if (const char* env = std::getenv("JDGUARD_RATE_LIMIT_MAX_IDENTITIES")) {
    config->rate_limit.max_tracked_identities = EnvSize("JDGUARD_RATE_LIMIT_MAX_IDENTITIES", env);
  }
  if (const char* env = std::getenv("JDGUARD_INPUT_MIN_LENGTH")) {
    config->input.min_length = EnvSize("JDGUARD_INPUT_MIN_LENGTH", env);
  }
  if (const char* env = std::getenv("JDGUARD_INPUT_MAX_LENGTH")) {
    config->input.max_length = EnvSize("JDGUARD_INPUT_MAX_LENGTH", env);
  }
  if (const char* env = std::getenv("JDGUARD_OUTPUT_MIN_LENGTH")) {
    config->output.min_length = EnvSize("JDGUARD_OUTPUT_MIN_LENGTH", env);
  }
  if (const char* env = std::getenv("JDGUARD_OUTPUT_MAX_LENGTH")) {
    config->output.max_length = EnvSize("JDGUARD_OUTPUT_MAX_LENGTH", env);
  }
  if (const char* env = std::getenv("JDGUARD_ENABLE_RATE_LIMITING")) {
    config->features.rate_limiting = ParseBool(env);
  }
  if (const char* env = std::getenv("JDGUARD_ENABLE_CONTENT_FILTERING")) {
    config->features.content_filtering = ParseBool(env);
  }
  if (const char* env = std::getenv("JDGUARD_ENABLE_INPUT_VALIDATION")) {
    config->features.input_validation = ParseBool(env);
  }
  if (const char* env = std::getenv("JDGUARD_ENABLE_OUTPUT_VALIDATION")) {
    config->features.output_validation = ParseBool(env);
  }
  if (const char* env = std::getenv("JDGUARD_MODEL_NAME")) {
    config->model.name = env;
  }
  if (const char* env = std::getenv("JDGUARD_MODEL_TEMPERATURE")) {
    config->model.temperature = EnvDouble("JDGUARD_MODEL_TEMPERATURE", env);
  }
  if (const char* env = std::getenv("JDGUARD_MODEL_TIMEOUT")) {
    config->model.timeout_seconds = EnvInt("JDGUARD_MODEL_TIMEOUT", env);
  }
  if (const char* env = std::getenv("JDGUARD_MODEL_MAX_TOKENS")) {
    config->model.max_tokens = EnvInt("JDGUARD_MODEL_MAX_TOKENS", env);
  }
  if (const char* env = std::getenv("JDGUARD_OLLAMA_BASE_URL")) {
    config->model.base_url = env;
  }
  if (const char* env = std::getenv("JDGUARD_LOG_LEVEL")) {
    config->log_level = env;
  }
  if (const char* env = std::getenv("JDGUARD_LOG_FORMAT")) {
    config->log_json = ToLower(env) == "json";
  }
  if (const char* env = std::getenv("JDGUARD_AUDIT_LOG")) {
    config->audit_path = env;
  }
  if (const char* env = std::getenv("JDGUARD_AUDIT_DEBUG")) {
    config->audit_debug = ParseBool(env);
  }
}

void ValidateConfig(const GuardrailConfig& config) {
  if (config.features.rate_limiting) {
    // Switching the stage off is done with features.rate_limiting.
    if (config.rate_limit.max_requests <= 0) {
      throw ConfigError("rate_limit.max_requests must be positive when rate limiting is enabled");
    }
    if (config.rate_limit.window_seconds <= 0) {
      throw ConfigError("rate_limit.window_seconds must be positive");
    }
  }
  if (config.input.min_length > config.input.max_length) {
    throw ConfigError("input.min_length (" + std::to_string(config.input.min_length) +
                      ") exceeds input.max_length (" +
                      std::to_string(config.input.max_length) + ")");
  }
  if (config.input.max_length > kMaxRequestBytes) {
    throw ConfigError("input.max_length (" + std::to_string(config.input.max_length) +
                      ") exceeds the request ceiling of " +
                      std::to_string(kMaxRequestBytes) + " bytes");
  }
  if (config.output.min_length > config.output.max_length) {
    throw ConfigError("output.min_length (" + std::to_string(config.output.min_length) +
                      ") exceeds output.max_length (" +
                      std::to_string(config.output.max_length) + ")");
  }
  if (config.model.timeout_seconds <= 0) {
    throw ConfigError("model.timeout_seconds must be positive");
  }
  if (config.model.max_tokens <= 0) {
    throw ConfigError("model.max_tokens must be positive");
  }
}

GuardrailConfig LoadGuardrailConfig(const std::string& path) {
  auto config = GuardrailConfig::Defaults();
  if (!path.empty() && std::filesystem::exists(path)) {
    try {
      ApplyYamlNode(YAML::LoadFile(path), &config);
    } catch (const YAML::Exception& e) {
      throw ConfigError("error parsing config file " + path + ": " + e.what());
    }
  }
  ApplyEnvironmentOverrides(&config);
  ValidateConfig(config);
  return config;
}

}  // namespace jdguard
