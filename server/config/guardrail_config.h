#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace jdguard {

// Raised for configuration that cannot be used: unparsable YAML or
// environment values, inconsistent bounds, or a pattern that does not
// compile. Hosts treat it as fatal at startup.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// Hard ceiling on request text in bytes, enforced even with input validation
// off. std::regex matching recurses once per scanned character, so the content
// filter must never see longer text. input.max_length may not exceed it.
constexpr std::size_t kMaxRequestBytes = 10000;

struct RateLimitConfig {
  int max_requests{10};
  int window_seconds{60};
  // 0 means no cap on the number of identities held at once.
  std::size_t max_tracked_identities{0};
};

struct LengthBounds {
  std::size_t min_length{0};
  std::size_t max_length{0};
};

// A disabled stage is skipped and always passes.
struct FeatureToggles {
  bool rate_limiting{true};
  bool content_filtering{true};
  bool input_validation{true};
  bool output_validation{true};
  // Per-category switches inside content filtering.
  bool malicious_patterns{true};
  bool inappropriate_patterns{true};
};

struct ModelConfig {
  std::string name{"mistral"};
  double temperature{0.3};
  int timeout_seconds{60};
  int max_tokens{1500};
  std::string base_url{"http://localhost:11434"};
};

struct GuardrailConfig {
  RateLimitConfig rate_limit;
  LengthBounds input{10, 2000};
  LengthBounds output{100, 5000};
  FeatureToggles features;
  std::vector<std::string> malicious_patterns;
  std::vector<std::string> inappropriate_patterns;
  ModelConfig model;
  std::string log_level{"INFO"};
  bool log_json{false};
  std::string audit_path;
  bool audit_debug{false};

  // Default config with the built-in pattern sets.
  static GuardrailConfig Defaults();
};

std::vector<std::string> DefaultMaliciousPatterns();
std::vector<std::string> DefaultInappropriatePatterns();

// Defaults, then `path` (skipped when the file does not exist), then
// JDGUARD_* environment overrides, then Validate(). Throws ConfigError.
GuardrailConfig LoadGuardrailConfig(const std::string& path);

// Overlays YAML text onto `config`. Keys that are absent keep their value;
// a present pattern list replaces the default list.
void ApplyYamlConfig(const std::string& yaml_text, GuardrailConfig* config);

// Overlays JDGUARD_* environment variables onto `config`.
void ApplyEnvironmentOverrides(GuardrailConfig* config);

// Checks bounds and sizes. Pattern syntax is checked by ContentFilter.
void ValidateConfig(const GuardrailConfig& config);

}  // namespace jdguard
