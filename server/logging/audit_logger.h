#pragma once

#include <fstream>
#include <mutex>
#include <string>

namespace jdguard {

class AuditLogger {
 public:
  AuditLogger() = default;

  // path: JSON-lines file; debug_mode: when true, record the raw request text
  // instead of its SHA-256 hash.
  explicit AuditLogger(const std::string& path, bool debug_mode = false);

  bool Enabled() const { return stream_.is_open(); }

  // One guardrail decision. `stage` names the pipeline stage that decided
  // ("rate_limit", "input_validation", "content_filter", "output_validation",
  // "generation", or "pipeline" for an admission), `decision` is
  // "accepted" or "rejected".
  void LogDecision(const std::string& identity,
                   const std::string& stage,
                   const std::string& decision,
                   const std::string& reason,
                   const std::string& text);

  // Hash a string to its SHA-256 hex representation (64 chars).
  static std::string HashContent(const std::string& content);

  static constexpr std::size_t kPreviewChars = 100;

 private:
  std::ofstream stream_;
  std::mutex mutex_;
  bool debug_mode_{false};
};

}  // namespace jdguard
