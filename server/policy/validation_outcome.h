#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace jdguard {

enum class RejectionKind {
  kRateLimitExceeded,
  kInvalidInput,
  kUnsafeContent,
  kOutputFormatInvalid,
  kGenerationFailure,
};

// Which check produced a rejection. kNone on accepted outcomes.
enum class RejectionDetail {
  kNone,
  kRateLimit,
  kEmpty,
  kTooShort,
  kTooLong,
  kNoAlphanumeric,
  kMaliciousPattern,
  kInappropriatePattern,
  kOutputTooShort,
  kFormatMismatch,
  kBackendTimeout,
  kBackendConnection,
  kBackendFailure,
};

// How a host should report the outcome to its caller.
enum class StatusCategory { kOk, kTooManyRequests, kBadInput, kGenerationFailure };

struct QualityMetrics {
  std::size_t length{0};
  std::size_t word_count{0};
  std::vector<std::string> sections_found;
  bool has_bullet_points{false};
  double quality_score{0.0};
  std::string job_title;  // empty when no "Job Title:" line was found
  bool job_title_valid{false};
};

// Result of one pipeline: either accepted with `text` (and, for output
// validation, `metrics`) or rejected with a kind, detail and reason.
struct ValidationOutcome {
  bool accepted{false};
  std::string text;
  RejectionKind kind{RejectionKind::kInvalidInput};
  RejectionDetail detail{RejectionDetail::kNone};
  std::string reason;
  std::optional<QualityMetrics> metrics;

  static ValidationOutcome Accept(std::string text);
  static ValidationOutcome Reject(RejectionKind kind, RejectionDetail detail,
                                  std::string reason);

  StatusCategory Status() const;
  // 200, 429, 400, 500; a backend timeout is 504.
  int HttpStatus() const;
};

const char* RejectionKindName(RejectionKind kind);
const char* RejectionDetailName(RejectionDetail detail);
const char* StatusCategoryName(StatusCategory status);

}  // namespace jdguard
