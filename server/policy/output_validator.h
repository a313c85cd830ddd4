#pragma once

#include "server/policy/validation_outcome.h"

#include <cstddef>
#include <string>
#include <vector>

namespace jdguard {

struct OutputCheck {
  bool valid{false};
  // The text the checks ran on; cut to the maximum when the input was longer.
  std::string text;
  bool truncated{false};
  std::string reason;
  RejectionDetail detail{RejectionDetail::kNone};
};

// Structural and heuristic checks on generated job descriptions.
class OutputValidator {
 public:
  OutputValidator(std::size_t min_length, std::size_t max_length);

  // Too-short output is rejected before anything else. Oversized output is
  // truncated to max_length bytes and validated as truncated. At least
  // kMinSections of ExpectedSections() must appear, case-insensitively.
  OutputCheck Validate(const std::string& text) const;

  QualityMetrics Quality(const std::string& text) const;

  static const std::vector<std::string>& ExpectedSections();
  static constexpr std::size_t kMinSections = 2;

 private:
  std::size_t min_length_;
  std::size_t max_length_;
};

// Labels from ExpectedSections() found in `text`, in canonical order.
std::vector<std::string> FindSections(const std::string& text);

// True when some line starts (after indentation) with '-', '*' or a bullet
// character followed by whitespace.
bool HasBulletPoints(const std::string& text);

// Value of the first "Job Title:" line with markdown emphasis removed, or an
// empty string.
std::string ExtractJobTitle(const std::string& text);

}  // namespace jdguard
