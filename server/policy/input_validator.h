#pragma once

#include "server/policy/validation_outcome.h"

#include <cstddef>
#include <string>

namespace jdguard {

// Structural checks on raw role-detail text. Lengths are in bytes of the
// untrimmed text.
class InputValidator {
 public:
  InputValidator(std::size_t min_length, std::size_t max_length);

  // Checks, first failure wins: non-blank, >= min_length, <= max_length,
  // contains an ASCII letter or digit.
  bool Validate(const std::string& text, std::string* reason,
                RejectionDetail* detail = nullptr) const;

  // A plausible job title: 3 to 100 bytes with at least one ASCII letter.
  static bool ValidateJobTitle(const std::string& title);

  std::size_t MinLength() const { return min_length_; }
  std::size_t MaxLength() const { return max_length_; }

 private:
  std::size_t min_length_;
  std::size_t max_length_;
};

}  // namespace jdguard
