#include "server/policy/input_validator.h"

#include "server/policy/sanitizer.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace jdguard {

namespace {
bool Fail(RejectionDetail which, std::string message, std::string* reason,
          RejectionDetail* detail) {
  if (reason) {
    *reason = std::move(message);
  }
  if (detail) {
    *detail = which;
  }
  return false;
}
}  // namespace

InputValidator::InputValidator(std::size_t min_length, std::size_t max_length)
    : min_length_(min_length), max_length_(max_length) {}

bool InputValidator::Validate(const std::string& text, std::string* reason,
                              RejectionDetail* detail) const {
  if (TrimWhitespace(text).empty()) {
    return Fail(RejectionDetail::kEmpty, "Role details cannot be empty", reason, detail);
  }
  if (text.size() < min_length_) {
    return Fail(RejectionDetail::kTooShort,
                "Role details too short. Minimum " + std::to_string(min_length_) +
                    " characters required",
                reason, detail);
  }
  if (text.size() > max_length_) {
    return Fail(RejectionDetail::kTooLong,
                "Role details too long. Maximum " + std::to_string(max_length_) +
                    " characters allowed",
                reason, detail);
  }
  bool has_alnum = std::any_of(text.begin(), text.end(), [](unsigned char c) {
    return c < 0x80 && std::isalnum(c);
  });
  if (!has_alnum) {
    return Fail(RejectionDetail::kNoAlphanumeric, "Role details must contain valid text",
                reason, detail);
  }
  if (detail) {
    *detail = RejectionDetail::kNone;
  }
  return true;
}

bool InputValidator::ValidateJobTitle(const std::string& title) {
  if (title.size() < 3 || title.size() > 100) {
    return false;
  }
  return std::any_of(title.begin(), title.end(), [](unsigned char c) {
    return c < 0x80 && std::isalpha(c);
  });
}

}  // namespace jdguard
