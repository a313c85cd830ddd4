#include "server/policy/validation_outcome.h"

#include <utility>

namespace jdguard {

ValidationOutcome ValidationOutcome::Accept(std::string text) {
  ValidationOutcome outcome;
  outcome.accepted = true;
  outcome.text = std::move(text);
  return outcome;
}

ValidationOutcome ValidationOutcome::Reject(RejectionKind kind,
                                            RejectionDetail detail,
                                            std::string reason) {
  ValidationOutcome outcome;
  outcome.accepted = false;
  outcome.kind = kind;
  outcome.detail = detail;
  outcome.reason = std::move(reason);
  return outcome;
}

StatusCategory ValidationOutcome::Status() const {
  if (accepted) {
    return StatusCategory::kOk;
  }
  switch (kind) {
    case RejectionKind::kRateLimitExceeded:
      return StatusCategory::kTooManyRequests;
    case RejectionKind::kInvalidInput:
    case RejectionKind::kUnsafeContent:
      return StatusCategory::kBadInput;
    case RejectionKind::kOutputFormatInvalid:
    case RejectionKind::kGenerationFailure:
      return StatusCategory::kGenerationFailure;
  }
  return StatusCategory::kGenerationFailure;
}

int ValidationOutcome::HttpStatus() const {
  switch (Status()) {
    case StatusCategory::kOk:
      return 200;
    case StatusCategory::kTooManyRequests:
      return 429;
    case StatusCategory::kBadInput:
      return 400;
    case StatusCategory::kGenerationFailure:
      return detail == RejectionDetail::kBackendTimeout ? 504 : 500;
  }
  return 500;
}

const char* RejectionKindName(RejectionKind kind) {
  switch (kind) {
    case RejectionKind::kRateLimitExceeded:
      return "rate_limit_exceeded";
    case RejectionKind::kInvalidInput:
      return "invalid_input";
    case RejectionKind::kUnsafeContent:
      return "unsafe_content";
    case RejectionKind::kOutputFormatInvalid:
      return "output_format_invalid";
    case RejectionKind::kGenerationFailure:
      return "generation_failure";
  }
  return "unknown";
}

const char* RejectionDetailName(RejectionDetail detail) {
  switch (detail) {
    case RejectionDetail::kNone:
      return "none";
    case RejectionDetail::kRateLimit:
      return "rate_limit";
    case RejectionDetail::kEmpty:
      return "empty";
    case RejectionDetail::kTooShort:
      return "too_short";
    case RejectionDetail::kTooLong:
      return "too_long";
    case RejectionDetail::kNoAlphanumeric:
      return "no_alphanumeric";
    case RejectionDetail::kMaliciousPattern:
      return "malicious_pattern";
    case RejectionDetail::kInappropriatePattern:
      return "inappropriate_pattern";
    case RejectionDetail::kOutputTooShort:
      return "output_too_short";
    case RejectionDetail::kFormatMismatch:
      return "format_mismatch";
    case RejectionDetail::kBackendTimeout:
      return "backend_timeout";
    case RejectionDetail::kBackendConnection:
      return "backend_connection";
    case RejectionDetail::kBackendFailure:
      return "backend_failure";
  }
  return "unknown";
}

const char* StatusCategoryName(StatusCategory status) {
  switch (status) {
    case StatusCategory::kOk:
      return "ok";
    case StatusCategory::kTooManyRequests:
      return "too_many_requests";
    case StatusCategory::kBadInput:
      return "bad_input";
    case StatusCategory::kGenerationFailure:
      return "generation_failure";
  }
  return "unknown";
}

}  // namespace jdguard
