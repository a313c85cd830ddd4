#pragma once

#include <stdexcept>
#include <string>

namespace jdguard {

// Raised by a GenerationBackend when it cannot produce text. Callers convert
// it into a generation-failure outcome; nothing retries.
class GenerationError : public std::runtime_error {
 public:
  enum class Kind { kTimeout, kConnection, kFailure };

  GenerationError(Kind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  Kind kind() const { return kind_; }

 private:
  Kind kind_;
};

// Text-generation collaborator: sanitized role details in, generated job
// description out, within a bounded time budget.
class GenerationBackend {
 public:
  virtual ~GenerationBackend() = default;

  // Throws GenerationError.
  virtual std::string Generate(const std::string& role_details) = 0;
  virtual std::string Name() const = 0;
};

}  // namespace jdguard
