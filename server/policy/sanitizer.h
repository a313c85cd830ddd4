#pragma once

#include <string>

namespace jdguard {

// Strips HTML-like tags, collapses whitespace runs to one space, removes the
// characters < > { } and trims. Idempotent.
std::string SanitizeText(const std::string& text);

// Leading and trailing whitespace removed.
std::string TrimWhitespace(const std::string& text);

}  // namespace jdguard
