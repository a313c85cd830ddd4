#pragma once

#include <regex>
#include <string>
#include <vector>

namespace jdguard {

enum class ContentCategory { kNone, kMalicious, kInappropriate };

// Lexical content filter. Each category's patterns are joined into one
// case-insensitive alternation and compiled once; the two categories are
// separate matchers so each can be switched off on its own.
class ContentFilter {
 public:
  // Throws ConfigError naming the first pattern that does not compile.
  ContentFilter(const std::vector<std::string>& malicious_patterns,
                const std::vector<std::string>& inappropriate_patterns,
                bool malicious_enabled = true,
                bool inappropriate_enabled = true);

  // Malicious patterns are tested first; an inappropriate match is only
  // looked for when no malicious pattern matched. The matched text goes to
  // the log, never into `reason`. Callers bound `text` to kMaxRequestBytes.
  bool IsSafe(const std::string& text, std::string* reason,
              ContentCategory* category = nullptr) const;

  std::string Sanitize(const std::string& text) const;

  bool Enabled() const;
  bool CategoryEnabled(ContentCategory category) const;
  std::size_t PatternCount(ContentCategory category) const;

 private:
  struct Matcher {
    std::regex regex;
    std::size_t pattern_count{0};
    bool enabled{false};

    bool Active() const { return enabled && pattern_count > 0; }
  };

  static Matcher Compile(const std::vector<std::string>& patterns, bool enabled,
                         const char* category);
  const Matcher* Find(ContentCategory category) const;

  Matcher malicious_;
  Matcher inappropriate_;
};

const char* ContentCategoryName(ContentCategory category);

}  // namespace jdguard
