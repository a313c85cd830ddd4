#include "server/policy/content_filter.h"

#include "server/config/guardrail_config.h"
#include "server/logging/logger.h"
#include "server/policy/sanitizer.h"

namespace jdguard {

namespace {
constexpr auto kRegexFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
constexpr std::size_t kLogPreviewChars = 100;
}  // namespace

const char* ContentCategoryName(ContentCategory category) {
  switch (category) {
    case ContentCategory::kNone:
      return "none";
    case ContentCategory::kMalicious:
      return "malicious";
    case ContentCategory::kInappropriate:
      return "inappropriate";
  }
  return "unknown";
}

ContentFilter::Matcher ContentFilter::Compile(const std::vector<std::string>& patterns,
                                              bool enabled, const char* category) {
  Matcher matcher;
  matcher.enabled = enabled;
  std::string combined;
  for (const auto& pattern : patterns) {
    if (pattern.empty()) {
      continue;
    }
    try {
      std::regex compiled(pattern, kRegexFlags);
    } catch (const std::regex_error& e) {
      throw ConfigError(std::string("invalid ") + category + " pattern '" + pattern +
                        "': " + e.what());
    }
    if (!combined.empty()) {
      combined += "|";
    }
    combined += "(?:" + pattern + ")";
    ++matcher.pattern_count;
  }
  if (matcher.pattern_count > 0) {
    try {
      matcher.regex = std::regex(combined, kRegexFlags);
    } catch (const std::regex_error& e) {
      throw ConfigError(std::string("invalid combined ") + category + " patterns: " + e.what());
    }
  }
  return matcher;
}

ContentFilter::ContentFilter(const std::vector<std::string>& malicious_patterns,
                             const std::vector<std::string>& inappropriate_patterns,
                             bool malicious_enabled, bool inappropriate_enabled)
    : malicious_(Compile(malicious_patterns, malicious_enabled, "malicious")),
      inappropriate_(Compile(inappropriate_patterns, inappropriate_enabled, "inappropriate")) {}

bool ContentFilter::IsSafe(const std::string& text, std::string* reason,
                           ContentCategory* category) const {
  std::smatch match;
  if (malicious_.Active() && std::regex_search(text, match, malicious_.regex)) {
    log::Warn("content_filter", "Malicious content detected",
              "match=" + log::Preview(match.str(0), kLogPreviewChars) +
                  " text=" + log::Preview(text, kLogPreviewChars));
    if (reason) {
      *reason = "Input contains potentially malicious content";
    }
    if (category) {
      *category = ContentCategory::kMalicious;
    }
    return false;
  }
  if (inappropriate_.Active() && std::regex_search(text, match, inappropriate_.regex)) {
    log::Warn("content_filter", "Inappropriate content detected",
              "match=" + log::Preview(match.str(0), kLogPreviewChars) +
                  " text=" + log::Preview(text, kLogPreviewChars));
    if (reason) {
      *reason = "Input contains inappropriate content";
    }
    if (category) {
      *category = ContentCategory::kInappropriate;
    }
    return false;
  }
  if (category) {
    *category = ContentCategory::kNone;
  }
  return true;
}

std::string ContentFilter::Sanitize(const std::string& text) const { return SanitizeText(text); }

bool ContentFilter::Enabled() const { return malicious_.Active() || inappropriate_.Active(); }

const ContentFilter::Matcher* ContentFilter::Find(ContentCategory category) const {
  switch (category) {
    case ContentCategory::kMalicious:
      return &malicious_;
    case ContentCategory::kInappropriate:
      return &inappropriate_;
    case ContentCategory::kNone:
      break;
  }
  return nullptr;
}

bool ContentFilter::CategoryEnabled(ContentCategory category) const {
  const auto* matcher = Find(category);
  return matcher != nullptr && matcher->Active();
}

std::size_t ContentFilter::PatternCount(ContentCategory category) const {
  const auto* matcher = Find(category);
  return matcher == nullptr ? 0 : matcher->pattern_count;
}

}  // namespace jdguard
