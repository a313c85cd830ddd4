#include "server/policy/output_validator.h"

#include "server/logging/logger.h"
#include "server/policy/input_validator.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace jdguard {

namespace {

constexpr char kBulletChar[] = "\xE2\x80\xA2";  // U+2022

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool IsSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

std::size_t CountWords(const std::string& text) {
  std::size_t words = 0;
  bool in_word = false;
  for (char c : text) {
    if (IsSpace(c)) {
      in_word = false;
    } else if (!in_word) {
      in_word = true;
      ++words;
    }
  }
  return words;
}

bool LineStartsWithBullet(const std::string& line) {
  std::size_t i = 0;
  while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) {
    ++i;
  }
  std::size_t marker_len = 0;
  if (i < line.size() && (line[i] == '-' || line[i] == '*')) {
    marker_len = 1;
  } else if (line.compare(i, sizeof(kBulletChar) - 1, kBulletChar) == 0) {
    marker_len = sizeof(kBulletChar) - 1;
  }
  if (marker_len == 0) {
    return false;
  }
  std::size_t after = i + marker_len;
  return after < line.size() && IsSpace(line[after]);
}

std::string StripDecoration(const std::string& value) {
  const char* kDecoration = " \t\r*#_";
  auto start = value.find_first_not_of(kDecoration);
  if (start == std::string::npos) {
    return "";
  }
  auto end = value.find_last_not_of(kDecoration);
  return value.substr(start, end - start + 1);
}

}  // namespace

const std::vector<std::string>& OutputValidator::ExpectedSections() {
  static const std::vector<std::string> kSections{
      "Job Title", "Job Summary", "Responsibilities", "Skills"};
  return kSections;
}

std::vector<std::string> FindSections(const std::string& text) {
  auto lower = ToLower(text);
  std::vector<std::string> found;
  for (const auto& section : OutputValidator::ExpectedSections()) {
    if (lower.find(ToLower(section)) != std::string::npos) {
      found.push_back(section);
    }
  }
  return found;
}

bool HasBulletPoints(const std::string& text) {
  std::istringstream lines(text);
  std::string line;
  while (std::getline(lines, line)) {
    if (LineStartsWithBullet(line)) {
      return true;
    }
  }
  return false;
}

std::string ExtractJobTitle(const std::string& text) {
  std::istringstream lines(text);
  std::string line;
  while (std::getline(lines, line)) {
    auto lower = ToLower(line);
    auto label = lower.find("job title");
    if (label == std::string::npos) {
      continue;
    }
    auto colon = line.find(':', label);
    if (colon == std::string::npos) {
      continue;
    }
    return StripDecoration(line.substr(colon + 1));
  }
  return "";
}

OutputValidator::OutputValidator(std::size_t min_length, std::size_t max_length)
    : min_length_(min_length), max_length_(max_length) {}

OutputCheck OutputValidator::Validate(const std::string& text) const {
  OutputCheck check;
  if (text.size() < min_length_) {
    check.reason = "Generated output is too short";
    check.detail = RejectionDetail::kOutputTooShort;
    return check;
  }
  check.text = text;
  if (text.size() > max_length_) {
    log::Warn("output_validator", "Output length exceeds maximum, truncating",
              "length=" + std::to_string(text.size()) +
                  " max=" + std::to_string(max_length_));
    check.text.resize(max_length_);
    check.truncated = true;
  }
  if (FindSections(check.text).size() < kMinSections) {
    check.reason = "Generated output doesn't match expected format";
    check.detail = RejectionDetail::kFormatMismatch;
    return check;
  }
  check.valid = true;
  return check;
}

QualityMetrics OutputValidator::Quality(const std::string& text) const {
  QualityMetrics metrics;
  metrics.length = text.size();
  metrics.word_count = CountWords(text);
  metrics.sections_found = FindSections(text);
  metrics.has_bullet_points = HasBulletPoints(text);
  metrics.quality_score = std::min(100.0, static_cast<double>(metrics.word_count) / 5.0);
  metrics.job_title = ExtractJobTitle(text);
  metrics.job_title_valid =
      !metrics.job_title.empty() && InputValidator::ValidateJobTitle(metrics.job_title);
  return metrics;
}

}  // namespace jdguard
