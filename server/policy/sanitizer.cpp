#include "server/policy/sanitizer.h"

#include <cctype>

namespace jdguard {
namespace {

bool IsSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

// A tag is '<', at least one character other than '>', then '>'.
std::string StripTags(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    if (text[i] == '<') {
      auto close = text.find('>', i + 1);
      if (close != std::string::npos && close > i + 1) {
        i = close + 1;
        continue;
      }
    }
    out.push_back(text[i]);
    ++i;
  }
  return out;
}

std::string CollapseWhitespace(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  bool in_run = false;
  for (char c : text) {
    if (IsSpace(c)) {
      if (!in_run) {
        out.push_back(' ');
        in_run = true;
      }
      continue;
    }
    in_run = false;
    out.push_back(c);
  }
  return out;
}

std::string RemoveSpecialChars(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c == '<' || c == '>' || c == '{' || c == '}') {
      continue;
    }
    out.push_back(c);
  }
  return out;
}

}  // namespace

std::string TrimWhitespace(const std::string& text) {
  std::size_t start = 0;
  while (start < text.size() && IsSpace(text[start])) {
    ++start;
  }
  std::size_t end = text.size();
  while (end > start && IsSpace(text[end - 1])) {
    --end;
  }
  return text.substr(start, end - start);
}

std::string SanitizeText(const std::string& text) {
  auto cleaned = StripTags(text);
  cleaned = CollapseWhitespace(cleaned);
  cleaned = RemoveSpecialChars(cleaned);
  // Removing "{" from "a { b" leaves two adjacent spaces.
  cleaned = CollapseWhitespace(cleaned);
  return TrimWhitespace(cleaned);
}

}  // namespace jdguard
