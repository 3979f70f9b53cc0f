#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace dcm::core {

// Deterministic ASCII-only text folding used by every matcher.
// Non-ASCII bytes (Arabic or accented aliases) pass through unchanged, so
// multi-byte names still compare byte-for-byte.

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

[[nodiscard]] constexpr bool is_name_separator(const char ch) {
  return ch == '_' || ch == ' ' || ch == '-';
}

// fold_separators maps every name separator (space, hyphen, underscore) to
// `replacement`, so "plan routes", "plan-routes" and "plan_routes" compare equal.
inline std::string fold_separators(const std::string_view input, const char replacement = '_') {
  std::string result;
  result.reserve(input.size());
  for (const char ch : input) {
    result.push_back(is_name_separator(ch) ? replacement : ch);
  }
  return result;
}

// split_words splits on name separators and '.', dropping empty pieces.
// Returns words in encounter order.
inline std::vector<std::string> split_words(const std::string_view input) {
  std::vector<std::string> words;
  std::string current;
  for (const char ch : input) {
    if (is_name_separator(ch) || ch == '.') {
      if (!current.empty()) {
        words.push_back(std::move(current));
        current.clear();
      }
    } else {
      current.push_back(ch);
    }
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

// trim removes leading and trailing whitespace (ASCII space/tab/newline)
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && (input[start] == ' ' || input[start] == '\t' ||
                                  input[start] == '\n' || input[start] == '\r')) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && (input[end - 1] == ' ' || input[end - 1] == '\t' ||
                         input[end - 1] == '\n' || input[end - 1] == '\r')) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

}  // namespace dcm::core
