/**
 * @file csv_utils.hpp
 * @brief CSV field splitting, header normalization and numeric field parsing.
 * @author Watosn
 */
#pragma once

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

namespace onabc::core::csv {

inline std::string trim(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])) != 0) {
    ++b;
  }
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])) != 0) {
    --e;
  }
  return s.substr(b, e - b);
}

inline std::string to_lower(std::string s) {
  for (char& c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return s;
}

/**
 * @brief Split one CSV line on commas, honoring double-quoted fields.
 *
 * A trailing carriage return is dropped so CRLF exports parse like LF ones.
 */
inline std::vector<std::string> split_line(const std::string& line) {
  std::vector<std::string> fields;
  fields.reserve(64);
  std::string token;
  bool quoted = false;
  std::size_t n = line.size();
  if (n > 0 && line[n - 1] == '\r') {
    --n;
  }
  for (std::size_t i = 0; i < n; ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < n && line[i + 1] == '"') {
          token.push_back('"');
          ++i;
        } else {
          quoted = false;
        }
      } else {
        token.push_back(c);
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields.push_back(token);
      token.clear();
    } else {
      token.push_back(c);
    }
  }
  fields.push_back(token);
  return fields;
}

/**
 * @brief Normalize an instrument header to camelCase.
 *
 * "Date local (yyyy/MM/dd)" -> "dateLocal", "Blue BC1" -> "blueBc1",
 * "Relative Humidity (%)" -> "relativeHumidity". Parenthetical units and the
 * whitespace around them are removed, '%' becomes "Percent" and '/', '.', '-'
 * are dropped.
 */
inline std::string normalize_header(const std::string& header) {
  const std::string stripped = trim(header);

  std::string no_parens;
  no_parens.reserve(stripped.size());
  for (std::size_t i = 0; i < stripped.size(); ++i) {
    if (stripped[i] == '(') {
      const std::size_t close = stripped.find(')', i + 1);
      if (close != std::string::npos) {
        while (!no_parens.empty() && std::isspace(static_cast<unsigned char>(no_parens.back())) != 0) {
          no_parens.pop_back();
        }
        i = close;
        while (i + 1 < stripped.size() && std::isspace(static_cast<unsigned char>(stripped[i + 1])) != 0) {
          ++i;
        }
        continue;
      }
    }
    no_parens.push_back(stripped[i]);
  }

  std::vector<std::string> words;
  std::string word;
  for (const char c : no_parens) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      if (!word.empty()) {
        words.push_back(word);
        word.clear();
      }
    } else {
      word.push_back(c);
    }
  }
  if (!word.empty()) {
    words.push_back(word);
  }

  std::string camel;
  for (std::size_t w = 0; w < words.size(); ++w) {
    std::string lowered = to_lower(words[w]);
    if (w > 0 && !lowered.empty()) {
      lowered[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(lowered[0])));
    }
    camel += lowered;
  }

  std::string out;
  out.reserve(camel.size() + 8);
  for (const char c : camel) {
    if (c == '%') {
      out += "Percent";
    } else if (c == '/' || c == '.' || c == '-') {
      continue;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

/**
 * @brief True for the textual missing-value sentinels used by instrument exports.
 */
inline bool is_missing_token(const std::string& trimmed) {
  if (trimmed.empty() || trimmed == "-") {
    return true;
  }
  const std::string lower = to_lower(trimmed);
  return lower == "nan" || lower == "na" || lower == "n/a" || lower == "null" || lower == "none";
}

/**
 * @brief Parse a finite double; nullopt for sentinels, partial parses, NaN and infinities.
 */
inline std::optional<double> parse_number(const std::string& field) {
  const std::string t = trim(field);
  if (is_missing_token(t)) {
    return std::nullopt;
  }
  char* end = nullptr;
  const double v = std::strtod(t.c_str(), &end);
  if (end == t.c_str() || *end != '\0' || !std::isfinite(v)) {
    return std::nullopt;
  }
  return v;
}

}  // namespace onabc::core::csv
