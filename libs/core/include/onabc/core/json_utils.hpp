/**
 * @file json_utils.hpp
 * @brief String escaping for JSON-lines output.
 * @author Watosn
 */
#pragma once

#include <string>

#include <fmt/format.h>

namespace onabc::core::json {

/**
 * @brief Escape a string for use inside a JSON string literal (quotes not included).
 */
inline std::string escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (const char c : s) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20U) {
          out += fmt::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
        } else {
          out += c;
        }
        break;
    }
  }
  return out;
}

}  // namespace onabc::core::json
