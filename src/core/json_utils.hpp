#ifndef SITEBUILD_CORE_JSON_UTILS_HPP_
#define SITEBUILD_CORE_JSON_UTILS_HPP_

#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace sitebuild::core {

// JSON string escaping shared by the error-record renderer and the manifest.
inline std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
  return out.str();
}

// `"key":"value"` with the value escaped.
inline std::string JsonStringField(std::string_view key, std::string_view value) {
  return "\"" + std::string(key) + "\":\"" + EscapeJson(value) + "\"";
}

} // namespace sitebuild::core

#endif // SITEBUILD_CORE_JSON_UTILS_HPP_
