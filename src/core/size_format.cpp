#include "core/size_format.hpp"

#include <array>
#include <cstdio>
#include <string_view>

namespace sitebuild::core {

namespace {

constexpr std::array<std::string_view, 4> kUnits = {"Bytes", "KB", "MB", "GB"};
constexpr double kStep = 1024.0;

// Mirrors fixed-point rounding followed by numeric re-parse: "1.50" -> "1.5",
// "2.00" -> "2".
std::string TrimFixedDecimals(std::string text) {
  if (text.find('.') == std::string::npos) {
    return text;
  }
  while (!text.empty() && text.back() == '0') {
    text.pop_back();
  }
  if (!text.empty() && text.back() == '.') {
    text.pop_back();
  }
  return text;
}

} // namespace

std::string FormatSize(std::uintmax_t bytes) {
  if (bytes == 0U) {
    return "0 Bytes";
  }

  std::size_t unit_index = 0;
  double scaled = static_cast<double>(bytes);
  while (scaled >= kStep && unit_index + 1U < kUnits.size()) {
    scaled /= kStep;
    ++unit_index;
  }

  char buffer[64];
  const int written = std::snprintf(buffer, sizeof(buffer), "%.2f", scaled);
  if (written <= 0) {
    return std::to_string(bytes) + " Bytes";
  }

  return TrimFixedDecimals(std::string(buffer, static_cast<std::size_t>(written))) + " " +
         std::string(kUnits[unit_index]);
}

} // namespace sitebuild::core
