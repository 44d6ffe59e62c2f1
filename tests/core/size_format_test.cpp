#include "core/size_format.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>

using sitebuild::core::FormatSize;

TEST_CASE("FormatSize renders zero as bytes", "[core][size_format]") {
  REQUIRE(FormatSize(0) == "0 Bytes");
}

TEST_CASE("FormatSize picks the largest whole unit", "[core][size_format]") {
  REQUIRE(FormatSize(1) == "1 Bytes");
  REQUIRE(FormatSize(1023) == "1023 Bytes");
  REQUIRE(FormatSize(1024) == "1 KB");
  REQUIRE(FormatSize(1536) == "1.5 KB");
  REQUIRE(FormatSize(1048576) == "1 MB");
  REQUIRE(FormatSize(1073741824ULL) == "1 GB");
}

TEST_CASE("FormatSize rounds to two decimals and drops trailing zeros", "[core][size_format]") {
  REQUIRE(FormatSize(1100) == "1.07 KB");
  REQUIRE(FormatSize(2621440) == "2.5 MB");
  REQUIRE(FormatSize(1025) == "1 KB");
}

TEST_CASE("FormatSize clamps to gigabytes", "[core][size_format]") {
  REQUIRE(FormatSize(1099511627776ULL) == "1024 GB");
}

TEST_CASE("FormatSize scaled value is monotonic within a unit", "[core][size_format]") {
  double previous = 0.0;
  for (std::uint64_t bytes = 1024; bytes < 1024 * 1024; bytes += 997) {
    const std::string text = FormatSize(bytes);
    REQUIRE(text.size() > 3U);
    REQUIRE(text.substr(text.size() - 3) == " KB");
    const double value = std::stod(text.substr(0, text.size() - 3));
    REQUIRE(value >= previous);
    previous = value;
  }
}
