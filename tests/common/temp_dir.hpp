#ifndef SITEBUILD_TESTS_COMMON_TEMP_DIR_HPP_
#define SITEBUILD_TESTS_COMMON_TEMP_DIR_HPP_

#include "assertions.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#include <unistd.h>

namespace sitebuild::tests::common {

// Unique per process and per call, so ctest can run test binaries in
// parallel and one binary can create several roots within a millisecond.
inline std::filesystem::path CreateUniqueTempDir(std::string_view prefix) {
  static std::atomic<std::uint64_t> counter{0};
  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  const std::filesystem::path root =
      std::filesystem::temp_directory_path() /
      (std::string(prefix) + "-" + std::to_string(::getpid()) + "-" + std::to_string(now_ms) +
       "-" + std::to_string(counter.fetch_add(1U)));

  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  if (ec) {
    Fail("failed to create temp root: " + root.string());
  }
  return root;
}

inline void RemovePathBestEffort(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
}

// Removes the directory when the owning test scope ends, pass or fail.
class ScopedTempDir {
public:
  explicit ScopedTempDir(std::string_view prefix) : path_(CreateUniqueTempDir(prefix)) {}
  ~ScopedTempDir() {
    RemovePathBestEffort(path_);
  }

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const std::filesystem::path& path() const {
    return path_;
  }

private:
  std::filesystem::path path_;
};

} // namespace sitebuild::tests::common

#endif // SITEBUILD_TESTS_COMMON_TEMP_DIR_HPP_
