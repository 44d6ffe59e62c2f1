#ifndef SITEBUILD_CORE_FS_UTILS_HPP_
#define SITEBUILD_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

namespace sitebuild::core {

// rw-r--r-- for copied files.
inline constexpr std::filesystem::perms kFilePerms =
    std::filesystem::perms::owner_read | std::filesystem::perms::owner_write |
    std::filesystem::perms::group_read | std::filesystem::perms::others_read;

// rwxr-xr-x for created directories.
inline constexpr std::filesystem::perms kDirectoryPerms =
    std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
    std::filesystem::perms::group_exec | std::filesystem::perms::others_read |
    std::filesystem::perms::others_exec;

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

// Reads a whole file as raw bytes. Content is opaque: no newline translation.
inline bool ReadFileBytes(const std::filesystem::path& path, std::string& bytes,
                          std::string& error) {
  std::ifstream in_file(path, std::ios::binary);
  if (!in_file) {
    error = "failed to open '" + path.string() + "' for reading";
    return false;
  }

  // Unformatted reads turn a streambuf failure (EISDIR, EIO) into badbit
  // instead of letting it escape as an exception.
  bytes.clear();
  char buffer[64 * 1024];
  while (in_file) {
    in_file.read(buffer, sizeof(buffer));
    const std::streamsize read_count = in_file.gcount();
    if (read_count > 0) {
      bytes.append(buffer, static_cast<std::size_t>(read_count));
    }
  }

  if (in_file.bad()) {
    bytes.clear();
    error = "failed while reading '" + path.string() + "'";
    return false;
  }

  return true;
}

// Writes `bytes` to `path` (truncating) and applies `perms` to the result.
inline bool WriteFileBytes(const std::filesystem::path& path, std::string_view bytes,
                           std::filesystem::perms perms, std::string& error) {
  {
    std::ofstream out_file(path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open '" + path.string() + "' for writing";
      return false;
    }

    out_file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out_file.flush();
    if (!out_file) {
      error = "failed while writing '" + path.string() + "'";
      return false;
    }
  }

  std::error_code ec;
  std::filesystem::permissions(path, perms, std::filesystem::perm_options::replace, ec);
  if (ec) {
    error = "failed to set permissions on '" + path.string() + "': " + ec.message();
    return false;
  }

  return true;
}

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent_dir, ec);
  if (ec) {
    error = "failed to create directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }

  return true;
}

// Best-effort atomic text file write for report artifacts that live outside
// the staged tree: content goes to a temp sibling first and is renamed into
// place, so a reader never sees a half-written report.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildAtomicTempPath(output_path);
  if (!WriteFileBytes(temp_path, text, kFilePerms, error)) {
    std::error_code cleanup_ec;
    (void)std::filesystem::remove(temp_path, cleanup_ec);
    return false;
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

} // namespace sitebuild::core

#endif // SITEBUILD_CORE_FS_UTILS_HPP_
