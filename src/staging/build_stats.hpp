#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace sitebuild::staging {

struct DirectoryCreateError {
  std::filesystem::path path;
  std::string message;
};

struct FileCopyError {
  std::filesystem::path source;
  std::filesystem::path destination;
  std::string message;
};

struct DirectoryCopyError {
  std::filesystem::path directory;
  std::string message;
};

struct CleanError {
  std::string message;
};

// Config rejection or an unexpected failure caught at the top of a build.
struct BuildFailure {
  std::string message;
};

using ErrorRecord =
    std::variant<DirectoryCreateError, FileCopyError, DirectoryCopyError, CleanError, BuildFailure>;

// Stable kind tag used in summaries and the manifest.
const char* KindOf(const ErrorRecord& record);

// Single-line JSON object with the record's kind and every context field.
std::string ToJson(const ErrorRecord& record);

struct FileRecord {
  // Relative to the output root, '/'-separated.
  std::string path;
  std::uintmax_t size = 0;
  std::string formatted_size;
};

// Ledger for one build run. Sequences are append-only; `files_processed` and
// `total_size` only move through RecordFile so they always agree with `files`.
class BuildStats {
public:
  void RecordFile(std::string relative_path, std::uintmax_t size);
  void RecordDirectory(std::filesystem::path path);
  void RecordWarning(std::string warning);
  void RecordError(ErrorRecord record);

  std::uint64_t FilesProcessed() const {
    return files_processed_;
  }

  std::uintmax_t TotalSize() const {
    return total_size_;
  }

  const std::vector<FileRecord>& Files() const {
    return files_;
  }

  const std::vector<std::filesystem::path>& Directories() const {
    return directories_;
  }

  const std::vector<std::string>& Warnings() const {
    return warnings_;
  }

  const std::vector<ErrorRecord>& Errors() const {
    return errors_;
  }

  bool HasErrors() const {
    return !errors_.empty();
  }

private:
  std::uint64_t files_processed_ = 0;
  std::uintmax_t total_size_ = 0;
  std::vector<ErrorRecord> errors_;
  std::vector<std::string> warnings_;
  std::vector<std::filesystem::path> directories_;
  std::vector<FileRecord> files_;
};

} // namespace sitebuild::staging
