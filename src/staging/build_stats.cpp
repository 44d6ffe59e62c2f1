#include "staging/build_stats.hpp"

#include "core/json_utils.hpp"
#include "core/size_format.hpp"

#include <type_traits>
#include <utility>

namespace sitebuild::staging {

namespace {

template <class>
inline constexpr bool kAlwaysFalse = false;

} // namespace

const char* KindOf(const ErrorRecord& record) {
  return std::visit(
      [](const auto& alternative) -> const char* {
        using T = std::decay_t<decltype(alternative)>;
        if constexpr (std::is_same_v<T, DirectoryCreateError>) {
          return "directory_create";
        } else if constexpr (std::is_same_v<T, FileCopyError>) {
          return "file_copy";
        } else if constexpr (std::is_same_v<T, DirectoryCopyError>) {
          return "directory_copy";
        } else if constexpr (std::is_same_v<T, CleanError>) {
          return "clean";
        } else if constexpr (std::is_same_v<T, BuildFailure>) {
          return "build";
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled ErrorRecord alternative");
        }
      },
      record);
}

std::string ToJson(const ErrorRecord& record) {
  std::string json = "{" + core::JsonStringField("kind", KindOf(record));

  std::visit(
      [&json](const auto& alternative) {
        using T = std::decay_t<decltype(alternative)>;
        if constexpr (std::is_same_v<T, DirectoryCreateError>) {
          json += "," + core::JsonStringField("path", alternative.path.string());
        } else if constexpr (std::is_same_v<T, FileCopyError>) {
          json += "," + core::JsonStringField("source", alternative.source.string());
          json += "," + core::JsonStringField("destination", alternative.destination.string());
        } else if constexpr (std::is_same_v<T, DirectoryCopyError>) {
          json += "," + core::JsonStringField("directory", alternative.directory.string());
        } else if constexpr (std::is_same_v<T, CleanError>) {
          json += "," + core::JsonStringField("operation", "clean");
        }
        json += "," + core::JsonStringField("error", alternative.message);
      },
      record);

  json += "}";
  return json;
}

void BuildStats::RecordFile(std::string relative_path, std::uintmax_t size) {
  ++files_processed_;
  total_size_ += size;
  files_.push_back(FileRecord{std::move(relative_path), size, core::FormatSize(size)});
}

void BuildStats::RecordDirectory(std::filesystem::path path) {
  directories_.push_back(std::move(path));
}

void BuildStats::RecordWarning(std::string warning) {
  warnings_.push_back(std::move(warning));
}

void BuildStats::RecordError(ErrorRecord record) {
  errors_.push_back(std::move(record));
}

} // namespace sitebuild::staging
