#include "staging/file_copier.hpp"

#include "core/fs_utils.hpp"
#include "core/size_format.hpp"
#include "staging/directory_ensurer.hpp"

#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace sitebuild::staging {

namespace {

StepResult RecordCopyFailure(BuildContext& context, const fs::path& source,
                             const fs::path& destination, const std::string& message,
                             StepStatus status) {
  const std::string summary =
      "Failed to copy file: " + source.string() + " -> " + destination.string();
  context.logger.Error(summary, {{"source", source.string()},
                                 {"destination", destination.string()},
                                 {"error", message}});
  context.stats.RecordError(FileCopyError{source, destination, message});
  return {status, summary + ": " + message};
}

} // namespace

StepResult CopyFile(BuildContext& context, const fs::path& source, const fs::path& destination) {
  const StepResult parent = EnsureDirectory(context, destination.parent_path());
  if (!parent.ok()) {
    return RecordCopyFailure(context, source, destination, parent.error, StepStatus::kFatal);
  }

  std::string error;
  std::string content;
  if (!core::ReadFileBytes(source, content, error)) {
    return RecordCopyFailure(context, source, destination, error, StepStatus::kRecorded);
  }

  if (!core::WriteFileBytes(destination, content, core::kFilePerms, error)) {
    return RecordCopyFailure(context, source, destination, error, StepStatus::kRecorded);
  }

  std::error_code ec;
  const std::uintmax_t size = fs::file_size(destination, ec);
  if (ec) {
    return RecordCopyFailure(context, source, destination,
                             "failed to stat '" + destination.string() + "': " + ec.message(),
                             StepStatus::kRecorded);
  }

  const std::string relative_path =
      destination.lexically_relative(context.config.output_root).generic_string();
  context.stats.RecordFile(relative_path, size);
  context.logger.Success("Copied: " + relative_path + " (" + core::FormatSize(size) + ")");
  return StepResult::Ok();
}

} // namespace sitebuild::staging
