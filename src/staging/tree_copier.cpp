#include "staging/tree_copier.hpp"

#include "staging/directory_ensurer.hpp"
#include "staging/file_copier.hpp"

#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace sitebuild::staging {

namespace {

std::uint64_t RecordDirectoryFailure(BuildContext& context, const fs::path& source_dir,
                                     const std::string& message, std::uint64_t copied) {
  context.logger.Error("Failed to copy directory: " + source_dir.string(),
                       {{"directory", source_dir.string()}, {"error", message}});
  context.stats.RecordError(DirectoryCopyError{source_dir, message});
  return copied;
}

} // namespace

std::uint64_t CopyTree(BuildContext& context, const fs::path& source_dir,
                       const fs::path& dest_dir) {
  std::error_code ec;
  if (!fs::exists(source_dir, ec)) {
    context.logger.Warn("Source directory does not exist: " + source_dir.string());
    context.stats.RecordWarning("Directory not found: " + source_dir.string());
    return 0;
  }

  const StepResult dest = EnsureDirectory(context, dest_dir);
  if (!dest.ok()) {
    return RecordDirectoryFailure(context, source_dir, dest.error, 0);
  }

  std::uint64_t copied = 0;
  fs::directory_iterator it(source_dir, ec);
  if (ec) {
    return RecordDirectoryFailure(context, source_dir, ec.message(), copied);
  }

  const fs::directory_iterator end{};
  for (; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }

    const fs::directory_entry& entry = *it;
    const fs::path source_path = entry.path();
    const fs::path dest_path = dest_dir / source_path.filename();

    // Classify without following links so a symlinked directory is skipped
    // rather than walked.
    std::error_code status_ec;
    const fs::file_status status = entry.symlink_status(status_ec);
    if (status_ec) {
      // Only this entry is lost; the rest of the listing still runs.
      RecordDirectoryFailure(context, source_dir,
                             "failed to stat '" + source_path.string() +
                                 "': " + status_ec.message(),
                             copied);
      continue;
    }

    if (fs::is_directory(status)) {
      copied += CopyTree(context, source_path, dest_path);
    } else if (fs::is_regular_file(status)) {
      const StepResult result = CopyFile(context, source_path, dest_path);
      if (result.ok()) {
        ++copied;
      } else if (result.fatal()) {
        return copied;
      }
    } else {
      context.logger.Warn("Skipping non-file/non-directory: " + source_path.string());
      context.stats.RecordWarning("Skipped: " + source_path.string());
    }
  }

  if (ec) {
    return RecordDirectoryFailure(context, source_dir, ec.message(), copied);
  }

  return copied;
}

} // namespace sitebuild::staging
