#include "staging/directory_ensurer.hpp"

#include "core/fs_utils.hpp"

#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace sitebuild::staging {

namespace {

// Log paths relative to the working directory when that is shorter to read.
std::string DisplayPath(const fs::path& path) {
  std::error_code ec;
  const fs::path cwd = fs::current_path(ec);
  if (ec) {
    return path.string();
  }
  const fs::path relative = path.lexically_relative(cwd);
  if (relative.empty() || *relative.begin() == "..") {
    return path.string();
  }
  return relative.string();
}

} // namespace

StepResult EnsureDirectory(BuildContext& context, const fs::path& path) {
  std::error_code ec;
  if (fs::exists(fs::symlink_status(path, ec))) {
    return StepResult::Ok();
  }

  // Remember which ancestors are about to be created so they receive the same
  // mode as the leaf instead of whatever the umask leaves.
  std::vector<fs::path> missing;
  for (fs::path cursor = path; !cursor.empty(); cursor = cursor.parent_path()) {
    std::error_code probe_ec;
    if (fs::exists(fs::symlink_status(cursor, probe_ec))) {
      break;
    }
    missing.push_back(cursor);
    if (cursor == cursor.parent_path()) {
      break;
    }
  }

  std::string message;
  ec.clear();
  fs::create_directories(path, ec);
  if (ec) {
    message = ec.message();
  } else {
    for (const auto& created : missing) {
      fs::permissions(created, core::kDirectoryPerms, fs::perm_options::replace, ec);
      if (ec) {
        message = "failed to set permissions on '" + created.string() + "': " + ec.message();
        break;
      }
    }
  }

  if (!message.empty()) {
    context.logger.Error("Failed to create directory: " + path.string(),
                         {{"path", path.string()}, {"error", message}});
    context.stats.RecordError(DirectoryCreateError{path, message});
    return StepResult::Fatal("Failed to create directory: " + path.string() + ": " + message);
  }

  context.logger.Info("Created directory: " + DisplayPath(path));
  context.stats.RecordDirectory(path);
  return StepResult::Ok();
}

} // namespace sitebuild::staging
