#include "staging/cleaner.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace sitebuild::staging {

StepResult CleanOutputRoot(BuildContext& context) {
  const fs::path& output_root = context.config.output_root;

  std::error_code ec;
  if (!fs::exists(fs::symlink_status(output_root, ec))) {
    return StepResult::Ok();
  }

  context.logger.Info("Cleaning output directory...", {{"path", output_root.string()}});
  fs::remove_all(output_root, ec);
  if (ec) {
    const std::string message = ec.message();
    context.logger.Error("Failed to clean output directory",
                         {{"path", output_root.string()}, {"error", message}});
    context.stats.RecordError(CleanError{message});
    return StepResult::Fatal("Failed to clean output directory: " + message);
  }

  context.logger.Success("Output directory cleaned");
  return StepResult::Ok();
}

} // namespace sitebuild::staging
