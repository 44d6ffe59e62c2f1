#include "staging/orchestrator.hpp"

#include "core/errors/exit_codes.hpp"
#include "core/time_utils.hpp"
#include "staging/build_summary.hpp"
#include "staging/cleaner.hpp"
#include "staging/directory_ensurer.hpp"
#include "staging/file_copier.hpp"
#include "staging/tree_copier.hpp"

#include <exception>
#include <filesystem>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace sitebuild::staging {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);

int AbortBuild(BuildContext& context, const std::string& reason) {
  context.logger.Error("Build aborted", {{"error", reason}});
  LogBuildSummary(context);
  return kExitFailure;
}

int FinalStatus(BuildContext& context) {
  if (context.stats.HasErrors()) {
    context.logger.Error("Build completed with errors",
                         {{"errors", std::to_string(context.stats.Errors().size())}});
    return kExitFailure;
  }
  if (context.stats.FilesProcessed() == 0U) {
    context.logger.Warn("Build completed but no files were processed");
    return kExitFailure;
  }
  context.logger.Success("Build completed successfully!");
  return kExitSuccess;
}

int RunBuildSteps(BuildContext& context) {
  const BuildConfig& config = context.config;

  context.logger.Info("Starting build process...",
                      {{"started_at", core::FormatUtcTimestamp(config.started_at)}});
  context.logger.Info("Source: " + config.source_root.string());
  context.logger.Info("Destination: " + config.output_root.string());

  const StepResult clean = CleanOutputRoot(context);
  if (!clean.ok()) {
    return AbortBuild(context, clean.error);
  }

  const StepResult output_root = EnsureDirectory(context, config.output_root);
  if (!output_root.ok()) {
    return AbortBuild(context, output_root.error);
  }

  const std::uint64_t html_count = CopyHtmlFiles(context);
  if (html_count == 0U) {
    context.logger.Warn("No HTML files were copied");
  }

  const std::uint64_t asset_count = CopyAssetDirectories(context);
  context.logger.Info("Total asset files copied: " + std::to_string(asset_count));

  LogBuildSummary(context);
  return FinalStatus(context);
}

} // namespace

std::uint64_t CopyHtmlFiles(BuildContext& context) {
  context.logger.Info("Copying HTML files...");
  std::uint64_t copied = 0;

  for (const auto& html_file : context.config.html_files) {
    const fs::path source_path = context.config.source_root / html_file;
    const fs::path dest_path = context.config.output_root / html_file;

    std::error_code ec;
    if (!fs::exists(source_path, ec)) {
      context.logger.Warn("HTML file not found: " + html_file);
      context.stats.RecordWarning("HTML file not found: " + html_file);
      continue;
    }

    // Failures are already in the ledger; the remaining HTML files still run.
    if (CopyFile(context, source_path, dest_path).ok()) {
      ++copied;
    }
  }

  return copied;
}

std::uint64_t CopyAssetDirectories(BuildContext& context) {
  context.logger.Info("Copying static assets...");
  std::uint64_t total = 0;

  for (const auto& asset_dir : context.config.asset_dirs) {
    context.logger.Info("Processing asset directory: " + asset_dir);
    const std::uint64_t copied = CopyTree(context, context.config.source_root / asset_dir,
                                          context.config.output_root / asset_dir);
    if (copied > 0U) {
      context.logger.Success("Copied " + std::to_string(copied) + " files from " + asset_dir +
                             "/");
    }
    total += copied;
  }

  return total;
}

int RunBuild(BuildContext& context) {
  try {
    return RunBuildSteps(context);
  } catch (const std::exception& ex) {
    context.logger.Error("Build process failed", {{"error", ex.what()}});
    context.stats.RecordError(BuildFailure{ex.what()});
  }

  try {
    LogBuildSummary(context);
  } catch (const std::exception& ex) {
    context.logger.Error("Failed to log build summary", {{"error", ex.what()}});
  }
  return kExitFailure;
}

} // namespace sitebuild::staging
