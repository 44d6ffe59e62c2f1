#pragma once

#include "core/logging/logger.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sitebuild::staging {

// Raw build request as supplied by the CLI or an in-process caller. Relative
// paths are resolved against `project_root` by MakeBuildConfig.
struct BuildOptions {
  std::filesystem::path project_root;
  std::filesystem::path source_dir = "src";
  std::filesystem::path output_dir = "dist";
  std::vector<std::string> asset_dirs = {"css", "js", "images", "fonts", "assets"};
  std::vector<std::string> html_files = {"index.html"};
  std::optional<std::filesystem::path> manifest_path;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Immutable per-run configuration. Paths are absolute and lexically normal
// before any filesystem work starts.
struct BuildConfig {
  std::filesystem::path source_root;
  std::filesystem::path output_root;
  std::vector<std::string> asset_dirs;
  std::vector<std::string> html_files;
  std::chrono::steady_clock::time_point start_time{};
  std::chrono::system_clock::time_point started_at{};
};

// Resolves `options` into a BuildConfig and validates it.
// Returns false and sets `error` when a path cannot be resolved or the
// resulting config is rejected by ValidateBuildConfig.
bool MakeBuildConfig(const BuildOptions& options, BuildConfig& config, std::string& error);

// Rejects configs that would stage outside the output root or wipe sources:
// - empty source/output roots
// - empty, absolute or `..`-bearing asset/HTML names
// - output root equal to, or an ancestor of, the source root
bool ValidateBuildConfig(const BuildConfig& config, std::string& error);

} // namespace sitebuild::staging
