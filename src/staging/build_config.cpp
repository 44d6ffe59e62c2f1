#include "staging/build_config.hpp"

#include <string_view>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace sitebuild::staging {

namespace {

bool ResolveAbsolute(const fs::path& base, const fs::path& raw, fs::path& resolved,
                     std::string& error) {
  if (raw.empty()) {
    error = "path cannot be empty";
    return false;
  }

  std::error_code ec;
  const fs::path joined = raw.is_absolute() ? raw : base / raw;
  resolved = fs::absolute(joined, ec);
  if (ec) {
    error = "failed to resolve absolute path for '" + joined.string() + "': " + ec.message();
    return false;
  }
  resolved = resolved.lexically_normal();

  // "dist/" normalizes to "dist/" with an empty filename; drop the separator
  // so relative-path math and ancestor checks see a plain directory path.
  if (resolved.has_relative_path() && !resolved.has_filename()) {
    resolved = resolved.parent_path();
  }
  return true;
}

bool ValidateEntryName(std::string_view kind, const std::string& name, std::string& error) {
  if (name.empty()) {
    error = std::string(kind) + " name cannot be empty";
    return false;
  }

  const fs::path as_path(name);
  if (as_path.is_absolute() || as_path.has_root_path()) {
    error = std::string(kind) + " name must be relative: " + name;
    return false;
  }

  for (const auto& part : as_path) {
    if (part == "..") {
      error = std::string(kind) + " name cannot contain '..': " + name;
      return false;
    }
  }

  return true;
}

// True when `ancestor` is `path` itself or one of its parents.
bool IsSameOrAncestor(const fs::path& ancestor, const fs::path& path) {
  auto ancestor_it = ancestor.begin();
  auto path_it = path.begin();
  for (; ancestor_it != ancestor.end(); ++ancestor_it, ++path_it) {
    if (path_it == path.end() || *ancestor_it != *path_it) {
      return false;
    }
  }
  return true;
}

// Absolute location of a configured entry under the source root, without a
// trailing separator ("css/" and "css" compare the same).
fs::path EntryPath(const fs::path& source_root, const std::string& name) {
  fs::path entry = (source_root / name).lexically_normal();
  if (entry.has_relative_path() && !entry.has_filename()) {
    entry = entry.parent_path();
  }
  return entry;
}

} // namespace

bool MakeBuildConfig(const BuildOptions& options, BuildConfig& config, std::string& error) {
  std::error_code ec;
  fs::path project_root = options.project_root;
  if (project_root.empty()) {
    project_root = fs::current_path(ec);
    if (ec) {
      error = "failed to read current working directory: " + ec.message();
      return false;
    }
  }

  BuildConfig resolved;
  if (!ResolveAbsolute(project_root, options.source_dir, resolved.source_root, error)) {
    error = "invalid source directory: " + error;
    return false;
  }
  if (!ResolveAbsolute(project_root, options.output_dir, resolved.output_root, error)) {
    error = "invalid output directory: " + error;
    return false;
  }

  resolved.asset_dirs = options.asset_dirs;
  resolved.html_files = options.html_files;
  resolved.start_time = std::chrono::steady_clock::now();
  resolved.started_at = std::chrono::system_clock::now();

  if (!ValidateBuildConfig(resolved, error)) {
    return false;
  }

  config = std::move(resolved);
  return true;
}

bool ValidateBuildConfig(const BuildConfig& config, std::string& error) {
  if (config.source_root.empty()) {
    error = "source root cannot be empty";
    return false;
  }
  if (config.output_root.empty()) {
    error = "output root cannot be empty";
    return false;
  }

  for (const auto& asset_dir : config.asset_dirs) {
    if (!ValidateEntryName("asset directory", asset_dir, error)) {
      return false;
    }
  }
  for (const auto& html_file : config.html_files) {
    if (!ValidateEntryName("HTML file", html_file, error)) {
      return false;
    }
  }

  if (IsSameOrAncestor(config.output_root, config.source_root)) {
    error = "output root '" + config.output_root.string() +
            "' must not be the source root or contain it: " + config.source_root.string();
    return false;
  }

  // An output root inside a copied entry would be walked while it is being
  // written, copying the output into itself.
  for (const auto& asset_dir : config.asset_dirs) {
    if (IsSameOrAncestor(EntryPath(config.source_root, asset_dir), config.output_root)) {
      error = "output root '" + config.output_root.string() +
              "' must not be inside asset directory: " + asset_dir;
      return false;
    }
  }
  for (const auto& html_file : config.html_files) {
    if (IsSameOrAncestor(EntryPath(config.source_root, html_file), config.output_root)) {
      error = "output root '" + config.output_root.string() +
              "' must not be inside HTML file path: " + html_file;
      return false;
    }
  }

  return true;
}

} // namespace sitebuild::staging
