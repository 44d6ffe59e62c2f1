#include "sitebuild/cli/router.hpp"

#include "artifacts/build_manifest_writer.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"
#include "staging/build_context.hpp"
#include "staging/orchestrator.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <utility>

namespace fs = std::filesystem;

namespace sitebuild::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  sitebuild build [--root <dir>] [--src <dir>] [--out <dir>] "
         "[--asset-dir <name>]... [--html <file>]... [--manifest <path>] "
         "[--log-level <debug|info|success|warn|error>]\n"
      << "  sitebuild version\n"
      << "  sitebuild help\n";
}

// Shared "--flag <value>" reader so every flag reports missing values the same
// way.
bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view flag,
               std::string_view& value, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  value = args[i + 1];
  ++i;
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "sitebuild 0.1.0\n";
  return kExitSuccess;
}

int CommandBuild(const std::vector<std::string_view>& args) {
  staging::BuildOptions options;
  std::string error;
  if (!ParseBuildOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  return ExecuteBuild(options);
}

} // namespace

bool ParseBuildOptions(const std::vector<std::string_view>& args, staging::BuildOptions& options,
                       std::string& error) {
  bool asset_dirs_overridden = false;
  bool html_files_overridden = false;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;

    if (token == "--root") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.project_root = fs::path(value);
      continue;
    }
    if (token == "--src") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.source_dir = fs::path(value);
      continue;
    }
    if (token == "--out") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.output_dir = fs::path(value);
      continue;
    }
    if (token == "--asset-dir") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      if (!asset_dirs_overridden) {
        options.asset_dirs.clear();
        asset_dirs_overridden = true;
      }
      options.asset_dirs.emplace_back(value);
      continue;
    }
    if (token == "--html") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      if (!html_files_overridden) {
        options.html_files.clear();
        html_files_overridden = true;
      }
      options.html_files.emplace_back(value);
      continue;
    }
    if (token == "--manifest") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.manifest_path = fs::path(value);
      continue;
    }
    if (token == "--log-level") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(value, parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }

    error = "build does not accept positional arguments: " + std::string(token);
    return false;
  }

  return true;
}

int ExecuteBuild(const staging::BuildOptions& options) {
  core::logging::Logger logger(options.log_level);

  staging::BuildConfig config;
  std::string error;
  if (!staging::MakeBuildConfig(options, config, error)) {
    logger.Error("invalid build configuration", {{"error", error}});
    return kExitUsage;
  }

  staging::BuildContext context(std::move(config), logger);
  int exit_code = staging::RunBuild(context);

  if (options.manifest_path.has_value()) {
    fs::path manifest_path = *options.manifest_path;
    if (manifest_path.is_relative() && !options.project_root.empty()) {
      manifest_path = options.project_root / manifest_path;
    }

    if (!artifacts::WriteBuildManifestJson(context.stats, context.config.output_root,
                                           manifest_path, error)) {
      logger.Error("failed to write build manifest", {{"error", error}});
      exit_code = kExitFailure;
    } else {
      logger.Info("Build manifest written", {{"path", manifest_path.string()}});
    }
  }

  return exit_code;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "build") {
    return CommandBuild(args);
  }

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace sitebuild::cli
