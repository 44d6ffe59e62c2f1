#pragma once

#include "staging/build_config.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sitebuild::cli {

// Parses `build` arguments into BuildOptions. Repeated `--asset-dir` and
// `--html` flags replace the default lists rather than extending them.
// Unknown flags, stray positionals and missing values are usage errors.
bool ParseBuildOptions(const std::vector<std::string_view>& args, staging::BuildOptions& options,
                       std::string& error);

// Runs one build through the same pipeline the `build` subcommand uses and
// writes the manifest when requested. Returns the process exit code.
int ExecuteBuild(const staging::BuildOptions& options);

// Routes `sitebuild` subcommands and returns process exit codes with a stable
// contract for scripts and CI:
//   0 => build succeeded
//   1 => build failed, recorded errors, or processed no files
//   2 => usage error (unknown command / invalid args / invalid config)
int Dispatch(int argc, char** argv);

} // namespace sitebuild::cli
