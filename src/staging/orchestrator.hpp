#pragma once

#include "staging/build_context.hpp"

#include <cstdint>

namespace sitebuild::staging {

// Copies each configured HTML file from the source root to the output root.
// A missing source file is a warning, not an error. Returns the number copied.
std::uint64_t CopyHtmlFiles(BuildContext& context);

// Mirrors each configured asset directory that exists under the source root.
// Returns the total number of files copied across all of them.
std::uint64_t CopyAssetDirectories(BuildContext& context);

// Runs one full clean build:
//   clean -> ensure output root -> HTML files -> asset dirs -> summary.
//
// Returns the process exit status:
//   1 if the clean or output-root creation failed (nothing further is copied),
//   1 if the ledger holds any error,
//   1 if no file was processed,
//   0 otherwise.
// The summary is logged on every path, including aborts, so accumulated
// warnings and errors are always reported.
int RunBuild(BuildContext& context);

} // namespace sitebuild::staging
