#pragma once

#include "staging/build_context.hpp"

#include <cstdint>
#include <filesystem>

namespace sitebuild::staging {

// Recursively mirrors `source_dir` into `dest_dir` and returns how many files
// were copied successfully.
//
// Policy:
// - Missing `source_dir`: WARN plus one ledger warning, returns 0. Optional
//   asset folders are expected to be absent.
// - `dest_dir` cannot be created: the error is recorded by EnsureDirectory,
//   a DirectoryCopyError is recorded for `source_dir`, and 0 is returned.
// - Directories recurse; regular files go through CopyFile; symlinks,
//   devices, sockets and FIFOs are skipped with a warning.
// - A listing failure is recorded as DirectoryCopyError and the count so far
//   is returned. One bad subtree never aborts its siblings.
std::uint64_t CopyTree(BuildContext& context, const std::filesystem::path& source_dir,
                       const std::filesystem::path& dest_dir);

} // namespace sitebuild::staging
