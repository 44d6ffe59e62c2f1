#pragma once

#include "staging/build_stats.hpp"

#include <filesystem>
#include <string>

namespace sitebuild::artifacts {

// Writes a JSON manifest describing one finished build.
//
// Contract:
// - `output_root` is the staged tree the ledger's FileRecords are relative to.
// - Every recorded file is re-read from `output_root` and hashed with
//   FNV-1a 64-bit; entries are sorted by path.
// - Ledger totals, warnings and errors are included verbatim.
// - `manifest_path` is written atomically (temp file + rename).
// - Returns false and populates `error` on failure.
bool WriteBuildManifestJson(const staging::BuildStats& stats,
                            const std::filesystem::path& output_root,
                            const std::filesystem::path& manifest_path, std::string& error);

} // namespace sitebuild::artifacts
