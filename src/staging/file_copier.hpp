#pragma once

#include "staging/build_context.hpp"
#include "staging/step_result.hpp"

#include <filesystem>

namespace sitebuild::staging {

// Copies one file byte-for-byte and records it in the ledger.
//
// Contract:
// - Ensures `destination`'s parent directory first. If that fails the
//   directory error is already recorded; a FileCopyError is recorded as well
//   and kFatal is returned so a tree walk stops writing into that directory.
// - Reads `source` fully, writes `destination` with mode 0644, then stats
//   the written file for its authoritative size.
// - Read/write/stat failure: records FileCopyError, logs ERROR, returns
//   kRecorded. Never throws.
// - Success: records a FileRecord relative to the output root, logs SUCCESS.
StepResult CopyFile(BuildContext& context, const std::filesystem::path& source,
                    const std::filesystem::path& destination);

} // namespace sitebuild::staging
