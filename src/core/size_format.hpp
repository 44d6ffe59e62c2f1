#pragma once

#include <cstdint>
#include <string>

namespace sitebuild::core {

// Human-readable byte count used in copy logs, the summary table and the
// manifest.
//
// Contract:
// - 0 renders as "0 Bytes".
// - Otherwise picks the largest unit in {Bytes, KB, MB, GB} (1024 steps) whose
//   scaled value is >= 1, clamped to GB.
// - Scaled value is rounded to 2 decimals with trailing zeros dropped
//   ("1 KB", "1.5 KB", "2.34 MB").
std::string FormatSize(std::uintmax_t bytes);

} // namespace sitebuild::core
