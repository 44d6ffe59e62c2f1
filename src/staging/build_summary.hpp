#pragma once

#include "staging/build_context.hpp"

namespace sitebuild::staging {

// Logs the end-of-build report: elapsed time, file/byte/directory totals,
// then the numbered warning list, numbered error list and the per-file
// table, each only when non-empty. Reads the ledger without modifying it.
void LogBuildSummary(const BuildContext& context);

} // namespace sitebuild::staging
