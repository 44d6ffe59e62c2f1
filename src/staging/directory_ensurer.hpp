#pragma once

#include "staging/build_context.hpp"
#include "staging/step_result.hpp"

#include <filesystem>

namespace sitebuild::staging {

// Creates `path` and any missing ancestors with mode 0755.
//
// Contract:
// - Existing entry at `path` (of any type) is a no-op returning kOk.
// - On creation, appends `path` to the ledger's directories and logs INFO.
// - On failure, appends a DirectoryCreateError, logs ERROR and returns
//   kFatal: a missing directory makes every later write into it pointless.
StepResult EnsureDirectory(BuildContext& context, const std::filesystem::path& path);

} // namespace sitebuild::staging
