#pragma once

#include "staging/build_context.hpp"
#include "staging/step_result.hpp"

namespace sitebuild::staging {

// Removes the output root and everything beneath it.
// An absent output root is a no-op. Removal failure is recorded as a
// CleanError, logged, and returned as kFatal: a half-cleaned tree cannot be
// trusted as a build target.
StepResult CleanOutputRoot(BuildContext& context);

} // namespace sitebuild::staging
