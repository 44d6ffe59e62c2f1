#pragma once

#include "core/logging/logger.hpp"
#include "staging/build_config.hpp"
#include "staging/build_stats.hpp"

#include <utility>

namespace sitebuild::staging {

// Everything one build run touches. Constructed by the caller and passed by
// reference into every staging step; two contexts never share a ledger.
struct BuildContext {
  BuildContext(BuildConfig build_config, core::logging::Logger& build_logger)
      : config(std::move(build_config)), logger(build_logger) {}

  const BuildConfig config;
  BuildStats stats;
  core::logging::Logger& logger;
};

} // namespace sitebuild::staging
