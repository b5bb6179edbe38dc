/* @file Logging.cpp
 * @brief console log pattern + -v mapping
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// 3rd-party headers
#include <spdlog/spdlog.h>

// VibroSweep headers
#include "core/Logging.hpp"

spdlog::level::level_enum vsweep::core::levelForVerbosity(int verbosity) {
  if (verbosity <= 0)
    return spdlog::level::info;
  if (verbosity == 1)
    return spdlog::level::debug;
  return spdlog::level::trace;
}

void vsweep::core::configureLogging(int verbosity) {
  // Log message format ("pattern")
  spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_level(levelForVerbosity(verbosity));
}
