#pragma once
/** @file  Logging.hpp
 *  @brief spdlog setup shared by the executable and the tests.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <spdlog/common.h>

namespace vsweep::core {

  /// 0 → info, 1 → debug, 2+ → trace.
  spdlog::level::level_enum levelForVerbosity(int verbosity);

  /// Installs the console pattern and the level for @p verbosity.
  void configureLogging(int verbosity);

} // namespace vsweep::core
