#pragma once
/** @file  CommandLine.hpp
 *  @brief `vibrosweep` argument parsing.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>
#include <string>

namespace vsweep::core {

  struct CommandLineOptions {
    std::string measureConfig; ///< -m / --measureconf (required)
    std::string deviceConfig;  ///< -d / --deviceconf (required)
    std::string outputDir{ "." };
    int verbosity{ 0 };        ///< count of -v, capped at kMaxVerbosity
    bool showHelp{ false };
  };

  inline constexpr int kMaxVerbosity = 5;

  /// Bad or missing arguments; `what()` is meant for the user.
  class UsageError : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
  };

  /// Throws `UsageError`; `-h` short-circuits the required-option checks.
  CommandLineOptions parseCommandLine(int argc, const char* const* argv);

  std::string usage(const std::string& program);

  /// `vibrosweep_bridge`: republishes the configured BrainFlow board on LSL.
  struct BridgeOptions {
    std::string deviceConfig; ///< -c / --config (required)
    int verbosity{ 0 };
    bool showHelp{ false };
  };

  BridgeOptions parseBridgeCommandLine(int argc, const char* const* argv);

  std::string bridgeUsage(const std::string& program);

} // namespace vsweep::core
