/* @file CommandLine.cpp
 * @brief argv -> CommandLineOptions
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// VibroSweep headers
#include "core/CommandLine.hpp"

using namespace vsweep::core;

namespace {

  std::string requireValue(int argc, const char* const* argv, int& i, const std::string& flag) {
    if (i + 1 >= argc)
      throw UsageError("option " + flag + " needs a value");
    return argv[++i];
  }

  /// `-v`, `-vv`, `-vvv`... ; 0 when @p arg is something else
  int verboseCount(const std::string& arg) {
    if (arg == "--verbose")
      return 1;
    if (arg.size() < 2 || arg[0] != '-' || arg[1] != 'v')
      return 0;
    if (!std::all_of(arg.begin() + 1, arg.end(), [](char c) { return c == 'v'; }))
      return 0;
    return static_cast<int>(arg.size()) - 1;
  }

} // namespace

CommandLineOptions vsweep::core::parseCommandLine(int argc, const char* const* argv) {
  CommandLineOptions opts;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      opts.showHelp = true;
      return opts;
    } else if (arg == "-m" || arg == "--measureconf") {
      opts.measureConfig = requireValue(argc, argv, i, arg);
    } else if (arg == "-d" || arg == "--deviceconf") {
      opts.deviceConfig = requireValue(argc, argv, i, arg);
    } else if (arg == "-o" || arg == "--outdir") {
      opts.outputDir = requireValue(argc, argv, i, arg);
    } else if (int n = verboseCount(arg); n > 0) {
      opts.verbosity = std::min(kMaxVerbosity, opts.verbosity + n);
    } else {
      throw UsageError("unknown argument: " + arg);
    }
  }

  if (opts.measureConfig.empty())
    throw UsageError("missing required option -m/--measureconf");
  if (opts.deviceConfig.empty())
    throw UsageError("missing required option -d/--deviceconf");
  return opts;
}

std::string vsweep::core::usage(const std::string& program) {
  return "Usage: " + program +
         " -m <measureconf> -d <deviceconf> [-o <outdir>] [-v...]\n"
         "\n"
         "Sweeps the vibrotactile stimulator over channel x frequency x volume and\n"
         "records marker-tagged biosignal rows for every combination.\n"
         "\n"
         "  -m, --measureconf PATH  measurement protocol document (required)\n"
         "  -d, --deviceconf PATH   device / board document (required)\n"
         "  -o, --outdir DIR        parent of the Recordings/ directory (default: .)\n"
         "  -v, --verbose           more logging; repeat up to 5 times\n"
         "  -h, --help              show this help\n";
}

BridgeOptions vsweep::core::parseBridgeCommandLine(int argc, const char* const* argv) {
  BridgeOptions opts;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      opts.showHelp = true;
      return opts;
    } else if (arg == "-c" || arg == "--config") {
      opts.deviceConfig = requireValue(argc, argv, i, arg);
    } else if (int n = verboseCount(arg); n > 0) {
      opts.verbosity = std::min(kMaxVerbosity, opts.verbosity + n);
    } else {
      throw UsageError("unknown argument: " + arg);
    }
  }

  if (opts.deviceConfig.empty())
    throw UsageError("missing required option -c/--config");
  return opts;
}

std::string vsweep::core::bridgeUsage(const std::string& program) {
  return "Usage: " + program +
         " -c <deviceconf> [-v...]\n"
         "\n"
         "Streams the EEG rows of the configured BrainFlow board (live or playback)\n"
         "to an LSL outlet until ctrl+c.\n"
         "\n"
         "  -c, --config PATH       device / board document (required)\n"
         "  -v, --verbose           more logging; repeat up to 5 times\n"
         "  -h, --help              show this help\n";
}
