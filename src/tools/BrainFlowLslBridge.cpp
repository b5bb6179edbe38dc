/* @file BrainFlowLslBridge.cpp
 * @brief vibrosweep_bridge entry point: BrainFlow board -> LSL outlet
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <exception>
#include <iostream>
#include <string>

// Linux headers
#include <signal.h>

// 3rd-party headers
#include <spdlog/spdlog.h>

// VibroSweep headers
#include "acq/BrainFlowSource.hpp"
#include "acq/LslOutlet.hpp"
#include "acq/StreamBridge.hpp"
#include "core/CommandLine.hpp"
#include "core/ConfigLoader.hpp"
#include "core/Errors.hpp"
#include "core/Logging.hpp"
#include "core/SweepConfig.hpp"
#include "core/SystemCoordinator.hpp"

namespace {
  // toggled by ctrl+c, polled by the bridge between chunk pulls
  std::atomic<bool> g_stop{ false };

  void onSigint(int) { g_stop.store(true, std::memory_order_relaxed); }
} // namespace

int main(int argc, char** argv) {
  using namespace vsweep;
  using namespace vsweep::core;

  BridgeOptions options;
  try {
    options = parseBridgeCommandLine(argc, argv);
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n\n" << bridgeUsage(argv[0]);
    return kExitUsage;
  }
  if (options.showHelp) {
    std::cout << bridgeUsage(argv[0]);
    return kExitOk;
  }

  configureLogging(options.verbosity);

  BoardConfig board;
  acq::BrainFlowSourceConfig sourceConfig;
  try {
    spdlog::debug("Reading config from {}", options.deviceConfig);
    ConfigLoader loader(options.deviceConfig);
    board = SweepConfig::parseBoard(loader.load());
    sourceConfig = acq::makeBrainFlowConfig(board);
  } catch (const ConfigurationError& e) {
    spdlog::critical("Configuration error: {}", e.what());
    return kExitConfig;
  }
  // playback replays the file endlessly instead of stopping at its end
  sourceConfig.loopback = sourceConfig.masterBoard.has_value();

  // a ctrl+c during session setup makes the bridge return right away
  struct sigaction sa {};
  sa.sa_handler = onSigint;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  if (sigaction(SIGINT, &sa, nullptr) != 0)
    spdlog::warn("SIGINT handler not installed, ctrl+c will abort without cleanup");

  try {
    // the session is released by the destructor on every path out of this block
    acq::BrainFlowSource source(sourceConfig);
    source.start();

    acq::LslOutletConfig outletConfig;
    outletConfig.streamName = board.streamName.value_or(outletConfig.streamName);
    outletConfig.sourceId = "brainflow_" + std::to_string(source.layoutBoard());
    outletConfig.channelRows = source.eegRows();
    outletConfig.samplingRate = source.samplingRate();
    acq::LslOutlet outlet(outletConfig);
    spdlog::info("Streaming '{}' ({} ch @ {} Hz) until ctrl+c", outletConfig.streamName,
                 outlet.channelCount(), outletConfig.samplingRate);

    acq::StreamBridge bridge(source, outlet);
    bridge.run(g_stop);
    spdlog::info("Stopping stream... {} samples forwarded in {} chunks", bridge.forwarded(),
                 bridge.chunks());
  } catch (const ConfigurationError& e) {
    spdlog::critical("Configuration error: {}", e.what());
    return kExitConfig;
  } catch (const std::exception& e) {
    spdlog::critical("Bridge failed: {}", e.what());
    return kExitFailure;
  }

  return kExitOk;
}
