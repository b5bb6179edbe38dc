/* @file main.cpp
 * @brief vibrosweep entry point
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <exception>
#include <iostream>
#include <utility>

// Linux headers
#include <signal.h>

// 3rd-party headers
#include <spdlog/spdlog.h>

// VibroSweep headers
#include "core/CommandLine.hpp"
#include "core/Errors.hpp"
#include "core/Logging.hpp"
#include "core/SourceRegistry.hpp"
#include "core/SystemCoordinator.hpp"

namespace {
  // toggled by ctrl+c, polled by the recorder between chunk pulls
  std::atomic<bool> g_stop{ false };

  void onSigint(int) { g_stop.store(true, std::memory_order_relaxed); }
} // namespace

int main(int argc, char** argv) {
  using namespace vsweep::core;

  CommandLineOptions options;
  try {
    options = parseCommandLine(argc, argv);
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n\n" << usage(argv[0]);
    return kExitUsage;
  }
  if (options.showHelp) {
    std::cout << usage(argv[0]);
    return kExitOk;
  }

  configureLogging(options.verbosity);

  SourceRegistry registry;
  registerBuiltinSources(registry);

  SystemCoordinator coordinator(std::move(registry), std::cin, std::cout);
  coordinator.setCancelFlag(&g_stop);

  try {
    coordinator.initialize(options);
  } catch (const ConfigurationError& e) {
    spdlog::critical("Configuration error: {}", e.what());
    return kExitConfig;
  } catch (const std::exception& e) {
    spdlog::critical("Startup failed: {}", e.what());
    return kExitFailure;
  }

  // installed after startup so ctrl+c still kills a stuck stream resolve;
  // no SA_RESTART, so a blocked operator prompt returns too
  struct sigaction sa {};
  sa.sa_handler = onSigint;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  if (sigaction(SIGINT, &sa, nullptr) != 0)
    spdlog::warn("SIGINT handler not installed, ctrl+c will abort without cleanup");

  return coordinator.run();
}
