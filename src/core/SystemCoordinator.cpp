/* @file SystemCoordinator.cpp
 * @brief process-level lifecycle around one sweep run
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>

// 3rd-party headers
#include <spdlog/spdlog.h>

// VibroSweep headers
#include "acq/AcquisitionSource.hpp"
#include "acq/KeepAliveTask.hpp"
#include "core/CommandLine.hpp"
#include "core/Errors.hpp"
#include "core/SystemCoordinator.hpp"
#include "io/SerialChannel.hpp"
#include "ui/OperatorGate.hpp"

using namespace vsweep::core;

namespace {
  constexpr std::chrono::milliseconds kKeepAliveInterval{ 1000 };

  const char* toString(int s) {
    static const char* names[] = { "BOOT", "INIT", "RUNNING", "FINISHED", "ERROR" };
    return (s >= 0 && s < 5) ? names[s] : "UNKNOWN";
  }
} // namespace

SystemCoordinator::SystemCoordinator(SourceRegistry registry, std::istream& in, std::ostream& out)
    : registry_(std::move(registry)), in_(in), out_(out),
      errorMonitor_(std::make_shared<ErrorMonitor>()),
      makeChannel_([] { return std::make_unique<io::SerialChannel>(); }) {
  errorMonitor_->registerEscalation(
      [this](const std::string& reason) { handleError(reason); });
}

SystemCoordinator::~SystemCoordinator() { shutdown(); }

void SystemCoordinator::setChannelFactory(SweepOrchestrator::ChannelFactory factory) {
  if (!factory)
    throw std::invalid_argument("[SystemCoordinator] channel factory is empty");
  makeChannel_ = std::move(factory);
}

void SystemCoordinator::setOperatorGate(std::unique_ptr<ui::OperatorGate> gate) {
  gate_ = std::move(gate);
}

const SweepConfig& SystemCoordinator::config() const {
  if (!config_)
    throw std::logic_error("[SystemCoordinator] not initialized");
  return *config_;
}

void SystemCoordinator::initialize(const CommandLineOptions& options) {
  config_.emplace(
      SweepConfig::load(options.measureConfig, options.deviceConfig, options.outputDir));

  const BoardConfig& board = config_->device().board;
  source_ = registry_.create(board.backendName(), board);
  source_->start();
  spdlog::info("Acquisition: {}", source_->description());

  if (board.keepAlive) {
    keepAlive_ = std::make_unique<acq::KeepAliveTask>(*source_, kKeepAliveInterval, errorMonitor_);
    keepAlive_->start();
  }

  if (!gate_)
    gate_ = std::make_unique<ui::ConsoleGate>(in_, out_);

  transitionTo(State::INIT);
}

int SystemCoordinator::run() {
  if (currentState_ != State::INIT)
    throw std::logic_error("[SystemCoordinator] run() before initialize()");

  transitionTo(State::RUNNING);
  SweepOrchestrator orchestrator(*config_, *source_, *gate_, makeChannel_, errorMonitor_, out_,
                                 timing_);
  orchestrator.setCancelFlag(cancel_);

  const bool completed = orchestrator.run();
  shutdown();

  if (completed && !errorMonitor_->hasFailures()) {
    transitionTo(State::FINISHED);
    return kExitOk;
  }

  transitionTo(State::ERROR);
  if (cancel_ && cancel_->load())
    return kExitInterrupted;
  return kExitFailure;
}

void SystemCoordinator::shutdown() {
  if (keepAlive_) {
    keepAlive_->stop();
    keepAlive_.reset();
  }
  if (source_)
    source_->stop();
}

void SystemCoordinator::transitionTo(State next) {
  spdlog::debug("[SystemCoordinator] {} -> {}", ::toString(static_cast<int>(currentState_)),
                ::toString(static_cast<int>(next)));
  currentState_ = next;
}

void SystemCoordinator::handleError(const std::string& reason) {
  spdlog::debug("[SystemCoordinator] failure escalated: {}", reason);
}
