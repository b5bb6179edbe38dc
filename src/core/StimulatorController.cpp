/* @file StimulatorController.cpp
 * @brief command round-trips with the stimulator over serial over usb
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <thread>
#include <utility>

// 3rd-party headers
#include <spdlog/spdlog.h>

// VibroSweep headers
#include "core/Errors.hpp"
#include "core/StimulatorController.hpp"

using namespace vsweep::core;
using vsweep::protocols::Command;

StimulatorController::StimulatorController(std::unique_ptr<io::SerialChannel> channel,
                                           std::string port,
                                           std::shared_ptr<ErrorMonitor> errMonitor,
                                           StimulatorTiming timing)
    : channel_(std::move(channel)), port_(std::move(port)), errorMonitor_(std::move(errMonitor)),
      timing_(timing) {
  if (!channel_)
    throw std::invalid_argument("[StimulatorController] serial channel is nullptr");
  if (!errorMonitor_)
    throw std::invalid_argument("[StimulatorController] error monitor is nullptr");

  if (!channel_->open(port_, kDefaultBaud)) {
    std::string errMsg = "[StimulatorController] stimulator not reachable on " + port_;
    errorMonitor_->notifyFailure(errMsg);
    throw DeviceUnreachable(errMsg);
  }
  spdlog::info("Stimulator connected on {}", port_);

  std::this_thread::sleep_for(timing_.warmUp);
}

StimulatorController::~StimulatorController() {
  channel_->close();
  spdlog::info("Serial connection closed.");
}

void StimulatorController::send(const Command& cmd) {
  spdlog::trace("Serial VHP Sent: {}", cmd.payload);

  if (!channel_->writeLine(cmd.toWire())) {
    std::string errMsg = "[StimulatorController] failed to write '" + cmd.payload + "' to " + port_;
    errorMonitor_->notifyFailure(errMsg);
    throw TransportError(errMsg);
  }

  std::this_thread::sleep_for(timing_.settle);
  for (const auto& response : channel_->drainLines())
    spdlog::debug("Serial VHP Received: {}", response);
}

void StimulatorController::setChannel(int channel) { send(Command::channel(channel)); }
void StimulatorController::setVolume(int volume) { send(Command::volume(volume)); }
void StimulatorController::setFrequency(int frequency) { send(Command::frequency(frequency)); }
void StimulatorController::setTestMode(bool enabled) { send(Command::testMode(enabled)); }
void StimulatorController::startStimulation() { send(Command::start()); }
void StimulatorController::stopStimulation() { send(Command::stop()); }

void StimulatorController::setDuration(int ms) { send(Command::duration(ms)); }
void StimulatorController::setCyclePeriod(int ms) { send(Command::cyclePeriod(ms)); }
void StimulatorController::setPauseCyclePeriod(int n) { send(Command::pauseCyclePeriod(n)); }
void StimulatorController::setPausedCycles(int n) { send(Command::pausedCycles(n)); }
void StimulatorController::setJitter(int n) { send(Command::jitter(n)); }
