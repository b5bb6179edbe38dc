/* @file SweepOrchestrator.cpp
 * @brief baseline + sweep phase sequencing against stimulator and acquisition source
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <exception>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

// 3rd-party headers
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

// VibroSweep headers
#include "acq/AcquisitionSource.hpp"
#include "core/Errors.hpp"
#include "core/SweepOrchestrator.hpp"
#include "io/SerialChannel.hpp"
#include "ui/OperatorGate.hpp"

using namespace vsweep::core;
using Seconds = std::chrono::duration<double>;

namespace {
  constexpr const char* kNoContactPrompt = "Place finger(s) 5 cm away from tactors (NO CONTACT)";
  constexpr const char* kContactPrompt = "Place finger(s) ON tactors (CONTACT) - Sweep starts...";
} // namespace

const char* vsweep::core::toString(Phase p) {
  switch (p) {
  case Phase::Idle:
    return "Idle";
  case Phase::DeviceWait:
    return "DeviceWait";
  case Phase::OperatorGate1:
    return "OperatorGate1";
  case Phase::Baseline2:
    return "Baseline2";
  case Phase::OperatorGate2:
    return "OperatorGate2";
  case Phase::Sweep:
    return "Sweep";
  case Phase::Complete:
    return "Complete";
  case Phase::Error:
    return "Error";
  }
  return "Unknown";
}

SweepOrchestrator::SweepOrchestrator(const SweepConfig& config, acq::AcquisitionSource& source,
                                     ui::OperatorGate& gate, ChannelFactory makeChannel,
                                     std::shared_ptr<ErrorMonitor> errMonitor,
                                     std::ostream& console, SweepTiming timing)
    : config_(config), source_(source), gate_(gate), makeChannel_(std::move(makeChannel)),
      errorMonitor_(std::move(errMonitor)), timing_(timing),
      recorder_(config.device().board.channels, timing.pollTimeout), reporter_(console) {
  if (!makeChannel_)
    throw std::invalid_argument("[SweepOrchestrator] channel factory is empty");
  if (!errorMonitor_)
    throw std::invalid_argument("[SweepOrchestrator] error monitor is nullptr");

  const auto dir = config_.recordingsDir();
  const auto& ts = config_.timestamp();
  const auto& board = config_.device().board.id;
  const auto& p = config_.protocol();
  artifacts_.baseline1 = dir / fmt::format("{}_{}_baseline_with_VHP_powered_OFF.csv", ts, board);
  artifacts_.baseline2 =
      dir / fmt::format("{}_{}_baseline_with_VHP_powered_ON_stim_ON_no_contact_c{}_f{}_v{}.csv", ts,
                        board, p.channel.start, p.frequency.start, p.volume.start);
  artifacts_.metadata = dir / fmt::format("{}_metadata.txt", ts);
}

void SweepOrchestrator::setCancelFlag(const std::atomic<bool>* flag) {
  cancel_ = flag;
  recorder_.setCancelFlag(flag);
}

std::filesystem::path SweepOrchestrator::pointFile(const SweepPoint& point) const {
  return config_.recordingsDir() / fmt::format("{}_{}_c{}_f{}_v{}.csv", config_.timestamp(),
                                               config_.device().board.id, point.channel,
                                               point.frequency, point.volume);
}

void SweepOrchestrator::transitionTo(Phase next) {
  spdlog::debug("[SweepOrchestrator] {} -> {}", toString(phase_), toString(next));
  phase_ = next;
}

bool SweepOrchestrator::run() {
  try {
    std::error_code ec;
    std::filesystem::create_directories(config_.recordingsDir(), ec);
    if (ec)
      throw RecordingIOError("cannot create " + config_.recordingsDir().string() + ": " +
                             ec.message());

    if (!checkDevicePresent())
      waitForDevice();

    StimulatorController stim(makeChannel_(), config_.device().stimulatorPort, errorMonitor_,
                              timing_.stimulator);

    transitionTo(Phase::OperatorGate1);
    gate_.waitForReady(kNoContactPrompt);

    transitionTo(Phase::Baseline2);
    recordNoContactBaseline(stim);

    transitionTo(Phase::OperatorGate2);
    gate_.waitForReady(kContactPrompt);

    transitionTo(Phase::Sweep);
    runSweep(stim);

    writeMetadata();
    transitionTo(Phase::Complete);
    spdlog::info("Sweep completed.");
    return true;
  } catch (const std::exception& e) {
    lastError_ = e.what();
    spdlog::error("Error during execution ({}): {}", toString(phase_), lastError_);
    errorMonitor_->notifyFailure(lastError_);
    transitionTo(Phase::Error);
    return false;
  }
}

bool SweepOrchestrator::checkDevicePresent() {
  auto channel = makeChannel_();
  if (!channel->open(config_.device().stimulatorPort, StimulatorController::kDefaultBaud))
    return false;
  std::this_thread::sleep_for(timing_.presenceHold);
  channel->close();
  return true;
}

void SweepOrchestrator::waitForDevice() {
  transitionTo(Phase::DeviceWait);
  spdlog::info("Recording Baseline 1 (waiting for VHP ON)...");

  io::FileLogger file = openRecording(artifacts_.baseline1, true);

  // carried over until a sample actually takes it
  std::optional<int> pending = markers::kDeviceWait;
  do {
    spdlog::info("Waiting for VHP to power ON...");
    if (recorder_.record(source_, timing_.presenceInterval, file, pending))
      pending.reset();
    if (cancel_ && cancel_->load())
      throw RunCancelled();
  } while (!checkDevicePresent());

  spdlog::info("Baseline 1 started");
  recordWithCountdown("Baseline 1", Seconds(config_.protocol().baseline1), file,
                      markers::kBaselineStart);
  closeRecording(file);
  spdlog::info("Baseline 1 completed.");
}

void SweepOrchestrator::recordNoContactBaseline(StimulatorController& stim) {
  const auto& p = config_.protocol();
  spdlog::info("Recording Baseline 2 (VHP ON, STIM ON, no contact)...");

  stim.setChannel(p.channel.start);
  stim.setVolume(p.volume.start);
  stim.setFrequency(p.frequency.start);
  stim.startStimulation();

  io::FileLogger file = openRecording(artifacts_.baseline2, true);
  recordWithCountdown("Baseline 2", Seconds(p.baseline2), file, markers::kNoContactStimOn);

  stim.stopStimulation();
  recordWithCountdown("Baseline 2 (stim OFF)", Seconds(p.baseline2), file,
                      markers::kBaselineStart);
  closeRecording(file);
  spdlog::info("Baseline 2 completed.");
}

void SweepOrchestrator::recordWithCountdown(const std::string& label, Seconds duration,
                                            io::FileLogger& file, std::optional<int> marker) {
  const auto startedAt = SteadyClock::now();
  const Seconds tick(timing_.countdownTick);

  for (;;) {
    const Seconds elapsed = SteadyClock::now() - startedAt;
    const Seconds remaining = duration - elapsed;
    if (remaining.count() <= 0.0)
      break;
    reporter_.countdown(label, remaining.count(), elapsed.count());
    // a silent slice keeps the marker for the next one
    if (recorder_.record(source_, std::min(remaining, tick), file, marker))
      marker.reset();
  }
  reporter_.finish();
}

void SweepOrchestrator::runSweep(StimulatorController& stim) {
  const auto& p = config_.protocol();

  stim.setTestMode(true);
  applyStimulusTiming(stim);

  const SweepDomain domain(p);
  progress_ = GlobalProgress{};
  progress_.total = domain.totalSteps(p.cycles);
  progress_.startedAt = SteadyClock::now();
  spdlog::info("Total stim cycles in sweep: {} ({} points x {} cycles)", progress_.total,
               domain.size(), p.cycles);

  domain.forEach([&](const SweepPoint& point) { measure(stim, point); });
}

void SweepOrchestrator::applyStimulusTiming(StimulatorController& stim) {
  const StimulusTiming& t = config_.protocol().stimulus;
  if (t.duration)
    stim.setDuration(*t.duration);
  if (t.cyclePeriod)
    stim.setCyclePeriod(*t.cyclePeriod);
  if (t.pauseCyclePeriod)
    stim.setPauseCyclePeriod(*t.pauseCyclePeriod);
  if (t.pausedCycles)
    stim.setPausedCycles(*t.pausedCycles);
  if (t.jitter)
    stim.setJitter(*t.jitter);
}

void SweepOrchestrator::measure(StimulatorController& stim, const SweepPoint& point) {
  const auto& p = config_.protocol();
  spdlog::info("Measuring: CH={}, FREQ={}, VOL={}", point.channel, point.frequency, point.volume);
  stim.setChannel(point.channel);
  stim.setVolume(point.volume);
  stim.setFrequency(point.frequency);

  const auto path = pointFile(point);
  io::FileLogger file = openRecording(path, false);
  artifacts_.pointFiles.push_back(path);

  spdlog::info("Baseline 3 (contact) recording...");
  recorder_.record(source_, Seconds(p.baseline3), file, markers::kContactBaseline);

  spdlog::info("Stim cycles: {} cycles (ON={}s, OFF={}s)", p.cycles, p.durationOn, p.durationOff);
  for (int cycle = 1; cycle <= p.cycles; ++cycle) {
    spdlog::info("Cycle {}/{} - ON period", cycle, p.cycles);
    if (timing_.recordPreStimulusWindow)
      recorder_.record(source_, Seconds(p.durationOn), file, markers::kPreStimulus);
    stim.startStimulation();
    recorder_.record(source_, Seconds(p.durationOn), file, markers::kStimulusOn);
    stim.stopStimulation();

    spdlog::info("Cycle {}/{} - OFF period", cycle, p.cycles);
    recorder_.record(source_, Seconds(p.durationOff), file, markers::kStimulusOff);

    progress_.advance();
    reporter_.report(progress_);
  }

  closeRecording(file);
  spdlog::info("Measurement completed CH={}, FREQ={}, VOL={}", point.channel, point.frequency,
               point.volume);
}

void SweepOrchestrator::writeMetadata() {
  io::FileLogger file = openRecording(artifacts_.metadata, false);

  file.write("Recording on: " + localTimestamp("%d/%m/%Y %H:%M:%S") + "\n\n");
  file.write("*** Measure Configuration ***\n");
  file.write(config_.measurementText());
  file.write("\n*** Device Configuration ***\n");
  file.write(config_.deviceText());
  file.write("\nBaseline 1 (VHP OFF>ON): " + artifacts_.baseline1.string() + "\n");
  file.write("Baseline 2 (VHP ON, STIM ON, no contact): " + artifacts_.baseline2.string() + "\n");
  closeRecording(file);
  spdlog::info("Metadata written to {}", artifacts_.metadata.string());
}

vsweep::io::FileLogger SweepOrchestrator::openRecording(const std::filesystem::path& path,
                                                        bool append) const {
  io::FileLogger file;
  if (!file.open(path.string(), append ? io::OpenMode::Append : io::OpenMode::Truncate))
    throw RecordingIOError("cannot open " + path.string());
  return file;
}

void SweepOrchestrator::closeRecording(io::FileLogger& file) {
  if (!file.close())
    throw RecordingIOError("cannot finalize " + file.path());
}
