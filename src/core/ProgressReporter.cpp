/* @file ProgressReporter.cpp
 * @brief progress bar + ETA formatting
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <ostream>
#include <utility>

// 3rd-party headers
#include <spdlog/fmt/fmt.h>

// VibroSweep headers
#include "core/ProgressReporter.hpp"

using namespace vsweep::core;

std::string vsweep::core::formatDuration(double seconds) {
  const long long total = seconds > 0.0 ? static_cast<long long>(seconds) : 0;
  if (total < 60)
    return fmt::format("{}s", total);
  if (total < 3600)
    return fmt::format("{}m{:02d}s", total / 60, total % 60);
  return fmt::format("{}h{:02d}m", total / 3600, (total % 3600) / 60);
}

double vsweep::core::etaSeconds(std::size_t current, std::size_t total, double elapsedSeconds) {
  if (current == 0 || current >= total)
    return 0.0;
  return elapsedSeconds / static_cast<double>(current) * static_cast<double>(total - current);
}

std::string vsweep::core::render(const std::string& prefix, std::size_t current,
                                 std::size_t total, SteadyClock::time_point startedAt,
                                 std::size_t barLength, SteadyClock::time_point now) {
  const double fraction =
      total > 0 ? static_cast<double>(current) / static_cast<double>(total) : 0.0;
  const std::size_t filled = total > 0 ? std::min(current, total) * barLength / total : 0;

  const double elapsed = std::chrono::duration<double>(now - startedAt).count();
  const double eta = etaSeconds(current, total, elapsed);

  return fmt::format("{} |{}{}| {:6.2f}%  ETA: {}  Elapsed: {}", prefix,
                     std::string(filled, '#'), std::string(barLength - filled, '-'),
                     fraction * 100.0, formatDuration(eta), formatDuration(elapsed));
}

std::string vsweep::core::renderCountdown(const std::string& label, double remainingSeconds,
                                          double elapsedSeconds) {
  const double remaining = remainingSeconds > 0.0 ? std::ceil(remainingSeconds) : 0.0;
  return fmt::format("{}: {:3d}s remaining  ETA: {}  Elapsed: {}", label,
                     static_cast<long long>(remaining), formatDuration(remaining),
                     formatDuration(elapsedSeconds));
}

ProgressReporter::ProgressReporter(std::ostream& out, std::string prefix, std::size_t barLength)
    : out_(out), prefix_(std::move(prefix)), barLength_(barLength) {}

void ProgressReporter::report(const GlobalProgress& progress) {
  out_ << '\r' << render(prefix_, progress.current, progress.total, progress.startedAt, barLength_)
       << '\n' << std::flush;
}

void ProgressReporter::countdown(const std::string& label, double remainingSeconds,
                                 double elapsedSeconds) {
  out_ << '\r' << renderCountdown(label, remainingSeconds, elapsedSeconds) << std::flush;
}

void ProgressReporter::finish() { out_ << '\n' << std::flush; }
