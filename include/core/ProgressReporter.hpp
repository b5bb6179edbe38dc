#pragma once
/** @file  ProgressReporter.hpp
 *  @brief Global sweep counter plus the text progress bar / ETA renderer.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <string>

namespace vsweep {
  namespace core {

    using SteadyClock = std::chrono::steady_clock;

    /// Owned by the orchestrator; handed to the reporter by const reference.
    struct GlobalProgress {
      std::size_t current{ 0 };
      std::size_t total{ 0 };
      SteadyClock::time_point startedAt{ SteadyClock::now() };

      void advance() { ++current; }
    };

    /// `45s`, `2m05s`, `1h02m` (fractional seconds are truncated).
    std::string formatDuration(double seconds);

    /// `elapsed / current * (total - current)`, or 0 before the first step.
    double etaSeconds(std::size_t current, std::size_t total, double elapsedSeconds);

    /** Pure renderer: `<prefix> |####------| 33.33%  ETA: 4s  Elapsed: 2s`.
     *  @p now is injectable so tests can pin the clock. */
    std::string render(const std::string& prefix, std::size_t current, std::size_t total,
                       SteadyClock::time_point startedAt, std::size_t barLength = 30,
                       SteadyClock::time_point now = SteadyClock::now());

    /// `Baseline 2:   4s remaining  ETA: 4s  Elapsed: 1s` (remaining rounded up).
    std::string renderCountdown(const std::string& label, double remainingSeconds,
                                double elapsedSeconds);

    /**
 * @class ProgressReporter
 * @brief Console progress output, kept apart from the log stream.
 *
 *  * `report()` prints one complete line per finished cycle, so the log lines
 *    that follow start on a fresh line.
 *  * `countdown()` rewrites the current line (`\r`) until `finish()`.
 */
    class ProgressReporter {
    public:
      explicit ProgressReporter(std::ostream& out, std::string prefix = "Global sweep",
                                std::size_t barLength = 30);

      void report(const GlobalProgress& progress);
      void countdown(const std::string& label, double remainingSeconds, double elapsedSeconds);

      /// Terminates a countdown line.
      void finish();

    private:
      std::ostream& out_;
      std::string prefix_;
      std::size_t barLength_;
    };

  } // namespace core
} // namespace vsweep
