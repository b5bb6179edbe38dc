#pragma once
/** @file  SampleRecorder.hpp
 *  @brief Bounded-duration capture from an acquisition source into a CSV sink.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace vsweep {
  namespace acq {
    class AcquisitionSource;
    struct Sample;
  } // namespace acq
  namespace io {
    class FileLogger;
  }

  namespace core {

    /// Event codes written to the marker column.
    namespace markers {
      inline constexpr int kPreStimulus = 0;        ///< ON window recorded before the start command
      inline constexpr int kStimulusOn = 1;
      inline constexpr int kDeviceWait = 3;         ///< stimulator still powered off
      inline constexpr int kStimulusOff = 11;
      inline constexpr int kNoContactStimOn = 31;
      inline constexpr int kBaselineStart = 33;
      inline constexpr int kContactBaseline = 333;
    } // namespace markers

    /**
 * @class SampleRecorder
 * @brief Pulls chunks until `duration` of wall-clock time has elapsed and
 *        appends one row per sample: `timestamp, ch_0..ch_{N-1}, marker`.
 *
 *  * The marker goes on the first sample of the call only; with no samples
 *    it is lost and `record()` returns false.
 *  * Every pulled sample is written, in arrival order; the sink is flushed
 *    before returning (`RecordingIOError` on failure).
 *  * A raised cancel flag aborts the call with `RunCancelled`.
 */
    class SampleRecorder {
    public:
      explicit SampleRecorder(std::size_t channelCount,
                              std::chrono::milliseconds pollTimeout = std::chrono::milliseconds{ 100 });

      bool record(acq::AcquisitionSource& source, std::chrono::duration<double> duration,
                  io::FileLogger& sink, std::optional<int> marker = std::nullopt) const;

      /// One CSV row, values truncated to the configured channel count.
      std::string formatRow(const acq::Sample& sample, const std::string& marker) const;

      void setCancelFlag(const std::atomic<bool>* flag) { cancel_ = flag; }
      std::size_t channelCount() const { return channelCount_; }

    private:
      std::size_t channelCount_;
      std::chrono::milliseconds pollTimeout_;
      const std::atomic<bool>* cancel_{ nullptr };
    };

  } // namespace core
} // namespace vsweep
