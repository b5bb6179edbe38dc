#pragma once
/** @file  SweepOrchestrator.hpp
 *  @brief Phase state machine: baselines, operator gates, channel × frequency ×
 *         volume sweep of ON/OFF stimulation cycles.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// VibroSweep headers
#include "core/ErrorMonitor.hpp"
#include "core/ProgressReporter.hpp"
#include "core/SampleRecorder.hpp"
#include "core/StimulatorController.hpp"
#include "core/SweepConfig.hpp"
#include "core/SweepDomain.hpp"
#include "io/FileLogger.hpp"

namespace vsweep {
  namespace acq {
    class AcquisitionSource;
  }
  namespace io {
    class SerialChannel;
  }
  namespace ui {
    class OperatorGate;
  }

  namespace core {

    enum class Phase : std::uint8_t {
      Idle,
      DeviceWait,
      OperatorGate1,
      Baseline2,
      OperatorGate2,
      Sweep,
      Complete,
      Error
    };
    const char* toString(Phase p);

    struct SweepTiming {
      std::chrono::milliseconds presenceInterval{ 500 }; ///< DeviceWait poll period
      std::chrono::milliseconds presenceHold{ 1000 };    ///< port held open per presence check
      std::chrono::milliseconds pollTimeout{ 100 };      ///< per chunk pull
      std::chrono::milliseconds countdownTick{ 1000 };   ///< baseline countdown refresh
      StimulatorTiming stimulator{};
      bool recordPreStimulusWindow{ true }; ///< marker-0 ON window before the start command
    };

    /// Every file the run produced, for the metadata and the caller.
    struct RunArtifacts {
      std::filesystem::path baseline1;
      std::filesystem::path baseline2;
      std::filesystem::path metadata;
      std::vector<std::filesystem::path> pointFiles;
    };

    /**
 * @class SweepOrchestrator
 * @brief Runs the phases strictly in order on the caller’s thread.
 *
 *  DeviceWait (only if the stimulator is unreachable at start) →
 *  OperatorGate1 → Baseline2 → OperatorGate2 → Sweep → Complete.
 *  Any failure after start moves to Error: logged once, escalated through the
 *  ErrorMonitor, and `run()` returns false.
 */
    class SweepOrchestrator {
    public:
      using ChannelFactory = std::function<std::unique_ptr<io::SerialChannel>()>;

      SweepOrchestrator(const SweepConfig& config, acq::AcquisitionSource& source,
                        ui::OperatorGate& gate, ChannelFactory makeChannel,
                        std::shared_ptr<ErrorMonitor> errMonitor, std::ostream& console,
                        SweepTiming timing = {});

      /// @returns true when the run reached Complete.
      bool run();

      Phase phase() const { return phase_; }
      const GlobalProgress& progress() const { return progress_; }
      const RunArtifacts& artifacts() const { return artifacts_; }
      const std::string& lastError() const { return lastError_; }

      void setCancelFlag(const std::atomic<bool>* flag);

      /// `<ts>_<board>_c<ch>_f<freq>_v<vol>.csv` under the recordings directory.
      std::filesystem::path pointFile(const SweepPoint& point) const;

    private:
      void transitionTo(Phase next);

      bool checkDevicePresent();
      void waitForDevice();
      void recordNoContactBaseline(StimulatorController& stim);
      /// Records in countdown slices; @p marker goes to the first sample of the window.
      void recordWithCountdown(const std::string& label, std::chrono::duration<double> duration,
                               io::FileLogger& file, std::optional<int> marker);
      void runSweep(StimulatorController& stim);
      void applyStimulusTiming(StimulatorController& stim);
      void measure(StimulatorController& stim, const SweepPoint& point);
      void writeMetadata();

      io::FileLogger openRecording(const std::filesystem::path& path, bool append) const;
      static void closeRecording(io::FileLogger& file);

      const SweepConfig& config_;
      acq::AcquisitionSource& source_;
      ui::OperatorGate& gate_;
      ChannelFactory makeChannel_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      SweepTiming timing_;

      SampleRecorder recorder_;
      ProgressReporter reporter_;
      GlobalProgress progress_;
      RunArtifacts artifacts_;
      Phase phase_{ Phase::Idle };
      std::string lastError_;
      const std::atomic<bool>* cancel_{ nullptr };
    };

  } // namespace core
} // namespace vsweep
