#pragma once

/** @file  SystemCoordinator.hpp
 *  @brief Public API for vsweep::core::SystemCoordinator.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <atomic>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

// VibroSweep headers
#include "core/ErrorMonitor.hpp"
#include "core/SourceRegistry.hpp"
#include "core/SweepConfig.hpp"
#include "core/SweepOrchestrator.hpp"

namespace vsweep {
  namespace acq {
    class AcquisitionSource;
    class KeepAliveTask;
  } // namespace acq
  namespace ui {
    class OperatorGate;
  }

  namespace core {

    struct CommandLineOptions;

    /// Process exit codes; success and failure are always distinguishable.
    enum ExitCode : int {
      kExitOk = 0,
      kExitFailure = 1,
      kExitConfig = 2,
      kExitUsage = 64,
      kExitInterrupted = 130
    };

    /**
 * @class SystemCoordinator
 * @brief Owns every long-lived object of a run: config, acquisition source,
 *        keepalive, error monitor, operator gate.
 *
 *  BOOT → INIT (`initialize`) → RUNNING → FINISHED | ERROR (`run`).
 *  Teardown (`shutdown`, also from the destructor) joins the keepalive and
 *  stops the source regardless of how the run ended.
 */
    class SystemCoordinator {

    public:
      SystemCoordinator(SourceRegistry registry, std::istream& in, std::ostream& out);
      ~SystemCoordinator();

      /// Load + validate config, build and start the acquisition source.
      /// Throws `ConfigurationError` / `TransportError`.
      void initialize(const CommandLineOptions& options);

      /// Execute the sweep; returns the process exit code.
      int run();

      void shutdown();

      //---seams for automated runs and tests--------------------------------
      void setChannelFactory(SweepOrchestrator::ChannelFactory factory);
      void setTiming(SweepTiming timing) { timing_ = timing; }
      void setOperatorGate(std::unique_ptr<ui::OperatorGate> gate);
      void setCancelFlag(const std::atomic<bool>* flag) { cancel_ = flag; }

      const ErrorMonitor& errors() const { return *errorMonitor_; }
      const SweepConfig& config() const;

    private:
      enum class State { BOOT, INIT, RUNNING, FINISHED, ERROR };

      void transitionTo(State next);
      void handleError(const std::string& reason);

      SourceRegistry registry_;
      std::istream& in_;
      std::ostream& out_;

      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::optional<SweepConfig> config_;
      std::unique_ptr<acq::AcquisitionSource> source_;
      std::unique_ptr<acq::KeepAliveTask> keepAlive_;
      std::unique_ptr<ui::OperatorGate> gate_;
      SweepOrchestrator::ChannelFactory makeChannel_;
      SweepTiming timing_{};
      const std::atomic<bool>* cancel_{ nullptr };

      State currentState_{ State::BOOT };
    };

  } // namespace core
} // namespace vsweep
