#pragma once
/** @file  StimulatorController.hpp
 *  @brief Owns the stimulator serial line and speaks its one-line command set.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <memory>
#include <string>

// VibroSweep headers
#include "core/ErrorMonitor.hpp" // StimulatorController reports transport faults to the monitor
#include "io/SerialChannel.hpp"  // owns the channel and requires full type knowledge
#include "protocols/Command.hpp"

namespace vsweep {
  namespace core {

    struct StimulatorTiming {
      std::chrono::milliseconds warmUp{ 2000 }; ///< device boot after the port opens
      std::chrono::milliseconds settle{ 50 };   ///< pause between a command and the drain
    };

    /**
 * @class StimulatorController
 * @brief Scoped connection to the vibrotactile stimulator.
 *
 *  * The constructor opens the port (throws `DeviceUnreachable`) and waits for
 *    the device boot sequence; the destructor closes it on every exit path.
 *  * Every command: write, settle, drain + log whatever the device answered.
 *  * No retries; a failed write throws `TransportError`.
 */
    class StimulatorController {
    public:
      static constexpr speed_t kDefaultBaud = B115200;

      StimulatorController(std::unique_ptr<io::SerialChannel> channel, std::string port,
                           std::shared_ptr<ErrorMonitor> errMonitor,
                           StimulatorTiming timing = {});
      ~StimulatorController();

      //---public APIs------------------------------------------------------
      void setChannel(int channel);
      void setVolume(int volume);
      void setFrequency(int frequency);
      void setTestMode(bool enabled);
      void startStimulation();
      void stopStimulation();

      void setDuration(int ms);
      void setCyclePeriod(int ms);
      void setPauseCyclePeriod(int n);
      void setPausedCycles(int n);
      void setJitter(int n);

      void send(const protocols::Command& cmd);

      const std::string& port() const { return port_; }

      StimulatorController(const StimulatorController&) = delete;
      StimulatorController& operator=(const StimulatorController&) = delete;

    private:
      std::unique_ptr<io::SerialChannel> channel_;
      std::string port_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      StimulatorTiming timing_;
    };

  } // namespace core
} // namespace vsweep
