#pragma once
/** @file  KeepAliveTask.hpp
 *  @brief Background poller that stops an idle board from dropping its link.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace vsweep {
  namespace core {
    class ErrorMonitor;
  }

  namespace acq {

    class AcquisitionSource;

    /**
 * @class KeepAliveTask
 * @brief Calls `source.ping()` every @p interval on its own thread.
 *
 *  * `stop()` signals and joins; the destructor does the same.
 *  * A throwing ping is logged, reported to the ErrorMonitor and ends the
 *    task (no retry).
 */
    class KeepAliveTask {
    public:
      KeepAliveTask(AcquisitionSource& source, std::chrono::milliseconds interval,
                    std::shared_ptr<core::ErrorMonitor> errMonitor);
      ~KeepAliveTask();

      void start(); ///< launch worker thread
      void stop();  ///< signal + join worker thread

      bool running() const { return running_.load(); }
      std::size_t pings() const { return pings_.load(); }

      KeepAliveTask(const KeepAliveTask&) = delete;
      KeepAliveTask& operator=(const KeepAliveTask&) = delete;

    private:
      void loop();

      AcquisitionSource& source_;
      std::chrono::milliseconds interval_;
      std::shared_ptr<core::ErrorMonitor> errorMonitor_;

      std::thread worker_;
      std::mutex mtx_;
      std::condition_variable wake_;
      bool stopRequested_{ false };
      std::atomic<bool> running_{ false };
      std::atomic<std::size_t> pings_{ 0 };
    };

  } // namespace acq
} // namespace vsweep
