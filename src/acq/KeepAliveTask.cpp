/* @file KeepAliveTask.cpp
 * @brief cancellable keepalive worker
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <string>
#include <utility>

// 3rd-party headers
#include <spdlog/spdlog.h>

// VibroSweep headers
#include "acq/AcquisitionSource.hpp"
#include "acq/KeepAliveTask.hpp"
#include "core/ErrorMonitor.hpp"

using namespace vsweep::acq;

KeepAliveTask::KeepAliveTask(AcquisitionSource& source, std::chrono::milliseconds interval,
                             std::shared_ptr<core::ErrorMonitor> errMonitor)
    : source_(source), interval_(interval), errorMonitor_(std::move(errMonitor)) {}

KeepAliveTask::~KeepAliveTask() { stop(); }

void KeepAliveTask::start() {
  if (worker_.joinable())
    return;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    stopRequested_ = false;
  }
  running_ = true;
  worker_ = std::thread([this] { loop(); });
  spdlog::debug("[KeepAliveTask] started ({} ms)", interval_.count());
}

void KeepAliveTask::stop() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    stopRequested_ = true;
  }
  wake_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
    spdlog::debug("[KeepAliveTask] joined after {} pings", pings_.load());
  }
}

void KeepAliveTask::loop() {
  std::unique_lock<std::mutex> lock(mtx_);
  while (!stopRequested_) {
    lock.unlock();
    try {
      source_.ping();
      ++pings_;
    } catch (const std::exception& e) {
      spdlog::warn("Keepalive thread error: {}", e.what());
      if (errorMonitor_)
        errorMonitor_->notifyFailure(std::string("[KeepAliveTask] ") + e.what());
      running_ = false;
      return;
    }
    lock.lock();
    wake_.wait_for(lock, interval_, [this] { return stopRequested_; });
  }
  running_ = false;
}
