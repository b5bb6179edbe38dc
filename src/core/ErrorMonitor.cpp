/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault sink shared by the sweep and the keepalive thread
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <utility>

// VibroSweep headers
#include "core/ErrorMonitor.hpp"

using namespace vsweep::core;

void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
  std::lock_guard<std::mutex> lock(mtx_);
  escalation_ = std::move(cb);
}

void ErrorMonitor::notifyFailure(const std::string& message) {
  std::function<void(const std::string&)> escalate;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!rememberIfNew(message))
      return;
    escalate = escalation_;
  }
  // callback runs unlocked so it may query the monitor itself
  if (escalate)
    escalate(message);
}

bool ErrorMonitor::hasFailures() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return !seen_.empty();
}

std::vector<std::string> ErrorMonitor::failures() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return seen_;
}

bool ErrorMonitor::rememberIfNew(const std::string& message) {
  if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
    return false;
  seen_.push_back(message);
  return true;
}
