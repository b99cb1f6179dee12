/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault sink shared by the dispatcher and the coordinator
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <iostream>

// ZoneWatch headers
#include "core/ErrorMonitor.hpp"

using namespace zonewatch::core;

void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
  std::lock_guard<std::mutex> lock(mtx_);
  escalation_ = std::move(cb);
}

void ErrorMonitor::notifyFailure(const std::string& message) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    ++failures_;
  }
  forwardIfNew(message);
}

void ErrorMonitor::clearSeen() {
  std::lock_guard<std::mutex> lock(mtx_);
  seen_.clear();
}

std::size_t ErrorMonitor::failureCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return failures_;
}

void ErrorMonitor::forwardIfNew(const std::string& message) {
  std::function<void(const std::string&)> cb;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
      return;
    seen_.push_back(message);
    cb = escalation_;
  }

  // escalate outside the lock, the callback may log or call back into us
  if (cb)
    cb(message);
  else
    std::cerr << "[ErrorMonitor] " << message << "\n";
}
