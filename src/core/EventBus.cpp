/* @file EventBus.cpp
 * @brief synchronous observer list with per-handler fault isolation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <stdexcept>

// ZoneWatch headers
#include "core/EventBus.hpp"
#include "core/Logger.hpp"

using namespace zonewatch::core;

EventBus::EventBus(std::shared_ptr<Logger> logger) : logger_(std::move(logger)) {}

void EventBus::subscribe(const std::string& eventName, Handler handler) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (sealed_)
    throw std::logic_error("[EventBus] subscribe(\"" + eventName + "\") after start-up");
  handlers_[eventName].push_back(std::move(handler));
}

void EventBus::seal() {
  std::lock_guard<std::mutex> lock(mtx_);
  sealed_ = true;
}

bool EventBus::sealed() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return sealed_;
}

std::size_t EventBus::subscriberCount(const std::string& eventName) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = handlers_.find(eventName);
  return it == handlers_.end() ? 0 : it->second.size();
}

void EventBus::publish(const std::string& eventName, const BeaconEvent& event) const {
  std::vector<Handler> targets;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = handlers_.find(eventName);
    if (it == handlers_.end())
      return;
    targets = it->second;
  }

  for (std::size_t i = 0; i < targets.size(); ++i) {
    try {
      if (targets[i])
        targets[i](event);
    } catch (const std::exception& e) {
      if (logger_)
        logger_->log(LogLevel::Error, "EventBus",
                     "handler " + std::to_string(i) + " for " + eventName + " threw: " + e.what());
    } catch (...) {
      if (logger_)
        logger_->log(LogLevel::Error, "EventBus",
                     "handler " + std::to_string(i) + " for " + eventName +
                         " threw a non-standard exception");
    }
  }
}
