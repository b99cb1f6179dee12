/* @file Watchdog.cpp
 * @brief timer thread driving the silence sweep
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>

// ZoneWatch headers
#include "core/AlarmEngine.hpp"
#include "core/Logger.hpp"
#include "core/ParameterStore.hpp"
#include "core/Watchdog.hpp"

using namespace zonewatch::core;

Watchdog::Watchdog(std::shared_ptr<AlarmEngine> engine, std::shared_ptr<const ParameterStore> params,
                   std::shared_ptr<Logger> logger, ClockFn clock)
    : engine_(std::move(engine)), params_(std::move(params)), logger_(std::move(logger)),
      clock_(std::move(clock)) {}

Watchdog::~Watchdog() { stop(); }

void Watchdog::start() {
  if (running_.exchange(true))
    return;
  worker_ = std::thread(&Watchdog::workerLoop, this);
}

void Watchdog::stop() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!running_.exchange(false))
      return;
  }
  cv_.notify_all();
  if (worker_.joinable())
    worker_.join();
}

void Watchdog::sweepOnce() {
  engine_->watchdogTick(clock_());
  ++sweeps_;
}

void Watchdog::workerLoop() {
  while (running_) {
    const double secs = params_ ? params_->get(Parameter::WatchdogIntervalSeconds, 5.0) : 5.0;
    const auto interval = std::chrono::milliseconds{ static_cast<long long>(secs * 1000.0) };

    {
      std::unique_lock<std::mutex> lock(mtx_);
      if (cv_.wait_for(lock, interval, [this] { return !running_; }))
        break;
    }

    try {
      sweepOnce();
    } catch (const std::exception& e) {
      if (logger_)
        logger_->log(LogLevel::Error, "Watchdog", std::string("sweep failed: ") + e.what());
    }
  }
}
