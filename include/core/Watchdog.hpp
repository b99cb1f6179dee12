#pragma once
/** @file  Watchdog.hpp
 *  @brief Periodic silence sweep, independent of uplink traffic.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <cstdint>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "core/BeaconState.hpp"

namespace zonewatch::core {

  class AlarmEngine;
  class Logger;
  class ParameterStore;

  /**
 * @class Watchdog
 * @brief Calls `AlarmEngine::watchdogTick()` every WatchdogIntervalSeconds.
 *
 *  * The interval is re-read from the ParameterStore every cycle.
 *  * `stop()` wakes the thread immediately.
 */
  class Watchdog {
  public:
    using ClockFn = std::function<TimePoint()>;

    Watchdog(std::shared_ptr<AlarmEngine> engine, std::shared_ptr<const ParameterStore> params,
             std::shared_ptr<Logger> logger = nullptr, ClockFn clock = &Clock::now);
    ~Watchdog(); ///< stop()

    void start();
    void stop();
    bool running() const { return running_; }

    /// One sweep at the injected clock's current time.
    void sweepOnce();

    std::uint64_t sweeps() const { return sweeps_; }

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

  private:
    void workerLoop();

    std::shared_ptr<AlarmEngine> engine_;
    std::shared_ptr<const ParameterStore> params_;
    std::shared_ptr<Logger> logger_;
    ClockFn clock_;

    std::thread worker_;
    std::mutex mtx_;
    std::condition_variable cv_;
    std::atomic<bool> running_{ false };
    std::atomic<std::uint64_t> sweeps_{ 0 };
  };

} // namespace zonewatch::core
