/* @file Scheduler.cpp
 * @brief timer thread for non-blocking delays between downlink steps
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>

// ZoneWatch headers
#include "core/Logger.hpp"
#include "core/Scheduler.hpp"

using namespace zonewatch::core;

TimerScheduler::TimerScheduler(std::shared_ptr<Logger> logger) : logger_(std::move(logger)) {}

TimerScheduler::~TimerScheduler() { stop(); }

void TimerScheduler::start() {
  if (running_.exchange(true))
    return;
  worker_ = std::thread(&TimerScheduler::workerLoop, this);
}

void TimerScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!running_.exchange(false))
      return;
  }
  cv_.notify_all();
  if (worker_.joinable())
    worker_.join();

  std::size_t discarded = 0;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    discarded = queue_.size();
    queue_ = {};
  }
  if (discarded > 0 && logger_)
    logger_->log(LogLevel::Warn, "TimerScheduler",
                 "discarded " + std::to_string(discarded) + " pending task(s) on stop");
}

void TimerScheduler::schedule(std::chrono::milliseconds delay, Task task) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    queue_.push(Entry{ std::chrono::steady_clock::now() + delay, nextOrder_++, std::move(task) });
  }
  cv_.notify_all();
}

std::size_t TimerScheduler::pending() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return queue_.size();
}

void TimerScheduler::workerLoop() {
  std::unique_lock<std::mutex> lock(mtx_);
  while (running_) {
    if (queue_.empty()) {
      cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });
      continue;
    }

    const auto due = queue_.top().due;
    if (std::chrono::steady_clock::now() < due) {
      cv_.wait_until(lock, due);
      continue; // re-evaluate: earlier task may have arrived, or stop()
    }

    Task task = queue_.top().task;
    queue_.pop();
    lock.unlock();
    try {
      task();
    } catch (const std::exception& e) {
      if (logger_)
        logger_->log(LogLevel::Error, "TimerScheduler", std::string("task threw: ") + e.what());
    }
    lock.lock();
  }
}
