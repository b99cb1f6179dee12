#pragma once
/** @file  Scheduler.hpp
 *  @brief Delayed-continuation executor used for the downlink command pacing.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace zonewatch::core {

  class Logger;

  /**
 * @class Scheduler
 * @brief Runs a task once \p delay has elapsed, without blocking the caller.
 */
  class Scheduler {
  public:
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;
    virtual void schedule(std::chrono::milliseconds delay, Task task) = 0;
  };

  /**
 * @class TimerScheduler
 * @brief One worker thread draining a deadline-ordered queue.
 *
 *  * Tasks with equal deadlines run in submission order.
 *  * `stop()` discards tasks that are not yet due.
 */
  class TimerScheduler : public Scheduler {
  public:
    explicit TimerScheduler(std::shared_ptr<Logger> logger = nullptr);
    ~TimerScheduler() override; ///< stop()

    void start();
    void stop();

    void schedule(std::chrono::milliseconds delay, Task task) override;

    std::size_t pending() const;

    TimerScheduler(const TimerScheduler&) = delete;
    TimerScheduler& operator=(const TimerScheduler&) = delete;

  private:
    struct Entry {
      std::chrono::steady_clock::time_point due;
      std::uint64_t order;
      Task task;
    };
    struct Later {
      bool operator()(const Entry& a, const Entry& b) const {
        return a.due != b.due ? a.due > b.due : a.order > b.order;
      }
    };

    void workerLoop();

    std::shared_ptr<Logger> logger_;
    std::priority_queue<Entry, std::vector<Entry>, Later> queue_;
    std::uint64_t nextOrder_{ 0 };
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> running_{ false };
  };

} // namespace zonewatch::core
