#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "io/FileLogger.hpp"

namespace zonewatch {
  namespace core {

    enum class LogLevel : std::uint8_t { Debug, Info, Warn, Error };

    const char* toString(LogLevel level);

    /// Parses "debug" / "info" / "warn" / "error" (case-insensitive), defaults to Info.
    LogLevel parseLogLevel(const std::string& text);

    struct LogEvent {
      std::chrono::system_clock::time_point timestamp{};
      LogLevel level{ LogLevel::Info };
      std::string source;
      std::string message;
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /**
 * @class Logger
 * @brief Non-blocking logger shared by every subsystem.
 *
 *  * `log()` only enqueues; the worker formats and writes CSV rows.
 *  * Outside a run (before `startNewRun()` / after `finishRun()`) events are
 *    mirrored synchronously to stderr and nothing is written to disk.
 */
    class Logger {

    public:
      static constexpr std::size_t kDefaultCapacity = 1024;

      explicit Logger(std::size_t capacity = kDefaultCapacity);
      ~Logger(); ///< finishRun()

      // --- public API ---
      bool startNewRun(const std::string& csvPath); ///< open file + launch worker thread
      void log(const LogEvent& event);              ///< enqueue event (non-blocking)
      void log(LogLevel level, std::string source, std::string message);
      void finishRun(); ///< flush + join worker thread

      void setMinLevel(LogLevel level) { minLevel_ = level; }
      void setMirrorToStderr(bool on) { mirror_ = on; }

      /// Events lost because the buffer was full.
      std::uint64_t dropped() const { return dropped_; }

      /// One CSV row (no trailing newline), RFC-4180 quoted.
      static std::string formatCsv(const LogEvent& event);

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void workerLoop();
      void writeOut(const LogEvent& event);

      io::FileLogger csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::mutex mtx_;
      std::condition_variable cv_;
      std::atomic<bool> running_{ false };
      std::atomic<LogLevel> minLevel_{ LogLevel::Info };
      std::atomic<bool> mirror_{ true };
      std::atomic<std::uint64_t> dropped_{ 0 };
    };

  } // namespace core
} // namespace zonewatch
