/* @file Logger.cpp
 * @brief worker-thread logger: ring buffer in, CSV rows (and optionally stderr) out
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

// ZoneWatch headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

namespace zonewatch::core {

  namespace {

    std::string isoTimestamp(std::chrono::system_clock::time_point tp) {
      const auto secs = std::chrono::system_clock::to_time_t(tp);
      const auto ms =
          std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
      std::tm utc{};
      gmtime_r(&secs, &utc);
      std::ostringstream os;
      os << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms
         << 'Z';
      return os.str();
    }

    std::string csvField(const std::string& text) {
      if (text.find_first_of(",\"\n\r") == std::string::npos)
        return text;
      std::string out = "\"";
      for (char c : text) {
        if (c == '"')
          out += '"';
        out += c;
      }
      out += '"';
      return out;
    }

  } // namespace

  const char* toString(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
    default:
      return "INFO";
    }
  }

  LogLevel parseLogLevel(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug")
      return LogLevel::Debug;
    if (lower == "warn" || lower == "warning")
      return LogLevel::Warn;
    if (lower == "error")
      return LogLevel::Error;
    return LogLevel::Info;
  }

  Logger::Logger(std::size_t capacity)
      : buffer_(std::make_unique<RingBuffer<LogEvent>>(capacity)) {}

  Logger::~Logger() { finishRun(); }

  std::string Logger::formatCsv(const LogEvent& event) {
    std::string row = isoTimestamp(event.timestamp);
    row += ',';
    row += toString(event.level);
    row += ',';
    row += csvField(event.source);
    row += ',';
    row += csvField(event.message);
    return row;
  }

  bool Logger::startNewRun(const std::string& csvPath) {
    if (running_)
      return true;

    if (!csvPath.empty() && !csvFile_.open(csvPath, "timestamp,level,source,message\n")) {
      return false;
    }
    running_ = true;
    worker_ = std::thread(&Logger::workerLoop, this);
    return true;
  }

  void Logger::log(LogLevel level, std::string source, std::string message) {
    log(LogEvent{ std::chrono::system_clock::now(), level, std::move(source), std::move(message) });
  }

  void Logger::log(const LogEvent& event) {
    if (event.level < minLevel_.load())
      return;

    if (!running_) {
      if (mirror_)
        std::cerr << formatCsv(event) << '\n';
      return;
    }

    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (buffer_->push(event))
        ++dropped_;
    }
    cv_.notify_one();
  }

  void Logger::finishRun() {
    if (!running_.exchange(false))
      return;
    cv_.notify_one();
    if (worker_.joinable())
      worker_.join();
    csvFile_.close();
  }

  void Logger::writeOut(const LogEvent& event) {
    const std::string row = formatCsv(event);
    if (csvFile_.isOpen())
      csvFile_.write(row + '\n');
    if (mirror_)
      std::cerr << row << '\n';
  }

  void Logger::workerLoop() {
    std::unique_lock<std::mutex> lock(mtx_);
    for (;;) {
      cv_.wait_for(lock, std::chrono::milliseconds{ 500 },
                   [this] { return !buffer_->empty() || !running_; });

      while (auto event = buffer_->pop()) {
        lock.unlock();
        writeOut(*event);
        lock.lock();
      }
      csvFile_.flush();

      if (!running_ && buffer_->empty())
        break;
    }
  }

} // namespace zonewatch::core
