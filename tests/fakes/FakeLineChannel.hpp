#pragma once
/** @file  FakeLineChannel.hpp
 *  @brief LineChannel derivative with scripted reads and recorded writes.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <deque>
#include <mutex>
#include <vector>

#include "io/LineChannel.hpp"

namespace zonewatch {
  namespace test {

    /**
 * @class FakeLineChannel
 * @brief Never touches a file descriptor.
 */
    class FakeLineChannel : public zonewatch::io::LineChannel {
    public:
      bool open_called = false;
      bool open_result = true;
      bool is_open = true;
      bool write_success = true;
      std::deque<std::string> scripted_reads;

      bool open(const std::string&, Mode, speed_t) override {
        open_called = true;
        is_open = open_result;
        return open_result;
      }

      bool isOpen() const override { return is_open; }

      bool writeLine(const std::string& line) override {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!write_success)
          return false;
        written_.push_back(line);
        return true;
      }

      std::optional<std::string> readLine(std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(mtx_);
        if (scripted_reads.empty())
          return std::nullopt;
        auto line = scripted_reads.front();
        scripted_reads.pop_front();
        return line;
      }

      std::vector<std::string> written() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return written_;
      }

      std::string lastWritten() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return written_.empty() ? std::string{} : written_.back();
      }

    private:
      mutable std::mutex mtx_;
      std::vector<std::string> written_;
    };

  } // namespace test
} // namespace zonewatch
