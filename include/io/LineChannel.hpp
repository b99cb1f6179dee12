#pragma once
/** @file  LineChannel.hpp
 *  @brief Non-blocking line I/O over a tty, FIFO, regular file or stdio.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

// Linux header
#include <termios.h> // for speed_t types e.g., B115200

namespace zonewatch {
  namespace io {

    /**
 * @class LineChannel
 * @brief RAII wrapper around a single file descriptor carrying text lines.
 *
 *  * "-" opens stdin (Read) or stdout (Write); those fds are never closed.
 *  * Raw termios mode is applied only when the fd is a tty.
 *  * FIFOs are opened read-write so the reader survives writer restarts.
 *  * Lines end in '\n'; a trailing '\r' is stripped on read.
 *  * *Non-copyable*, but move-constructible.
 */
    class LineChannel {

    public:
      enum class Mode { Read, Write, ReadWrite };

      //---ctr / dtr--------------------------------------------
      LineChannel() = default;
      virtual ~LineChannel(); // close the fd at destruction

      //---public API-------------------------------------------
      virtual bool open(const std::string& path, Mode mode, speed_t baud = B115200);
      virtual bool writeLine(const std::string& line); // returns false on EIO
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      virtual bool isOpen() const { return fd_ >= 0; }
      void close();

      //---non-copyable-----------------------------------------
      LineChannel(const LineChannel&) = delete;
      LineChannel& operator=(const LineChannel&) = delete;

      //---mv and mv assign-------------------------------------
      LineChannel(LineChannel&& other) noexcept;
      LineChannel& operator=(LineChannel&& other) noexcept;

    private:
      int fd_{ -1 };            ///< POSIX fd (-1==closed)
      bool ownsFd_{ true };     ///< false for stdin/stdout
      std::string rx_buffer_{}; ///< buffer to store readLine content
      std::mutex writeMtx_;     ///< writers from several threads
    };
  } // namespace io
} // namespace zonewatch
