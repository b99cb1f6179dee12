/* @file LineChannel.cpp
 * @brief IO abstraction layer for the uplink feed and downlink bridge - handles file descriptor, framing, line io and RAII - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <fcntl.h> // Contains file controls like O_RDWR
#include <poll.h>
#include <sys/stat.h>
#include <unistd.h> // write(), read(), close()

// ZoneWatch headers
#include "io/LineChannel.hpp"

using namespace zonewatch::io;

LineChannel::~LineChannel() { close(); }

LineChannel::LineChannel(LineChannel&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), ownsFd_(other.ownsFd_),
      rx_buffer_(std::move(other.rx_buffer_)) {}

LineChannel& LineChannel::operator=(LineChannel&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    ownsFd_ = other.ownsFd_;
    rx_buffer_ = std::move(other.rx_buffer_);
  }
  return *this;
}

bool LineChannel::open(const std::string& path, Mode mode, speed_t baud) {
  close();

  if (path == "-") {
    fd_ = (mode == Mode::Write) ? STDOUT_FILENO : STDIN_FILENO;
    ownsFd_ = false;
    if (mode == Mode::Read)
      ::fcntl(fd_, F_SETFL, ::fcntl(fd_, F_GETFL) | O_NONBLOCK);
    return true;
  }

  int flags = O_NOCTTY | O_NONBLOCK;
  struct stat st {};
  const bool exists = ::stat(path.c_str(), &st) == 0;
  if (exists && S_ISFIFO(st.st_mode)) {
    flags |= O_RDWR; // keep a writer reference so EOF never arrives
  } else if (mode == Mode::Read) {
    flags |= O_RDONLY;
  } else if (mode == Mode::Write) {
    flags |= O_WRONLY | O_APPEND | (exists ? 0 : O_CREAT);
  } else {
    flags |= O_RDWR;
  }

  fd_ = ::open(path.c_str(), flags, 0644);
  if (fd_ < 0) {
    std::cerr << "Error " << errno << " from open(" << path << "): " << strerror(errno) << "\n";
    return false;
  }
  ownsFd_ = true;

  if (!::isatty(fd_))
    return true;

  // fetch current attrs
  struct termios tty;
  if (tcgetattr(fd_, &tty) != 0) {
    std::cerr << "Error " << errno << " from tcgetattr: " << strerror(errno) << "\n";
    close();
    return false;
  }

  cfmakeraw(&tty);
  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= CS8;
  tty.c_cflag &= ~CRTSCTS;
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);

  cfsetispeed(&tty, baud);
  cfsetospeed(&tty, baud);

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    std::cerr << "Error " << errno << " from tcsetattr: " << strerror(errno) << "\n";
    close();
    return false;
  }
  return true;
}

bool LineChannel::writeLine(const std::string& line) {
  std::lock_guard<std::mutex> lock(writeMtx_);

  if (fd_ < 0) {
    return false;
  }

  std::string out = line;
  if (!out.ends_with("\n")) {
    out += "\n";
  }

  std::size_t total = 0;
  while (total < out.size()) {
    ssize_t written = ::write(fd_, out.data() + total, out.size() - total);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{ fd_, POLLOUT, 0 };
      if (::poll(&pfd, 1, 1000) <= 0) {
        std::cerr << "Error: write to fd " << fd_ << " stalled\n";
        return false;
      }
    } else {
      std::cerr << "Error: " << errno << " from write: " << strerror(errno) << "\n";
      return false;
    }
  }

  return true;
}

// -------------------------------------------------------------------
// LineChannel::readLine
// Non-blocking line reader with timeout and internal buffer.
// Returns std::nullopt on timeout, disconnect, or error. An unterminated
// tail is returned as the last line before the channel closes.
// -------------------------------------------------------------------
std::optional<std::string> LineChannel::readLine(std::chrono::milliseconds timeout) {
  if (fd_ < 0)
    return std::nullopt;

  auto takeLine = [this]() -> std::optional<std::string> {
    auto pos = rx_buffer_.find('\n');
    if (pos == std::string::npos)
      return std::nullopt;
    std::string line = rx_buffer_.substr(0, pos);
    rx_buffer_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    return line;
  };

  // a previous read may already have buffered several lines
  if (auto line = takeLine())
    return line;

  char temp[512];
  pollfd pfd{ fd_, POLLIN, 0 };

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < deadline) {

    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    int ms = static_cast<int>(ms_left.count());

    int rc = ::poll(&pfd, 1, ms);
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      std::cerr << "poll: " << strerror(errno) << '\n';
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    if (pfd.revents & (POLLIN | POLLHUP)) {
      ssize_t n = ::read(fd_, temp, sizeof(temp));
      if (n > 0) {
        rx_buffer_.append(temp, static_cast<std::size_t>(n));
      } else if (n == 0) { // EOF / disconnect
        close();
        if (rx_buffer_.empty())
          return std::nullopt;
        // unterminated tail is still a line
        std::string last;
        last.swap(rx_buffer_);
        if (last.back() == '\r')
          last.pop_back();
        return last;
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue; // transient → retry
      } else {
        std::cerr << "read: " << strerror(errno) << '\n';
        return std::nullopt;
      }

      if (auto line = takeLine())
        return line;
    }
  }
  return std::nullopt; // timeout/partial
}

void LineChannel::close() {
  if (fd_ >= 0 && ownsFd_)
    ::close(fd_);
  fd_ = -1;
  ownsFd_ = true;
}
