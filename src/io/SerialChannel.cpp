/* @file SerialChannel.cpp
 * @brief IO abstraction layer that wraps ttyUSBx / ttyACMx - handles file descriptor, framing, line io and RAII - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstring> // for strerror
#include <utility>

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <fcntl.h> // Contains file controls like O_RDWR
#include <poll.h>
#include <unistd.h> // write(), read(), close()

// 3rd-party headers
#include <spdlog/spdlog.h>

// VibroSweep headers
#include "io/SerialChannel.hpp"

using namespace vsweep::io;

SerialChannel::~SerialChannel() {
  // qualified: never dispatch to a derived override from the destructor
  SerialChannel::close();
}

SerialChannel::SerialChannel(SerialChannel&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), rx_buffer_(std::move(other.rx_buffer_)) {}

SerialChannel& SerialChannel::operator=(SerialChannel&& other) noexcept {
  if (this != &other) {
    SerialChannel::close();
    fd_ = std::exchange(other.fd_, -1);
    rx_buffer_ = std::move(other.rx_buffer_);
  }
  return *this;
}

bool SerialChannel::open(const std::string& dev, speed_t baud) {
  if (fd_ >= 0)
    close();

  // open non-blocking, dont become ctrl-TTY
  fd_ = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    spdlog::debug("[SerialChannel] open {}: {} ({})", dev, strerror(errno), errno);
    return false;
  }

  // fetch current attrs
  struct termios tty;
  if (tcgetattr(fd_, &tty) != 0) {
    spdlog::warn("[SerialChannel] tcgetattr {}: {}", dev, strerror(errno));
    close();
    return false;
  }

  cfmakeraw(&tty);
  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= CS8;
  tty.c_cflag &= ~CRTSCTS;
  tty.c_cflag |= (CLOCAL | CREAD);
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);

  cfsetispeed(&tty, baud);
  cfsetospeed(&tty, baud);

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    spdlog::warn("[SerialChannel] tcsetattr {}: {}", dev, strerror(errno));
    close();
    return false;
  }
  rx_buffer_.clear();
  return true;
}

bool SerialChannel::writeLine(const std::string& line) {

  if (fd_ < 0) {
    return false;
  }

  std::string out = line;
  if (!out.ends_with('\n')) {
    out += '\n';
  }

  // Good Pattern for POSIX write loop (required if the tty blocks for instance)
  std::size_t total = 0;
  while (total < out.size()) {
    ssize_t written = ::write(fd_, out.data() + total, out.size() - total);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      // output queue full: wait until the tty drains a little
      pollfd pfd{ fd_, POLLOUT, 0 };
      if (::poll(&pfd, 1, 100) == -1 && errno != EINTR) {
        spdlog::error("[SerialChannel] poll(POLLOUT): {}", strerror(errno));
        return false;
      }
    } else {
      spdlog::error("[SerialChannel] write: {} ({})", strerror(errno), errno);
      return false;
    }
  }

  return true;
}

// -------------------------------------------------------------------
// SerialChannel::readLine
// Non-blocking line reader with timeout and internal buffer.
// Polls at least once, so a zero timeout still picks up pending bytes.
// Returns std::nullopt on timeout, disconnect, or error.
// -------------------------------------------------------------------
std::optional<std::string> SerialChannel::readLine(std::chrono::milliseconds timeout) {
  if (auto buffered = takeBufferedLine())
    return buffered;

  if (fd_ < 0)
    return std::nullopt;

  char temp[256];
  pollfd pfd{ fd_, POLLIN, 0 };

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  do {
    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    int ms = ms_left.count() > 0 ? static_cast<int>(ms_left.count()) : 0;

    int rc = ::poll(&pfd, 1, ms);
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      spdlog::error("[SerialChannel] poll: {}", strerror(errno));
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    if (pfd.revents & (POLLHUP | POLLERR)) {
      spdlog::warn("[SerialChannel] device hung up");
      close();
      return std::nullopt;
    }

    if (pfd.revents & POLLIN) {
      ssize_t n = ::read(fd_, temp, sizeof(temp));
      if (n > 0) {
        rx_buffer_.append(temp, static_cast<std::size_t>(n));
      } else if (n == 0) { // EOF / disconnect
        close();
        return std::nullopt;
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue; // transient → retry
      } else {
        spdlog::error("[SerialChannel] read: {}", strerror(errno));
        return std::nullopt;
      }

      if (auto line = takeBufferedLine())
        return line;
    }
  } while (std::chrono::steady_clock::now() < deadline);

  return std::nullopt; // timeout/partial
}

std::vector<std::string> SerialChannel::drainLines() {
  std::vector<std::string> lines;
  while (auto line = readLine(std::chrono::milliseconds{ 0 }))
    lines.push_back(std::move(*line));
  return lines;
}

void SerialChannel::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}

std::optional<std::string> SerialChannel::takeBufferedLine() {
  const auto pos = rx_buffer_.find('\n');
  if (pos == std::string::npos)
    return std::nullopt;

  std::string line = rx_buffer_.substr(0, pos);
  rx_buffer_.erase(0, pos + 1);
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
  return line;
}
