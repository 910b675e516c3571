#include "pl-gpib/transport/SerialTransport.hpp"
#include "pl-gpib/Errors.hpp"
#include "pl-gpib/Logger.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace plgpib {

namespace {

speed_t to_speed(unsigned int baud_rate) {
  switch (baud_rate) {
  case 1200:
    return B1200;
  case 2400:
    return B2400;
  case 4800:
    return B4800;
  case 9600:
    return B9600;
  case 19200:
    return B19200;
  case 38400:
    return B38400;
  case 57600:
    return B57600;
  case 115200:
    return B115200;
  case 230400:
    return B230400;
  default:
    throw IOError(fmt::format("Unsupported baud rate {}", baud_rate));
  }
}

std::string errno_text(const std::string &what) {
  return fmt::format("{}: {}", what, std::strerror(errno));
}

/// Longest single wait poll() can express
constexpr std::chrono::milliseconds kMaxWait{INT_MAX};

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  if (left.count() <= 0) {
    return 0;
  }
  return static_cast<int>(std::min(left, kMaxWait).count());
}

} // namespace

SerialTransport::SerialTransport(std::string device, SerialOptions options)
    : device_(std::move(device)), options_(std::move(options)) {
  if (options_.terminator.empty()) {
    throw IOError("Serial line terminator must not be empty");
  }
}

SerialTransport::~SerialTransport() {
  try {
    close();
  } catch (const std::exception &e) {
    LOG_ERROR("SERIAL", "CLOSE", "Error closing {}: {}", device_, e.what());
  }
}

void SerialTransport::open() {
  std::lock_guard lock(io_mutex_);
  if (fd_ >= 0) {
    return;
  }

  int fd = ::open(device_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
  if (fd < 0) {
    throw IOError(errno_text("Cannot open " + device_));
  }
  fd_ = fd;

  int wake[2];
  if (::pipe2(wake, O_NONBLOCK | O_CLOEXEC) != 0) {
    std::string msg = errno_text("Cannot create wake pipe");
    release();
    throw IOError(msg);
  }
  wake_read_ = wake[0];
  wake_write_ = wake[1];

  try {
    configure_port();
  } catch (const IOError &) {
    release();
    throw;
  }

  closing_ = false;
  pending_.clear();
  LOG_INFO("SERIAL", "OPEN", "Opened {} at {} baud", device_,
           options_.baud_rate);
}

void SerialTransport::configure_port() {
  struct termios settings;
  if (tcgetattr(fd_, &settings) != 0) {
    throw IOError(errno_text("tcgetattr failed on " + device_));
  }

  cfmakeraw(&settings);
  settings.c_cflag |= CLOCAL | CREAD; // Keep current port owner and enable receiver
  settings.c_cflag &= ~(CSTOPB | PARENB | CRTSCTS);
  settings.c_iflag &= ~(IXON | IXOFF | IXANY);
  settings.c_cc[VMIN] = 0;
  settings.c_cc[VTIME] = 0;

  speed_t speed = to_speed(options_.baud_rate);
  cfsetispeed(&settings, speed);
  cfsetospeed(&settings, speed);

  if (tcsetattr(fd_, TCSANOW, &settings) != 0) {
    throw IOError(errno_text("tcsetattr failed on " + device_));
  }
  tcflush(fd_, TCIOFLUSH);
}

void SerialTransport::release() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  for (auto *end : {&wake_read_, &wake_write_}) {
    int fd = end->exchange(-1);
    if (fd >= 0) {
      ::close(fd);
    }
  }
}

void SerialTransport::close() {
  if (fd_ < 0) {
    return;
  }
  closing_ = true;

  // Wake a reader blocked in poll(); it drops io_mutex_ on its way out
  int wake = wake_write_.load();
  if (wake >= 0) {
    char token = 'x';
    if (::write(wake, &token, 1) < 0 && errno != EAGAIN) {
      LOG_WARN("SERIAL", "CLOSE", "Wake-up write failed: {}",
               std::strerror(errno));
    }
  }

  std::lock_guard lock(io_mutex_);
  if (fd_ < 0) {
    return;
  }
  release();
  pending_.clear();
  LOG_INFO("SERIAL", "CLOSE", "Closed {}", device_);
}

bool SerialTransport::is_open() const { return fd_ >= 0 && !closing_; }

void SerialTransport::write_line(const Bytes &line) {
  std::lock_guard lock(io_mutex_);
  if (fd_ < 0 || closing_) {
    throw IOError("Serial port " + device_ + " is not open");
  }

  Bytes frame = line + options_.terminator;
  auto deadline = std::chrono::steady_clock::now() + options_.write_timeout;
  size_t done = 0;

  while (done < frame.size()) {
    ssize_t n = ::write(fd_, frame.data() + done, frame.size() - done);
    if (n > 0) {
      done += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno != EAGAIN && errno != EINTR) {
      throw IOError(errno_text("Write to " + device_ + " failed"));
    }

    // Output buffer full, wait for room
    struct pollfd pfd {
      fd_, POLLOUT, 0
    };
    int rc = ::poll(&pfd, 1, remaining_ms(deadline));
    if (rc == 0) {
      throw IOError("Write to " + device_ + " stalled");
    }
    if (rc < 0 && errno != EINTR) {
      throw IOError(errno_text("poll failed on " + device_));
    }
  }

  LOG_TRACE("SERIAL", "TX", "'{}'", line);
}

void SerialTransport::discard_input() {
  std::lock_guard lock(io_mutex_);
  if (fd_ < 0 || closing_) {
    throw IOError("Serial port " + device_ + " is not open");
  }
  if (!pending_.empty()) {
    LOG_DEBUG("SERIAL", "FLUSH", "Dropping {} stale byte(s)", pending_.size());
    pending_.clear();
  }
  if (tcflush(fd_, TCIFLUSH) != 0) {
    throw IOError(errno_text("tcflush failed on " + device_));
  }
}

Bytes SerialTransport::read(size_t max_bytes,
                            std::chrono::milliseconds timeout) {
  std::lock_guard lock(io_mutex_);
  if (fd_ < 0 || closing_) {
    throw IOError("Serial port " + device_ + " is not open");
  }

  const char term = options_.terminator.back();
  auto deadline =
      std::chrono::steady_clock::now() + std::min(timeout, kMaxWait);
  Bytes out;

  // Returns true once the collected data satisfies the request
  auto take_pending = [&]() {
    size_t want = max_bytes - out.size();
    size_t pos = pending_.find(term);
    size_t n = std::min(want, pos == Bytes::npos ? pending_.size() : pos + 1);
    out.append(pending_, 0, n);
    pending_.erase(0, n);
    return out.size() >= max_bytes ||
           (!out.empty() && out.back() == term);
  };

  if (!pending_.empty() && take_pending()) {
    return out;
  }

  char buffer[256];
  while (out.size() < max_bytes) {
    int wait_ms = remaining_ms(deadline);
    if (wait_ms == 0) {
      break;
    }

    struct pollfd fds[2] = {{fd_, POLLIN, 0},
                            {wake_read_.load(), POLLIN, 0}};
    int rc = ::poll(fds, 2, wait_ms);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      throw IOError(errno_text("poll failed on " + device_));
    }
    if (rc == 0) {
      break;
    }
    if (fds[1].revents & POLLIN) {
      throw IOError("Serial port " + device_ + " closed during read");
    }
    if ((fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) &&
        !(fds[0].revents & POLLIN)) {
      throw IOError("Serial port " + device_ + " disconnected");
    }

    ssize_t n = ::read(fd_, buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EAGAIN || errno == EINTR)
        continue;
      throw IOError(errno_text("Read from " + device_ + " failed"));
    }
    if (n == 0) {
      throw IOError("Serial port " + device_ + " disconnected");
    }

    pending_.append(buffer, static_cast<size_t>(n));
    if (take_pending()) {
      break;
    }
  }

  if (out.empty()) {
    throw TimeoutError(fmt::format("No response from {} within {} ms",
                                   device_, timeout.count()));
  }

  LOG_TRACE("SERIAL", "RX", "'{}'", out);
  return out;
}

} // namespace plgpib
