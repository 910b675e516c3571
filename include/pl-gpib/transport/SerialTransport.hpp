#pragma once
#include "pl-gpib/transport/Transport.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

namespace plgpib {

struct SerialOptions {
  unsigned int baud_rate{115200};
  std::string terminator{"\n"};
  std::chrono::milliseconds write_timeout{1000};
};

/// Transport over a POSIX tty (raw mode, 8N1, no flow control)
class PL_GPIB_API SerialTransport : public Transport {
public:
  explicit SerialTransport(std::string device,
                           SerialOptions options = SerialOptions{});
  ~SerialTransport() override;

  SerialTransport(const SerialTransport &) = delete;
  SerialTransport &operator=(const SerialTransport &) = delete;

  void open() override;
  void close() override;
  bool is_open() const override;

  void write_line(const Bytes &line) override;
  Bytes read(size_t max_bytes, std::chrono::milliseconds timeout) override;
  void discard_input() override;

  std::string port_name() const override { return device_; }

private:
  void configure_port();
  void release();

  std::string device_;
  SerialOptions options_;

  Bytes pending_; // bytes read past the last terminator
  std::atomic<bool> closing_{false};
  std::atomic<int> fd_{-1};
  // Self-pipe; close() reads these without io_mutex_
  std::atomic<int> wake_read_{-1};
  std::atomic<int> wake_write_{-1};
  std::mutex io_mutex_;
};

} // namespace plgpib
