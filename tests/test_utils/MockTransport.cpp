#include "MockTransport.hpp"
#include "pl-gpib/Errors.hpp"

#include <algorithm>

namespace plgpib {
namespace test {

MockTransport::MockTransport(std::string port) : port_(std::move(port)) {}

void MockTransport::set_response(const std::string &line, const Bytes &reply) {
  std::lock_guard lock(mutex_);
  responses_[line] = reply;
}

void MockTransport::set_device_response(int address, const std::string &line,
                                        const Bytes &reply) {
  std::lock_guard lock(mutex_);
  device_responses_[address][line] = reply;
}

void MockTransport::queue_read(const Bytes &reply) {
  {
    std::lock_guard lock(mutex_);
    pending_.push_back(reply);
  }
  cv_.notify_all();
}

void MockTransport::set_read_delay(std::chrono::milliseconds delay) {
  std::lock_guard lock(mutex_);
  read_delay_ = delay;
}

void MockTransport::set_fail_writes(bool fail) {
  std::lock_guard lock(mutex_);
  fail_writes_ = fail;
}

void MockTransport::set_fail_open(bool fail) {
  std::lock_guard lock(mutex_);
  fail_open_ = fail;
}

std::vector<std::string> MockTransport::written() const {
  std::lock_guard lock(mutex_);
  return history_;
}

size_t MockTransport::write_count() const {
  std::lock_guard lock(mutex_);
  return history_.size();
}

void MockTransport::clear_history() {
  std::lock_guard lock(mutex_);
  history_.clear();
}

std::optional<int> MockTransport::addressed() const {
  std::lock_guard lock(mutex_);
  return addressed_;
}

int MockTransport::open_count() const {
  std::lock_guard lock(mutex_);
  return open_count_;
}

void MockTransport::open() {
  std::lock_guard lock(mutex_);
  if (fail_open_) {
    throw IOError("Cannot open " + port_);
  }
  open_ = true;
  ++open_count_;
}

void MockTransport::close() {
  {
    std::lock_guard lock(mutex_);
    open_ = false;
  }
  cv_.notify_all();
}

bool MockTransport::is_open() const {
  std::lock_guard lock(mutex_);
  return open_;
}

void MockTransport::write_line(const Bytes &line) {
  {
    std::lock_guard lock(mutex_);
    if (!open_) {
      throw IOError(port_ + " is not open");
    }
    if (fail_writes_) {
      throw IOError("Write to " + port_ + " failed");
    }
    history_.push_back(line);

    const std::string select = "++addr ";
    if (line.compare(0, select.size(), select) == 0) {
      addressed_ = std::stoi(line.substr(select.size()));
      return;
    }

    if (addressed_) {
      auto dev = device_responses_.find(*addressed_);
      if (dev != device_responses_.end()) {
        auto it = dev->second.find(line);
        if (it != dev->second.end()) {
          pending_.push_back(it->second);
          cv_.notify_all();
          return;
        }
      }
    }
    auto it = responses_.find(line);
    if (it == responses_.end()) {
      return;
    }
    pending_.push_back(it->second);
  }
  cv_.notify_all();
}

Bytes MockTransport::read(size_t max_bytes,
                          std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  if (!open_) {
    throw IOError(port_ + " is not open");
  }

  auto deadline = std::chrono::steady_clock::now() + timeout;

  // A slow instrument: nothing shows up before the delay has passed
  if (read_delay_.count() > 0) {
    auto ready_at = std::chrono::steady_clock::now() + read_delay_;
    if (cv_.wait_until(lock, std::min(ready_at, deadline),
                       [this] { return !open_; })) {
      throw IOError(port_ + " closed during read");
    }
    if (ready_at > deadline) {
      throw TimeoutError("No response from " + port_);
    }
  }

  if (!cv_.wait_until(lock, deadline,
                      [this] { return !open_ || !pending_.empty(); })) {
    throw TimeoutError("No response from " + port_);
  }
  if (!open_) {
    throw IOError(port_ + " closed during read");
  }

  Bytes &front = pending_.front();
  if (front.size() <= max_bytes) {
    Bytes out = std::move(front);
    pending_.pop_front();
    return out;
  }
  Bytes out = front.substr(0, max_bytes);
  front.erase(0, max_bytes);
  return out;
}

void MockTransport::discard_input() {
  std::lock_guard lock(mutex_);
  pending_.clear();
}

void script_handshake(MockTransport &transport, const Bytes &mode,
                      const Bytes &address, const Bytes &version) {
  transport.set_response("++mode", mode);
  transport.set_response("++addr", address);
  transport.set_response("++ver", version);
}

} // namespace test
} // namespace plgpib
