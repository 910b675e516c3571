#pragma once
#include "pl-gpib/export.h"
#include "pl-gpib/types.hpp"

#include <chrono>
#include <string>

namespace plgpib {

/// Line-oriented byte stream to the adapter.
///
/// write_line() appends the configured terminator and sends synchronously.
/// read() returns as soon as max_bytes are collected, the terminator is seen
/// or the deadline passes, whichever comes first. A read that collected at
/// least one byte succeeds; TimeoutError is raised only when nothing arrived.
/// Both throw IOError once the stream is closed or broken.
class PL_GPIB_API Transport {
public:
  virtual ~Transport() = default;

  virtual void open() = 0;

  /// Safe to call from any thread; wakes a read blocked in another thread
  virtual void close() = 0;

  virtual bool is_open() const = 0;

  virtual void write_line(const Bytes &line) = 0;

  virtual Bytes read(size_t max_bytes, std::chrono::milliseconds timeout) = 0;

  /// Drop anything received but not yet read (late or surplus replies)
  virtual void discard_input() = 0;

  virtual std::string port_name() const = 0;
};

} // namespace plgpib
