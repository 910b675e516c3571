#pragma once
#include "pl-gpib/export.h"
#include "pl-gpib/types.hpp"

#include <map>
#include <stdexcept>
#include <string>

namespace plgpib {

/// Base class of every error raised by this library
class PL_GPIB_API GpibError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Adapter unreachable or failed the startup handshake
class PL_GPIB_API ConnectError : public GpibError {
public:
  using GpibError::GpibError;
};

/// Address already bound to another instrument on this controller
class PL_GPIB_API DuplicateAddress : public GpibError {
public:
  explicit DuplicateAddress(GpibAddress address);
  GpibAddress address() const { return address_; }

private:
  GpibAddress address_;
};

/// No instrument registered at the requested address
class PL_GPIB_API NotFound : public GpibError {
public:
  explicit NotFound(GpibAddress address);
  GpibAddress address() const { return address_; }

private:
  GpibAddress address_;
};

/// Address outside the primary address range
class PL_GPIB_API InvalidAddress : public GpibError {
public:
  explicit InvalidAddress(int address);
};

/// Instrument used for I/O before being attached to a controller
class PL_GPIB_API NotAttached : public GpibError {
public:
  using GpibError::GpibError;
};

/// Operation name not present in a command or query set
class PL_GPIB_API UnknownCommand : public GpibError {
public:
  explicit UnknownCommand(const std::string &name);
};

/// Operation invoked with the wrong number of arguments
class PL_GPIB_API ArityError : public GpibError {
public:
  ArityError(const std::string &name, size_t expected, size_t given);
  size_t expected() const { return expected_; }
  size_t given() const { return given_; }

private:
  size_t expected_;
  size_t given_;
};

/// No byte arrived before the read deadline
class PL_GPIB_API TimeoutError : public GpibError {
public:
  using GpibError::GpibError;
};

/// Transport-level failure; the session should be reconnected
class PL_GPIB_API IOError : public GpibError {
public:
  using GpibError::GpibError;
};

/// Decoder rejected a response; the undecoded bytes are kept
class PL_GPIB_API ResponseParseError : public GpibError {
public:
  ResponseParseError(const std::string &what, Bytes raw);
  const Bytes &raw() const { return raw_; }

private:
  Bytes raw_;
};

/// Bench configuration rejected
class PL_GPIB_API ConfigError : public GpibError {
public:
  using GpibError::GpibError;
};

/// Adapter answered with one of its own error strings
class PL_GPIB_API AdapterCommandError : public GpibError {
public:
  using GpibError::GpibError;
};

class PL_GPIB_API UnrecognizedCommand : public AdapterCommandError {
public:
  UnrecognizedCommand();
};

/// Throws the matching AdapterCommandError when a response is one of the
/// adapter's error strings; returns normally otherwise.
PL_GPIB_API void throw_if_adapter_error(const Bytes &response);

} // namespace plgpib
