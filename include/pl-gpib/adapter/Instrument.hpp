#pragma once
#include "pl-gpib/command/OperationSet.hpp"
#include "pl-gpib/export.h"
#include "pl-gpib/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace plgpib {

class AdapterController;

/// Anything that can sit on the bus behind an AdapterController: raw
/// write/read plus named command and query lookup.
///
/// An instrument is inert until AdapterController::add_instrument() binds it;
/// I/O before that fails with NotAttached.
class PL_GPIB_API Instrument {
public:
  virtual ~Instrument() = default;

  virtual GpibAddress address() const = 0;
  virtual std::string name() const = 0;
  virtual bool is_attached() const = 0;

  virtual void write(const Bytes &payload) = 0;
  virtual Bytes read(size_t max_bytes,
                     std::optional<std::chrono::milliseconds> timeout) = 0;
  Bytes read(size_t max_bytes = kDefaultQueryReadBytes) {
    return read(max_bytes, std::nullopt);
  }

  virtual const CommandSet &commands() const = 0;
  virtual const QuerySet &queries() const = 0;

  /// Resolve, expand and write a command
  virtual void run_command(const std::string &name,
                           const std::vector<ParamValue> &args) = 0;

  /// Resolve, expand, write, read back and decode a query
  virtual ResponseValue
  run_query(const std::string &name, const std::vector<ParamValue> &args,
            std::optional<std::chrono::milliseconds> timeout) = 0;

  template <typename... Args>
  void command(const std::string &name, Args &&...args) {
    run_command(name, {to_param(std::forward<Args>(args))...});
  }

  template <typename... Args>
  ResponseValue query(const std::string &name, Args &&...args) {
    return run_query(name, {to_param(std::forward<Args>(args))...},
                     std::nullopt);
  }

  template <typename... Args>
  ResponseValue query_with_timeout(const std::string &name,
                                   std::chrono::milliseconds timeout,
                                   Args &&...args) {
    return run_query(name, {to_param(std::forward<Args>(args))...}, timeout);
  }

protected:
  friend class AdapterController;

  /// Called by the controller while registering / unregistering
  virtual void attach(AdapterController *controller) = 0;
  virtual void detach() = 0;
};

} // namespace plgpib
