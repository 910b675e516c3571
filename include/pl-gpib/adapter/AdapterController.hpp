#pragma once
#include "pl-gpib/adapter/Instrument.hpp"
#include "pl-gpib/adapter/InstrumentRegistry.hpp"
#include "pl-gpib/export.h"
#include "pl-gpib/transport/SerialTransport.hpp"
#include "pl-gpib/transport/Transport.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace plgpib {

struct AdapterOptions {
  SerialOptions serial;

  /// Deadline for each adapter-native query, the startup handshake included
  std::chrono::milliseconds adapter_timeout{kDefaultStartupTimeout};

  /// Applied right after the handshake when set
  std::optional<AdapterMode> initial_mode;
  std::optional<bool> auto_read;
};

/// Owns the single connection to a Prologix-style adapter and multiplexes it
/// across the instruments registered with it.
///
/// The adapter's active address is session state with no per-request
/// addressing, so every bus transaction (address-set, write, read) runs under
/// one recursive bus lock. raw_query() holds it across write and read;
/// lock_bus() lets a caller hold it across a longer sequence.
///
/// close() does not take the bus lock: it is the way to abort a transaction
/// blocked in another thread, which then fails with IOError.
class PL_GPIB_API AdapterController {
public:
  using BusLock = std::unique_lock<std::recursive_mutex>;

  explicit AdapterController(AdapterOptions options = AdapterOptions{});
  ~AdapterController();

  AdapterController(const AdapterController &) = delete;
  AdapterController &operator=(const AdapterController &) = delete;

  /// Open a SerialTransport on the given device and run the handshake
  void connect(const std::string &port);

  /// Run the handshake over an already constructed transport
  void connect(std::unique_ptr<Transport> transport);

  void close();
  bool is_connected() const;
  std::string port_name() const;

  // Cached adapter state, empty until connected
  std::optional<AdapterMode> mode() const;
  std::optional<GpibAddress> current_address() const;
  std::string version() const;
  std::optional<bool> auto_read() const;

  // Adapter-native control commands
  void set_mode(AdapterMode mode);
  AdapterMode query_mode();
  GpibAddress query_address();
  std::string query_version();
  void set_auto_read(bool enabled);
  bool query_auto_read();

  /// Point the adapter at an address; no bus traffic when already there
  void address_instrument(GpibAddress address);

  /// Throws DuplicateAddress; binds the instrument to this controller
  void add_instrument(std::shared_ptr<Instrument> instrument);

  /// Throws NotFound; unbinds and returns the instrument
  std::shared_ptr<Instrument> remove_instrument(GpibAddress address);

  std::shared_ptr<Instrument> instrument(GpibAddress address) const;
  std::vector<GpibAddress> instrument_addresses() const;

  // Bus access on behalf of instruments. Each addresses first; switching
  // address or starting a query drops unread input from earlier traffic.
  void raw_write(GpibAddress address, const Bytes &payload);
  Bytes raw_read(GpibAddress address, size_t max_bytes,
                 std::chrono::milliseconds timeout);
  Bytes raw_query(GpibAddress address, const Bytes &payload, size_t max_bytes,
                  std::chrono::milliseconds timeout);

  BusLock lock_bus() const { return BusLock(bus_mutex_); }

private:
  void handshake();
  std::shared_ptr<Transport> transport() const;
  void send_adapter(const std::string &line);
  Bytes read_adapter();
  void discard_input();
  void invalidate_address();

  AdapterOptions options_;
  InstrumentRegistry registry_;

  mutable std::recursive_mutex bus_mutex_;

  // Guards the members below for readers that do not hold the bus lock
  mutable std::mutex state_mutex_;
  std::shared_ptr<Transport> transport_;
  std::optional<GpibAddress> current_address_;
  std::optional<AdapterMode> mode_;
  std::optional<bool> auto_read_;
  std::string version_;
};

} // namespace plgpib
