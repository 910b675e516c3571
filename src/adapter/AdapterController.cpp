#include "pl-gpib/adapter/AdapterController.hpp"
#include "pl-gpib/Errors.hpp"
#include "pl-gpib/Logger.hpp"
#include "pl-gpib/adapter/AdapterProtocol.hpp"

#include <fmt/format.h>
#include <stdexcept>

namespace plgpib {

namespace {

/// Adapter replies are short: a digit, an address or the version banner
constexpr size_t kAdapterReplyBytes = 100;

std::string addr_context(GpibAddress address) {
  return fmt::format("GPIB{}", address);
}

} // namespace

AdapterController::AdapterController(AdapterOptions options)
    : options_(std::move(options)) {}

AdapterController::~AdapterController() {
  for (auto &instrument : registry_.clear()) {
    instrument->detach();
  }
  try {
    close();
  } catch (const std::exception &e) {
    LOG_ERROR("ADAPTER", "CLOSE", "Error closing adapter: {}", e.what());
  }
}

void AdapterController::connect(const std::string &port) {
  LOG_INFO("ADAPTER", "CONNECT", "Connecting to adapter on {}", port);
  std::unique_ptr<Transport> serial;
  try {
    serial = std::make_unique<SerialTransport>(port, options_.serial);
  } catch (const IOError &e) {
    throw ConnectError(fmt::format("Cannot use {}: {}", port, e.what()));
  }
  connect(std::move(serial));
}

void AdapterController::connect(std::unique_ptr<Transport> transport) {
  if (!transport) {
    throw std::invalid_argument("connect() needs a transport");
  }

  BusLock bus(bus_mutex_);
  close();

  const std::string port = transport->port_name();
  try {
    transport->open();
  } catch (const GpibError &e) {
    LOG_ERROR("ADAPTER", "CONNECT", "Cannot open {}: {}", port, e.what());
    throw ConnectError(fmt::format("Cannot open {}: {}", port, e.what()));
  }

  {
    std::lock_guard lock(state_mutex_);
    transport_ = std::move(transport);
    current_address_.reset();
    mode_.reset();
    auto_read_.reset();
    version_.clear();
  }

  try {
    handshake();
  } catch (const GpibError &e) {
    LOG_ERROR("ADAPTER", "CONNECT", "Handshake with {} failed: {}", port,
              e.what());
    close();
    throw ConnectError(
        fmt::format("Adapter on {} failed the handshake: {}", port, e.what()));
  }

  LOG_INFO("ADAPTER", "CONNECT",
           "Connected to '{}' on {} (mode={}, address={})", version(), port,
           to_string(*mode()), current_address().value_or(0));
}

void AdapterController::handshake() {
  query_mode();
  query_address();
  query_version();

  if (options_.initial_mode && *options_.initial_mode != *mode()) {
    set_mode(*options_.initial_mode);
  }
  if (options_.auto_read) {
    set_auto_read(*options_.auto_read);
  }
}

void AdapterController::close() {
  std::shared_ptr<Transport> transport;
  {
    std::lock_guard lock(state_mutex_);
    transport = transport_;
    current_address_.reset();
  }
  if (transport && transport->is_open()) {
    transport->close();
    LOG_INFO("ADAPTER", "CLOSE", "Closed {}", transport->port_name());
  }
}

bool AdapterController::is_connected() const {
  auto t = transport();
  return t && t->is_open();
}

std::string AdapterController::port_name() const {
  auto t = transport();
  return t ? t->port_name() : std::string();
}

std::shared_ptr<Transport> AdapterController::transport() const {
  std::lock_guard lock(state_mutex_);
  return transport_;
}

std::optional<AdapterMode> AdapterController::mode() const {
  std::lock_guard lock(state_mutex_);
  return mode_;
}

std::optional<GpibAddress> AdapterController::current_address() const {
  std::lock_guard lock(state_mutex_);
  return current_address_;
}

std::string AdapterController::version() const {
  std::lock_guard lock(state_mutex_);
  return version_;
}

std::optional<bool> AdapterController::auto_read() const {
  std::lock_guard lock(state_mutex_);
  return auto_read_;
}

void AdapterController::send_adapter(const std::string &line) {
  auto t = transport();
  if (!t) {
    throw IOError("Adapter is not connected");
  }
  t->write_line(line);
  LOG_TRACE("ADAPTER", "TX", "{}", line);
}

Bytes AdapterController::read_adapter() {
  auto t = transport();
  if (!t) {
    throw IOError("Adapter is not connected");
  }
  Bytes reply =
      protocol::trim_line_ending(t->read(kAdapterReplyBytes, options_.adapter_timeout));
  LOG_TRACE("ADAPTER", "RX", "{}", reply);
  throw_if_adapter_error(reply);
  return reply;
}

void AdapterController::discard_input() {
  auto t = transport();
  if (!t) {
    throw IOError("Adapter is not connected");
  }
  t->discard_input();
}

void AdapterController::invalidate_address() {
  std::lock_guard lock(state_mutex_);
  current_address_.reset();
}

void AdapterController::set_mode(AdapterMode mode) {
  BusLock bus(bus_mutex_);
  send_adapter(protocol::set_mode(mode));
  std::lock_guard lock(state_mutex_);
  mode_ = mode;
  LOG_DEBUG("ADAPTER", "MODE", "Mode set to {}", to_string(mode));
}

AdapterMode AdapterController::query_mode() {
  BusLock bus(bus_mutex_);
  send_adapter(protocol::kMode);
  AdapterMode mode = protocol::parse_mode(read_adapter());
  std::lock_guard lock(state_mutex_);
  mode_ = mode;
  return mode;
}

GpibAddress AdapterController::query_address() {
  BusLock bus(bus_mutex_);
  invalidate_address();
  send_adapter(protocol::kAddress);
  GpibAddress address = protocol::parse_address(read_adapter());
  std::lock_guard lock(state_mutex_);
  current_address_ = address;
  return address;
}

std::string AdapterController::query_version() {
  BusLock bus(bus_mutex_);
  send_adapter(protocol::kVersion);
  Bytes reply = read_adapter();
  if (reply.empty()) {
    throw ResponseParseError("Adapter returned an empty version string", reply);
  }
  std::lock_guard lock(state_mutex_);
  version_ = reply;
  return reply;
}

void AdapterController::set_auto_read(bool enabled) {
  BusLock bus(bus_mutex_);
  send_adapter(protocol::set_auto_read(enabled));
  std::lock_guard lock(state_mutex_);
  auto_read_ = enabled;
  LOG_DEBUG("ADAPTER", "AUTO", "Read-after-write {}",
            enabled ? "enabled" : "disabled");
}

bool AdapterController::query_auto_read() {
  BusLock bus(bus_mutex_);
  send_adapter(protocol::kAutoRead);
  bool enabled = protocol::parse_flag(read_adapter());
  std::lock_guard lock(state_mutex_);
  auto_read_ = enabled;
  return enabled;
}

void AdapterController::address_instrument(GpibAddress address) {
  if (!is_valid_address(address)) {
    throw InvalidAddress(address);
  }

  BusLock bus(bus_mutex_);
  if (current_address() == address) {
    return;
  }

  // Bytes still buffered belong to the previous instrument
  discard_input();

  // A failed write leaves the cache empty so the next call re-addresses
  invalidate_address();
  send_adapter(protocol::set_address(address));

  std::lock_guard lock(state_mutex_);
  current_address_ = address;
  LOG_DEBUG("ADAPTER", "ADDR", "Addressed GPIB {}", address);
}

void AdapterController::add_instrument(std::shared_ptr<Instrument> instrument) {
  if (!instrument) {
    throw std::invalid_argument("Cannot add a null instrument");
  }
  if (instrument->is_attached()) {
    throw GpibError(fmt::format("{} is already attached to a controller",
                                instrument->name()));
  }

  registry_.insert(instrument);
  instrument->attach(this);
  LOG_INFO("ADAPTER", "ATTACH", "Attached '{}' at GPIB {}", instrument->name(),
           instrument->address());
}

std::shared_ptr<Instrument>
AdapterController::remove_instrument(GpibAddress address) {
  auto instrument = registry_.erase(address);
  instrument->detach();
  LOG_INFO("ADAPTER", "DETACH", "Detached '{}' from GPIB {}",
           instrument->name(), address);
  return instrument;
}

std::shared_ptr<Instrument>
AdapterController::instrument(GpibAddress address) const {
  return registry_.find(address);
}

std::vector<GpibAddress> AdapterController::instrument_addresses() const {
  return registry_.addresses();
}

void AdapterController::raw_write(GpibAddress address, const Bytes &payload) {
  BusLock bus(bus_mutex_);
  address_instrument(address);
  send_adapter(protocol::escape_payload(payload));
  LOG_TRACE(addr_context(address), "WRITE", "{}", payload);
}

Bytes AdapterController::raw_read(GpibAddress address, size_t max_bytes,
                                  std::chrono::milliseconds timeout) {
  BusLock bus(bus_mutex_);
  address_instrument(address);

  // Without read-after-write the adapter only talks when asked to
  if (!auto_read().value_or(false)) {
    send_adapter(protocol::kReadEoi);
  }

  auto t = transport();
  if (!t) {
    throw IOError("Adapter is not connected");
  }

  Bytes reply;
  try {
    reply = protocol::trim_line_ending(t->read(max_bytes, timeout));
  } catch (const TimeoutError &) {
    LOG_WARN(addr_context(address), "READ", "No response within {} ms",
             timeout.count());
    throw;
  }

  LOG_TRACE(addr_context(address), "READ", "{}", reply);
  throw_if_adapter_error(reply);
  return reply;
}

Bytes AdapterController::raw_query(GpibAddress address, const Bytes &payload,
                                   size_t max_bytes,
                                   std::chrono::milliseconds timeout) {
  BusLock bus(bus_mutex_);
  address_instrument(address);
  // A reply left over from an earlier timed-out or short read is not ours
  discard_input();
  raw_write(address, payload);
  return raw_read(address, max_bytes, timeout);
}

} // namespace plgpib
