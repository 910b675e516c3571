#include "pl-gpib/adapter/GenericInstrument.hpp"
#include "pl-gpib/Errors.hpp"
#include "pl-gpib/Logger.hpp"
#include "pl-gpib/adapter/AdapterController.hpp"

#include <fmt/format.h>
#include <stdexcept>

namespace plgpib {

namespace {

// Every built-in must be present and unchanged
void require_builtins(const OperationSet &table, const OperationSet &builtins,
                      const char *kind) {
  for (const auto &name : builtins.list_all()) {
    if (!table.contains(name)) {
      throw std::invalid_argument(
          fmt::format("Built-in {} '{}' is missing", kind, name));
    }
    const Descriptor &have = table.get(name);
    const Descriptor &want = builtins.get(name);
    if (have.template_str != want.template_str || have.arity != want.arity ||
        have.decoder_name != want.decoder_name) {
      throw std::invalid_argument(
          fmt::format("Built-in {} '{}' may not be redefined", kind, name));
    }
  }
}

} // namespace

GenericInstrument::GenericInstrument(GpibAddress address,
                                     InstrumentOptions options)
    : GenericInstrument(address, builtin_definition(), std::move(options)) {}

GenericInstrument::GenericInstrument(GpibAddress address,
                                     InstrumentDefinition definition,
                                     InstrumentOptions options)
    : address_(address), timeout_(options.timeout),
      commands_(std::move(definition.commands)),
      queries_(std::move(definition.queries)), name_(std::move(options.name)) {
  if (!is_valid_address(address)) {
    throw InvalidAddress(address);
  }
  InstrumentDefinition builtins = builtin_definition();
  require_builtins(commands_, builtins.commands, "command");
  require_builtins(queries_, builtins.queries, "query");
  if (name_.empty()) {
    name_ = fmt::format("GPIB{}", address);
  }
}

std::string GenericInstrument::name() const {
  std::lock_guard lock(name_mutex_);
  return name_;
}

AdapterController &GenericInstrument::controller() const {
  AdapterController *controller = controller_.load();
  if (!controller) {
    throw NotAttached(fmt::format(
        "Instrument at GPIB address {} is not attached to a controller",
        address_));
  }
  return *controller;
}

void GenericInstrument::attach(AdapterController *controller) {
  controller_ = controller;
}

void GenericInstrument::detach() { controller_ = nullptr; }

void GenericInstrument::write(const Bytes &payload) {
  controller().raw_write(address_, payload);
}

Bytes GenericInstrument::read(size_t max_bytes,
                              std::optional<std::chrono::milliseconds> timeout) {
  return controller().raw_read(address_, max_bytes, timeout.value_or(timeout_));
}

void GenericInstrument::run_command(const std::string &name,
                                    const std::vector<ParamValue> &args) {
  std::string payload = commands_.render(name, args);
  LOG_DEBUG(this->name(), "COMMAND", "{} -> '{}'", name, payload);
  write(payload);
}

ResponseValue
GenericInstrument::run_query(const std::string &name,
                             const std::vector<ParamValue> &args,
                             std::optional<std::chrono::milliseconds> timeout) {
  const Descriptor &d = queries_.get(name);
  std::string payload = queries_.render(name, args);
  auto deadline = timeout.value_or(d.timeout.value_or(timeout_));

  LOG_DEBUG(this->name(), "QUERY", "{} -> '{}'", name, payload);
  Bytes raw = controller().raw_query(address_, payload, d.read_bytes, deadline);

  try {
    return d.decoder(raw);
  } catch (const ResponseParseError &e) {
    LOG_WARN(this->name(), "QUERY", "{}: {}", name, e.what());
    throw;
  }
}

std::string GenericInstrument::identify() {
  ResponseValue ident = query("ident");
  std::string text = std::get<std::string>(ident);
  {
    std::lock_guard lock(name_mutex_);
    name_ = text;
  }
  LOG_INFO(fmt::format("GPIB{}", address_), "IDENT", "Identified as '{}'",
           text);
  return text;
}

InstrumentDefinition
extend_builtins(const std::vector<Descriptor> &extra_commands,
                const std::vector<Descriptor> &extra_queries) {
  InstrumentDefinition def = builtin_definition();
  for (const auto &d : extra_commands) {
    def.commands.add(d);
  }
  for (const auto &d : extra_queries) {
    def.queries.add(d);
  }
  return def;
}

} // namespace plgpib
