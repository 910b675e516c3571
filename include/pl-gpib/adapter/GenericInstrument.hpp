#pragma once
#include "pl-gpib/adapter/Instrument.hpp"
#include "pl-gpib/command/Builtins.hpp"

#include <atomic>
#include <mutex>

namespace plgpib {

struct InstrumentOptions {
  std::string name; // defaults to "GPIB<address>"
  std::chrono::milliseconds timeout{kDefaultInstrumentTimeout};
};

/// Default Instrument: the built-in IEEE 488.2 table plus whatever the
/// definition passed in adds. Tables are fixed once constructed; a
/// definition missing or altering a built-in throws std::invalid_argument.
class PL_GPIB_API GenericInstrument : public Instrument {
public:
  explicit GenericInstrument(GpibAddress address,
                             InstrumentOptions options = InstrumentOptions{});
  GenericInstrument(GpibAddress address, InstrumentDefinition definition,
                    InstrumentOptions options = InstrumentOptions{});

  GenericInstrument(const GenericInstrument &) = delete;
  GenericInstrument &operator=(const GenericInstrument &) = delete;

  GpibAddress address() const override { return address_; }
  std::string name() const override;
  bool is_attached() const override { return controller_ != nullptr; }

  using Instrument::read;
  void write(const Bytes &payload) override;
  Bytes read(size_t max_bytes,
             std::optional<std::chrono::milliseconds> timeout) override;

  const CommandSet &commands() const override { return commands_; }
  const QuerySet &queries() const override { return queries_; }

  void run_command(const std::string &name,
                   const std::vector<ParamValue> &args) override;
  ResponseValue
  run_query(const std::string &name, const std::vector<ParamValue> &args,
            std::optional<std::chrono::milliseconds> timeout) override;

  /// Run the identification query and keep the answer as the name
  std::string identify();

  std::chrono::milliseconds timeout() const { return timeout_; }

protected:
  void attach(AdapterController *controller) override;
  void detach() override;

private:
  AdapterController &controller() const;

  const GpibAddress address_;
  const std::chrono::milliseconds timeout_;
  const CommandSet commands_;
  const QuerySet queries_;

  mutable std::mutex name_mutex_;
  std::string name_;

  std::atomic<AdapterController *> controller_{nullptr};
};

/// Built-in table with the extra entries merged in. Throws
/// std::invalid_argument when an extra entry reuses a built-in name.
PL_GPIB_API InstrumentDefinition
extend_builtins(const std::vector<Descriptor> &extra_commands,
                const std::vector<Descriptor> &extra_queries);

} // namespace plgpib
