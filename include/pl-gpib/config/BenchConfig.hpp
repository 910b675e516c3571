#pragma once
#include "pl-gpib/adapter/AdapterController.hpp"
#include "pl-gpib/adapter/GenericInstrument.hpp"
#include "pl-gpib/export.h"

#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace plgpib {

struct OperationConfig {
  std::string name;
  std::string template_str;
  std::optional<size_t> arity;

  // Query only
  std::string decoder{"raw"};
  size_t read_bytes{kDefaultQueryReadBytes};
  std::optional<std::chrono::milliseconds> timeout;
};

struct InstrumentConfig {
  std::string name;
  GpibAddress address{0};
  std::chrono::milliseconds timeout{kDefaultInstrumentTimeout};
  std::vector<OperationConfig> commands;
  std::vector<OperationConfig> queries;
};

struct AdapterConfig {
  std::string port;
  AdapterOptions options;
};

/// One adapter and the instruments on its bus
struct BenchConfig {
  AdapterConfig adapter;
  std::vector<InstrumentConfig> instruments;
};

struct ValidationError {
  std::string path;
  std::string message;
};

struct ValidationResult {
  bool valid{true};
  std::vector<ValidationError> errors;
};

/// Convert a YAML document to JSON, guessing scalar types
PL_GPIB_API nlohmann::json yaml_to_json(const YAML::Node &node);

/// Collects every problem instead of stopping at the first one
PL_GPIB_API ValidationResult validate_bench_config(const nlohmann::json &doc);
PL_GPIB_API ValidationResult validate_bench_file(const std::string &yaml_path);

/// Throw ConfigError listing the validation errors
PL_GPIB_API BenchConfig parse_bench_config(const std::string &yaml_text);
PL_GPIB_API BenchConfig load_bench_config(const std::string &yaml_path);
PL_GPIB_API BenchConfig bench_config_from_json(const nlohmann::json &doc);

/// Built-in table plus the configured entries
PL_GPIB_API std::shared_ptr<GenericInstrument>
make_instrument(const InstrumentConfig &config);

/// A connected controller with every configured instrument attached
class PL_GPIB_API Bench {
public:
  static std::unique_ptr<Bench> open(const BenchConfig &config);

  /// Same, over a caller-supplied transport (port in the config is ignored)
  static std::unique_ptr<Bench> open(const BenchConfig &config,
                                     std::unique_ptr<Transport> transport);

  AdapterController &controller() { return *controller_; }

  /// nullptr for an unknown name
  std::shared_ptr<GenericInstrument> instrument(const std::string &name) const;

  std::vector<std::string> instrument_names() const;

private:
  explicit Bench(const BenchConfig &config);
  void attach_all(const BenchConfig &config);

  std::unique_ptr<AdapterController> controller_;
  std::map<std::string, std::shared_ptr<GenericInstrument>> instruments_;
};

} // namespace plgpib
