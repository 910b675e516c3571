#include "pl-gpib/config/BenchConfig.hpp"
#include "pl-gpib/Errors.hpp"
#include "pl-gpib/Logger.hpp"
#include "pl-gpib/command/ResponseDecoders.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <optional>
#include <set>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace plgpib {

nlohmann::json yaml_to_json(const YAML::Node &node) {
  if (!node || node.IsNull()) {
    return nullptr;
  } else if (node.IsScalar()) {
    // Quoted scalars stay strings
    if (node.Tag() == "!") {
      return node.as<std::string>();
    }
    int64_t i;
    if (YAML::convert<int64_t>::decode(node, i)) {
      return i;
    }
    double d;
    if (YAML::convert<double>::decode(node, d)) {
      return d;
    }
    bool b;
    if (YAML::convert<bool>::decode(node, b)) {
      return b;
    }
    return node.as<std::string>();
  } else if (node.IsSequence()) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto &item : node) {
      arr.push_back(yaml_to_json(item));
    }
    return arr;
  } else if (node.IsMap()) {
    nlohmann::json obj = nlohmann::json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  return nullptr;
}

namespace {

std::string node_path(const std::vector<std::string> &path) {
  std::string out;
  for (const auto &p : path) {
    out += "/" + p;
  }
  return out.empty() ? "/" : out;
}

void add_error(ValidationResult &result, const std::vector<std::string> &path,
               const std::string &msg) {
  result.valid = false;
  result.errors.push_back({node_path(path), msg});
}

bool is_positive_int(const nlohmann::json &j) {
  return j.is_number_integer() && j.get<int64_t>() > 0;
}

void validate_operation(const std::string &name, const nlohmann::json &op,
                        bool query, const OperationSet &builtins,
                        ValidationResult &result,
                        const std::vector<std::string> &path) {
  if (builtins.contains(name)) {
    add_error(result, path,
              fmt::format("'{}' would replace a built-in operation", name));
  }

  const nlohmann::json *tmpl = nullptr;
  if (op.is_string()) {
    tmpl = &op;
  } else if (op.is_object()) {
    if (!op.contains("template") || !op["template"].is_string()) {
      add_error(result, path, "Missing required string field 'template'");
    } else {
      tmpl = &op["template"];
    }
    if (op.contains("arity") &&
        !(op["arity"].is_number_integer() && op["arity"].get<int64_t>() >= 0)) {
      add_error(result, path, "arity must be a non-negative integer");
    }
    if (query) {
      if (op.contains("decoder") &&
          !(op["decoder"].is_string() &&
            has_decoder(op["decoder"].get<std::string>()))) {
        add_error(result, path,
                  fmt::format("decoder must be one of: {}",
                              fmt::join(decoder_names(), ", ")));
      }
      for (const auto &key : {"read_bytes", "timeout_ms"}) {
        if (op.contains(key) && !is_positive_int(op[key])) {
          add_error(result, path,
                    std::string(key) + " must be a positive integer");
        }
      }
    } else {
      for (const auto &key : {"decoder", "read_bytes", "timeout_ms"}) {
        if (op.contains(key)) {
          add_error(result, path,
                    std::string("'") + key + "' only applies to queries");
        }
      }
    }
  } else {
    add_error(result, path, "Operation must be a template string or a map");
  }

  if (tmpl) {
    try {
      size_t placeholders = count_placeholders(tmpl->get<std::string>());
      if (op.is_object() && op.contains("arity") &&
          op["arity"].is_number_integer() && placeholders > 0 &&
          op["arity"].get<int64_t>() != static_cast<int64_t>(placeholders)) {
        add_error(result, path,
                  fmt::format("arity does not match the {} placeholder(s)",
                              placeholders));
      }
    } catch (const std::invalid_argument &e) {
      add_error(result, path, e.what());
    }
  }
}

void validate_adapter(const nlohmann::json &adapter, ValidationResult &result) {
  std::vector<std::string> path = {"adapter"};
  if (!adapter.is_object()) {
    add_error(result, path, "adapter must be a map");
    return;
  }
  if (!adapter.contains("port") || !adapter["port"].is_string() ||
      adapter["port"].get<std::string>().empty()) {
    add_error(result, path, "Missing required string field 'port'");
  }
  for (const auto &key : {"baud_rate", "timeout_ms"}) {
    if (adapter.contains(key) && !is_positive_int(adapter[key])) {
      add_error(result, path, std::string(key) + " must be a positive integer");
    }
  }
  if (adapter.contains("eos") &&
      !(adapter["eos"].is_string() &&
        !adapter["eos"].get<std::string>().empty())) {
    add_error(result, path, "eos must be a non-empty string");
  }
  if (adapter.contains("mode")) {
    const auto &mode = adapter["mode"];
    if (!mode.is_string() ||
        (mode != "controller" && mode != "device")) {
      add_error(result, path, "mode must be 'controller' or 'device'");
    }
  }
  if (adapter.contains("auto_read") && !adapter["auto_read"].is_boolean()) {
    add_error(result, path, "auto_read must be a boolean");
  }
}

void validate_instrument(const nlohmann::json &inst, size_t index,
                         const InstrumentDefinition &builtins,
                         std::set<int64_t> &addresses,
                         std::set<std::string> &names,
                         ValidationResult &result) {
  std::vector<std::string> path = {"instruments", std::to_string(index)};
  if (!inst.is_object()) {
    add_error(result, path, "Instrument entry must be a map");
    return;
  }

  std::optional<int64_t> valid_address;
  if (!inst.contains("address") || !inst["address"].is_number_integer()) {
    add_error(result, path, "Missing required integer field 'address'");
  } else {
    int64_t address = inst["address"].get<int64_t>();
    if (address < kMinAddress || address > kMaxAddress) {
      add_error(result, path,
                fmt::format("address {} outside {}..{}", address, kMinAddress,
                            kMaxAddress));
    } else if (!addresses.insert(address).second) {
      add_error(result, path,
                fmt::format("address {} is used twice", address));
    } else {
      valid_address = address;
    }
  }

  // Unnamed instruments are known as GPIB<address>
  std::optional<std::string> name;
  if (inst.contains("name")) {
    if (!inst["name"].is_string()) {
      add_error(result, path, "name must be a string");
    } else {
      name = inst["name"].get<std::string>();
    }
  } else if (valid_address) {
    name = fmt::format("GPIB{}", *valid_address);
  }
  if (name && !names.insert(*name).second) {
    add_error(result, path, fmt::format("name '{}' is used twice", *name));
  }

  if (inst.contains("timeout_ms") && !is_positive_int(inst["timeout_ms"])) {
    add_error(result, path, "timeout_ms must be a positive integer");
  }

  for (const auto &[key, query] :
       {std::pair{"commands", false}, std::pair{"queries", true}}) {
    if (!inst.contains(key)) {
      continue;
    }
    const auto &ops = inst[key];
    if (!ops.is_object()) {
      add_error(result, path, std::string(key) + " must be a map");
      continue;
    }
    const OperationSet &table =
        query ? static_cast<const OperationSet &>(builtins.queries)
              : static_cast<const OperationSet &>(builtins.commands);
    for (const auto &[name, op] : ops.items()) {
      std::vector<std::string> op_path = path;
      op_path.push_back(key);
      op_path.push_back(name);
      validate_operation(name, op, query, table, result, op_path);
    }
  }
}

OperationConfig operation_from_json(const std::string &name,
                                    const nlohmann::json &op) {
  OperationConfig cfg;
  cfg.name = name;
  if (op.is_string()) {
    cfg.template_str = op.get<std::string>();
    return cfg;
  }
  cfg.template_str = op["template"].get<std::string>();
  if (op.contains("arity")) {
    cfg.arity = op["arity"].get<size_t>();
  }
  cfg.decoder = op.value("decoder", std::string("raw"));
  cfg.read_bytes = op.value("read_bytes", kDefaultQueryReadBytes);
  if (op.contains("timeout_ms")) {
    cfg.timeout = std::chrono::milliseconds(op["timeout_ms"].get<int64_t>());
  }
  return cfg;
}

} // namespace

ValidationResult validate_bench_config(const nlohmann::json &doc) {
  ValidationResult result;
  if (!doc.is_object()) {
    add_error(result, {}, "Bench configuration must be a map");
    return result;
  }

  if (!doc.contains("adapter")) {
    add_error(result, {}, "Missing required field 'adapter'");
  } else {
    validate_adapter(doc["adapter"], result);
  }

  if (doc.contains("instruments")) {
    const auto &instruments = doc["instruments"];
    if (!instruments.is_array()) {
      add_error(result, {"instruments"}, "instruments must be a sequence");
    } else {
      InstrumentDefinition builtins = builtin_definition();
      std::set<int64_t> addresses;
      std::set<std::string> names;
      for (size_t i = 0; i < instruments.size(); ++i) {
        validate_instrument(instruments[i], i, builtins, addresses, names,
                            result);
      }
    }
  }
  return result;
}

ValidationResult validate_bench_file(const std::string &yaml_path) {
  ValidationResult result;
  try {
    YAML::Node doc = YAML::LoadFile(yaml_path);
    return validate_bench_config(yaml_to_json(doc));
  } catch (const YAML::Exception &e) {
    add_error(result, {}, e.what());
  }
  return result;
}

BenchConfig bench_config_from_json(const nlohmann::json &doc) {
  ValidationResult result = validate_bench_config(doc);
  if (!result.valid) {
    std::string msg = "Invalid bench configuration:";
    for (const auto &err : result.errors) {
      msg += fmt::format("\n  {}: {}", err.path, err.message);
    }
    throw ConfigError(msg);
  }

  BenchConfig config;
  const auto &adapter = doc["adapter"];
  config.adapter.port = adapter["port"].get<std::string>();
  auto &options = config.adapter.options;
  options.serial.baud_rate =
      adapter.value("baud_rate", options.serial.baud_rate);
  options.serial.terminator =
      adapter.value("eos", options.serial.terminator);
  if (adapter.contains("timeout_ms")) {
    options.adapter_timeout =
        std::chrono::milliseconds(adapter["timeout_ms"].get<int64_t>());
  }
  if (adapter.contains("mode")) {
    options.initial_mode = adapter["mode"] == "device"
                               ? AdapterMode::Device
                               : AdapterMode::Controller;
  }
  if (adapter.contains("auto_read")) {
    options.auto_read = adapter["auto_read"].get<bool>();
  }

  if (doc.contains("instruments")) {
    for (const auto &inst : doc["instruments"]) {
      InstrumentConfig ic;
      ic.address = static_cast<GpibAddress>(inst["address"].get<int64_t>());
      ic.name = inst.value("name", fmt::format("GPIB{}", ic.address));
      if (inst.contains("timeout_ms")) {
        ic.timeout =
            std::chrono::milliseconds(inst["timeout_ms"].get<int64_t>());
      }
      if (inst.contains("commands")) {
        for (const auto &[name, op] : inst["commands"].items()) {
          ic.commands.push_back(operation_from_json(name, op));
        }
      }
      if (inst.contains("queries")) {
        for (const auto &[name, op] : inst["queries"].items()) {
          ic.queries.push_back(operation_from_json(name, op));
        }
      }
      config.instruments.push_back(std::move(ic));
    }
  }
  return config;
}

BenchConfig parse_bench_config(const std::string &yaml_text) {
  try {
    return bench_config_from_json(yaml_to_json(YAML::Load(yaml_text)));
  } catch (const YAML::Exception &e) {
    throw ConfigError(fmt::format("Cannot parse bench YAML: {}", e.what()));
  }
}

BenchConfig load_bench_config(const std::string &yaml_path) {
  LOG_INFO("CONFIG", "LOAD", "Loading bench from: {}", yaml_path);
  try {
    return bench_config_from_json(yaml_to_json(YAML::LoadFile(yaml_path)));
  } catch (const YAML::Exception &e) {
    LOG_ERROR("CONFIG", "LOAD", "Failed to load config: {}", e.what());
    throw ConfigError(
        fmt::format("Cannot load bench file {}: {}", yaml_path, e.what()));
  }
}

std::shared_ptr<GenericInstrument>
make_instrument(const InstrumentConfig &config) {
  std::vector<Descriptor> commands;
  for (const auto &op : config.commands) {
    commands.push_back(make_command(op.name, op.template_str, op.arity));
  }
  std::vector<Descriptor> queries;
  for (const auto &op : config.queries) {
    queries.push_back(make_query(op.name, op.template_str, op.decoder, op.arity,
                                 op.read_bytes, op.timeout));
  }

  InstrumentOptions options;
  options.name = config.name;
  options.timeout = config.timeout;
  return std::make_shared<GenericInstrument>(
      config.address, extend_builtins(commands, queries), options);
}

Bench::Bench(const BenchConfig &config)
    : controller_(std::make_unique<AdapterController>(config.adapter.options)) {
}

std::unique_ptr<Bench> Bench::open(const BenchConfig &config) {
  std::unique_ptr<Bench> bench(new Bench(config));
  bench->controller_->connect(config.adapter.port);
  bench->attach_all(config);
  return bench;
}

std::unique_ptr<Bench> Bench::open(const BenchConfig &config,
                                   std::unique_ptr<Transport> transport) {
  std::unique_ptr<Bench> bench(new Bench(config));
  bench->controller_->connect(std::move(transport));
  bench->attach_all(config);
  return bench;
}

void Bench::attach_all(const BenchConfig &config) {
  for (const auto &ic : config.instruments) {
    auto instrument = make_instrument(ic);
    controller_->add_instrument(instrument);
    instruments_[ic.name] = instrument;
  }
  LOG_INFO("BENCH", "OPEN", "{} instrument(s) attached on {}",
           instruments_.size(), controller_->port_name());
}

std::shared_ptr<GenericInstrument>
Bench::instrument(const std::string &name) const {
  auto it = instruments_.find(name);
  if (it == instruments_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<std::string> Bench::instrument_names() const {
  std::vector<std::string> names;
  for (const auto &[name, _] : instruments_) {
    names.push_back(name);
  }
  return names;
}

} // namespace plgpib
