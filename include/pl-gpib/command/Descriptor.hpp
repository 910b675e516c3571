#pragma once
#include "pl-gpib/export.h"
#include "pl-gpib/types.hpp"

#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace plgpib {

using ResponseDecoder = std::function<ResponseValue(const Bytes &)>;

/// Named protocol operation: a literal instrument string, optionally with
/// positional placeholders ({0}, {1}, ...). A template without placeholders
/// but with a non-zero arity gets its arguments appended, space separated.
struct Descriptor {
  std::string name;
  std::string template_str;
  size_t arity{0};

  // Query only
  std::string decoder_name{"raw"};
  ResponseDecoder decoder;
  size_t read_bytes{kDefaultQueryReadBytes};
  std::optional<std::chrono::milliseconds> timeout;

  nlohmann::json to_json() const;
};

/// Highest placeholder index + 1, or 0 when the template has none.
/// Throws std::invalid_argument on an unbalanced or non-numeric placeholder.
PL_GPIB_API size_t count_placeholders(const std::string &template_str);

/// Expands a template with already-validated arguments
PL_GPIB_API std::string render_template(const std::string &template_str,
                                        const std::vector<ParamValue> &args);

/// Build a command descriptor. Arity defaults to the placeholder count.
PL_GPIB_API Descriptor make_command(std::string name, std::string template_str,
                                    std::optional<size_t> arity = std::nullopt);

/// Build a query descriptor with a named decoder (see ResponseDecoders.hpp)
PL_GPIB_API Descriptor
make_query(std::string name, std::string template_str,
           const std::string &decoder_name = "raw",
           std::optional<size_t> arity = std::nullopt,
           size_t read_bytes = kDefaultQueryReadBytes,
           std::optional<std::chrono::milliseconds> timeout = std::nullopt);

} // namespace plgpib
