#include "pl-gpib/command/Descriptor.hpp"
#include "pl-gpib/command/ResponseDecoders.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>

namespace plgpib {

namespace {

// Walks the template, calling on_text for literal runs and on_index for
// each placeholder index found.
template <typename TextFn, typename IndexFn>
void scan_template(const std::string &tmpl, TextFn &&on_text,
                   IndexFn &&on_index) {
  size_t i = 0;
  while (i < tmpl.size()) {
    char c = tmpl[i];
    if (c == '{' && i + 1 < tmpl.size() && tmpl[i + 1] == '{') {
      on_text('{');
      i += 2;
    } else if (c == '}' && i + 1 < tmpl.size() && tmpl[i + 1] == '}') {
      on_text('}');
      i += 2;
    } else if (c == '{') {
      size_t close = tmpl.find('}', i + 1);
      if (close == std::string::npos || close == i + 1) {
        throw std::invalid_argument(
            fmt::format("Malformed placeholder in template '{}'", tmpl));
      }
      std::string digits = tmpl.substr(i + 1, close - i - 1);
      if (digits.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(fmt::format(
            "Placeholder '{{{}}}' in template '{}' is not an index", digits,
            tmpl));
      }
      on_index(static_cast<size_t>(std::stoul(digits)));
      i = close + 1;
    } else if (c == '}') {
      throw std::invalid_argument(
          fmt::format("Unmatched '}}' in template '{}'", tmpl));
    } else {
      on_text(c);
      ++i;
    }
  }
}

} // namespace

size_t count_placeholders(const std::string &template_str) {
  size_t count = 0;
  scan_template(
      template_str, [](char) {},
      [&](size_t index) { count = std::max(count, index + 1); });
  return count;
}

std::string render_template(const std::string &template_str,
                            const std::vector<ParamValue> &args) {
  std::string out;
  bool has_placeholders = false;
  scan_template(
      template_str, [&](char c) { out.push_back(c); },
      [&](size_t index) {
        has_placeholders = true;
        out += format_param(args.at(index));
      });

  if (!has_placeholders) {
    for (const auto &arg : args) {
      out += ' ';
      out += format_param(arg);
    }
  }
  return out;
}

Descriptor make_command(std::string name, std::string template_str,
                        std::optional<size_t> arity) {
  Descriptor d;
  size_t placeholders = count_placeholders(template_str);
  if (arity && placeholders > 0 && *arity != placeholders) {
    throw std::invalid_argument(fmt::format(
        "Operation '{}': arity {} does not match {} placeholder(s)", name,
        *arity, placeholders));
  }
  d.name = std::move(name);
  d.template_str = std::move(template_str);
  d.arity = arity.value_or(placeholders);
  return d;
}

Descriptor make_query(std::string name, std::string template_str,
                      const std::string &decoder_name,
                      std::optional<size_t> arity, size_t read_bytes,
                      std::optional<std::chrono::milliseconds> timeout) {
  if (read_bytes == 0) {
    throw std::invalid_argument(
        fmt::format("Query '{}': read_bytes must be positive", name));
  }
  Descriptor d = make_command(std::move(name), std::move(template_str), arity);
  d.decoder_name = decoder_name;
  d.decoder = decoder_by_name(decoder_name);
  d.read_bytes = read_bytes;
  d.timeout = timeout;
  return d;
}

nlohmann::json Descriptor::to_json() const {
  nlohmann::json j;
  j["name"] = name;
  j["template"] = template_str;
  j["arity"] = arity;
  if (decoder) {
    j["decoder"] = decoder_name;
    j["read_bytes"] = read_bytes;
  }
  if (timeout) {
    j["timeout_ms"] = timeout->count();
  }
  return j;
}

} // namespace plgpib
