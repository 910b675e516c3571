#include "pl-gpib/command/ResponseDecoders.hpp"
#include "pl-gpib/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fmt/format.h>
#include <map>
#include <stdexcept>

namespace plgpib {

namespace {

std::string trim(const Bytes &raw) {
  auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto begin = std::find_if(raw.begin(), raw.end(), not_space);
  auto end = std::find_if(raw.rbegin(), raw.rend(), not_space).base();
  return begin < end ? std::string(begin, end) : std::string();
}

std::string upper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return text;
}

double parse_double(const std::string &text, const Bytes &raw) {
  if (text.empty()) {
    throw ResponseParseError("Empty response where a number was expected",
                             raw);
  }
  errno = 0;
  char *end = nullptr;
  double value = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size() || errno == ERANGE) {
    throw ResponseParseError(
        fmt::format("Cannot decode '{}' as a number", text), raw);
  }
  return value;
}

const std::map<std::string, ResponseDecoder> &decoder_table() {
  static const std::map<std::string, ResponseDecoder> table = {
      {"raw", decode_raw},
      {"string", decode_string},
      {"int", decode_int},
      {"float", decode_float},
      {"bool", decode_bool},
      {"float_list", decode_float_list},
  };
  return table;
}

} // namespace

const ResponseDecoder &decoder_by_name(const std::string &name) {
  const auto &table = decoder_table();
  auto it = table.find(name);
  if (it == table.end()) {
    throw std::invalid_argument(fmt::format("Unknown decoder '{}'", name));
  }
  return it->second;
}

bool has_decoder(const std::string &name) {
  return decoder_table().count(name) > 0;
}

std::vector<std::string> decoder_names() {
  std::vector<std::string> names;
  for (const auto &[name, _] : decoder_table()) {
    names.push_back(name);
  }
  return names;
}

ResponseValue decode_raw(const Bytes &raw) { return ResponseValue(raw); }

ResponseValue decode_string(const Bytes &raw) {
  return ResponseValue(trim(raw));
}

ResponseValue decode_int(const Bytes &raw) {
  std::string text = trim(raw);
  if (text.empty()) {
    throw ResponseParseError("Empty response where an integer was expected",
                             raw);
  }
  errno = 0;
  char *end = nullptr;
  long long value = std::strtoll(text.c_str(), &end, 10);
  if (end != text.c_str() + text.size() || errno == ERANGE) {
    throw ResponseParseError(
        fmt::format("Cannot decode '{}' as an integer", text), raw);
  }
  return static_cast<int64_t>(value);
}

ResponseValue decode_float(const Bytes &raw) {
  return parse_double(trim(raw), raw);
}

ResponseValue decode_bool(const Bytes &raw) {
  std::string text = upper(trim(raw));
  if (text == "1" || text == "+1" || text == "ON" || text == "TRUE") {
    return ResponseValue(std::in_place_type<bool>, true);
  }
  if (text == "0" || text == "+0" || text == "OFF" || text == "FALSE") {
    return ResponseValue(std::in_place_type<bool>, false);
  }
  throw ResponseParseError(fmt::format("Cannot decode '{}' as a boolean", text),
                           raw);
}

ResponseValue decode_float_list(const Bytes &raw) {
  std::vector<double> values;
  std::string text = trim(raw);
  if (text.empty()) {
    return values;
  }

  size_t start = 0;
  while (true) {
    size_t comma = text.find(',', start);
    std::string item = trim(text.substr(
        start, comma == std::string::npos ? std::string::npos : comma - start));
    values.push_back(parse_double(item, raw));
    if (comma == std::string::npos)
      break;
    start = comma + 1;
  }
  return values;
}

} // namespace plgpib
