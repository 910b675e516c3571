#include "pl-gpib/adapter/AdapterProtocol.hpp"
#include "pl-gpib/Errors.hpp"

#include <fmt/format.h>

namespace plgpib::protocol {

namespace {

int parse_small_int(const Bytes &response, const char *what) {
  Bytes text = trim_line_ending(response);
  if (text.empty() || text.size() > 3 ||
      text.find_first_not_of("0123456789") != Bytes::npos) {
    throw ResponseParseError(
        fmt::format("Adapter {} reply '{}' is not a number", what, text),
        response);
  }
  return std::stoi(text);
}

} // namespace

std::string set_mode(AdapterMode mode) {
  return fmt::format("{} {}", kMode, static_cast<int>(mode));
}

std::string set_address(GpibAddress address) {
  return fmt::format("{} {}", kAddress, address);
}

std::string set_auto_read(bool enabled) {
  return fmt::format("{} {}", kAutoRead, enabled ? 1 : 0);
}

Bytes escape_payload(const Bytes &payload) {
  Bytes out;
  out.reserve(payload.size());
  for (char c : payload) {
    if (c == '\r' || c == '\n' || c == kEscape || c == '+') {
      out.push_back(kEscape);
    }
    out.push_back(c);
  }
  return out;
}

Bytes trim_line_ending(Bytes response) {
  while (!response.empty() &&
         (response.back() == '\n' || response.back() == '\r')) {
    response.pop_back();
  }
  return response;
}

AdapterMode parse_mode(const Bytes &response) {
  int value = parse_small_int(response, "mode");
  switch (value) {
  case 0:
    return AdapterMode::Device;
  case 1:
    return AdapterMode::Controller;
  default:
    throw ResponseParseError(
        fmt::format("Adapter mode reply {} is neither 0 nor 1", value),
        response);
  }
}

GpibAddress parse_address(const Bytes &response) {
  int value = parse_small_int(response, "address");
  if (value > kMaxAddress) {
    throw ResponseParseError(
        fmt::format("Adapter address reply {} out of range", value), response);
  }
  return static_cast<GpibAddress>(value);
}

bool parse_flag(const Bytes &response) {
  int value = parse_small_int(response, "flag");
  if (value > 1) {
    throw ResponseParseError(
        fmt::format("Adapter flag reply {} is neither 0 nor 1", value),
        response);
  }
  return value == 1;
}

} // namespace plgpib::protocol
