#include "pl-gpib/types.hpp"

#include <fmt/format.h>
#include <type_traits>

namespace plgpib {

std::string to_string(AdapterMode mode) {
  switch (mode) {
  case AdapterMode::Device:
    return "device";
  case AdapterMode::Controller:
    return "controller";
  }
  return "unknown";
}

std::string format_param(const ParamValue &value) {
  return std::visit(
      [](const auto &v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
          return v ? "1" : "0";
        } else if constexpr (std::is_same_v<T, double>) {
          // Shortest form that reads back to the same value
          return fmt::format("{}", v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else {
          return std::to_string(v);
        }
      },
      value);
}

} // namespace plgpib
