#pragma once
#include "pl-gpib/export.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace plgpib {

/// Raw bytes exchanged with the adapter. GPIB traffic is 8-bit clean.
using Bytes = std::string;

/// Primary GPIB bus address
using GpibAddress = uint8_t;

constexpr GpibAddress kMinAddress = 1;
constexpr GpibAddress kMaxAddress = 30;

constexpr bool is_valid_address(int address) {
  return address >= kMinAddress && address <= kMaxAddress;
}

/// Number of bytes a query reads back when nothing else is configured
constexpr size_t kDefaultQueryReadBytes = 100;

constexpr std::chrono::milliseconds kDefaultInstrumentTimeout{1000};
constexpr std::chrono::milliseconds kDefaultStartupTimeout{1000};

/// Operating mode of the adapter (the values are the ++mode wire values)
enum class AdapterMode : int { Device = 0, Controller = 1 };

PL_GPIB_API std::string to_string(AdapterMode mode);

/// Argument passed to a command or query template
using ParamValue = std::variant<int64_t, double, bool, std::string>;

/// Decoded query response. Undecoded (raw) responses are held as the string
/// alternative, byte for byte.
using ResponseValue =
    std::variant<std::string, int64_t, double, bool, std::vector<double>>;

/// Text form of an argument as written into a protocol string
PL_GPIB_API std::string format_param(const ParamValue &value);

} // namespace plgpib
