#pragma once
#include "pl-gpib/export.h"
#include "pl-gpib/types.hpp"

#include <string>

namespace plgpib::protocol {

// Adapter-native control vocabulary. Every adapter command starts with "++";
// instrument payloads are escaped so they can never be read as one.
inline constexpr const char *kMode = "++mode";
inline constexpr const char *kAddress = "++addr";
inline constexpr const char *kVersion = "++ver";
inline constexpr const char *kAutoRead = "++auto";
inline constexpr const char *kReadEoi = "++read eoi";

inline constexpr char kEscape = 0x1b;

PL_GPIB_API std::string set_mode(AdapterMode mode);
PL_GPIB_API std::string set_address(GpibAddress address);
PL_GPIB_API std::string set_auto_read(bool enabled);

/// Prefix ESC to CR, LF, ESC and '+' so the adapter forwards them to the
/// instrument instead of interpreting them.
PL_GPIB_API Bytes escape_payload(const Bytes &payload);

/// Drop trailing CR/LF left by the line terminator
PL_GPIB_API Bytes trim_line_ending(Bytes response);

PL_GPIB_API AdapterMode parse_mode(const Bytes &response);
PL_GPIB_API GpibAddress parse_address(const Bytes &response);
PL_GPIB_API bool parse_flag(const Bytes &response);

} // namespace plgpib::protocol
