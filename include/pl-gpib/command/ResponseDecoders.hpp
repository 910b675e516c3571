#pragma once
#include "pl-gpib/command/Descriptor.hpp"

#include <string>
#include <vector>

namespace plgpib {

/// Decoders available to query descriptors, by name:
///   raw        - bytes unchanged
///   string     - text with surrounding whitespace removed
///   int        - signed integer
///   float      - floating point, SCPI NR1/NR2/NR3 forms
///   bool       - 0/1, ON/OFF, TRUE/FALSE
///   float_list - comma separated floats
/// Every decoder raises ResponseParseError (holding the input) on failure.
PL_GPIB_API const ResponseDecoder &decoder_by_name(const std::string &name);

PL_GPIB_API bool has_decoder(const std::string &name);

PL_GPIB_API std::vector<std::string> decoder_names();

PL_GPIB_API ResponseValue decode_raw(const Bytes &raw);
PL_GPIB_API ResponseValue decode_string(const Bytes &raw);
PL_GPIB_API ResponseValue decode_int(const Bytes &raw);
PL_GPIB_API ResponseValue decode_float(const Bytes &raw);
PL_GPIB_API ResponseValue decode_bool(const Bytes &raw);
PL_GPIB_API ResponseValue decode_float_list(const Bytes &raw);

} // namespace plgpib
