#pragma once
#include "pl-gpib/command/OperationSet.hpp"

namespace plgpib {

/// Command and query tables an instrument is built from
struct InstrumentDefinition {
  CommandSet commands;
  QuerySet queries;
};

/// IEEE 488.2 common commands every instrument starts with:
///
///   commands: reset, clear, wait, save(n), recall(n),
///             event_status_enable(mask), service_request_enable(mask),
///             operation_complete
///   queries:  ident, self_test, status_byte, event_status,
///             event_status_enable, service_request_enable,
///             operation_complete, options
PL_GPIB_API InstrumentDefinition builtin_definition();

} // namespace plgpib
