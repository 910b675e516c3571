#include "pl-gpib/Errors.hpp"

#include <fmt/format.h>
#include <functional>

namespace plgpib {

DuplicateAddress::DuplicateAddress(GpibAddress address)
    : GpibError(fmt::format("GPIB address {} is already in use", address)),
      address_(address) {}

NotFound::NotFound(GpibAddress address)
    : GpibError(fmt::format("No instrument registered at GPIB address {}",
                            address)),
      address_(address) {}

InvalidAddress::InvalidAddress(int address)
    : GpibError(fmt::format("GPIB address {} outside {}..{}", address,
                            kMinAddress, kMaxAddress)) {}

UnknownCommand::UnknownCommand(const std::string &name)
    : GpibError(fmt::format("Unknown operation '{}'", name)) {}

ArityError::ArityError(const std::string &name, size_t expected, size_t given)
    : GpibError(fmt::format("Operation '{}' takes {} argument(s), {} given",
                            name, expected, given)),
      expected_(expected), given_(given) {}

ResponseParseError::ResponseParseError(const std::string &what, Bytes raw)
    : GpibError(what), raw_(std::move(raw)) {}

UnrecognizedCommand::UnrecognizedCommand()
    : AdapterCommandError("Adapter reported: Unrecognized Command") {}

void throw_if_adapter_error(const Bytes &response) {
  static const std::map<Bytes, std::function<void()>> kAdapterErrors = {
      {"Unrecognized Command", [] { throw UnrecognizedCommand(); }},
  };

  auto it = kAdapterErrors.find(response);
  if (it != kAdapterErrors.end()) {
    it->second();
  }
}

} // namespace plgpib
