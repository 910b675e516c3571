#include "pl-gpib/adapter/InstrumentRegistry.hpp"
#include "pl-gpib/Errors.hpp"

#include <stdexcept>

namespace plgpib {

void InstrumentRegistry::insert(std::shared_ptr<Instrument> instrument) {
  if (!instrument) {
    throw std::invalid_argument("Cannot register a null instrument");
  }
  GpibAddress address = instrument->address();
  if (!is_valid_address(address)) {
    throw InvalidAddress(address);
  }

  std::lock_guard lock(mutex_);
  if (instruments_.count(address)) {
    throw DuplicateAddress(address);
  }
  instruments_.emplace(address, std::move(instrument));
}

std::shared_ptr<Instrument> InstrumentRegistry::erase(GpibAddress address) {
  std::lock_guard lock(mutex_);
  auto it = instruments_.find(address);
  if (it == instruments_.end()) {
    throw NotFound(address);
  }
  auto instrument = std::move(it->second);
  instruments_.erase(it);
  return instrument;
}

std::shared_ptr<Instrument>
InstrumentRegistry::find(GpibAddress address) const {
  std::lock_guard lock(mutex_);
  auto it = instruments_.find(address);
  if (it == instruments_.end()) {
    return nullptr;
  }
  return it->second;
}

bool InstrumentRegistry::contains(GpibAddress address) const {
  std::lock_guard lock(mutex_);
  return instruments_.count(address) > 0;
}

std::vector<GpibAddress> InstrumentRegistry::addresses() const {
  std::lock_guard lock(mutex_);
  std::vector<GpibAddress> out;
  out.reserve(instruments_.size());
  for (const auto &[address, _] : instruments_) {
    out.push_back(address);
  }
  return out;
}

size_t InstrumentRegistry::size() const {
  std::lock_guard lock(mutex_);
  return instruments_.size();
}

std::vector<std::shared_ptr<Instrument>> InstrumentRegistry::clear() {
  std::lock_guard lock(mutex_);
  std::vector<std::shared_ptr<Instrument>> out;
  out.reserve(instruments_.size());
  for (auto &[address, instrument] : instruments_) {
    out.push_back(std::move(instrument));
  }
  instruments_.clear();
  return out;
}

} // namespace plgpib
