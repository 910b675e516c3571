#pragma once
#include "pl-gpib/adapter/Instrument.hpp"
#include "pl-gpib/export.h"

#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace plgpib {

/// GPIB address -> instrument, at most one instrument per address
class PL_GPIB_API InstrumentRegistry {
public:
  InstrumentRegistry() = default;

  InstrumentRegistry(const InstrumentRegistry &) = delete;
  InstrumentRegistry &operator=(const InstrumentRegistry &) = delete;

  /// Throws InvalidAddress or DuplicateAddress
  void insert(std::shared_ptr<Instrument> instrument);

  /// Throws NotFound
  std::shared_ptr<Instrument> erase(GpibAddress address);

  /// nullptr when absent
  std::shared_ptr<Instrument> find(GpibAddress address) const;

  bool contains(GpibAddress address) const;

  /// Ascending
  std::vector<GpibAddress> addresses() const;

  size_t size() const;

  /// Remove everything, handing back what was registered
  std::vector<std::shared_ptr<Instrument>> clear();

private:
  mutable std::mutex mutex_;
  std::map<GpibAddress, std::shared_ptr<Instrument>> instruments_;
};

} // namespace plgpib
