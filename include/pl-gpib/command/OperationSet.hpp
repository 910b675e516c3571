#pragma once
#include "pl-gpib/command/Descriptor.hpp"
#include "pl-gpib/export.h"

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <vector>

namespace plgpib {

/// Name -> Descriptor table shared by the command and query namespaces.
/// Entries can be added but never replaced or removed.
class PL_GPIB_API OperationSet {
public:
  /// Throws std::invalid_argument if the name is already present
  void add(Descriptor descriptor);

  bool contains(const std::string &name) const;

  /// Throws UnknownCommand
  const Descriptor &get(const std::string &name) const;

  /// Resolve and expand. Throws UnknownCommand or ArityError.
  std::string render(const std::string &name,
                     const std::vector<ParamValue> &args) const;

  /// Sorted operation names
  std::vector<std::string> list_all() const;

  size_t size() const { return entries_.size(); }

  nlohmann::json to_json() const;

protected:
  OperationSet() = default;

private:
  std::map<std::string, Descriptor> entries_;
};

class PL_GPIB_API CommandSet : public OperationSet {
public:
  CommandSet() {}
};

class PL_GPIB_API QuerySet : public OperationSet {
public:
  QuerySet() {}

  /// Queries always carry a decoder; descriptors without one get "raw"
  void add(Descriptor descriptor);
};

/// Convert a C++ argument to the ParamValue it is written as
template <typename T> ParamValue to_param(T &&value) {
  using U = std::decay_t<T>;
  if constexpr (std::is_same_v<U, ParamValue>) {
    return value;
  } else if constexpr (std::is_same_v<U, bool>) {
    return ParamValue(std::in_place_type<bool>, value);
  } else if constexpr (std::is_integral_v<U>) {
    return ParamValue(std::in_place_type<int64_t>, static_cast<int64_t>(value));
  } else if constexpr (std::is_floating_point_v<U>) {
    return ParamValue(std::in_place_type<double>, static_cast<double>(value));
  } else {
    return ParamValue(std::in_place_type<std::string>, std::string(value));
  }
}

} // namespace plgpib
