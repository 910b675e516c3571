#include "pl-gpib/command/OperationSet.hpp"
#include "pl-gpib/Errors.hpp"
#include "pl-gpib/command/ResponseDecoders.hpp"

#include <fmt/format.h>
#include <stdexcept>

namespace plgpib {

void OperationSet::add(Descriptor descriptor) {
  if (descriptor.name.empty()) {
    throw std::invalid_argument("Operation name must not be empty");
  }
  if (entries_.count(descriptor.name)) {
    throw std::invalid_argument(
        fmt::format("Operation '{}' is already defined", descriptor.name));
  }
  size_t placeholders = count_placeholders(descriptor.template_str);
  if (placeholders > 0 && descriptor.arity != placeholders) {
    throw std::invalid_argument(fmt::format(
        "Operation '{}': arity {} does not match {} placeholder(s)",
        descriptor.name, descriptor.arity, placeholders));
  }
  std::string name = descriptor.name;
  entries_.emplace(std::move(name), std::move(descriptor));
}

bool OperationSet::contains(const std::string &name) const {
  return entries_.count(name) > 0;
}

const Descriptor &OperationSet::get(const std::string &name) const {
  auto it = entries_.find(name);
  if (it == entries_.end()) {
    throw UnknownCommand(name);
  }
  return it->second;
}

std::string OperationSet::render(const std::string &name,
                                 const std::vector<ParamValue> &args) const {
  const Descriptor &d = get(name);
  if (args.size() != d.arity) {
    throw ArityError(name, d.arity, args.size());
  }
  return render_template(d.template_str, args);
}

std::vector<std::string> OperationSet::list_all() const {
  std::vector<std::string> names;
  names.reserve(entries_.size());
  for (const auto &[name, _] : entries_) {
    names.push_back(name);
  }
  return names;
}

nlohmann::json OperationSet::to_json() const {
  nlohmann::json j = nlohmann::json::object();
  for (const auto &[name, descriptor] : entries_) {
    j[name] = descriptor.to_json();
  }
  return j;
}

void QuerySet::add(Descriptor descriptor) {
  if (!descriptor.decoder) {
    descriptor.decoder_name = "raw";
    descriptor.decoder = decoder_by_name("raw");
  }
  OperationSet::add(std::move(descriptor));
}

} // namespace plgpib
