#include "pl-gpib/Logger.hpp"

namespace plgpib {

// DLL-safe singleton implementation
BusLogger &BusLogger::instance() {
  static BusLogger logger;
  return logger;
}

} // namespace plgpib
