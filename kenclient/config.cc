#include "kenclient/config.hh"

#include <iostream>

namespace kenclient {

Config::Config() :
  messages(&std::cerr),
  library_name("ken"),
  search_system_path(true) {}

} // namespace kenclient
