#include "ibcore/core/log.hpp"
#include "ibcore/core/config.hpp"

#include <iostream>

namespace ibcore::core {

void log_debug(std::string_view component, std::string_view message) {
  if (!codec_config_instance().debug) return;
  std::cerr << "[ibcore][" << component << "] " << message << std::endl;
}

} // namespace ibcore::core
