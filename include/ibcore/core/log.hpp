#pragma once

#include <string_view>

namespace ibcore::core {

// Writes "[ibcore][<component>] <message>" to stderr when IBCORE_CODEC_DEBUG is on.
void log_debug(std::string_view component, std::string_view message);

} // namespace ibcore::core
