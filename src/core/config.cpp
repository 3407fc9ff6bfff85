#include "ibcore/core/config.hpp"
#include "ibcore/core/platform_utils.hpp"

#include <iostream>
#include <limits>
#include <string>

namespace ibcore::core {

namespace {

void read_size(const char* name, std::size_t& field, std::size_t ceiling,
               std::vector<std::string>* warnings) {
  auto v = safe_getenv(name);
  if (!v) return;
  auto parsed = parse_u64(*v);
  if (!parsed || *parsed == 0) {
    if (warnings) warnings->push_back(std::string(name) + "=\"" + *v + "\" ignored");
    return;
  }
  if (*parsed > ceiling) {
    if (warnings) {
      warnings->push_back(std::string(name) + "=\"" + *v + "\" clamped to " + std::to_string(ceiling));
    }
    field = ceiling;
    return;
  }
  field = static_cast<std::size_t>(*parsed);
}

} // namespace

auto load_codec_config(std::vector<std::string>* warnings) -> codec_config {
  codec_config cfg{};
  cfg.debug = env_flag_enabled(safe_getenv("IBCORE_CODEC_DEBUG"));
  read_size("IBCORE_MAX_DECODE_BYTES", cfg.max_decode_bytes,
            std::numeric_limits<std::size_t>::max(), warnings);
  read_size("IBCORE_MAX_RLP_DEPTH", cfg.max_rlp_depth, MAX_RLP_DEPTH_CEILING, warnings);
  return cfg;
}

auto codec_config_instance() -> const codec_config& {
  static const codec_config instance = [] {
    std::vector<std::string> warnings;
    auto cfg = load_codec_config(&warnings);
    if (cfg.debug) {
      for (const auto& w : warnings) {
        std::cerr << "[ibcore][config] " << w << std::endl;
      }
    }
    return cfg;
  }();
  return instance;
}

} // namespace ibcore::core
