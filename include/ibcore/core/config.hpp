#pragma once

/** \file config.hpp
 *  \brief Process-wide codec configuration read from the environment.
 *
 * Variables:
 *   IBCORE_CODEC_DEBUG       log decode failures to stderr
 *   IBCORE_MAX_DECODE_BYTES  upper bound on a single decode input (default 16 MiB)
 *   IBCORE_MAX_RLP_DEPTH     nesting bound for opaque RLP items (default 64,
 *                            clamped to MAX_RLP_DEPTH_CEILING)
 *
 * Malformed numeric values keep the default.
 */

#include <cstddef>
#include <vector>
#include <string>

namespace ibcore::core {

/** \brief Hard upper bound for max_rlp_depth; depth validation recurses once per level. */
inline constexpr std::size_t MAX_RLP_DEPTH_CEILING = 1024;

struct codec_config {
  bool debug{false};
  std::size_t max_decode_bytes{16u * 1024u * 1024u};
  std::size_t max_rlp_depth{64};
};

/** \brief Parse the IBCORE_* environment variables; warnings collects rejected values. */
auto load_codec_config(std::vector<std::string>* warnings = nullptr) -> codec_config;

/** \brief Snapshot taken on first use; immutable afterwards. */
auto codec_config_instance() -> const codec_config&;

} // namespace ibcore::core
