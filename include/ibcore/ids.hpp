#pragma once

/** \file ids.hpp
 *  \brief Protocol-wide constants and identifier renderers used for default values.
 */

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace ibcore {

/** \brief Store prefix under which IBC commitments live on this chain ("ibc"). */
inline constexpr std::array<std::uint8_t, 3> COMMITMENT_PREFIX{'i', 'b', 'c'};

inline constexpr const char* CHANNEL_ID_PREFIX = "channel-";

/** \brief COMMITMENT_PREFIX as an owned byte vector. */
auto default_commitment_prefix() -> std::vector<std::uint8_t>;

/** \brief Lower-case hex of 32 bytes, no prefix (64 characters). */
auto byte32_to_hex(const std::array<std::uint8_t, 32>& bytes) -> std::string;

/** \brief Lower-case hex of arbitrary bytes, no prefix. */
auto to_hex(std::span<const std::uint8_t> bytes) -> std::string;

/** \brief "channel-<index>". */
auto channel_id_str(std::uint64_t index) -> std::string;

/** \brief byte32_to_hex of 32 zero bytes; computed once. */
auto zero_hex_id() -> const std::string&;

} // namespace ibcore
