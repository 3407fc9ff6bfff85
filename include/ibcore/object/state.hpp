#pragma once

/** \file state.hpp
 *  \brief Closed handshake enumerations with explicit wire tags.
 *
 * Wire form is a one-element list holding the tag ("Open" -> C1 04) so an enum
 * is never confused with a bare integer at the same position. Tags start at 1;
 * any other value, 0 included, fails to decode.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>

#include "ibcore/object/object.hpp"

namespace ibcore::object {

enum class ConnectionState : std::uint8_t {
  Unknown = 1,
  Init = 2,
  OpenTry = 3,
  Open = 4,
  Closed = 5,
  Frozen = 6,
};

enum class ChannelOrdering : std::uint8_t {
  Unknown = 1,
  Unordered = 2,
  Ordered = 3,
};

constexpr auto tag(ConnectionState s) noexcept -> std::uint8_t { return static_cast<std::uint8_t>(s); }
constexpr auto tag(ChannelOrdering o) noexcept -> std::uint8_t { return static_cast<std::uint8_t>(o); }

auto connection_state_from_tag(std::uint8_t t) noexcept -> std::optional<ConnectionState>;
auto channel_ordering_from_tag(std::uint8_t t) noexcept -> std::optional<ChannelOrdering>;

auto to_string(ConnectionState s) noexcept -> std::string_view;
auto to_string(ChannelOrdering o) noexcept -> std::string_view;

template <>
struct object_codec<ConnectionState> {
  static constexpr std::string_view NAME = "connection_state";
  static void append(rlp::Encoder& enc, ConnectionState s);
  static auto read(const rlp::Rlp& item) -> std::expected<ConnectionState, core::error>;
};

template <>
struct object_codec<ChannelOrdering> {
  static constexpr std::string_view NAME = "channel_ordering";
  static void append(rlp::Encoder& enc, ChannelOrdering o);
  static auto read(const rlp::Rlp& item) -> std::expected<ChannelOrdering, core::error>;
};

} // namespace ibcore::object
