#pragma once

/** \file channel.hpp
 *  \brief Channel-side handshake records.
 *
 *  ChannelCounterparty: [port_id, channel_id]
 *  ChannelEnd:          [state, ordering, remote, [connection_hop...]]
 */

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "ibcore/object/object.hpp"
#include "ibcore/object/state.hpp"

namespace ibcore::object {

struct ChannelCounterparty {
  std::string port_id;
  std::string channel_id;

  friend bool operator==(const ChannelCounterparty&, const ChannelCounterparty&) = default;
};

struct ChannelEnd {
  ConnectionState state{ConnectionState::Unknown};
  ChannelOrdering ordering{ChannelOrdering::Unknown};
  ChannelCounterparty remote{};
  std::vector<std::string> connection_hops;  // ordered path, one entry for a single hop

  friend bool operator==(const ChannelEnd&, const ChannelEnd&) = default;
};

template <>
struct object_codec<ChannelCounterparty> {
  static constexpr std::string_view NAME = "channel_counterparty";
  static void append(rlp::Encoder& enc, const ChannelCounterparty& v);
  static auto read(const rlp::Rlp& item) -> std::expected<ChannelCounterparty, core::error>;
};

template <>
struct object_codec<ChannelEnd> {
  static constexpr std::string_view NAME = "channel_end";
  static void append(rlp::Encoder& enc, const ChannelEnd& v);
  static auto read(const rlp::Rlp& item) -> std::expected<ChannelEnd, core::error>;
};

} // namespace ibcore::object
