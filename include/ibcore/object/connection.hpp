#pragma once

/** \file connection.hpp
 *  \brief Connection-side handshake records.
 *
 *  ConnectionCounterparty: [client_id, connection_id?, commitment_prefix]
 *  Version:                [identifier, [feature...]]
 *  ConnectionEnd:          [state, client_id, counterparty, delay_period, [version...]]
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ibcore/ids.hpp"
#include "ibcore/object/object.hpp"
#include "ibcore/object/state.hpp"

namespace ibcore::object {

struct ConnectionCounterparty {
  std::string client_id;
  std::optional<std::string> connection_id;   // assigned by the counterparty's try step
  std::vector<std::uint8_t> commitment_prefix{default_commitment_prefix()};

  friend bool operator==(const ConnectionCounterparty&, const ConnectionCounterparty&) = default;
};

/** \brief Negotiated protocol version; feature order is significant. */
struct Version {
  std::string identifier{"1"};
  std::vector<std::string> features{"ORDER_ORDERED", "ORDER_UNORDERED"};

  friend bool operator==(const Version&, const Version&) = default;
};

struct ConnectionEnd {
  ConnectionState state{ConnectionState::Unknown};
  std::string client_id{zero_hex_id()};
  ConnectionCounterparty counterparty{};
  std::uint64_t delay_period{0};
  std::vector<Version> versions;

  friend bool operator==(const ConnectionEnd&, const ConnectionEnd&) = default;
};

template <>
struct object_codec<ConnectionCounterparty> {
  static constexpr std::string_view NAME = "connection_counterparty";
  static void append(rlp::Encoder& enc, const ConnectionCounterparty& v);
  static auto read(const rlp::Rlp& item) -> std::expected<ConnectionCounterparty, core::error>;
};

template <>
struct object_codec<Version> {
  static constexpr std::string_view NAME = "version";
  static void append(rlp::Encoder& enc, const Version& v);
  static auto read(const rlp::Rlp& item) -> std::expected<Version, core::error>;
};

template <>
struct object_codec<ConnectionEnd> {
  static constexpr std::string_view NAME = "connection_end";
  static void append(rlp::Encoder& enc, const ConnectionEnd& v);
  static auto read(const rlp::Rlp& item) -> std::expected<ConnectionEnd, core::error>;
};

} // namespace ibcore::object
