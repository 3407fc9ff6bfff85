#pragma once

/** \file packet.hpp
 *  \brief Relayed packets and their acknowledgements.
 *
 *  Packet:    [sequence, src_port, src_channel, dst_port, dst_channel, data,
 *              timeout_height, timeout_timestamp]
 *  PacketAck: [ack, packet]
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "ibcore/ids.hpp"
#include "ibcore/object/object.hpp"

namespace ibcore::object {

struct Packet {
  std::uint16_t sequence{0};
  std::string source_port_id{zero_hex_id()};
  std::string source_channel_id{channel_id_str(0)};
  std::string destination_port_id{zero_hex_id()};
  std::string destination_channel_id{channel_id_str(0)};
  std::vector<std::uint8_t> data;
  std::uint64_t timeout_height{0};     // 0 together with timeout_timestamp 0: no timeout
  std::uint64_t timeout_timestamp{0};

  /** \brief Same logical packet: every field except sequence is identical. */
  [[nodiscard]] bool equal_unless_sequence(const Packet& other) const noexcept;

  [[nodiscard]] bool has_timeout() const noexcept { return timeout_height != 0 || timeout_timestamp != 0; }

  friend bool operator==(const Packet&, const Packet&) = default;
};

struct PacketAck {
  std::vector<std::uint8_t> ack;   // opaque to this library
  Packet packet{};

  friend bool operator==(const PacketAck&, const PacketAck&) = default;
};

template <>
struct object_codec<Packet> {
  static constexpr std::string_view NAME = "packet";
  static void append(rlp::Encoder& enc, const Packet& v);
  static auto read(const rlp::Rlp& item) -> std::expected<Packet, core::error>;
};

template <>
struct object_codec<PacketAck> {
  static constexpr std::string_view NAME = "packet_ack";
  static void append(rlp::Encoder& enc, const PacketAck& v);
  static auto read(const rlp::Rlp& item) -> std::expected<PacketAck, core::error>;
};

} // namespace ibcore::object
