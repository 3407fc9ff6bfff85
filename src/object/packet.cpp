#include "ibcore/object/packet.hpp"

#include <tuple>
#include <utility>

namespace ibcore::object {

bool Packet::equal_unless_sequence(const Packet& other) const noexcept {
  return std::tie(source_port_id, source_channel_id, destination_port_id, destination_channel_id,
                  data, timeout_height, timeout_timestamp) ==
         std::tie(other.source_port_id, other.source_channel_id, other.destination_port_id,
                  other.destination_channel_id, other.data, other.timeout_height,
                  other.timeout_timestamp);
}

void object_codec<Packet>::append(rlp::Encoder& enc, const Packet& v) {
  enc.begin_list();
  enc.append_uint(v.sequence);
  enc.append_string(v.source_port_id);
  enc.append_string(v.source_channel_id);
  enc.append_string(v.destination_port_id);
  enc.append_string(v.destination_channel_id);
  enc.append_bytes(v.data);
  enc.append_uint(v.timeout_height);
  enc.append_uint(v.timeout_timestamp);
  enc.end_list();
}

auto object_codec<Packet>::read(const rlp::Rlp& item) -> std::expected<Packet, core::error> {
  auto f = item.items(8, NAME);
  if (!f) return std::unexpected(f.error());
  const auto& fields = *f;

  auto sequence = rlp::as_uint<std::uint16_t>(fields[0]);
  if (!sequence) return std::unexpected(sequence.error());

  std::string ids[4];
  for (std::size_t i = 0; i < 4; ++i) {
    auto s = rlp::as_string(fields[1 + i]);
    if (!s) return std::unexpected(s.error());
    ids[i] = std::move(*s);
  }

  auto data = rlp::as_bytes(fields[5]);
  if (!data) return std::unexpected(data.error());
  auto timeout_height = rlp::as_uint<std::uint64_t>(fields[6]);
  if (!timeout_height) return std::unexpected(timeout_height.error());
  auto timeout_timestamp = rlp::as_uint<std::uint64_t>(fields[7]);
  if (!timeout_timestamp) return std::unexpected(timeout_timestamp.error());

  return Packet{*sequence,
                std::move(ids[0]),
                std::move(ids[1]),
                std::move(ids[2]),
                std::move(ids[3]),
                std::move(*data),
                *timeout_height,
                *timeout_timestamp};
}

void object_codec<PacketAck>::append(rlp::Encoder& enc, const PacketAck& v) {
  enc.begin_list();
  enc.append_bytes(v.ack);
  object_codec<Packet>::append(enc, v.packet);
  enc.end_list();
}

auto object_codec<PacketAck>::read(const rlp::Rlp& item) -> std::expected<PacketAck, core::error> {
  auto f = item.items(2, NAME);
  if (!f) return std::unexpected(f.error());
  auto ack = rlp::as_bytes((*f)[0]);
  if (!ack) return std::unexpected(ack.error());
  auto packet = object_codec<Packet>::read((*f)[1]);
  if (!packet) return std::unexpected(packet.error());
  return PacketAck{std::move(*ack), std::move(*packet)};
}

} // namespace ibcore::object
