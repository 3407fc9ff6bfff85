#include "ibcore/object/format.hpp"

#include "ibcore/ids.hpp"

namespace ibcore::object {

namespace {

struct hex_bytes {
  std::span<const std::uint8_t> bytes;
};

std::ostream& operator<<(std::ostream& os, hex_bytes h) {
  return os << "0x" << to_hex(h.bytes);
}

struct string_list {
  const std::vector<std::string>& items;
};

std::ostream& operator<<(std::ostream& os, string_list l) {
  os << '[';
  for (std::size_t i = 0; i < l.items.size(); ++i) {
    if (i) os << ", ";
    os << '"' << l.items[i] << '"';
  }
  return os << ']';
}

} // namespace

std::ostream& operator<<(std::ostream& os, ConnectionState s) {
  return os << to_string(s);
}

std::ostream& operator<<(std::ostream& os, ChannelOrdering o) {
  return os << to_string(o);
}

std::ostream& operator<<(std::ostream& os, const ConnectionCounterparty& v) {
  os << "ConnectionCounterparty{client_id=\"" << v.client_id << "\", connection_id=";
  if (v.connection_id) os << '"' << *v.connection_id << '"'; else os << "none";
  return os << ", commitment_prefix=" << hex_bytes{v.commitment_prefix} << '}';
}

std::ostream& operator<<(std::ostream& os, const Version& v) {
  return os << "Version{identifier=\"" << v.identifier << "\", features=" << string_list{v.features} << '}';
}

std::ostream& operator<<(std::ostream& os, const ConnectionEnd& v) {
  os << "ConnectionEnd{state=" << v.state << ", client_id=\"" << v.client_id
     << "\", counterparty=" << v.counterparty << ", delay_period=" << v.delay_period << ", versions=[";
  for (std::size_t i = 0; i < v.versions.size(); ++i) {
    if (i) os << ", ";
    os << v.versions[i];
  }
  return os << "]}";
}

std::ostream& operator<<(std::ostream& os, const ChannelCounterparty& v) {
  return os << "ChannelCounterparty{port_id=\"" << v.port_id << "\", channel_id=\"" << v.channel_id << "\"}";
}

std::ostream& operator<<(std::ostream& os, const ChannelEnd& v) {
  return os << "ChannelEnd{state=" << v.state << ", ordering=" << v.ordering << ", remote=" << v.remote
            << ", connection_hops=" << string_list{v.connection_hops} << '}';
}

std::ostream& operator<<(std::ostream& os, const Packet& v) {
  return os << "Packet{sequence=" << v.sequence
            << ", source_port_id=\"" << v.source_port_id
            << "\", source_channel_id=\"" << v.source_channel_id
            << "\", destination_port_id=\"" << v.destination_port_id
            << "\", destination_channel_id=\"" << v.destination_channel_id
            << "\", data=" << hex_bytes{v.data}
            << ", timeout_height=" << v.timeout_height
            << ", timeout_timestamp=" << v.timeout_timestamp << '}';
}

std::ostream& operator<<(std::ostream& os, const PacketAck& v) {
  return os << "PacketAck{ack=" << hex_bytes{v.ack} << ", packet=" << v.packet << '}';
}

std::ostream& operator<<(std::ostream& os, const ObjectProof& v) {
  return os << "ObjectProof{" << hex_bytes{v.encoded()} << '}';
}

std::ostream& operator<<(std::ostream& os, const ProofBundle& v) {
  return os << "ProofBundle{height=" << v.height.to_hex() << ", object_proof=" << v.object_proof
            << ", client_proof=" << hex_bytes{v.client_proof} << '}';
}

} // namespace ibcore::object
