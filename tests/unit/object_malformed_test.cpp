#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <ibcore/objects.hpp>
#include <tests/support/object_fixtures.hpp>

using namespace ibcore::object;
using ibcore::core::error_code;
using test_support::from_hex;

namespace {

template <typename T>
void require_serde_error(const std::vector<std::uint8_t>& bytes) {
  auto r = decode<T>(bytes);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == error_code::serde_error);
  REQUIRE_FALSE(r.error().message.empty());
}

template <typename T>
void require_rejects_damage(const T& value) {
  const auto good = encode(value);
  REQUIRE(decode<T>(good).has_value());

  for (std::size_t n = 0; n < good.size(); ++n) {
    INFO("prefix length " << n);
    require_serde_error<T>(std::vector<std::uint8_t>(good.begin(), good.begin() + static_cast<std::ptrdiff_t>(n)));
  }

  auto flipped = good;
  flipped[0] ^= 0xFF;
  require_serde_error<T>(flipped);

  auto trailing = good;
  trailing.push_back(0x00);
  require_serde_error<T>(trailing);
}

} // namespace

TEST_CASE("damaged encodings are rejected", "[object][malformed]") {
  require_rejects_damage(test_support::sample_connection_end());
  require_rejects_damage(test_support::sample_channel_end());
  require_rejects_damage(test_support::sample_packet());
  require_rejects_damage(test_support::sample_packet_ack());
  require_rejects_damage(test_support::sample_proof_bundle());
  require_rejects_damage(Version{});
  require_rejects_damage(ConnectionCounterparty{});
}

TEST_CASE("field counts must match exactly", "[object][malformed]") {
  // packet with the timeout timestamp dropped, then with an extra field
  require_serde_error<Packet>(
      from_hex("e005827031896368616e6e656c2d30827031896368616e6e656c2d318301020364"));
  require_serde_error<Packet>(
      from_hex("e205827031896368616e6e656c2d30827031896368616e6e656c2d3183010203648080"));
  // channel end without connection hops
  require_serde_error<ChannelEnd>(from_hex("d8c104c103d3887472616e73666572896368616e6e656c2d37"));
  require_serde_error<ConnectionCounterparty>(from_hex("c0"));
  require_serde_error<ProofBundle>(from_hex("c0"));
}

TEST_CASE("field shapes must match", "[object][malformed]") {
  // state as a bare integer instead of [tag]
  require_serde_error<ChannelEnd>(
      from_hex("e504c103d3887472616e73666572896368616e6e656c2d37cd8c636f6e6e656374696f6e2d30"));
  // sequence with a leading zero byte
  require_serde_error<Packet>(
      from_hex("e3820005827031896368616e6e656c2d30827031896368616e6e656c2d31830102036480"));
  // source port that is not utf-8
  require_serde_error<Packet>(
      from_hex("e10582c0af896368616e6e656c2d30827031896368616e6e656c2d31830102036480"));
  // packet given where a packet ack is expected
  require_serde_error<PacketAck>(from_hex(test_support::SAMPLE_PACKET_HEX));
  // list where the commitment prefix string belongs
  require_serde_error<ConnectionCounterparty>(from_hex("c480c0c0"));
}

TEST_CASE("decode never throws on arbitrary bytes", "[object][malformed]") {
  std::uint32_t state = 0x12345678u;
  auto next = [&]() {
    state ^= state << 13;
    state ^= state >> 17;
    state ^= state << 5;
    return static_cast<std::uint8_t>(state);
  };
  for (int round = 0; round < 2000; ++round) {
    std::vector<std::uint8_t> bytes(static_cast<std::size_t>(round % 48));
    for (auto& b : bytes) b = next();
    if (!bytes.empty() && round % 3 == 0) bytes[0] = static_cast<std::uint8_t>(0xC0 + bytes.size() - 1);
    REQUIRE_NOTHROW(decode<ConnectionEnd>(bytes));
    REQUIRE_NOTHROW(decode<ChannelEnd>(bytes));
    REQUIRE_NOTHROW(decode<Packet>(bytes));
    REQUIRE_NOTHROW(decode<PacketAck>(bytes));
    REQUIRE_NOTHROW(decode<ProofBundle>(bytes));
  }
}

TEST_CASE("inputs over the decode size limit are rejected", "[object][malformed]") {
  const std::size_t limit = ibcore::core::codec_config_instance().max_decode_bytes;
  const std::vector<std::uint8_t> oversized(limit + 1, 0x00);

  auto packet = decode<Packet>(oversized);
  REQUIRE_FALSE(packet.has_value());
  REQUIRE(packet.error().code == error_code::serde_error);
  REQUIRE(packet.error().component == "object.packet");

  auto bundle = decode<ProofBundle>(oversized);
  REQUIRE_FALSE(bundle.has_value());
  REQUIRE(bundle.error().component == "object.proof_bundle");

  auto proof = ObjectProof::from_encoded(oversized);
  REQUIRE_FALSE(proof.has_value());
  REQUIRE(proof.error().code == error_code::serde_error);
  REQUIRE(proof.error().component == "object.object_proof");
}

TEST_CASE("decode failures stay silent unless debug logging is on", "[object][malformed]") {
  // Only meaningful when the run does not set IBCORE_CODEC_DEBUG.
  if (ibcore::core::codec_config_instance().debug) return;
  std::ostringstream captured;
  auto* previous = std::cerr.rdbuf(captured.rdbuf());
  auto r = decode<Packet>(from_hex("c0"));
  std::cerr.rdbuf(previous);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(captured.str().empty());
}
