#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include <ibcore/c/ibcore.h>
#include <tests/support/object_fixtures.hpp>

using test_support::from_hex;

TEST_CASE("c api: version and status names", "[c_api]") {
  REQUIRE(std::string(ibcore_version()) == "1.0.0");
  REQUIRE(std::string(ibcore_status_name(IBCORE_OK)) == "ok");
  REQUIRE(std::string(ibcore_status_name(IBCORE_E_SERDE_ERROR)) == "serde_error");
  REQUIRE(std::string(ibcore_status_name(IBCORE_E_WRONG_PACKET_ARGS)) == "wrong_packet_args");
  REQUIRE(std::string(ibcore_status_name(IBCORE_E_INVALID_ARGUMENT)) == "invalid_argument");
  REQUIRE(std::string(ibcore_status_name(99)) == "unknown");
  REQUIRE(std::string(ibcore_status_name(100000)) == "unknown");
}

TEST_CASE("c api: decode check", "[c_api]") {
  const auto packet = from_hex(test_support::SAMPLE_PACKET_HEX);
  REQUIRE(ibcore_decode_check(IBCORE_OBJECT_PACKET, packet.data(), packet.size()) == IBCORE_OK);
  REQUIRE(std::string(ibcore_get_last_error()).empty());

  REQUIRE(ibcore_decode_check(IBCORE_OBJECT_CHANNEL_END, packet.data(), packet.size()) ==
          IBCORE_E_SERDE_ERROR);
  REQUIRE(std::string(ibcore_get_last_error()).find("channel_end") != std::string::npos);

  REQUIRE(ibcore_decode_check(IBCORE_OBJECT_PACKET, nullptr, 0) == IBCORE_E_SERDE_ERROR);
  REQUIRE(ibcore_decode_check(IBCORE_OBJECT_PACKET, nullptr, 4) == IBCORE_E_INVALID_ARGUMENT);
  REQUIRE(ibcore_decode_check(static_cast<ibcore_object_kind_t>(42), packet.data(), packet.size()) ==
          IBCORE_E_SERDE_ERROR);
}

TEST_CASE("c api: canonicalize with size query", "[c_api]") {
  const auto channel = from_hex(test_support::SAMPLE_CHANNEL_END_HEX);
  std::size_t needed = 0;
  REQUIRE(ibcore_canonicalize(IBCORE_OBJECT_CHANNEL_END, channel.data(), channel.size(), nullptr, 0,
                              &needed) == IBCORE_OK);
  REQUIRE(needed == channel.size());

  std::vector<std::uint8_t> small(needed - 1);
  std::size_t written = 0;
  REQUIRE(ibcore_canonicalize(IBCORE_OBJECT_CHANNEL_END, channel.data(), channel.size(), small.data(),
                              small.size(), &written) == IBCORE_E_INVALID_ARGUMENT);
  REQUIRE(written == needed);

  std::vector<std::uint8_t> out(needed);
  REQUIRE(ibcore_canonicalize(IBCORE_OBJECT_CHANNEL_END, channel.data(), channel.size(), out.data(),
                              out.size(), &written) == IBCORE_OK);
  REQUIRE(out == channel);

  REQUIRE(ibcore_canonicalize(IBCORE_OBJECT_CHANNEL_END, channel.data(), channel.size(), out.data(),
                              out.size(), nullptr) == IBCORE_E_INVALID_ARGUMENT);
}

TEST_CASE("c api: packet comparison ignores sequence", "[c_api]") {
  auto a = test_support::sample_packet();
  auto b = a;
  b.sequence = 6;
  const auto a_bytes = ibcore::object::encode(a);
  const auto b_bytes = ibcore::object::encode(b);

  int equal = -1;
  REQUIRE(ibcore_packet_equal_unless_sequence(a_bytes.data(), a_bytes.size(), b_bytes.data(),
                                              b_bytes.size(), &equal) == IBCORE_OK);
  REQUIRE(equal == 1);

  b.data = {9};
  const auto c_bytes = ibcore::object::encode(b);
  REQUIRE(ibcore_packet_equal_unless_sequence(a_bytes.data(), a_bytes.size(), c_bytes.data(),
                                              c_bytes.size(), &equal) == IBCORE_OK);
  REQUIRE(equal == 0);

  const std::uint8_t junk[] = {0xC1};
  REQUIRE(ibcore_packet_equal_unless_sequence(a_bytes.data(), a_bytes.size(), junk, sizeof(junk),
                                              &equal) == IBCORE_E_SERDE_ERROR);
  REQUIRE_FALSE(std::string(ibcore_get_last_error()).empty());
  REQUIRE(ibcore_packet_equal_unless_sequence(a_bytes.data(), a_bytes.size(), b_bytes.data(),
                                              b_bytes.size(), nullptr) == IBCORE_E_INVALID_ARGUMENT);
}
