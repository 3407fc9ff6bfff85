#include <ibcore/error.hpp>
#include <ibcore/error_mapping.hpp>
#include <catch2/catch_test_macros.hpp>

#include <set>
#include <string>

using ibcore::core::error_code;
using ibcore::core::to_int;

TEST_CASE("error codes are pinned", "[errors]") {
  REQUIRE(to_int(error_code::ok) == 0);
  REQUIRE(to_int(error_code::found_no_message) == 100);
  REQUIRE(to_int(error_code::event_not_match) == 101);
  REQUIRE(to_int(error_code::invalid_receipt_proof) == 102);
  REQUIRE(to_int(error_code::serde_error) == 103);
  REQUIRE(to_int(error_code::wrong_client) == 104);
  REQUIRE(to_int(error_code::wrong_connection_id) == 105);
  REQUIRE(to_int(error_code::wrong_connection_number) == 106);
  REQUIRE(to_int(error_code::wrong_port_id) == 107);
  REQUIRE(to_int(error_code::wrong_common_hex_id) == 108);
  REQUIRE(to_int(error_code::connections_wrong) == 109);
  REQUIRE(to_int(error_code::wrong_connection_cnt) == 110);
  REQUIRE(to_int(error_code::wrong_connection_state) == 111);
  REQUIRE(to_int(error_code::wrong_connection_counterparty) == 112);
  REQUIRE(to_int(error_code::wrong_connection_client) == 113);
  REQUIRE(to_int(error_code::wrong_connection_next_channel_number) == 114);
  REQUIRE(to_int(error_code::wrong_connection_args) == 115);
  REQUIRE(to_int(error_code::wrong_channel_state) == 116);
  REQUIRE(to_int(error_code::wrong_channel) == 117);
  REQUIRE(to_int(error_code::wrong_channel_args) == 118);
  REQUIRE(to_int(error_code::wrong_channel_sequence) == 119);
  REQUIRE(to_int(error_code::wrong_unused_packet) == 120);
  REQUIRE(to_int(error_code::wrong_packet_sequence) == 121);
  REQUIRE(to_int(error_code::wrong_packet_status) == 122);
  REQUIRE(to_int(error_code::wrong_packet_content) == 123);
  REQUIRE(to_int(error_code::wrong_packet_args) == 124);
}

TEST_CASE("from_int is the closed inverse of to_int", "[errors]") {
  std::set<std::string> names;
  int known = 0;
  for (int v = -128; v <= 127; ++v) {
    auto ec = ibcore::core::from_int(static_cast<std::int8_t>(v));
    if (!ec) continue;
    ++known;
    REQUIRE(to_int(*ec) == v);
    names.insert(std::string(ibcore::core::to_string(*ec)));
  }
  REQUIRE(known == 26);
  REQUIRE(names.size() == 26);   // names are unique
  REQUIRE_FALSE(ibcore::core::from_int(99).has_value());
  REQUIRE_FALSE(ibcore::core::from_int(125).has_value());
  REQUIRE_FALSE(ibcore::core::from_int(-1).has_value());
}

TEST_CASE("error names are stable", "[errors]") {
  REQUIRE(ibcore::core::to_string(error_code::serde_error) == "serde_error");
  REQUIRE(ibcore::core::to_string(error_code::wrong_connection_next_channel_number) ==
          "wrong_connection_next_channel_number");
  REQUIRE(ibcore::core::to_string(error_code::ok) == "ok");
}

TEST_CASE("C status values mirror error codes", "[errors][c_api]") {
  using ibcore::core::from_c_status;
  using ibcore::core::to_c_status;
  REQUIRE(to_c_status(error_code::serde_error) == IBCORE_E_SERDE_ERROR);
  REQUIRE(to_c_status(error_code::wrong_packet_args) == IBCORE_E_WRONG_PACKET_ARGS);
  REQUIRE(to_c_status(error_code::ok) == IBCORE_OK);
  for (int v = 100; v <= 124; ++v) {
    auto ec = ibcore::core::from_int(static_cast<std::int8_t>(v));
    REQUIRE(ec.has_value());
    auto back = from_c_status(to_c_status(*ec));
    REQUIRE(back.has_value());
    REQUIRE(*back == *ec);
  }
  REQUIRE_FALSE(from_c_status(IBCORE_E_INVALID_ARGUMENT).has_value());
}
