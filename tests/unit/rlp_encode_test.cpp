#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <ibcore/rlp/encode.hpp>
#include <tests/support/object_fixtures.hpp>

using ibcore::rlp::Encoder;
using test_support::from_hex;

namespace {

template <typename Fn>
std::vector<std::uint8_t> encode_with(Fn fn) {
  Encoder enc;
  fn(enc);
  return std::move(enc).out();
}

} // namespace

TEST_CASE("rlp strings: known answers", "[rlp][encode]") {
  REQUIRE(encode_with([](Encoder& e) { e.append_string("dog"); }) == from_hex("83646f67"));
  REQUIRE(encode_with([](Encoder& e) { e.append_string(""); }) == from_hex("80"));
  REQUIRE(encode_with([](Encoder& e) { e.append_bytes(std::vector<std::uint8_t>{0x00}); }) == from_hex("00"));
  REQUIRE(encode_with([](Encoder& e) { e.append_bytes(std::vector<std::uint8_t>{0x7F}); }) == from_hex("7f"));
  REQUIRE(encode_with([](Encoder& e) { e.append_bytes(std::vector<std::uint8_t>{0x80}); }) == from_hex("8180"));

  const std::string lorem = "Lorem ipsum dolor sit amet, consectetur adipisicing elit";
  REQUIRE(lorem.size() == 56);
  auto long_form = encode_with([&](Encoder& e) { e.append_string(lorem); });
  REQUIRE(long_form.size() == 58);
  REQUIRE(long_form[0] == 0xB8);
  REQUIRE(long_form[1] == 0x38);
  REQUIRE(long_form[2] == 'L');
}

TEST_CASE("rlp integers: minimal big-endian", "[rlp][encode]") {
  REQUIRE(encode_with([](Encoder& e) { e.append_uint(0); }) == from_hex("80"));
  REQUIRE(encode_with([](Encoder& e) { e.append_uint(15); }) == from_hex("0f"));
  REQUIRE(encode_with([](Encoder& e) { e.append_uint(0x80); }) == from_hex("8180"));
  REQUIRE(encode_with([](Encoder& e) { e.append_uint(1024); }) == from_hex("820400"));
  REQUIRE(encode_with([](Encoder& e) { e.append_uint(0xFFFF); }) == from_hex("82ffff"));
  REQUIRE(encode_with([](Encoder& e) { e.append_uint(UINT64_MAX); }) == from_hex("88ffffffffffffffff"));

  const std::vector<std::uint8_t> padded{0x00, 0x00, 0x04, 0x00};
  REQUIRE(encode_with([&](Encoder& e) { e.append_uint_be(padded); }) == from_hex("820400"));
}

TEST_CASE("rlp lists: nesting and long payloads", "[rlp][encode]") {
  auto cat_dog = encode_with([](Encoder& e) {
    e.begin_list();
    e.append_string("cat");
    e.append_string("dog");
    e.end_list();
  });
  REQUIRE(cat_dog == from_hex("c88363617483646f67"));

  REQUIRE(encode_with([](Encoder& e) { e.append_empty_list(); }) == from_hex("c0"));

  // [ [], [[]], [ [], [[]] ] ]
  auto set_theory = encode_with([](Encoder& e) {
    e.begin_list();
    e.append_empty_list();
    e.begin_list(); e.append_empty_list(); e.end_list();
    e.begin_list();
    e.append_empty_list();
    e.begin_list(); e.append_empty_list(); e.end_list();
    e.end_list();
    e.end_list();
  });
  REQUIRE(set_theory == from_hex("c7c0c1c0c3c0c1c0"));

  auto long_list = encode_with([](Encoder& e) {
    e.begin_list();
    for (int i = 0; i < 60; ++i) e.append_uint(1);
    e.end_list();
  });
  REQUIRE(long_list.size() == 62);
  REQUIRE(long_list[0] == 0xF8);
  REQUIRE(long_list[1] == 60);
}

TEST_CASE("encoder refuses unbalanced lists", "[rlp][encode]") {
  Encoder open;
  open.begin_list();
  REQUIRE(open.open_lists() == 1);
  REQUIRE_THROWS_AS(std::move(open).out(), std::logic_error);

  Encoder closed;
  REQUIRE_THROWS_AS(closed.end_list(), std::logic_error);
}
