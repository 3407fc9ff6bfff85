#include <ibcore/error_mapping.hpp>
#include <ibcore/objects.hpp>
#include <ibcore/c/ibcore.h>
#include <catch2/catch_all.hpp>

TEST_CASE("headers compile and basic types exist", "[headers]") {
  ibcore::object::Packet p{};
  REQUIRE(p.sequence == 0);
  REQUIRE(IBCORE_C_ABI_VERSION == 1);
}

TEST_CASE("error mapping header is self-contained", "[headers]") {
  std::optional<ibcore::core::error_code> ec = ibcore::core::from_c_status(IBCORE_E_SERDE_ERROR);
  REQUIRE(ec == ibcore::core::error_code::serde_error);
}
