#include <cstdint>
#include <cstddef>
#include <cstdlib>
#include <algorithm>
#include <span>

#include "ibcore/objects.hpp"

namespace {

// Accepted input must already be canonical: re-encoding reproduces it.
template <typename T>
void check_kind(std::span<const std::uint8_t> bytes) {
  auto obj = ibcore::object::decode<T>(bytes);
  if (!obj) return;
  const auto again = ibcore::object::encode(*obj);
  if (again.size() != bytes.size() || !std::equal(again.begin(), again.end(), bytes.begin())) {
    std::abort();
  }
}

} // namespace

// Fuzzer: feeds arbitrary bytes to every object decoder; exceptions and
// non-canonical acceptance both surface as crashes.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  using namespace ibcore::object;
  std::span<const std::uint8_t> bytes{data, size};
  check_kind<ConnectionState>(bytes);
  check_kind<ChannelOrdering>(bytes);
  check_kind<ConnectionCounterparty>(bytes);
  check_kind<Version>(bytes);
  check_kind<ConnectionEnd>(bytes);
  check_kind<ChannelCounterparty>(bytes);
  check_kind<ChannelEnd>(bytes);
  check_kind<Packet>(bytes);
  check_kind<PacketAck>(bytes);
  check_kind<ProofBundle>(bytes);
  return 0;
}
