#include "ibcore/ids.hpp"

namespace ibcore {

auto default_commitment_prefix() -> std::vector<std::uint8_t> {
  return {COMMITMENT_PREFIX.begin(), COMMITMENT_PREFIX.end()};
}

auto to_hex(std::span<const std::uint8_t> bytes) -> std::string {
  static constexpr char DIGITS[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (auto b : bytes) {
    out.push_back(DIGITS[b >> 4]);
    out.push_back(DIGITS[b & 0x0F]);
  }
  return out;
}

auto byte32_to_hex(const std::array<std::uint8_t, 32>& bytes) -> std::string {
  return to_hex(bytes);
}

auto channel_id_str(std::uint64_t index) -> std::string {
  return std::string(CHANNEL_ID_PREFIX) + std::to_string(index);
}

auto zero_hex_id() -> const std::string& {
  static const std::string id = byte32_to_hex(std::array<std::uint8_t, 32>{});
  return id;
}

} // namespace ibcore
