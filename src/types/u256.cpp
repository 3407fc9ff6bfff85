#include "ibcore/types/u256.hpp"

#include <algorithm>

namespace ibcore {

static auto hex_value(char c) noexcept -> int {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

auto U256::from_be_bytes(std::span<const std::uint8_t> be) noexcept -> std::optional<U256> {
  if (be.size() > BYTES) return std::nullopt;
  U256 v;
  std::copy(be.begin(), be.end(), v.be_.begin() + static_cast<std::ptrdiff_t>(BYTES - be.size()));
  return v;
}

auto U256::from_hex(std::string_view hex) noexcept -> std::optional<U256> {
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) hex.remove_prefix(2);
  if (hex.empty() || hex.size() > 2 * BYTES) return std::nullopt;
  U256 v;
  // Fill nibbles from the least significant end.
  std::size_t nibble = 0;
  for (auto it = hex.rbegin(); it != hex.rend(); ++it, ++nibble) {
    const int d = hex_value(*it);
    if (d < 0) return std::nullopt;
    auto& byte = v.be_[BYTES - 1 - nibble / 2];
    byte = static_cast<std::uint8_t>(byte | (nibble % 2 == 0 ? d : d << 4));
  }
  return v;
}

auto U256::minimal_be() const noexcept -> std::span<const std::uint8_t> {
  std::size_t skip = 0;
  while (skip < BYTES && be_[skip] == 0) ++skip;
  return std::span<const std::uint8_t>(be_).subspan(skip);
}

bool U256::is_zero() const noexcept {
  return minimal_be().empty();
}

auto U256::to_u64() const noexcept -> std::optional<std::uint64_t> {
  auto m = minimal_be();
  if (m.size() > 8) return std::nullopt;
  std::uint64_t v = 0;
  for (auto b : m) v = (v << 8) | b;
  return v;
}

auto U256::to_hex() const -> std::string {
  static constexpr char DIGITS[] = "0123456789abcdef";
  auto m = minimal_be();
  if (m.empty()) return "0x0";
  std::string out = "0x";
  out.reserve(2 + 2 * m.size());
  bool leading = true;
  for (auto b : m) {
    const char hi = DIGITS[b >> 4];
    if (!(leading && hi == '0')) out.push_back(hi);
    out.push_back(DIGITS[b & 0x0F]);
    leading = false;
  }
  return out;
}

} // namespace ibcore
