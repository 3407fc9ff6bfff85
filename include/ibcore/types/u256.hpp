#pragma once

/** \file u256.hpp
 *  \brief Fixed-width 256-bit unsigned value (big-endian storage).
 *
 * Only what the wire objects need: construction, comparison, hex rendering and
 * minimal big-endian import/export for RLP. No arithmetic.
 */

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace ibcore {

class U256 {
public:
  static constexpr std::size_t BYTES = 32;

  constexpr U256() noexcept = default;
  constexpr U256(std::uint64_t v) noexcept {
    for (std::size_t i = 0; i < 8; ++i) {
      be_[BYTES - 1 - i] = static_cast<std::uint8_t>(v >> (8 * i));
    }
  }

  /** \brief From a big-endian magnitude of at most 32 bytes (leading zeros allowed). */
  static auto from_be_bytes(std::span<const std::uint8_t> be) noexcept -> std::optional<U256>;

  /** \brief From a hex string with optional 0x prefix, at most 64 digits. */
  static auto from_hex(std::string_view hex) noexcept -> std::optional<U256>;

  [[nodiscard]] auto be_bytes() const noexcept -> const std::array<std::uint8_t, BYTES>& { return be_; }

  /** \brief Big-endian bytes with leading zeros stripped (empty for zero). */
  [[nodiscard]] auto minimal_be() const noexcept -> std::span<const std::uint8_t>;

  [[nodiscard]] bool is_zero() const noexcept;

  /** \brief Value if it fits in 64 bits. */
  [[nodiscard]] auto to_u64() const noexcept -> std::optional<std::uint64_t>;

  /** \brief Lower-case hex with 0x prefix and no leading zeros ("0x0" for zero). */
  [[nodiscard]] auto to_hex() const -> std::string;

  friend constexpr bool operator==(const U256&, const U256&) noexcept = default;
  friend constexpr auto operator<=>(const U256&, const U256&) noexcept = default;

private:
  std::array<std::uint8_t, BYTES> be_{};
};

} // namespace ibcore
