#pragma once

/** \file decode.hpp
 *  \brief Strict RLP decoder view (no allocations for item payloads).
 *
 * Only canonical encodings are accepted: a single byte < 0x80 must not carry a
 * header, long-form lengths must exceed 55 and carry no leading zero, integers
 * carry no leading zero byte, and a top-level item must span the whole input.
 * Every failure is reported as core::error_code::serde_error.
 *
 * Thread-safety: functions are stateless and thread-safe. Rlp does not own memory.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "ibcore/error.hpp"

namespace ibcore::rlp {

struct Header {
  bool is_list{false};
  std::size_t header_len{0};   // bytes preceding the payload (0 for a bare byte)
  std::size_t payload_len{0};
};

/** \brief Decode the header of the item starting at bytes[0]; the item may be followed by more data. */
auto decode_header(std::span<const std::uint8_t> bytes) -> std::expected<Header, core::error>;

class Rlp {
public:
  Rlp() = default;

  /** \brief Parse exactly one item occupying all of bytes. */
  static auto parse(std::span<const std::uint8_t> bytes) -> std::expected<Rlp, core::error>;

  [[nodiscard]] bool is_list() const noexcept { return header_.is_list; }
  [[nodiscard]] auto raw() const noexcept -> std::span<const std::uint8_t> { return raw_; }
  [[nodiscard]] auto payload() const noexcept -> std::span<const std::uint8_t> {
    return raw_.subspan(header_.header_len, header_.payload_len);
  }

  /** \brief Elements of a list item. */
  auto items() const -> std::expected<std::vector<Rlp>, core::error>;

  /** \brief Elements of a list item that must hold exactly `count` entries. */
  auto items(std::size_t count, std::string_view what) const
      -> std::expected<std::vector<Rlp>, core::error>;

  /** \brief Recursively check every nested item, bounding list depth. */
  auto validate(std::size_t max_depth) const -> std::expected<void, core::error>;

private:
  Rlp(std::span<const std::uint8_t> raw, Header h) : raw_(raw), header_(h) {}

  std::span<const std::uint8_t> raw_{};
  Header header_{};
};

auto as_bytes(const Rlp& item) -> std::expected<std::vector<std::uint8_t>, core::error>;

/** \brief String item holding valid UTF-8. */
auto as_string(const Rlp& item) -> std::expected<std::string, core::error>;

/** \brief Canonical big-endian magnitude of at most max_bytes bytes (empty for zero). */
auto as_uint_be(const Rlp& item, std::size_t max_bytes)
    -> std::expected<std::span<const std::uint8_t>, core::error>;

template <typename T>
auto as_uint(const Rlp& item) -> std::expected<T, core::error> {
  static_assert(std::is_unsigned_v<T>, "as_uint requires an unsigned type");
  auto be = as_uint_be(item, sizeof(T));
  if (!be) return std::unexpected(be.error());
  T v = 0;
  for (auto b : *be) {
    v = static_cast<T>((static_cast<std::uint64_t>(v) << 8) | b);
  }
  return v;
}

auto as_string_list(const Rlp& item) -> std::expected<std::vector<std::string>, core::error>;

/** \brief True if bytes form well-formed UTF-8 (no overlongs, surrogates or values above U+10FFFF). */
bool is_valid_utf8(std::span<const std::uint8_t> bytes) noexcept;

} // namespace ibcore::rlp
