#pragma once

/** \file encode.hpp
 *  \brief Canonical RLP (Recursive Length Prefix) encoder stream.
 *
 * Layout:
 *   single byte < 0x80       the byte itself
 *   string, len <= 55        0x80+len, bytes
 *   string, len > 55         0xB7+len_of_len, big-endian len, bytes
 *   list, payload <= 55      0xC0+len, payload
 *   list, payload > 55       0xF7+len_of_len, big-endian len, payload
 *   unsigned integer         minimal big-endian string (zero is 0x80)
 *
 * Thread-safety: an Encoder is a plain value; distinct instances are independent.
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace ibcore::rlp {

class Encoder {
public:
  Encoder() = default;

  void append_bytes(std::span<const std::uint8_t> bytes);
  void append_string(std::string_view s);
  void append_uint(std::uint64_t value);

  /** \brief Append a big-endian magnitude; leading zero bytes are stripped. */
  void append_uint_be(std::span<const std::uint8_t> big_endian);

  /** \brief Append an already-encoded RLP item verbatim. */
  void append_raw(std::span<const std::uint8_t> encoded_item);

  /** \brief Open a list; every begin_list must be matched by end_list. */
  void begin_list();
  void end_list();

  /** \brief Convenience for a zero-length list (0xC0). */
  void append_empty_list();

  [[nodiscard]] auto open_lists() const noexcept -> std::size_t { return starts_.size(); }

  /** \brief Encoded bytes; throws std::logic_error if lists are still open. */
  [[nodiscard]] auto out() && -> std::vector<std::uint8_t>;

private:
  std::vector<std::uint8_t> buf_;
  std::vector<std::size_t> starts_;
};

// Header bytes for a payload of the given length (offset 0x80 for strings, 0xC0 for lists).
auto encode_length_header(std::size_t len, std::uint8_t offset) -> std::vector<std::uint8_t>;

} // namespace ibcore::rlp
