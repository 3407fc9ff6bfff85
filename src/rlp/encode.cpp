#include "ibcore/rlp/encode.hpp"

#include <array>
#include <stdexcept>
#include <utility>

namespace ibcore::rlp {

static constexpr std::uint8_t STRING_OFFSET = 0x80;
static constexpr std::uint8_t LIST_OFFSET = 0xC0;
static constexpr std::size_t SHORT_LIMIT = 55;

static auto big_endian_minimal(std::uint64_t v) -> std::vector<std::uint8_t> {
  std::array<std::uint8_t, 8> tmp{};
  std::size_t n = 0;
  while (v != 0) {
    tmp[7 - n] = static_cast<std::uint8_t>(v & 0xFFu);
    v >>= 8;
    ++n;
  }
  return {tmp.end() - static_cast<std::ptrdiff_t>(n), tmp.end()};
}

auto encode_length_header(std::size_t len, std::uint8_t offset) -> std::vector<std::uint8_t> {
  if (len <= SHORT_LIMIT) {
    return {static_cast<std::uint8_t>(offset + len)};
  }
  auto len_bytes = big_endian_minimal(static_cast<std::uint64_t>(len));
  std::vector<std::uint8_t> h;
  h.reserve(1 + len_bytes.size());
  h.push_back(static_cast<std::uint8_t>(offset + SHORT_LIMIT + len_bytes.size()));
  h.insert(h.end(), len_bytes.begin(), len_bytes.end());
  return h;
}

void Encoder::append_bytes(std::span<const std::uint8_t> bytes) {
  if (bytes.size() == 1 && bytes[0] < STRING_OFFSET) {
    buf_.push_back(bytes[0]);
    return;
  }
  auto h = encode_length_header(bytes.size(), STRING_OFFSET);
  buf_.insert(buf_.end(), h.begin(), h.end());
  buf_.insert(buf_.end(), bytes.begin(), bytes.end());
}

void Encoder::append_string(std::string_view s) {
  append_bytes({reinterpret_cast<const std::uint8_t*>(s.data()), s.size()});
}

void Encoder::append_uint(std::uint64_t value) {
  auto be = big_endian_minimal(value);
  append_bytes(be);
}

void Encoder::append_uint_be(std::span<const std::uint8_t> big_endian) {
  std::size_t skip = 0;
  while (skip < big_endian.size() && big_endian[skip] == 0) ++skip;
  append_bytes(big_endian.subspan(skip));
}

void Encoder::append_raw(std::span<const std::uint8_t> encoded_item) {
  buf_.insert(buf_.end(), encoded_item.begin(), encoded_item.end());
}

void Encoder::begin_list() {
  starts_.push_back(buf_.size());
}

void Encoder::end_list() {
  if (starts_.empty()) throw std::logic_error("rlp: end_list without begin_list");
  const std::size_t start = starts_.back();
  starts_.pop_back();
  auto h = encode_length_header(buf_.size() - start, LIST_OFFSET);
  buf_.insert(buf_.begin() + static_cast<std::ptrdiff_t>(start), h.begin(), h.end());
}

void Encoder::append_empty_list() {
  buf_.push_back(LIST_OFFSET);
}

auto Encoder::out() && -> std::vector<std::uint8_t> {
  if (!starts_.empty()) throw std::logic_error("rlp: unbalanced list");
  return std::move(buf_);
}

} // namespace ibcore::rlp
