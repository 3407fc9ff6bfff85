#include "ibcore/rlp/decode.hpp"

#include <utility>

namespace ibcore::rlp {

using core::serde_failure;

static constexpr const char* COMPONENT = "rlp.decode";

static auto load_be_length(std::span<const std::uint8_t> bytes) -> std::size_t {
  std::size_t v = 0;
  for (auto b : bytes) v = (v << 8) | b;
  return v;
}

auto decode_header(std::span<const std::uint8_t> bytes) -> std::expected<Header, core::error> {
  if (bytes.empty()) {
    return serde_failure("empty input", COMPONENT);
  }
  const std::uint8_t b0 = bytes[0];
  const std::size_t avail = bytes.size() - 1;

  if (b0 < 0x80) {
    return Header{false, 0, 1};
  }

  const bool is_list = b0 >= 0xC0;
  const std::uint8_t base = is_list ? 0xC0 : 0x80;
  const std::uint8_t tag = static_cast<std::uint8_t>(b0 - base);

  if (tag <= 55) {
    const std::size_t len = tag;
    if (len > avail) {
      return serde_failure("item exceeds input", COMPONENT);
    }
    if (!is_list && len == 1 && bytes[1] < 0x80) {
      return serde_failure("single byte below 0x80 must not carry a header", COMPONENT);
    }
    return Header{is_list, 1, len};
  }

  const std::size_t len_of_len = static_cast<std::size_t>(tag - 55);
  if (len_of_len > avail) {
    return serde_failure("length prefix exceeds input", COMPONENT);
  }
  if (len_of_len > sizeof(std::size_t)) {
    return serde_failure("length prefix too wide", COMPONENT);
  }
  if (bytes[1] == 0) {
    return serde_failure("length prefix has leading zero", COMPONENT);
  }
  const std::size_t len = load_be_length(bytes.subspan(1, len_of_len));
  if (len <= 55) {
    return serde_failure("long form used for short length", COMPONENT);
  }
  if (len > avail - len_of_len) {
    return serde_failure("item exceeds input", COMPONENT);
  }
  return Header{is_list, 1 + len_of_len, len};
}

auto Rlp::parse(std::span<const std::uint8_t> bytes) -> std::expected<Rlp, core::error> {
  auto h = decode_header(bytes);
  if (!h) return std::unexpected(h.error());
  if (h->header_len + h->payload_len != bytes.size()) {
    return serde_failure("trailing bytes after item", COMPONENT);
  }
  return Rlp(bytes, *h);
}

auto Rlp::items() const -> std::expected<std::vector<Rlp>, core::error> {
  if (!is_list()) {
    return serde_failure("expected list, found string", COMPONENT);
  }
  std::vector<Rlp> out;
  auto rest = payload();
  while (!rest.empty()) {
    auto h = decode_header(rest);
    if (!h) return std::unexpected(h.error());
    const std::size_t n = h->header_len + h->payload_len;
    out.push_back(Rlp(rest.first(n), *h));
    rest = rest.subspan(n);
  }
  return out;
}

auto Rlp::items(std::size_t count, std::string_view what) const
    -> std::expected<std::vector<Rlp>, core::error> {
  auto list = items();
  if (!list) return list;
  if (list->size() != count) {
    return serde_failure(std::string(what) + ": expected " + std::to_string(count) +
                             " fields, found " + std::to_string(list->size()),
                         COMPONENT);
  }
  return list;
}

auto Rlp::validate(std::size_t max_depth) const -> std::expected<void, core::error> {
  if (!is_list()) return {};
  if (max_depth == 0) {
    return serde_failure("list nesting too deep", COMPONENT);
  }
  auto list = items();
  if (!list) return std::unexpected(list.error());
  for (const auto& child : *list) {
    auto r = child.validate(max_depth - 1);
    if (!r) return r;
  }
  return {};
}

auto as_bytes(const Rlp& item) -> std::expected<std::vector<std::uint8_t>, core::error> {
  if (item.is_list()) {
    return serde_failure("expected string, found list", COMPONENT);
  }
  auto p = item.payload();
  return std::vector<std::uint8_t>(p.begin(), p.end());
}

auto as_string(const Rlp& item) -> std::expected<std::string, core::error> {
  if (item.is_list()) {
    return serde_failure("expected string, found list", COMPONENT);
  }
  auto p = item.payload();
  if (!is_valid_utf8(p)) {
    return serde_failure("string is not valid utf-8", COMPONENT);
  }
  return std::string(reinterpret_cast<const char*>(p.data()), p.size());
}

auto as_uint_be(const Rlp& item, std::size_t max_bytes)
    -> std::expected<std::span<const std::uint8_t>, core::error> {
  if (item.is_list()) {
    return serde_failure("expected integer, found list", COMPONENT);
  }
  auto p = item.payload();
  if (p.size() > max_bytes) {
    return serde_failure("integer wider than " + std::to_string(max_bytes) + " bytes", COMPONENT);
  }
  if (!p.empty() && p[0] == 0) {
    return serde_failure("integer has leading zero", COMPONENT);
  }
  return p;
}

auto as_string_list(const Rlp& item) -> std::expected<std::vector<std::string>, core::error> {
  auto list = item.items();
  if (!list) return std::unexpected(list.error());
  std::vector<std::string> out;
  out.reserve(list->size());
  for (const auto& e : *list) {
    auto s = as_string(e);
    if (!s) return std::unexpected(s.error());
    out.push_back(std::move(*s));
  }
  return out;
}

bool is_valid_utf8(std::span<const std::uint8_t> bytes) noexcept {
  std::size_t i = 0;
  const std::size_t n = bytes.size();
  while (i < n) {
    const std::uint8_t c = bytes[i];
    if (c < 0x80) { ++i; continue; }

    std::size_t extra = 0;
    std::uint32_t cp = 0;
    std::uint32_t min_cp = 0;
    if ((c & 0xE0u) == 0xC0u) { extra = 1; cp = c & 0x1Fu; min_cp = 0x80; }
    else if ((c & 0xF0u) == 0xE0u) { extra = 2; cp = c & 0x0Fu; min_cp = 0x800; }
    else if ((c & 0xF8u) == 0xF0u) { extra = 3; cp = c & 0x07u; min_cp = 0x10000; }
    else return false;

    if (extra > n - i - 1) return false;
    for (std::size_t k = 1; k <= extra; ++k) {
      const std::uint8_t cc = bytes[i + k];
      if ((cc & 0xC0u) != 0x80u) return false;
      cp = (cp << 6) | (cc & 0x3Fu);
    }
    if (cp < min_cp) return false;                      // overlong
    if (cp > 0x10FFFFu) return false;
    if (cp >= 0xD800u && cp <= 0xDFFFu) return false;   // surrogate
    i += extra + 1;
  }
  return true;
}

} // namespace ibcore::rlp
