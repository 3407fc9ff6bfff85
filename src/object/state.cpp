#include "ibcore/object/state.hpp"

#include <array>
#include <string>

namespace ibcore::object {

namespace {

struct state_entry {
  std::uint8_t tag;
  ConnectionState state;
  std::string_view name;
};

struct ordering_entry {
  std::uint8_t tag;
  ChannelOrdering ordering;
  std::string_view name;
};

// Wire tags are fixed here, independent of enumerator order.
constexpr std::array<state_entry, 6> STATE_TABLE{{
  {1, ConnectionState::Unknown, "Unknown"},
  {2, ConnectionState::Init, "Init"},
  {3, ConnectionState::OpenTry, "OpenTry"},
  {4, ConnectionState::Open, "Open"},
  {5, ConnectionState::Closed, "Closed"},
  {6, ConnectionState::Frozen, "Frozen"},
}};

constexpr std::array<ordering_entry, 3> ORDERING_TABLE{{
  {1, ChannelOrdering::Unknown, "Unknown"},
  {2, ChannelOrdering::Unordered, "Unordered"},
  {3, ChannelOrdering::Ordered, "Ordered"},
}};

static_assert([] {
  for (const auto& e : STATE_TABLE) if (tag(e.state) != e.tag) return false;
  for (const auto& e : ORDERING_TABLE) if (tag(e.ordering) != e.tag) return false;
  return true;
}(), "enumerator values must match the wire tag table");

template <typename Enum, typename FromTag>
auto read_tagged(const rlp::Rlp& item, std::string_view what, FromTag from_tag)
    -> std::expected<Enum, core::error> {
  auto fields = item.items(1, what);
  if (!fields) return std::unexpected(fields.error());
  auto raw = rlp::as_uint<std::uint8_t>((*fields)[0]);
  if (!raw) return std::unexpected(raw.error());
  auto v = from_tag(*raw);
  if (!v) {
    return core::serde_failure(std::string("invalid ") + std::string(what) + " tag " + std::to_string(*raw),
                               "object." + std::string(what));
  }
  return *v;
}

} // namespace

auto connection_state_from_tag(std::uint8_t t) noexcept -> std::optional<ConnectionState> {
  for (const auto& e : STATE_TABLE) {
    if (e.tag == t) return e.state;
  }
  return std::nullopt;
}

auto channel_ordering_from_tag(std::uint8_t t) noexcept -> std::optional<ChannelOrdering> {
  for (const auto& e : ORDERING_TABLE) {
    if (e.tag == t) return e.ordering;
  }
  return std::nullopt;
}

auto to_string(ConnectionState s) noexcept -> std::string_view {
  for (const auto& e : STATE_TABLE) {
    if (e.state == s) return e.name;
  }
  return "Invalid";
}

auto to_string(ChannelOrdering o) noexcept -> std::string_view {
  for (const auto& e : ORDERING_TABLE) {
    if (e.ordering == o) return e.name;
  }
  return "Invalid";
}

void object_codec<ConnectionState>::append(rlp::Encoder& enc, ConnectionState s) {
  enc.begin_list();
  enc.append_uint(tag(s));
  enc.end_list();
}

auto object_codec<ConnectionState>::read(const rlp::Rlp& item)
    -> std::expected<ConnectionState, core::error> {
  return read_tagged<ConnectionState>(item, NAME, connection_state_from_tag);
}

void object_codec<ChannelOrdering>::append(rlp::Encoder& enc, ChannelOrdering o) {
  enc.begin_list();
  enc.append_uint(tag(o));
  enc.end_list();
}

auto object_codec<ChannelOrdering>::read(const rlp::Rlp& item)
    -> std::expected<ChannelOrdering, core::error> {
  return read_tagged<ChannelOrdering>(item, NAME, channel_ordering_from_tag);
}

} // namespace ibcore::object
