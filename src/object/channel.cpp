#include "ibcore/object/channel.hpp"
#include "ibcore/object/fields.hpp"

#include <utility>

namespace ibcore::object {

void object_codec<ChannelCounterparty>::append(rlp::Encoder& enc, const ChannelCounterparty& v) {
  enc.begin_list();
  enc.append_string(v.port_id);
  enc.append_string(v.channel_id);
  enc.end_list();
}

auto object_codec<ChannelCounterparty>::read(const rlp::Rlp& item)
    -> std::expected<ChannelCounterparty, core::error> {
  auto f = item.items(2, NAME);
  if (!f) return std::unexpected(f.error());
  auto port_id = rlp::as_string((*f)[0]);
  if (!port_id) return std::unexpected(port_id.error());
  auto channel_id = rlp::as_string((*f)[1]);
  if (!channel_id) return std::unexpected(channel_id.error());
  return ChannelCounterparty{std::move(*port_id), std::move(*channel_id)};
}

void object_codec<ChannelEnd>::append(rlp::Encoder& enc, const ChannelEnd& v) {
  enc.begin_list();
  object_codec<ConnectionState>::append(enc, v.state);
  object_codec<ChannelOrdering>::append(enc, v.ordering);
  object_codec<ChannelCounterparty>::append(enc, v.remote);
  append_string_list(enc, v.connection_hops);
  enc.end_list();
}

auto object_codec<ChannelEnd>::read(const rlp::Rlp& item) -> std::expected<ChannelEnd, core::error> {
  auto f = item.items(4, NAME);
  if (!f) return std::unexpected(f.error());
  auto state = object_codec<ConnectionState>::read((*f)[0]);
  if (!state) return std::unexpected(state.error());
  auto ordering = object_codec<ChannelOrdering>::read((*f)[1]);
  if (!ordering) return std::unexpected(ordering.error());
  auto remote = object_codec<ChannelCounterparty>::read((*f)[2]);
  if (!remote) return std::unexpected(remote.error());
  auto hops = rlp::as_string_list((*f)[3]);
  if (!hops) return std::unexpected(hops.error());
  return ChannelEnd{*state, *ordering, std::move(*remote), std::move(*hops)};
}

} // namespace ibcore::object
