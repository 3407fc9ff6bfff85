#include "ibcore/object/connection.hpp"
#include "ibcore/object/fields.hpp"

#include <utility>

namespace ibcore::object {

void object_codec<ConnectionCounterparty>::append(rlp::Encoder& enc, const ConnectionCounterparty& v) {
  enc.begin_list();
  enc.append_string(v.client_id);
  append_optional_string(enc, v.connection_id);
  enc.append_bytes(v.commitment_prefix);
  enc.end_list();
}

auto object_codec<ConnectionCounterparty>::read(const rlp::Rlp& item)
    -> std::expected<ConnectionCounterparty, core::error> {
  auto f = item.items(3, NAME);
  if (!f) return std::unexpected(f.error());
  auto client_id = rlp::as_string((*f)[0]);
  if (!client_id) return std::unexpected(client_id.error());
  auto connection_id = read_optional_string((*f)[1]);
  if (!connection_id) return std::unexpected(connection_id.error());
  auto prefix = rlp::as_bytes((*f)[2]);
  if (!prefix) return std::unexpected(prefix.error());
  return ConnectionCounterparty{std::move(*client_id), std::move(*connection_id), std::move(*prefix)};
}

void object_codec<Version>::append(rlp::Encoder& enc, const Version& v) {
  enc.begin_list();
  enc.append_string(v.identifier);
  append_string_list(enc, v.features);
  enc.end_list();
}

auto object_codec<Version>::read(const rlp::Rlp& item) -> std::expected<Version, core::error> {
  auto f = item.items(2, NAME);
  if (!f) return std::unexpected(f.error());
  auto identifier = rlp::as_string((*f)[0]);
  if (!identifier) return std::unexpected(identifier.error());
  auto features = rlp::as_string_list((*f)[1]);
  if (!features) return std::unexpected(features.error());
  return Version{std::move(*identifier), std::move(*features)};
}

void object_codec<ConnectionEnd>::append(rlp::Encoder& enc, const ConnectionEnd& v) {
  enc.begin_list();
  object_codec<ConnectionState>::append(enc, v.state);
  enc.append_string(v.client_id);
  object_codec<ConnectionCounterparty>::append(enc, v.counterparty);
  enc.append_uint(v.delay_period);
  enc.begin_list();
  for (const auto& version : v.versions) object_codec<Version>::append(enc, version);
  enc.end_list();
  enc.end_list();
}

auto object_codec<ConnectionEnd>::read(const rlp::Rlp& item)
    -> std::expected<ConnectionEnd, core::error> {
  auto f = item.items(5, NAME);
  if (!f) return std::unexpected(f.error());
  auto state = object_codec<ConnectionState>::read((*f)[0]);
  if (!state) return std::unexpected(state.error());
  auto client_id = rlp::as_string((*f)[1]);
  if (!client_id) return std::unexpected(client_id.error());
  auto counterparty = object_codec<ConnectionCounterparty>::read((*f)[2]);
  if (!counterparty) return std::unexpected(counterparty.error());
  auto delay = rlp::as_uint<std::uint64_t>((*f)[3]);
  if (!delay) return std::unexpected(delay.error());
  auto version_items = (*f)[4].items();
  if (!version_items) return std::unexpected(version_items.error());

  ConnectionEnd out{};
  out.state = *state;
  out.client_id = std::move(*client_id);
  out.counterparty = std::move(*counterparty);
  out.delay_period = *delay;
  out.versions.reserve(version_items->size());
  for (const auto& vi : *version_items) {
    auto version = object_codec<Version>::read(vi);
    if (!version) return std::unexpected(version.error());
    out.versions.push_back(std::move(*version));
  }
  return out;
}

} // namespace ibcore::object
