#include "ibcore/object/proofs.hpp"

namespace ibcore::object {

ObjectProof::ObjectProof() : encoded_{0xC0} {}

auto ObjectProof::from_encoded(std::span<const std::uint8_t> encoded)
    -> std::expected<ObjectProof, core::error> {
  if (encoded.size() > core::codec_config_instance().max_decode_bytes) {
    return core::serde_failure("input exceeds IBCORE_MAX_DECODE_BYTES", component_of<ObjectProof>());
  }
  auto item = rlp::Rlp::parse(encoded);
  if (!item) return std::unexpected(item.error());
  return object_codec<ObjectProof>::read(*item);
}

void object_codec<ObjectProof>::append(rlp::Encoder& enc, const ObjectProof& v) {
  enc.append_raw(v.encoded());
}

auto object_codec<ObjectProof>::read(const rlp::Rlp& item) -> std::expected<ObjectProof, core::error> {
  auto ok = item.validate(core::codec_config_instance().max_rlp_depth);
  if (!ok) return std::unexpected(ok.error());
  auto raw = item.raw();
  return ObjectProof(std::vector<std::uint8_t>(raw.begin(), raw.end()));
}

void object_codec<ProofBundle>::append(rlp::Encoder& enc, const ProofBundle& v) {
  enc.begin_list();
  enc.append_uint_be(v.height.minimal_be());
  object_codec<ObjectProof>::append(enc, v.object_proof);
  enc.append_bytes(v.client_proof);
  enc.end_list();
}

auto object_codec<ProofBundle>::read(const rlp::Rlp& item) -> std::expected<ProofBundle, core::error> {
  auto f = item.items(3, NAME);
  if (!f) return std::unexpected(f.error());
  auto height_be = rlp::as_uint_be((*f)[0], U256::BYTES);
  if (!height_be) return std::unexpected(height_be.error());
  auto height = U256::from_be_bytes(*height_be);
  if (!height) {
    return core::serde_failure("height wider than 256 bits", component_of<ProofBundle>());
  }
  auto proof = object_codec<ObjectProof>::read((*f)[1]);
  if (!proof) return std::unexpected(proof.error());
  auto client_proof = rlp::as_bytes((*f)[2]);
  if (!client_proof) return std::unexpected(client_proof.error());
  return ProofBundle{*height, std::move(*proof), std::move(*client_proof)};
}

} // namespace ibcore::object
