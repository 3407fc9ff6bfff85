#pragma once

/** \file proofs.hpp
 *  \brief Proof material accompanying a cross-chain claim.
 *
 *  ProofBundle: [height, object_proof, client_proof]
 *
 * ObjectProof belongs to the proof-verification subsystem; here it is carried
 * as one well-formed RLP item and re-emitted byte for byte.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "ibcore/object/object.hpp"
#include "ibcore/types/u256.hpp"

namespace ibcore::object {

class ObjectProof;
template <>
struct object_codec<ObjectProof>;

class ObjectProof {
public:
  /** \brief Empty proof, encoded as the empty list (C0). */
  ObjectProof();

  /** \brief Adopt one encoded RLP item; nested lists are bounded by IBCORE_MAX_RLP_DEPTH. */
  static auto from_encoded(std::span<const std::uint8_t> encoded)
      -> std::expected<ObjectProof, core::error>;

  [[nodiscard]] auto encoded() const noexcept -> std::span<const std::uint8_t> { return encoded_; }

  friend bool operator==(const ObjectProof&, const ObjectProof&) = default;

private:
  friend struct object_codec<ObjectProof>;

  explicit ObjectProof(std::vector<std::uint8_t> encoded) : encoded_(std::move(encoded)) {}

  std::vector<std::uint8_t> encoded_;
};

struct ProofBundle {
  U256 height{};
  ObjectProof object_proof{};
  std::vector<std::uint8_t> client_proof;

  friend bool operator==(const ProofBundle&, const ProofBundle&) = default;
};

template <>
struct object_codec<ObjectProof> {
  static constexpr std::string_view NAME = "object_proof";
  static void append(rlp::Encoder& enc, const ObjectProof& v);
  static auto read(const rlp::Rlp& item) -> std::expected<ObjectProof, core::error>;
};

template <>
struct object_codec<ProofBundle> {
  static constexpr std::string_view NAME = "proof_bundle";
  static void append(rlp::Encoder& enc, const ProofBundle& v);
  static auto read(const rlp::Rlp& item) -> std::expected<ProofBundle, core::error>;
};

} // namespace ibcore::object
