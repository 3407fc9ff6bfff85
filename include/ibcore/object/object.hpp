#pragma once

/** \file object.hpp
 *  \brief Uniform encode/decode contract shared by every wire object.
 *
 * Each object type T provides an object_codec<T> specialization with:
 *   - NAME:   short identifier used in error components ("object.<NAME>")
 *   - append: write T as one RLP item (total, deterministic)
 *   - read:   rebuild T from one RLP item, rejecting any layout mismatch
 *
 * encode/decode wrap these for whole byte buffers. decode enforces
 * IBCORE_MAX_DECODE_BYTES, requires the item to span the whole input and logs
 * failures when IBCORE_CODEC_DEBUG is set. Every failure carries serde_error.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "ibcore/core/config.hpp"
#include "ibcore/core/log.hpp"
#include "ibcore/error.hpp"
#include "ibcore/rlp/decode.hpp"
#include "ibcore/rlp/encode.hpp"

namespace ibcore::object {

template <typename T>
struct object_codec;

template <typename T>
auto component_of() -> std::string {
  return std::string("object.") + std::string(object_codec<T>::NAME);
}

template <typename T>
auto encode(const T& value) -> std::vector<std::uint8_t> {
  rlp::Encoder enc;
  object_codec<T>::append(enc, value);
  return std::move(enc).out();
}

template <typename T>
auto decode(std::span<const std::uint8_t> bytes) -> std::expected<T, core::error> {
  auto result = [&]() -> std::expected<T, core::error> {
    if (bytes.size() > core::codec_config_instance().max_decode_bytes) {
      return core::serde_failure("input exceeds IBCORE_MAX_DECODE_BYTES", component_of<T>());
    }
    auto item = rlp::Rlp::parse(bytes);
    if (!item) return std::unexpected(item.error());
    return object_codec<T>::read(*item);
  }();
  if (!result && core::codec_config_instance().debug) {
    core::log_debug(component_of<T>(), result.error().component + ": " + result.error().message);
  }
  return result;
}

} // namespace ibcore::object
