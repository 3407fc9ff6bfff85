#include "ibcore/c/ibcore.h"

#include <cstring>
#include <exception>
#include <expected>
#include <span>
#include <string>
#include <vector>

#include "ibcore/error_mapping.hpp"
#include "ibcore/objects.hpp"
#include "ibcore_c_error.hpp"

thread_local std::string ibcore_c::g_last_error;
using ibcore_c::set_error;
using ibcore_c::clear_error;

using namespace ibcore;

namespace {

template <typename T>
auto canonical_bytes(std::span<const std::uint8_t> in)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  auto obj = object::decode<T>(in);
  if (!obj) return std::unexpected(obj.error());
  return object::encode(*obj);
}

auto canonicalize_kind(ibcore_object_kind_t kind, std::span<const std::uint8_t> in)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  switch (kind) {
    case IBCORE_OBJECT_CONNECTION_END: return canonical_bytes<object::ConnectionEnd>(in);
    case IBCORE_OBJECT_CHANNEL_END: return canonical_bytes<object::ChannelEnd>(in);
    case IBCORE_OBJECT_PACKET: return canonical_bytes<object::Packet>(in);
    case IBCORE_OBJECT_PACKET_ACK: return canonical_bytes<object::PacketAck>(in);
    case IBCORE_OBJECT_PROOF_BUNDLE: return canonical_bytes<object::ProofBundle>(in);
    case IBCORE_OBJECT_VERSION: return canonical_bytes<object::Version>(in);
    case IBCORE_OBJECT_CONNECTION_COUNTERPARTY: return canonical_bytes<object::ConnectionCounterparty>(in);
    case IBCORE_OBJECT_CHANNEL_COUNTERPARTY: return canonical_bytes<object::ChannelCounterparty>(in);
  }
  return std::unexpected(core::error{core::error_code::serde_error, "unknown object kind", "c_api"});
}

auto input_span(const uint8_t* data, size_t len) -> std::span<const std::uint8_t> {
  return len == 0 ? std::span<const std::uint8_t>{} : std::span<const std::uint8_t>{data, len};
}

auto invalid_argument(const char* what) -> ibcore_status_t {
  set_error(std::string("invalid argument: ") + what);
  return IBCORE_E_INVALID_ARGUMENT;
}

auto report(const core::error& e) -> ibcore_status_t {
  set_error(e.component + ": " + e.message);
  return core::to_c_status(e.code);
}

} // namespace

extern "C" {

IBCORE_C_API const char* ibcore_get_last_error(void) {
  return ibcore_c::g_last_error.c_str();
}

IBCORE_C_API const char* ibcore_version(void) {
  return "1.0.0";
}

IBCORE_C_API const char* ibcore_status_name(int status) {
  if (status < INT8_MIN || status > INT8_MAX) return "unknown";
  auto ec = core::from_int(static_cast<std::int8_t>(status));
  if (!ec) return status == IBCORE_E_INVALID_ARGUMENT ? "invalid_argument" : "unknown";
  // Names are backed by string literals, so data() is NUL-terminated.
  return core::to_string(*ec).data();
}

IBCORE_C_API ibcore_status_t ibcore_decode_check(ibcore_object_kind_t kind,
                                                 const uint8_t* data, size_t len) {
  if (!data && len != 0) return invalid_argument("data");
  clear_error();
  try {
    auto r = canonicalize_kind(kind, input_span(data, len));
    if (!r) return report(r.error());
    return IBCORE_OK;
  } catch (const std::exception& e) {
    set_error(e.what());
    return IBCORE_E_SERDE_ERROR;
  }
}

IBCORE_C_API ibcore_status_t ibcore_canonicalize(ibcore_object_kind_t kind,
                                                 const uint8_t* data, size_t len,
                                                 uint8_t* out, size_t out_cap,
                                                 size_t* out_size) {
  if (!data && len != 0) return invalid_argument("data");
  if (!out_size) return invalid_argument("out_size");
  clear_error();
  try {
    auto r = canonicalize_kind(kind, input_span(data, len));
    if (!r) return report(r.error());
    *out_size = r->size();
    if (!out) {
      // Size query only
      return IBCORE_OK;
    }
    if (out_cap < r->size()) {
      return invalid_argument("output buffer too small for canonical encoding");
    }
    std::memcpy(out, r->data(), r->size());
    return IBCORE_OK;
  } catch (const std::exception& e) {
    set_error(e.what());
    return IBCORE_E_SERDE_ERROR;
  }
}

IBCORE_C_API ibcore_status_t ibcore_packet_equal_unless_sequence(const uint8_t* a, size_t a_len,
                                                                 const uint8_t* b, size_t b_len,
                                                                 int* out_equal) {
  if ((!a && a_len != 0) || (!b && b_len != 0)) return invalid_argument("packet bytes");
  if (!out_equal) return invalid_argument("out_equal");
  clear_error();
  try {
    auto pa = object::decode<object::Packet>(input_span(a, a_len));
    if (!pa) return report(pa.error());
    auto pb = object::decode<object::Packet>(input_span(b, b_len));
    if (!pb) return report(pb.error());
    *out_equal = pa->equal_unless_sequence(*pb) ? 1 : 0;
    return IBCORE_OK;
  } catch (const std::exception& e) {
    set_error(e.what());
    return IBCORE_E_SERDE_ERROR;
  }
}

} // extern "C"
