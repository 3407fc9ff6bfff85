#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable signed 8-bit codes for programmatic handling across the host boundary.
 *   Values are part of the wire contract and are never renumbered or reused.
 * - Human-readable message and originating component for diagnostics.
 * - Only serde_error is produced by this library; the remaining codes are raised
 *   by verification logic built on top of it.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace ibcore::core {

/** \brief Stable verification / decoding failure codes. */
enum class error_code : std::int8_t {
  ok = 0,
  found_no_message = 100,
  event_not_match = 101,
  invalid_receipt_proof = 102,
  serde_error = 103,

  wrong_client = 104,
  wrong_connection_id = 105,
  wrong_connection_number = 106,
  wrong_port_id = 107,
  wrong_common_hex_id = 108,

  connections_wrong = 109,

  wrong_connection_cnt = 110,
  wrong_connection_state = 111,
  wrong_connection_counterparty = 112,
  wrong_connection_client = 113,
  wrong_connection_next_channel_number = 114,
  wrong_connection_args = 115,

  wrong_channel_state = 116,
  wrong_channel = 117,
  wrong_channel_args = 118,
  wrong_channel_sequence = 119,

  wrong_unused_packet = 120,
  wrong_packet_sequence = 121,
  wrong_packet_status = 122,
  wrong_packet_content = 123,
  wrong_packet_args = 124,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::serde_error};  /**< machine-parseable code */
  std::string message;                       /**< short human-readable message */
  std::string component;                     /**< subsystem, e.g., "rlp.decode" */
};

/** \brief Raw integer exchanged with hosts that cannot carry error types. */
constexpr auto to_int(error_code ec) noexcept -> std::int8_t {
  return static_cast<std::int8_t>(ec);
}

/** \brief Closed inverse of to_int; integers outside the taxonomy yield nullopt. */
auto from_int(std::int8_t value) noexcept -> std::optional<error_code>;

/** \brief Stable snake_case name, e.g. "serde_error". */
auto to_string(error_code ec) noexcept -> std::string_view;

/** \brief Shorthand for the single structural decode failure. */
inline auto serde_failure(std::string message, std::string component)
    -> std::unexpected<error> {
  return std::unexpected(error{error_code::serde_error, std::move(message), std::move(component)});
}

} // namespace ibcore::core
