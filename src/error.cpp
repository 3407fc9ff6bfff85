#include "ibcore/error.hpp"

#include <array>
#include <utility>

namespace ibcore::core {

namespace {

struct code_entry {
  error_code code;
  std::string_view name;
};

// Authoritative code table; tests pin every value.
constexpr std::array<code_entry, 26> CODE_TABLE{{
  {error_code::ok, "ok"},
  {error_code::found_no_message, "found_no_message"},
  {error_code::event_not_match, "event_not_match"},
  {error_code::invalid_receipt_proof, "invalid_receipt_proof"},
  {error_code::serde_error, "serde_error"},
  {error_code::wrong_client, "wrong_client"},
  {error_code::wrong_connection_id, "wrong_connection_id"},
  {error_code::wrong_connection_number, "wrong_connection_number"},
  {error_code::wrong_port_id, "wrong_port_id"},
  {error_code::wrong_common_hex_id, "wrong_common_hex_id"},
  {error_code::connections_wrong, "connections_wrong"},
  {error_code::wrong_connection_cnt, "wrong_connection_cnt"},
  {error_code::wrong_connection_state, "wrong_connection_state"},
  {error_code::wrong_connection_counterparty, "wrong_connection_counterparty"},
  {error_code::wrong_connection_client, "wrong_connection_client"},
  {error_code::wrong_connection_next_channel_number, "wrong_connection_next_channel_number"},
  {error_code::wrong_connection_args, "wrong_connection_args"},
  {error_code::wrong_channel_state, "wrong_channel_state"},
  {error_code::wrong_channel, "wrong_channel"},
  {error_code::wrong_channel_args, "wrong_channel_args"},
  {error_code::wrong_channel_sequence, "wrong_channel_sequence"},
  {error_code::wrong_unused_packet, "wrong_unused_packet"},
  {error_code::wrong_packet_sequence, "wrong_packet_sequence"},
  {error_code::wrong_packet_status, "wrong_packet_status"},
  {error_code::wrong_packet_content, "wrong_packet_content"},
  {error_code::wrong_packet_args, "wrong_packet_args"},
}};

} // namespace

auto from_int(std::int8_t value) noexcept -> std::optional<error_code> {
  for (const auto& e : CODE_TABLE) {
    if (to_int(e.code) == value) return e.code;
  }
  return std::nullopt;
}

auto to_string(error_code ec) noexcept -> std::string_view {
  for (const auto& e : CODE_TABLE) {
    if (e.code == ec) return e.name;
  }
  return "unknown";
}

} // namespace ibcore::core
