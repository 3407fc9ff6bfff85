#pragma once

#include <optional>

#include "ibcore/c/ibcore.h"
#include "ibcore/error.hpp"

namespace ibcore::core {

// Status values mirror error_code one to one.
constexpr ibcore_status_t to_c_status(error_code ec) {
  return static_cast<ibcore_status_t>(to_int(ec));
}

constexpr auto from_c_status(ibcore_status_t st) -> std::optional<error_code> {
  switch (st) {
    case IBCORE_OK: return error_code::ok;
    case IBCORE_E_FOUND_NO_MESSAGE: return error_code::found_no_message;
    case IBCORE_E_EVENT_NOT_MATCH: return error_code::event_not_match;
    case IBCORE_E_INVALID_RECEIPT_PROOF: return error_code::invalid_receipt_proof;
    case IBCORE_E_SERDE_ERROR: return error_code::serde_error;
    case IBCORE_E_WRONG_CLIENT: return error_code::wrong_client;
    case IBCORE_E_WRONG_CONNECTION_ID: return error_code::wrong_connection_id;
    case IBCORE_E_WRONG_CONNECTION_NUMBER: return error_code::wrong_connection_number;
    case IBCORE_E_WRONG_PORT_ID: return error_code::wrong_port_id;
    case IBCORE_E_WRONG_COMMON_HEX_ID: return error_code::wrong_common_hex_id;
    case IBCORE_E_CONNECTIONS_WRONG: return error_code::connections_wrong;
    case IBCORE_E_WRONG_CONNECTION_CNT: return error_code::wrong_connection_cnt;
    case IBCORE_E_WRONG_CONNECTION_STATE: return error_code::wrong_connection_state;
    case IBCORE_E_WRONG_CONNECTION_COUNTERPARTY: return error_code::wrong_connection_counterparty;
    case IBCORE_E_WRONG_CONNECTION_CLIENT: return error_code::wrong_connection_client;
    case IBCORE_E_WRONG_CONNECTION_NEXT_CHANNEL_NUMBER: return error_code::wrong_connection_next_channel_number;
    case IBCORE_E_WRONG_CONNECTION_ARGS: return error_code::wrong_connection_args;
    case IBCORE_E_WRONG_CHANNEL_STATE: return error_code::wrong_channel_state;
    case IBCORE_E_WRONG_CHANNEL: return error_code::wrong_channel;
    case IBCORE_E_WRONG_CHANNEL_ARGS: return error_code::wrong_channel_args;
    case IBCORE_E_WRONG_CHANNEL_SEQUENCE: return error_code::wrong_channel_sequence;
    case IBCORE_E_WRONG_UNUSED_PACKET: return error_code::wrong_unused_packet;
    case IBCORE_E_WRONG_PACKET_SEQUENCE: return error_code::wrong_packet_sequence;
    case IBCORE_E_WRONG_PACKET_STATUS: return error_code::wrong_packet_status;
    case IBCORE_E_WRONG_PACKET_CONTENT: return error_code::wrong_packet_content;
    case IBCORE_E_WRONG_PACKET_ARGS: return error_code::wrong_packet_args;
    case IBCORE_E_INVALID_ARGUMENT: return std::nullopt;
  }
  return std::nullopt;
}

} // namespace ibcore::core
