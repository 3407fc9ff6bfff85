#ifndef IBCORE_C_H
#define IBCORE_C_H

#ifdef __cplusplus
extern "C" {
#endif

// Symbol visibility
#if defined(_WIN32)
  #if defined(IBCORE_C_API_EXPORTS)
    #define IBCORE_C_API __declspec(dllexport)
  #else
    #define IBCORE_C_API __declspec(dllimport)
  #endif
#else
  #define IBCORE_C_API __attribute__((visibility("default")))
#endif

#include <stddef.h>
#include <stdint.h>

// Versioning and stability
// - IBCORE_C_ABI_VERSION increments on incompatible changes.
// - Status values equal the C++ error_code values and are never renumbered.
#define IBCORE_C_ABI_VERSION 1

typedef enum {
  IBCORE_E_INVALID_ARGUMENT = -1,   // ABI misuse (null pointer, short buffer); not a taxonomy code
  IBCORE_OK = 0,
  IBCORE_E_FOUND_NO_MESSAGE = 100,
  IBCORE_E_EVENT_NOT_MATCH = 101,
  IBCORE_E_INVALID_RECEIPT_PROOF = 102,
  IBCORE_E_SERDE_ERROR = 103,
  IBCORE_E_WRONG_CLIENT = 104,
  IBCORE_E_WRONG_CONNECTION_ID = 105,
  IBCORE_E_WRONG_CONNECTION_NUMBER = 106,
  IBCORE_E_WRONG_PORT_ID = 107,
  IBCORE_E_WRONG_COMMON_HEX_ID = 108,
  IBCORE_E_CONNECTIONS_WRONG = 109,
  IBCORE_E_WRONG_CONNECTION_CNT = 110,
  IBCORE_E_WRONG_CONNECTION_STATE = 111,
  IBCORE_E_WRONG_CONNECTION_COUNTERPARTY = 112,
  IBCORE_E_WRONG_CONNECTION_CLIENT = 113,
  IBCORE_E_WRONG_CONNECTION_NEXT_CHANNEL_NUMBER = 114,
  IBCORE_E_WRONG_CONNECTION_ARGS = 115,
  IBCORE_E_WRONG_CHANNEL_STATE = 116,
  IBCORE_E_WRONG_CHANNEL = 117,
  IBCORE_E_WRONG_CHANNEL_ARGS = 118,
  IBCORE_E_WRONG_CHANNEL_SEQUENCE = 119,
  IBCORE_E_WRONG_UNUSED_PACKET = 120,
  IBCORE_E_WRONG_PACKET_SEQUENCE = 121,
  IBCORE_E_WRONG_PACKET_STATUS = 122,
  IBCORE_E_WRONG_PACKET_CONTENT = 123,
  IBCORE_E_WRONG_PACKET_ARGS = 124
} ibcore_status_t;

typedef enum {
  IBCORE_OBJECT_CONNECTION_END = 1,
  IBCORE_OBJECT_CHANNEL_END = 2,
  IBCORE_OBJECT_PACKET = 3,
  IBCORE_OBJECT_PACKET_ACK = 4,
  IBCORE_OBJECT_PROOF_BUNDLE = 5,
  IBCORE_OBJECT_VERSION = 6,
  IBCORE_OBJECT_CONNECTION_COUNTERPARTY = 7,
  IBCORE_OBJECT_CHANNEL_COUNTERPARTY = 8
} ibcore_object_kind_t;

// API ownership & lifetime rules
// - Input buffers are borrowed for the duration of the call.
// - Output buffers are caller-provided (out/out_cap); out_size receives the required size.
//   Passing out == NULL performs a size query.
// - All functions are thread-safe; the last-error string is per thread.

// Thread-local last error string ("" when the last call succeeded)
IBCORE_C_API const char* ibcore_get_last_error(void);

// Version info (semantic version string)
IBCORE_C_API const char* ibcore_version(void);

// Stable snake_case name of a status ("serde_error"); "unknown" for values outside the taxonomy
IBCORE_C_API const char* ibcore_status_name(int status);

// Decode `data` as `kind`; IBCORE_OK or IBCORE_E_SERDE_ERROR
IBCORE_C_API ibcore_status_t ibcore_decode_check(ibcore_object_kind_t kind,
                                                 const uint8_t* data, size_t len);

// Decode then re-encode in canonical form
IBCORE_C_API ibcore_status_t ibcore_canonicalize(ibcore_object_kind_t kind,
                                                 const uint8_t* data, size_t len,
                                                 uint8_t* out, size_t out_cap,
                                                 size_t* out_size);

// Decode two packets and compare every field except the sequence number
IBCORE_C_API ibcore_status_t ibcore_packet_equal_unless_sequence(const uint8_t* a, size_t a_len,
                                                                 const uint8_t* b, size_t b_len,
                                                                 int* out_equal);

#ifdef __cplusplus
}
#endif

#endif // IBCORE_C_H
