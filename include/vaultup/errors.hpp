#pragma once

namespace vaultup {

// Return codes. 0 is success, everything below is a failure.
inline constexpr int OK              = 0;
inline constexpr int E_EMPTY_SOURCE  = -1001; // zero-length input, never attempted
inline constexpr int E_SOURCE_READ   = -1002;
inline constexpr int E_ORDER         = -1003; // cipher called out of sequence
inline constexpr int E_KEY_FORMAT    = -1004; // unarmored key neither 16 nor 32 bytes
inline constexpr int E_ATTR_DECODE   = -1005; // attribute magic tag mismatch
inline constexpr int E_TRANSIENT     = -1006; // retryable transport failure
inline constexpr int E_PERMANENT     = -1007; // server refused a chunk
inline constexpr int E_MISSING_TOKEN = -1008;
inline constexpr int E_MAC_TIMEOUT   = -1009;
inline constexpr int E_MAC_MISMATCH  = -1010;
inline constexpr int E_CRYPTO        = -1011; // EVP failure
inline constexpr int E_ARGS          = -1012;
inline constexpr int E_STATE         = -1013;
inline constexpr int E_CANCELLED     = -1014;
inline constexpr int E_API           = -1015; // negative service code from the API
inline constexpr int E_TIMEOUT       = -1016; // transfers did not settle in time

const char* strerror(int rc);

// Service codes that are worth another attempt (EAGAIN, ERATELIMIT, ETOOMANY, ETEMPUNAVAIL)
bool service_code_transient(long code);

const char* service_strerror(long code);

}
