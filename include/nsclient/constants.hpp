#pragma once

#include <cstddef>
#include <cstdint>

namespace nsclient::constants {

// ACS authentication
constexpr int ACS_AUTH_VERSION = 5;
constexpr const char* ACS_CLIENT_IP = "0.0.0.0";
constexpr const char* ACS_SERVER_IP = "0.0.0.0";
constexpr size_t NONCE_RANDOM_BYTES = 6;

// Header names
constexpr const char* HEADER_ACS_ACTION = "X-Akamai-ACS-Action";
constexpr const char* HEADER_ACS_AUTH_DATA = "X-Akamai-ACS-Auth-Data";
constexpr const char* HEADER_ACS_AUTH_SIGN = "X-Akamai-ACS-Auth-Sign";

// Prefix of the action line inside the signed message
constexpr const char* SIGNED_ACTION_PREFIX = "x-akamai-acs-action:";

// Default action query fields, in signing order
constexpr const char* DEFAULT_API_VERSION = "1";
constexpr const char* DEFAULT_ACTION = "du";
constexpr const char* DEFAULT_FORMAT = "xml";

// Directory creation treats this status as "already exists"
constexpr int STATUS_ALREADY_EXISTS = 409;
constexpr int STATUS_NOT_FOUND = 404;

// Transport defaults
constexpr long DEFAULT_CONNECT_TIMEOUT_MS = 30000;
constexpr long DEFAULT_TOTAL_TIMEOUT_MS = 300000;  // 5 minutes
constexpr size_t DEFAULT_MAX_IDLE_HANDLES = 16;
constexpr size_t DEFAULT_MAX_RESPONSE_SIZE = 64 * 1024 * 1024;  // 64MB
constexpr const char* DEFAULT_USER_AGENT = "nsclient/1.0";

// Diagnostics
constexpr const char* MASKED_SECRET = "****";

} // namespace nsclient::constants
