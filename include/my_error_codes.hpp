#pragma once

namespace my_errors {

namespace GENERAL {  // General errors

constexpr int INVALID_ARGUMENT = 5000;  // Invalid argument
constexpr int SHOW_OPT_DESC = 5002;  // Show options description
constexpr int NOT_FOUND = 5003;  // Not found
constexpr int MISSING_FIELD = 5008;  // Missing field
constexpr int UNEXPECTED_RESULT = 5017;  // Unexpected result
constexpr int UNAUTHORIZED = 5018;  // Unauthorized
constexpr int FILE_NOT_FOUND = 5019;  // File not found
constexpr int FILE_READ_WRITE = 5020;  // File read/write error
constexpr int FORBIDDEN = 5022;  // Forbidden
constexpr int CONFLICT = 5023;  // Ambiguous or conflicting entity
}  // namespace GENERAL

namespace NETWORK {  // Network errors

constexpr int CONNECT_ERROR = 5200;  // Connect error
constexpr int READ_ERROR = 5201;  // Read error
constexpr int WRITE_ERROR = 5202;  // Write error
constexpr int TIMEOUT_ERROR = 5203;  // Timeout error
constexpr int SSL_ERROR = 5204;  // SSL error
constexpr int REMOTE_UNAVAILABLE = 5206;  // Remote 5xx or unreachable
}  // namespace NETWORK

namespace JSON {  // Json errors

constexpr int MALFORMED = 9000;  // Malformed JSON text
constexpr int DECODE_ERROR = 9001;  // Failed to decode/parse JSON (low-level)
constexpr int MISSING_JSON_FIELD = 9004;  // Required JSON field missing
}  // namespace JSON

namespace LISTEN {  // Listen/forward core errors

constexpr int NOT_OPEN = 7100;  // Transport has no open socket
constexpr int OVERLOADED = 7101;  // Outbound queue full
constexpr int REAUTH_REQUIRED = 7102;  // Session token rejected
constexpr int SESSION_REVOKED = 7103;  // Remote revoked the session
constexpr int DRAIN_TIMEOUT = 7104;  // Drain deadline exceeded
constexpr int TERMINAL_ERROR = 7105;  // Terminal I/O failed
}  // namespace LISTEN

}  // namespace my_errors
