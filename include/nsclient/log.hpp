#pragma once

namespace nsclient {

// Informational output to stdout.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

// Errors to stderr with an "ERROR: " prefix.
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

// Request tracing to stderr with a "DEBUG: " prefix.
// Callers gate this on their own verbose setting.
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

} // namespace nsclient
