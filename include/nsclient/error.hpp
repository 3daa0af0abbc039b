#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace nsclient {

enum class ErrorKind {
    None,
    Transport,   // network, DNS, timeout: never interpreted
    Protocol,    // HTTP status >= 300
    Parse,       // malformed XML response body
    Validation   // bad argument, no request issued
};

const char* error_kind_name(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::None;
    int status = 0;  // HTTP status for Protocol errors, 0 otherwise
    std::string message;

    explicit operator bool() const { return kind != ErrorKind::None; }

    static Error transport(const std::string& message);
    static Error protocol(int status, const std::string& message);
    static Error parse(const std::string& message);
    static Error validation(const std::string& message);
};

// Result of a single API action.
// On success, data holds either {"status": <code>} or the parsed XML body.
struct ActionResult {
    bool success = false;
    int status = 0;
    nlohmann::json data;
    Error error;
};

// Result of a multi-step operation (directory materialization, create)
struct Status {
    bool success = false;
    Error error;

    static Status ok() { return Status{true, {}}; }
    static Status fail(Error error) { return Status{false, std::move(error)}; }
};

// Result of file_exists()
struct ExistsResult {
    bool success = false;
    bool exists = false;
    Error error;
};

} // namespace nsclient
