#include "nsclient/error.hpp"

namespace nsclient {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Protocol: return "protocol";
        case ErrorKind::Parse: return "parse";
        case ErrorKind::Validation: return "validation";
    }
    return "none";
}

Error Error::transport(const std::string& message) {
    return Error{ErrorKind::Transport, 0, message};
}

Error Error::protocol(int status, const std::string& message) {
    return Error{ErrorKind::Protocol, status, message};
}

Error Error::parse(const std::string& message) {
    return Error{ErrorKind::Parse, 0, message};
}

Error Error::validation(const std::string& message) {
    return Error{ErrorKind::Validation, 0, message};
}

} // namespace nsclient
