#include "common/error.hpp"

namespace vault {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::ConnectFailed:    return "ConnectFailed";
        case ErrorKind::WriteFailed:      return "WriteFailed";
        case ErrorKind::IncompleteHeader: return "IncompleteHeader";
        case ErrorKind::ConnectionClosed: return "ConnectionClosed";
        case ErrorKind::ServerError:      return "ServerError";
        case ErrorKind::AuthFailed:       return "AuthFailed";
        case ErrorKind::FrameTooLarge:    return "FrameTooLarge";
        case ErrorKind::DecodeFailed:     return "DecodeFailed";
        case ErrorKind::HttpStatus:       return "HttpStatus";
    }
    return "Unknown";
}

ClientError::ClientError(ErrorKind kind, const std::string& message, unsigned status)
    : std::runtime_error(std::string(to_string(kind)) + ": " + message),
      kind_(kind),
      status_(status) {}

} // namespace vault
