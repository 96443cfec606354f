#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace vault {

// ── ErrorKind ─────────────────────────────────────────────────────────────────
// Every failure a client call can hit on the wire.  Transport and protocol
// kinds are caught at the client boundary; FrameTooLarge escapes to the caller
// because it is raised before any connection is opened.

enum class ErrorKind : uint8_t {
    ConnectFailed,     // DNS, refusal, or connect timeout
    WriteFailed,       // short write, write error, or write timeout
    IncompleteHeader,  // fewer than 5 response header bytes before EOF/timeout
    ConnectionClosed,  // EOF/timeout while reading a response body
    ServerError,       // non-zero status byte; status() holds it
    AuthFailed,        // non-zero status in reply to AUTH; status() holds it
    FrameTooLarge,     // key > 65535 bytes or value > 2^32-1 bytes
    DecodeFailed,      // malformed JSON or text in a convenience layer
    HttpStatus,        // unexpected HTTP status; status() holds the code
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

// ── ClientError ───────────────────────────────────────────────────────────────

class ClientError : public std::runtime_error {
public:
    ClientError(ErrorKind kind, const std::string& message, unsigned status = 0);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    // Status byte for ServerError / AuthFailed, HTTP code for HttpStatus,
    // zero otherwise.
    [[nodiscard]] unsigned status() const noexcept { return status_; }

private:
    ErrorKind kind_;
    unsigned  status_;
};

} // namespace vault
