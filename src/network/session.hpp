#pragma once

#include "network/frame_codec.hpp"
#include "network/stream.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace vault::network {

// ── SessionState ──────────────────────────────────────────────────────────────

enum class SessionState : uint8_t {
    Closed        = 0,
    Connecting    = 1,
    Connected     = 2,
    Authenticated = 3,
    Operating     = 4,
};

[[nodiscard]] std::string_view to_string(SessionState s) noexcept;

// ── Session ───────────────────────────────────────────────────────────────────
//
// One connection, used for one logical client call:
//
//   Closed → Connecting → Connected → [Authenticated] → Operating → Closed
//
// The constructor opens the stream through `connector`.  authenticate() is
// optional and must come before round_trip(); round_trip() may be called
// once.  The stream is closed exactly once: by the first failing exchange, by
// an explicit close(), or by the destructor, whichever comes first.
//
// A Session is not thread-safe; it is meant to live on one call's stack.

class Session {
public:
    // Opens the connection.  Throws ClientError(ConnectFailed).
    Session(const Endpoint& endpoint,
            std::chrono::milliseconds timeout,
            const Connector& connector,
            std::shared_ptr<spdlog::logger> logger = {});

    Session(const Session&)            = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&)                 = delete;
    Session& operator=(Session&&)      = delete;

    ~Session();

    // Send AUTH with `credential` as the key and check the reply.
    // No-op when `credential` is empty.
    // Throws ClientError(AuthFailed) carrying the status on a non-SUCCESS
    // reply, or the transport error that interrupted the exchange.
    void authenticate(const std::optional<std::string>& credential);

    // Write one encoded request and return the response body.
    // Throws ClientError(WriteFailed | IncompleteHeader | ServerError |
    // ConnectionClosed).  Throws std::logic_error when called twice.
    [[nodiscard]] Bytes round_trip(std::span<const uint8_t> request);

    // Release the connection.  Subsequent calls do nothing.
    void close() noexcept;

    [[nodiscard]] SessionState state() const noexcept { return state_; }

    [[nodiscard]] bool is_open() const noexcept { return stream_ != nullptr; }

private:
    // write → header → body.  Closes the stream before propagating any error.
    Bytes exchange(std::span<const uint8_t> request);

    // Accumulate up to kHeaderSize bytes and decode them.
    ResponseHeader read_header();

    void set_state(SessionState s) noexcept;

    std::unique_ptr<Stream>         stream_;
    std::shared_ptr<spdlog::logger> logger_;
    std::string                     peer_;
    SessionState                    state_{SessionState::Closed};
};

} // namespace vault::network
