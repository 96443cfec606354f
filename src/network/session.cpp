#include "network/session.hpp"

#include "common/error.hpp"
#include "common/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <array>
#include <stdexcept>
#include <utility>

namespace vault::network {

std::string_view to_string(SessionState s) noexcept {
    switch (s) {
        case SessionState::Closed:        return "Closed";
        case SessionState::Connecting:    return "Connecting";
        case SessionState::Connected:     return "Connected";
        case SessionState::Authenticated: return "Authenticated";
        case SessionState::Operating:     return "Operating";
    }
    return "Unknown";
}

// ── Constructor / destructor ──────────────────────────────────────────────────

Session::Session(const Endpoint& endpoint,
                 std::chrono::milliseconds timeout,
                 const Connector& connector,
                 std::shared_ptr<spdlog::logger> logger)
    : logger_(logger_or_default(std::move(logger))),
      peer_(fmt::format("{}:{}", endpoint.host, endpoint.port))
{
    set_state(SessionState::Connecting);

    stream_ = connector(endpoint, timeout);
    if (!stream_) {
        set_state(SessionState::Closed);
        throw ClientError(ErrorKind::ConnectFailed,
            fmt::format("no stream returned for {}", peer_));
    }

    set_state(SessionState::Connected);
}

Session::~Session() {
    close();
}

// ── State helper ──────────────────────────────────────────────────────────────

void Session::set_state(SessionState s) noexcept {
    if (state_ == s) return;
    state_ = s;
    logger_->trace("Session [{}] state → {}", peer_, to_string(s));
}

// ── authenticate ──────────────────────────────────────────────────────────────

void Session::authenticate(const std::optional<std::string>& credential) {
    if (!credential || credential->empty()) {
        return;
    }
    if (state_ != SessionState::Connected) {
        throw std::logic_error(fmt::format(
            "Session [{}]: authenticate() in state {}", peer_, to_string(state_)));
    }

    const auto request = encode_request(OpCode::Auth, *credential);

    try {
        [[maybe_unused]] auto body = exchange(request);
    } catch (const ClientError& e) {
        if (e.kind() == ErrorKind::ServerError) {
            throw ClientError(ErrorKind::AuthFailed,
                fmt::format("credential rejected by {} with status {}",
                            peer_, format_status(static_cast<uint8_t>(e.status()))),
                e.status());
        }
        throw;
    }

    set_state(SessionState::Authenticated);
    logger_->debug("Session [{}] authenticated", peer_);
}

// ── round_trip ────────────────────────────────────────────────────────────────

Bytes Session::round_trip(std::span<const uint8_t> request) {
    if (state_ != SessionState::Connected && state_ != SessionState::Authenticated) {
        throw std::logic_error(fmt::format(
            "Session [{}]: round_trip() in state {}; sessions are single-use",
            peer_, to_string(state_)));
    }

    set_state(SessionState::Operating);
    return exchange(request);
}

// ── close ─────────────────────────────────────────────────────────────────────

void Session::close() noexcept {
    if (!stream_) {
        return;
    }
    stream_->close();
    stream_.reset();
    set_state(SessionState::Closed);
}

// ── Internals ─────────────────────────────────────────────────────────────────

Bytes Session::exchange(std::span<const uint8_t> request) {
    try {
        stream_->write_all(request);

        const auto header = read_header();
        logger_->trace("Session [{}] header status={} body_length={}",
                       peer_, format_status(header.status), header.body_length);

        return decode_response_body(header, [this](std::span<uint8_t> buf) {
            return stream_->read_some(buf);
        });
    } catch (const ClientError& e) {
        logger_->debug("Session [{}] exchange failed: {}", peer_, e.what());
        close();
        throw;
    }
}

ResponseHeader Session::read_header() {
    std::array<uint8_t, wire::kHeaderSize> header{};
    std::size_t filled = 0;

    while (filled < header.size()) {
        const std::size_t n = stream_->read_some(
            std::span<uint8_t>(header.data() + filled, header.size() - filled));
        if (n == 0) {
            break;
        }
        filled += n;
    }

    return decode_response_header(std::span<const uint8_t>(header.data(), filled));
}

} // namespace vault::network
