#pragma once

#include "client/kv_client.hpp"
#include "common/client_config.hpp"
#include "network/frame_codec.hpp"
#include "network/stream.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <span>
#include <string_view>

namespace vault::client {

// ── BinaryClient ──────────────────────────────────────────────────────────────
//
// KvClient over the length-prefixed binary protocol.
//
// Every call opens its own network::Session, authenticates when an api_key is
// configured, performs one request/response exchange, and closes the
// connection before returning.  Nothing is pooled or retried.
//
// Wire convention kept as-is: a SUCCESS reply with an empty body to GET means
// the key is missing, so a stored empty value also reads back as absent.
//
// Requests are encoded before any connection is opened; an oversized key or
// value throws ClientError(FrameTooLarge) to the caller instead of being
// reported as a failed call.

class BinaryClient final : public KvClient {
public:
    // Fixed key sent with HEALTH requests.
    static constexpr std::string_view kHealthKey = "health";

    // `connector` defaults to network::TcpStream.
    // Throws std::runtime_error if `config` does not validate.
    explicit BinaryClient(ClientConfig config,
                          std::shared_ptr<spdlog::logger> logger = {},
                          network::Connector connector = {});

    [[nodiscard]] std::optional<Bytes> get(std::string_view key) override;
    [[nodiscard]] bool set(std::string_view key, std::span<const uint8_t> value) override;
    [[nodiscard]] bool del(std::string_view key) override;
    [[nodiscard]] std::optional<Health> health() override;

    [[nodiscard]] const ClientConfig& config() const noexcept { return config_; }

private:
    // Open a session, authenticate, send `request`, return the body.
    // Transport and protocol failures propagate as ClientError.
    Bytes execute(std::span<const uint8_t> request);

    ClientConfig       config_;
    network::Endpoint  endpoint_;
    network::Connector connector_;
};

} // namespace vault::client
