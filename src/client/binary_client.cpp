#include "client/binary_client.hpp"

#include "common/error.hpp"
#include "network/session.hpp"
#include "network/tcp_stream.hpp"

#include <utility>

namespace vault::client {

using network::OpCode;

BinaryClient::BinaryClient(ClientConfig config,
                           std::shared_ptr<spdlog::logger> logger,
                           network::Connector connector)
    : KvClient(std::move(logger)),
      config_(std::move(config)),
      endpoint_(config_.binary_endpoint()),
      connector_(std::move(connector))
{
    validate(config_);
    if (!connector_) {
        connector_ = network::TcpStream::connector(logger_);
    }
}

// ── Operations ────────────────────────────────────────────────────────────────

std::optional<Bytes> BinaryClient::get(std::string_view key) {
    const auto request = network::encode_request(OpCode::Get, key);

    try {
        auto body = execute(request);
        if (body.empty()) {
            logger_->debug("BinaryClient GET {}: not found", key);
            return std::nullopt;
        }
        logger_->debug("BinaryClient GET {}: {} bytes", key, body.size());
        return body;
    } catch (const ClientError& e) {
        logger_->warn("BinaryClient GET {} failed: {}", key, e.what());
        return std::nullopt;
    }
}

bool BinaryClient::set(std::string_view key, std::span<const uint8_t> value) {
    const auto request = network::encode_request(OpCode::Set, key, value);

    try {
        [[maybe_unused]] auto body = execute(request);
        logger_->debug("BinaryClient SET {}: {} bytes", key, value.size());
        return true;
    } catch (const ClientError& e) {
        logger_->warn("BinaryClient SET {} failed: {}", key, e.what());
        return false;
    }
}

bool BinaryClient::del(std::string_view key) {
    const auto request = network::encode_request(OpCode::Delete, key);

    try {
        [[maybe_unused]] auto body = execute(request);
        logger_->debug("BinaryClient DELETE {}", key);
        return true;
    } catch (const ClientError& e) {
        logger_->warn("BinaryClient DELETE {} failed: {}", key, e.what());
        return false;
    }
}

std::optional<Health> BinaryClient::health() {
    const auto request = network::encode_request(OpCode::Health, kHealthKey);

    try {
        return parse_health(execute(request));
    } catch (const ClientError& e) {
        logger_->warn("BinaryClient HEALTH failed: {}", e.what());
        return std::nullopt;
    }
}

// ── execute ───────────────────────────────────────────────────────────────────

Bytes BinaryClient::execute(std::span<const uint8_t> request) {
    network::Session session(endpoint_, config_.timeout, connector_, logger_);
    session.authenticate(config_.api_key);
    return session.round_trip(request);
}

} // namespace vault::client
