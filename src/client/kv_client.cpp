#include "client/kv_client.hpp"

#include "common/logger.hpp"

#include <string>
#include <utility>

namespace vault::client {

Bytes to_bytes(std::string_view s) {
    return Bytes(s.begin(), s.end());
}

KvClient::KvClient(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger_or_default(std::move(logger))) {}

bool KvClient::exists(std::string_view key) {
    return get(key).has_value();
}

std::optional<nlohmann::json> KvClient::get_json(std::string_view key) {
    auto data = get(key);
    if (!data) {
        return std::nullopt;
    }

    try {
        return nlohmann::json::parse(data->begin(), data->end());
    } catch (const nlohmann::json::parse_error& e) {
        logger_->warn("get_json {}: DecodeFailed: {}", key, e.what());
        return std::nullopt;
    }
}

bool KvClient::set_json(std::string_view key, const nlohmann::json& value) {
    std::string text;
    try {
        text = value.dump();
    } catch (const nlohmann::json::type_error& e) {
        logger_->warn("set_json {}: DecodeFailed: {}", key, e.what());
        return false;
    }
    return set(key, to_bytes(text));
}

} // namespace vault::client
