#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <span>
#include <string>

namespace vault::client {

// Server health snapshot returned by the HEALTH operation (binary) and
// GET /health (HTTP).  Both transports carry the same JSON object.
struct Health {
    std::string status;
    int64_t     uptime_seconds  = 0;
    int64_t     cache_items     = 0;
    int64_t     cache_size_mb   = 0;
    int64_t     storage_size_mb = 0;
    int64_t     server_threads  = 0;   // "goroutines" on the wire
    int64_t     memory_mb       = 0;

    [[nodiscard]] bool healthy() const noexcept { return status == "healthy"; }

    bool operator==(const Health&) const = default;
};

// `status` is required; numeric fields default to 0 when absent.
// Throws nlohmann::json::exception on a non-object body, a missing status,
// or a wrong field type.
void from_json(const nlohmann::json& j, Health& h);
void to_json(nlohmann::json& j, const Health& h);

// Decode a UTF-8 JSON body into a Health record.
// Throws ClientError(DecodeFailed) on malformed JSON or a bad shape.
[[nodiscard]] Health parse_health(std::span<const uint8_t> body);

} // namespace vault::client
