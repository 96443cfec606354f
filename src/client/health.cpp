#include "client/health.hpp"

#include "common/error.hpp"

#include <string>

namespace vault::client {

void from_json(const nlohmann::json& j, Health& h) {
    // at() rejects non-object bodies as well as a missing status.
    j.at("status").get_to(h.status);
    h.uptime_seconds  = j.value("uptime_seconds",  int64_t{0});
    h.cache_items     = j.value("cache_items",     int64_t{0});
    h.cache_size_mb   = j.value("cache_size_mb",   int64_t{0});
    h.storage_size_mb = j.value("storage_size_mb", int64_t{0});
    h.server_threads  = j.value("goroutines",      int64_t{0});
    h.memory_mb       = j.value("memory_mb",       int64_t{0});
}

void to_json(nlohmann::json& j, const Health& h) {
    j = nlohmann::json{
        {"status",          h.status},
        {"uptime_seconds",  h.uptime_seconds},
        {"cache_items",     h.cache_items},
        {"cache_size_mb",   h.cache_size_mb},
        {"storage_size_mb", h.storage_size_mb},
        {"goroutines",      h.server_threads},
        {"memory_mb",       h.memory_mb},
    };
}

Health parse_health(std::span<const uint8_t> body) {
    try {
        return nlohmann::json::parse(body.begin(), body.end()).get<Health>();
    } catch (const nlohmann::json::exception& e) {
        throw ClientError(ErrorKind::DecodeFailed,
                          std::string("health body: ") + e.what());
    }
}

} // namespace vault::client
