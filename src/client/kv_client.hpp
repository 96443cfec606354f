#pragma once

#include "client/health.hpp"
#include "network/frame_codec.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <span>
#include <string_view>

namespace vault::client {

using network::Bytes;

// Copy the bytes of `s` into a value buffer.
[[nodiscard]] Bytes to_bytes(std::string_view s);

// ── KvClient ──────────────────────────────────────────────────────────────────
//
// Transport-agnostic operation surface.  Implementations never throw for
// transport or protocol failures: they log a diagnostic through the client
// logger and return an absent value or false.  A miss and a failure therefore
// look the same to the caller; the log line is the only way to tell them
// apart.
//
// Implementations keep no per-call mutable state, so one client may serve
// concurrent calls from several threads (the batch helpers rely on this).

class KvClient {
public:
    virtual ~KvClient() = default;

    KvClient(const KvClient&)            = delete;
    KvClient& operator=(const KvClient&) = delete;

    [[nodiscard]] virtual std::optional<Bytes> get(std::string_view key) = 0;
    [[nodiscard]] virtual bool set(std::string_view key, std::span<const uint8_t> value) = 0;
    [[nodiscard]] virtual bool del(std::string_view key) = 0;
    [[nodiscard]] virtual std::optional<Health> health() = 0;

    // True when get(key) returns a value.  No dedicated wire operation.
    [[nodiscard]] bool exists(std::string_view key);

    // get() followed by a UTF-8 JSON parse.  Absent on a miss, a failure, or
    // a body that is not valid JSON.
    [[nodiscard]] std::optional<nlohmann::json> get_json(std::string_view key);

    // Serialize `value` and set() it.  False if serialization fails (e.g. a
    // string holding invalid UTF-8) or the set fails.
    [[nodiscard]] bool set_json(std::string_view key, const nlohmann::json& value);

    [[nodiscard]] const std::shared_ptr<spdlog::logger>& logger() const noexcept {
        return logger_;
    }

protected:
    explicit KvClient(std::shared_ptr<spdlog::logger> logger);

    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace vault::client
