#pragma once

#include "client/kv_client.hpp"
#include "common/client_config.hpp"

#include <boost/beast/http/verb.hpp>

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace vault::client {

// ── HttpClient ────────────────────────────────────────────────────────────────
//
// KvClient over the store's HTTP interface:
//
//   GET    /<key>    200 → value, 404 → absent
//   PUT    /<key>    2xx → true     (X-API-Key when configured)
//   DELETE /<key>    2xx → true     (X-API-Key when configured)
//   GET    /health   200 → Health JSON
//
// Each call uses a fresh connection ("Connection: close") and the configured
// timeout on connect, write and read.  Unlike the binary protocol, HTTP has a
// distinct miss status, so an empty 200 body is returned as an empty value.

class HttpClient final : public KvClient {
public:
    // Throws std::runtime_error if `config` does not validate.
    explicit HttpClient(ClientConfig config,
                        std::shared_ptr<spdlog::logger> logger = {});

    [[nodiscard]] std::optional<Bytes> get(std::string_view key) override;
    [[nodiscard]] bool set(std::string_view key, std::span<const uint8_t> value) override;
    [[nodiscard]] bool del(std::string_view key) override;
    [[nodiscard]] std::optional<Health> health() override;

    [[nodiscard]] const ClientConfig& config() const noexcept { return config_; }

    // Percent-encode `key` as a single path segment ("/a b" → "%2Fa%20b").
    [[nodiscard]] static std::string encode_path_segment(std::string_view key);

private:
    struct Reply {
        unsigned status = 0;
        Bytes    body;
    };

    // Perform one request.  Throws ClientError(ConnectFailed | WriteFailed |
    // ConnectionClosed) on transport failure; any HTTP status is returned.
    Reply perform(boost::beast::http::verb method,
                  const std::string& target,
                  std::span<const uint8_t> body,
                  bool send_api_key);

    ClientConfig config_;
};

} // namespace vault::client
