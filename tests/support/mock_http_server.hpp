#pragma once

#include "network/frame_codec.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace vault::test {

struct HttpExchange {
    std::string                method;
    std::string                target;    // as received, still percent-encoded
    std::optional<std::string> api_key;   // X-API-Key, when present
    std::string                content_type;
};

// ── MockHttpServer ────────────────────────────────────────────────────────────
//
// Loopback HTTP/1.1 server with the store's REST surface:
//
//   GET /health  → 200 JSON
//   GET /<key>   → 200 value | 404
//   PUT /<key>   → 204 | 401 without the right X-API-Key
//   DELETE /<key>→ 204 | 401 without the right X-API-Key
//
// One request per connection.  `force_status` replaces every reply with an
// empty response of that status.

class MockHttpServer {
public:
    explicit MockHttpServer(std::optional<std::string> write_key = std::nullopt);
    ~MockHttpServer();

    MockHttpServer(const MockHttpServer&)            = delete;
    MockHttpServer& operator=(const MockHttpServer&) = delete;

    [[nodiscard]] uint16_t port() const noexcept { return port_; }

    void force_status(unsigned status) noexcept { forced_.store(status); }
    void set_health_body(std::string body);

    void put(const std::string& key, const network::Bytes& value);
    [[nodiscard]] std::optional<network::Bytes> value_of(const std::string& key) const;

    [[nodiscard]] std::vector<HttpExchange> exchanges() const;

private:
    boost::asio::awaitable<void> accept_loop();
    boost::asio::awaitable<void> serve(boost::asio::ip::tcp::socket socket);

    boost::asio::io_context        ioc_{1};
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t                       port_ = 0;

    std::optional<std::string> write_key_;
    std::atomic<unsigned>      forced_{0};

    mutable std::mutex                    mu_;
    std::map<std::string, network::Bytes> data_;
    std::vector<HttpExchange>             exchanges_;
    std::string                           health_body_;

    std::thread thread_;
};

} // namespace vault::test
