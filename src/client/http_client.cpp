#include "client/http_client.hpp"

#include "common/error.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/vector_body.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/fmt/fmt.h>

#include <exception>
#include <string>
#include <utility>

namespace vault::client {

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp = asio::ip::tcp;

namespace {
    constexpr auto use_awaitable = asio::as_tuple(asio::use_awaitable);

    constexpr const char* kUserAgent   = "vault-client";
    constexpr const char* kApiKeyField = "X-API-Key";

    bool is_success(unsigned status) noexcept {
        return status >= 200 && status < 300;
    }

    std::string method_name(http::verb method) {
        const auto sv = http::to_string(method);
        return std::string(sv.data(), sv.size());
    }
} // anonymous namespace

HttpClient::HttpClient(ClientConfig config, std::shared_ptr<spdlog::logger> logger)
    : KvClient(std::move(logger)),
      config_(std::move(config))
{
    validate(config_);
}

std::string HttpClient::encode_path_segment(std::string_view key) {
    static constexpr char kHex[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(key.size());
    for (const char c : key) {
        const auto b = static_cast<unsigned char>(c);
        const bool unreserved =
            (b >= 'A' && b <= 'Z') || (b >= 'a' && b <= 'z') || (b >= '0' && b <= '9') ||
            b == '-' || b == '_' || b == '.' || b == '~' || b == ':';
        if (unreserved) {
            out.push_back(c);
        } else {
            out.push_back('%');
            out.push_back(kHex[b >> 4]);
            out.push_back(kHex[b & 0x0F]);
        }
    }
    return out;
}

// ── Operations ────────────────────────────────────────────────────────────────

std::optional<Bytes> HttpClient::get(std::string_view key) {
    try {
        auto reply = perform(http::verb::get, "/" + encode_path_segment(key), {}, false);
        if (reply.status == static_cast<unsigned>(http::status::not_found)) {
            logger_->debug("HttpClient GET {}: not found", key);
            return std::nullopt;
        }
        if (!is_success(reply.status)) {
            throw ClientError(ErrorKind::HttpStatus,
                fmt::format("GET returned {}", reply.status), reply.status);
        }
        logger_->debug("HttpClient GET {}: {} bytes", key, reply.body.size());
        return std::move(reply.body);
    } catch (const ClientError& e) {
        logger_->warn("HttpClient GET {} failed: {}", key, e.what());
        return std::nullopt;
    }
}

bool HttpClient::set(std::string_view key, std::span<const uint8_t> value) {
    try {
        auto reply = perform(http::verb::put, "/" + encode_path_segment(key), value, true);
        if (!is_success(reply.status)) {
            throw ClientError(ErrorKind::HttpStatus,
                fmt::format("PUT returned {}: {}", reply.status,
                            std::string(reply.body.begin(), reply.body.end())),
                reply.status);
        }
        logger_->debug("HttpClient SET {}: {} bytes", key, value.size());
        return true;
    } catch (const ClientError& e) {
        logger_->warn("HttpClient SET {} failed: {}", key, e.what());
        return false;
    }
}

bool HttpClient::del(std::string_view key) {
    try {
        auto reply = perform(http::verb::delete_, "/" + encode_path_segment(key), {}, true);
        if (!is_success(reply.status)) {
            throw ClientError(ErrorKind::HttpStatus,
                fmt::format("DELETE returned {}", reply.status), reply.status);
        }
        logger_->debug("HttpClient DELETE {}", key);
        return true;
    } catch (const ClientError& e) {
        logger_->warn("HttpClient DELETE {} failed: {}", key, e.what());
        return false;
    }
}

std::optional<Health> HttpClient::health() {
    try {
        auto reply = perform(http::verb::get, "/health", {}, false);
        if (!is_success(reply.status)) {
            throw ClientError(ErrorKind::HttpStatus,
                fmt::format("GET /health returned {}", reply.status), reply.status);
        }
        return parse_health(reply.body);
    } catch (const ClientError& e) {
        logger_->warn("HttpClient HEALTH failed: {}", e.what());
        return std::nullopt;
    }
}

// ── perform ───────────────────────────────────────────────────────────────────

HttpClient::Reply HttpClient::perform(http::verb method,
                                      const std::string& target,
                                      std::span<const uint8_t> body,
                                      bool send_api_key)
{
    const auto endpoint = config_.http_endpoint();

    http::request<http::vector_body<uint8_t>> req{method, target, 11};
    req.set(http::field::host, endpoint.host);
    req.set(http::field::user_agent, kUserAgent);
    req.set(http::field::connection, "close");
    if (send_api_key && config_.api_key && !config_.api_key->empty()) {
        req.set(kApiKeyField, *config_.api_key);
    }
    if (method == http::verb::put) {
        req.set(http::field::content_type, "application/octet-stream");
        req.body().assign(body.begin(), body.end());
    }
    req.prepare_payload();

    asio::io_context ioc{1};
    Reply reply;
    boost::system::error_code failure;
    ErrorKind failure_kind = ErrorKind::ConnectFailed;
    std::exception_ptr unexpected;

    asio::co_spawn(
        ioc,
        [&]() -> asio::awaitable<void> {
            tcp::resolver resolver(ioc);
            beast::tcp_stream stream(ioc);

            auto [rec, results] = co_await resolver.async_resolve(
                endpoint.host, std::to_string(endpoint.port), use_awaitable);
            if (rec) {
                failure = rec;
                co_return;
            }

            stream.expires_after(config_.timeout);
            auto [cec, ep] = co_await stream.async_connect(results, use_awaitable);
            if (cec) {
                failure = cec;
                co_return;
            }

            stream.expires_after(config_.timeout);
            auto [wec, wn] = co_await http::async_write(stream, req, use_awaitable);
            if (wec) {
                failure      = wec;
                failure_kind = ErrorKind::WriteFailed;
                co_return;
            }

            stream.expires_after(config_.timeout);
            beast::flat_buffer buffer;
            http::response<http::vector_body<uint8_t>> res;
            auto [hec, rn] = co_await http::async_read(stream, buffer, res, use_awaitable);
            if (hec) {
                failure      = hec;
                failure_kind = ErrorKind::ConnectionClosed;
                co_return;
            }

            reply.status = res.result_int();
            reply.body   = std::move(res.body());

            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        },
        [&unexpected](std::exception_ptr e) { unexpected = e; });

    ioc.run();

    if (unexpected) {
        std::rethrow_exception(unexpected);
    }
    if (failure) {
        throw ClientError(failure_kind,
            fmt::format("{} {}:{}{}: {}", method_name(method),
                        endpoint.host, endpoint.port, target, failure.message()));
    }

    logger_->trace("HttpClient {} {} → {}", method_name(method),
                   target, reply.status);
    return reply;
}

} // namespace vault::client
