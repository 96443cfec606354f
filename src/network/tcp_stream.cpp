#include "network/tcp_stream.hpp"

#include "common/error.hpp"
#include "common/logger.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/fmt/fmt.h>

#include <exception>
#include <string>
#include <utility>

namespace vault::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {
    constexpr auto use_awaitable = asio::as_tuple(asio::use_awaitable);
} // anonymous namespace

// ── Deadline runner ───────────────────────────────────────────────────────────

template <typename Op>
bool TcpStream::run_with_deadline(Op&& op) {
    bool done = false;
    std::exception_ptr failure;

    asio::co_spawn(
        ioc_,
        std::forward<Op>(op),
        [&done, &failure](std::exception_ptr e) {
            done    = true;
            failure = e;
        });

    ioc_.restart();
    ioc_.run_for(timeout_);

    if (!done) {
        // Deadline passed.  Abort whatever is pending and drain the aborted
        // handlers so nothing refers to this frame afterwards.
        boost::system::error_code ec;
        resolver_.cancel();
        socket_.close(ec);
        ioc_.restart();
        ioc_.run();
        return false;
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
    return true;
}

// ── Construction ──────────────────────────────────────────────────────────────

TcpStream::TcpStream(std::chrono::milliseconds timeout,
                     std::shared_ptr<spdlog::logger> logger)
    : socket_(ioc_),
      resolver_(ioc_),
      timeout_(timeout),
      logger_(std::move(logger)) {}

TcpStream::~TcpStream() {
    close();
}

std::unique_ptr<TcpStream> TcpStream::connect(
    const Endpoint& endpoint,
    std::chrono::milliseconds timeout,
    std::shared_ptr<spdlog::logger> logger)
{
    std::unique_ptr<TcpStream> stream(
        new TcpStream(timeout, logger_or_default(std::move(logger))));
    stream->peer_ = fmt::format("{}:{}", endpoint.host, endpoint.port);

    TcpStream& self = *stream;
    boost::system::error_code ec;

    const bool finished = self.run_with_deadline(
        [&]() -> asio::awaitable<void> {
            auto [rec, endpoints] = co_await self.resolver_.async_resolve(
                endpoint.host, std::to_string(endpoint.port), use_awaitable);
            if (rec) {
                ec = rec;
                co_return;
            }

            auto [cec, ep] = co_await asio::async_connect(
                self.socket_, endpoints, use_awaitable);
            ec = cec;
        });

    if (!finished) {
        throw ClientError(ErrorKind::ConnectFailed,
            fmt::format("connect to {} timed out after {}ms", self.peer_, timeout.count()));
    }
    if (ec) {
        throw ClientError(ErrorKind::ConnectFailed,
            fmt::format("connect to {} failed: {}", self.peer_, ec.message()));
    }

    // Requests are small and answered immediately; do not batch them.
    self.socket_.set_option(tcp::no_delay(true), ec);

    self.logger_->debug("TcpStream connected to {}", self.peer_);
    return stream;
}

Connector TcpStream::connector(std::shared_ptr<spdlog::logger> logger) {
    return [logger = std::move(logger)](const Endpoint& endpoint,
                                        std::chrono::milliseconds timeout)
               -> std::unique_ptr<Stream> {
        return TcpStream::connect(endpoint, timeout, logger);
    };
}

// ── I/O ───────────────────────────────────────────────────────────────────────

void TcpStream::write_all(std::span<const uint8_t> data) {
    boost::system::error_code ec;
    std::size_t written = 0;

    const bool finished = run_with_deadline(
        [&]() -> asio::awaitable<void> {
            auto [wec, n] = co_await asio::async_write(
                socket_, asio::buffer(data.data(), data.size()), use_awaitable);
            ec      = wec;
            written = n;
        });

    if (!finished) {
        throw ClientError(ErrorKind::WriteFailed,
            fmt::format("write to {} timed out after {}ms", peer_, timeout_.count()));
    }
    if (ec) {
        throw ClientError(ErrorKind::WriteFailed,
            fmt::format("write to {} failed: {}", peer_, ec.message()));
    }
    if (written != data.size()) {
        throw ClientError(ErrorKind::WriteFailed,
            fmt::format("short write to {}: {} of {} bytes", peer_, written, data.size()));
    }

    logger_->trace("TcpStream {} sent {} bytes", peer_, written);
}

std::size_t TcpStream::read_some(std::span<uint8_t> buffer) {
    if (buffer.empty() || !socket_.is_open()) {
        return 0;
    }

    boost::system::error_code ec;
    std::size_t received = 0;

    const bool finished = run_with_deadline(
        [&]() -> asio::awaitable<void> {
            auto [rec, n] = co_await socket_.async_read_some(
                asio::buffer(buffer.data(), buffer.size()), use_awaitable);
            ec       = rec;
            received = n;
        });

    if (!finished) {
        logger_->debug("TcpStream {} read timed out after {}ms", peer_, timeout_.count());
        return 0;
    }
    if (ec) {
        if (ec != asio::error::eof) {
            logger_->debug("TcpStream {} read error: {}", peer_, ec.message());
        }
        return 0;
    }

    logger_->trace("TcpStream {} received {} bytes", peer_, received);
    return received;
}

void TcpStream::close() noexcept {
    if (!socket_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    logger_->trace("TcpStream {} closed", peer_);
}

} // namespace vault::network
