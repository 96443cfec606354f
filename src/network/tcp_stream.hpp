#pragma once

#include "network/stream.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <memory>
#include <string>

namespace vault::network {

// ── TcpStream ─────────────────────────────────────────────────────────────────
//
// Blocking TCP stream with a deadline on every operation.
//
// Each TcpStream owns a private single-threaded io_context.  Every connect,
// write and read is spawned as a coroutine and the context is run for at most
// `timeout`; if the operation is still pending the socket is closed, the
// aborted operation is drained, and the call reports failure.  Nothing is
// shared between instances, so separate streams may be used from separate
// threads without locking.

class TcpStream final : public Stream {
public:
    // Resolve and connect.  Throws ClientError(ConnectFailed) on resolve
    // failure, refusal, or timeout.
    [[nodiscard]] static std::unique_ptr<TcpStream> connect(
        const Endpoint& endpoint,
        std::chrono::milliseconds timeout,
        std::shared_ptr<spdlog::logger> logger);

    // Connector bound to `logger`, for use as a Session's default connector.
    [[nodiscard]] static Connector connector(std::shared_ptr<spdlog::logger> logger);

    TcpStream(const TcpStream&)            = delete;
    TcpStream& operator=(const TcpStream&) = delete;
    TcpStream(TcpStream&&)                 = delete;
    TcpStream& operator=(TcpStream&&)      = delete;

    ~TcpStream() override;

    void write_all(std::span<const uint8_t> data) override;
    [[nodiscard]] std::size_t read_some(std::span<uint8_t> buffer) override;
    void close() noexcept override;

private:
    TcpStream(std::chrono::milliseconds timeout, std::shared_ptr<spdlog::logger> logger);

    // Spawn `op` and run the io_context until it completes or the deadline
    // passes.  Returns false on timeout, in which case the socket is closed.
    template <typename Op>
    bool run_with_deadline(Op&& op);

    boost::asio::io_context        ioc_{1};
    boost::asio::ip::tcp::socket   socket_;
    boost::asio::ip::tcp::resolver resolver_;
    std::chrono::milliseconds      timeout_;
    std::shared_ptr<spdlog::logger> logger_;
    std::string                    peer_;   // "host:port", for log lines
};

} // namespace vault::network
