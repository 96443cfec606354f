#include "network/tcp_stream.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"

#include "support/mock_vault_server.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <span>
#include <string>

using namespace std::chrono_literals;
using namespace vault;
using namespace vault::network;
using vault::test::MockVaultServer;
using vault::test::ServerBehavior;

// ── Helpers ───────────────────────────────────────────────────────────────────

static std::shared_ptr<spdlog::logger> quiet_logger() {
    return make_client_logger("tcp-stream-test", spdlog::level::off);
}

// Read until `n` bytes arrived or the stream reports end.
static Bytes read_n(Stream& s, std::size_t n) {
    Bytes out(n);
    std::size_t filled = 0;
    while (filled < n) {
        const auto got = s.read_some(std::span<uint8_t>(out.data() + filled, n - filled));
        if (got == 0) break;
        filled += got;
    }
    out.resize(filled);
    return out;
}

// ── Connect ───────────────────────────────────────────────────────────────────

TEST(TcpStream, RefusedConnectionIsConnectFailed) {
    uint16_t port = 0;
    {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::acceptor a(ioc);
        a.open(boost::asio::ip::tcp::v4());
        a.bind({boost::asio::ip::make_address("127.0.0.1"), 0});
        port = a.local_endpoint().port();
    }

    try {
        [[maybe_unused]] auto s = TcpStream::connect({"127.0.0.1", port}, 1000ms, quiet_logger());
        FAIL() << "expected ConnectFailed";
    } catch (const ClientError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConnectFailed);
    }
}

// ── I/O ───────────────────────────────────────────────────────────────────────

TEST(TcpStream, WriteThenReadReply) {
    MockVaultServer server;
    server.put("k", Bytes{'v', 'v'});

    auto s = TcpStream::connect({"127.0.0.1", server.port()}, 2000ms, quiet_logger());
    s->write_all(encode_request(OpCode::Get, "k"));

    EXPECT_EQ(read_n(*s, 7), (Bytes{0x00, 0x02, 0x00, 0x00, 0x00, 'v', 'v'}));
}

TEST(TcpStream, ReadTimeoutReturnsZero) {
    MockVaultServer server;
    server.set_behavior(ServerBehavior::Stall);

    auto s = TcpStream::connect({"127.0.0.1", server.port()}, 150ms, quiet_logger());
    s->write_all(encode_request(OpCode::Get, "k"));

    std::array<uint8_t, 5> buf{};
    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_EQ(s->read_some(buf), 0u);
    const auto elapsed = std::chrono::steady_clock::now() - t0;

    EXPECT_GE(elapsed, 100ms);
    EXPECT_LT(elapsed, 2s);

    // The timed-out socket is closed; later reads report end immediately.
    EXPECT_EQ(s->read_some(buf), 0u);
}

TEST(TcpStream, PeerCloseReturnsZero) {
    MockVaultServer server;
    server.set_behavior(ServerBehavior::TruncatedHeader);

    auto s = TcpStream::connect({"127.0.0.1", server.port()}, 2000ms, quiet_logger());
    s->write_all(encode_request(OpCode::Get, "k"));

    EXPECT_EQ(read_n(*s, 5).size(), 3u);
}

TEST(TcpStream, CloseIsIdempotent) {
    MockVaultServer server;
    auto s = TcpStream::connect({"127.0.0.1", server.port()}, 2000ms, quiet_logger());
    s->close();
    s->close();

    std::array<uint8_t, 1> buf{};
    EXPECT_EQ(s->read_some(buf), 0u);
    EXPECT_TRUE(server.wait_for_finished(1, 2s));
}

TEST(TcpStream, WriteAfterCloseIsWriteFailed) {
    MockVaultServer server;
    auto s = TcpStream::connect({"127.0.0.1", server.port()}, 2000ms, quiet_logger());
    s->close();

    try {
        s->write_all(encode_request(OpCode::Get, "k"));
        FAIL() << "expected WriteFailed";
    } catch (const ClientError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::WriteFailed);
    }
}
