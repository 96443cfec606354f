#include "network/session.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"

#include "support/fake_stream.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using namespace vault;
using namespace vault::network;
using vault::test::FakeStreamLog;
using vault::test::fake_connector;

// ── Helpers ───────────────────────────────────────────────────────────────────

static const Endpoint kEndpoint{"127.0.0.1", 3000};

static Bytes concat(const Bytes& a, const Bytes& b) {
    Bytes out = a;
    out.insert(out.end(), b.begin(), b.end());
    return out;
}

static Bytes text(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

class SessionTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeStreamLog> log_ = std::make_shared<FakeStreamLog>();
    std::shared_ptr<spdlog::logger> logger_ =
        make_client_logger("session-test", spdlog::level::off);

    std::unique_ptr<Session> open(Bytes script, std::size_t chunk = 4096, bool fail_writes = false) {
        return std::make_unique<Session>(
            kEndpoint, 100ms, fake_connector(std::move(script), log_, chunk, fail_writes), logger_);
    }
};

// ── Lifecycle ─────────────────────────────────────────────────────────────────

TEST_F(SessionTest, NewSessionIsConnected) {
    auto s = open({});
    EXPECT_EQ(s->state(), SessionState::Connected);
    EXPECT_TRUE(s->is_open());
}

TEST_F(SessionTest, NullStreamIsConnectFailed) {
    Connector none = [](const Endpoint&, std::chrono::milliseconds) {
        return std::unique_ptr<Stream>{};
    };
    try {
        Session s(kEndpoint, 100ms, none, logger_);
        FAIL() << "expected ClientError";
    } catch (const ClientError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConnectFailed);
    }
}

TEST_F(SessionTest, ConnectorErrorPropagates) {
    Connector refuse = [](const Endpoint&, std::chrono::milliseconds) -> std::unique_ptr<Stream> {
        throw ClientError(ErrorKind::ConnectFailed, "refused");
    };
    EXPECT_THROW(Session(kEndpoint, 100ms, refuse, logger_), ClientError);
}

TEST_F(SessionTest, CloseIsIdempotent) {
    auto s = open({});
    s->close();
    s->close();
    s.reset();
    EXPECT_EQ(log_->close_calls, 1u);
}

// ── round_trip ────────────────────────────────────────────────────────────────

TEST_F(SessionTest, RoundTripReturnsBody) {
    auto s = open(concat(Bytes{0x00, 0x05, 0x00, 0x00, 0x00}, text("hello")));
    const auto request = encode_request(OpCode::Get, "foo");

    EXPECT_EQ(s->round_trip(request), text("hello"));
    EXPECT_EQ(log_->written, request);
    EXPECT_EQ(s->state(), SessionState::Operating);

    s.reset();
    EXPECT_EQ(log_->close_calls, 1u);
}

TEST_F(SessionTest, RoundTripAcrossOneByteReads) {
    auto s = open(concat(Bytes{0x00, 0x03, 0x00, 0x00, 0x00}, text("abc")), 1);
    EXPECT_EQ(s->round_trip(encode_request(OpCode::Get, "k")), text("abc"));
    EXPECT_GE(log_->reads, 8u);
}

TEST_F(SessionTest, ErrorStatusClosesOnce) {
    auto s = open(Bytes{0xFF, 0x00, 0x00, 0x00, 0x00});
    try {
        [[maybe_unused]] auto body = s->round_trip(encode_request(OpCode::Get, "missing"));
        FAIL() << "expected ServerError";
    } catch (const ClientError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ServerError);
        EXPECT_EQ(e.status(), 0xFFu);
    }
    EXPECT_FALSE(s->is_open());
    EXPECT_EQ(s->state(), SessionState::Closed);

    s.reset();
    EXPECT_EQ(log_->close_calls, 1u);
}

TEST_F(SessionTest, ShortHeaderIsIncompleteHeader) {
    auto s = open(Bytes{0x00, 0x05, 0x00});
    try {
        [[maybe_unused]] auto body = s->round_trip(encode_request(OpCode::Get, "k"));
        FAIL() << "expected IncompleteHeader";
    } catch (const ClientError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IncompleteHeader);
    }
    s.reset();
    EXPECT_EQ(log_->close_calls, 1u);
}

TEST_F(SessionTest, ShortBodyIsConnectionClosed) {
    auto s = open(concat(Bytes{0x00, 0x0A, 0x00, 0x00, 0x00}, text("ab")));
    try {
        [[maybe_unused]] auto body = s->round_trip(encode_request(OpCode::Get, "k"));
        FAIL() << "expected ConnectionClosed";
    } catch (const ClientError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConnectionClosed);
    }
    s.reset();
    EXPECT_EQ(log_->close_calls, 1u);
}

TEST_F(SessionTest, WriteFailureClosesOnce) {
    auto s = open({}, 4096, /*fail_writes=*/true);
    try {
        [[maybe_unused]] auto body = s->round_trip(encode_request(OpCode::Get, "k"));
        FAIL() << "expected WriteFailed";
    } catch (const ClientError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::WriteFailed);
    }
    EXPECT_EQ(log_->reads, 0u);
    s.reset();
    EXPECT_EQ(log_->close_calls, 1u);
}

TEST_F(SessionTest, SecondRoundTripIsLogicError) {
    auto s = open(Bytes{0x00, 0x00, 0x00, 0x00, 0x00});
    [[maybe_unused]] auto body = s->round_trip(encode_request(OpCode::Delete, "k"));
    EXPECT_THROW([[maybe_unused]] auto again = s->round_trip(encode_request(OpCode::Delete, "k")),
                 std::logic_error);
}

// ── authenticate ──────────────────────────────────────────────────────────────

TEST_F(SessionTest, NoCredentialSendsNothing) {
    auto s = open({});
    s->authenticate(std::nullopt);
    EXPECT_TRUE(log_->written.empty());
    EXPECT_EQ(s->state(), SessionState::Connected);
}

TEST_F(SessionTest, EmptyCredentialSendsNothing) {
    auto s = open(Bytes{0xFF, 0x00, 0x00, 0x00, 0x00});
    s->authenticate(std::string{});
    EXPECT_TRUE(log_->written.empty());
    EXPECT_EQ(log_->reads, 0u);
    EXPECT_EQ(s->state(), SessionState::Connected);
}

TEST_F(SessionTest, AcceptedCredentialThenOperation) {
    auto s = open(concat(Bytes{0x00, 0x00, 0x00, 0x00, 0x00},
                         concat(Bytes{0x00, 0x01, 0x00, 0x00, 0x00}, text("v"))));
    s->authenticate(std::string("tok"));
    EXPECT_EQ(s->state(), SessionState::Authenticated);

    EXPECT_EQ(s->round_trip(encode_request(OpCode::Get, "k")), text("v"));
    EXPECT_EQ(log_->written,
              concat(encode_request(OpCode::Auth, "tok"), encode_request(OpCode::Get, "k")));
}

TEST_F(SessionTest, RejectedCredentialIsAuthFailedAndNoOperationSent) {
    auto s = open(Bytes{0xFF, 0x00, 0x00, 0x00, 0x00});

    try {
        s->authenticate(std::string("tok"));
        FAIL() << "expected AuthFailed";
    } catch (const ClientError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::AuthFailed);
        EXPECT_EQ(e.status(), 0xFFu);
    }

    // Only the AUTH frame went out.
    EXPECT_EQ(log_->written, (Bytes{0x06, 0x03, 0x00, 0x74, 0x6F, 0x6B}));
    EXPECT_FALSE(s->is_open());
    EXPECT_THROW([[maybe_unused]] auto body = s->round_trip(encode_request(OpCode::Get, "k")),
                 std::logic_error);

    s.reset();
    EXPECT_EQ(log_->close_calls, 1u);
}

TEST_F(SessionTest, AuthenticateAfterRoundTripIsLogicError) {
    auto s = open(Bytes{0x00, 0x00, 0x00, 0x00, 0x00});
    [[maybe_unused]] auto body = s->round_trip(encode_request(OpCode::Delete, "k"));
    EXPECT_THROW(s->authenticate(std::string("tok")), std::logic_error);
}

TEST(SessionStateNames, AllStatesNamed) {
    EXPECT_EQ(to_string(SessionState::Closed),        "Closed");
    EXPECT_EQ(to_string(SessionState::Connecting),    "Connecting");
    EXPECT_EQ(to_string(SessionState::Connected),     "Connected");
    EXPECT_EQ(to_string(SessionState::Authenticated), "Authenticated");
    EXPECT_EQ(to_string(SessionState::Operating),     "Operating");
}
