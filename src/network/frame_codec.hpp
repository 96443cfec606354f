#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace vault::network {

using Bytes = std::vector<uint8_t>;

// ── Wire constants ────────────────────────────────────────────────────────────

enum class OpCode : uint8_t {
    Get    = 0x01,
    Set    = 0x02,
    Delete = 0x03,
    Health = 0x05,
    Auth   = 0x06,
};

namespace wire {

// Response status values.  Any non-zero status is a failure.
inline constexpr uint8_t kStatusSuccess = 0x00;
inline constexpr uint8_t kStatusError   = 0xFF;

// Value flags byte (SET only).  This client never compresses.
inline constexpr uint8_t kFlagUncompressed = 0x00;

// Response header: status (1 byte) + body_length (4 bytes LE).
inline constexpr std::size_t kHeaderSize = 5;

// Request prefix: op (1 byte) + key_length (2 bytes LE).
inline constexpr std::size_t kRequestPrefixSize = 3;

// SET value prefix: value_length (4 bytes LE) + flags (1 byte).
inline constexpr std::size_t kValuePrefixSize = 5;

inline constexpr std::size_t kMaxKeyBytes   = 0xFFFF;
inline constexpr uint64_t    kMaxValueBytes = 0xFFFFFFFFull;

// Upper bound of a single body read.
inline constexpr std::size_t kReadChunkSize = 8 * 1024;

} // namespace wire

[[nodiscard]] std::string_view to_string(OpCode op) noexcept;

// Returns true for a byte that names one of the known operations.
[[nodiscard]] constexpr bool is_known_op(uint8_t b) noexcept {
    return b == 0x01 || b == 0x02 || b == 0x03 || b == 0x05 || b == 0x06;
}

// Formats a status byte as "0xff".
[[nodiscard]] std::string format_status(uint8_t status);

// ── Frame types ───────────────────────────────────────────────────────────────

struct Request {
    OpCode               op;
    std::string          key;
    std::optional<Bytes> value;   // present iff op == Set
};

struct DecodeError {
    std::string message;
};

struct ResponseHeader {
    uint8_t  status      = wire::kStatusError;
    uint32_t body_length = 0;

    [[nodiscard]] bool ok() const noexcept { return status == wire::kStatusSuccess; }
};

// Fills `buffer` with up to buffer.size() bytes and returns the count.
// Zero means the source is exhausted (EOF, timeout, or reset).
using ChunkReader = std::function<std::size_t(std::span<uint8_t>)>;

// ── Requests ──────────────────────────────────────────────────────────────────

// Encode one request frame:
//   [op:u8][key_len:u16 LE][key]            (GET, DELETE, HEALTH, AUTH)
//   ... + [value_len:u32 LE][flags:u8][value]  (SET)
//
// Throws std::invalid_argument if `value` is present for an op other than SET
// or missing for SET.  Throws ClientError(FrameTooLarge) if the key exceeds
// 65535 bytes or the value exceeds 2^32-1 bytes.
[[nodiscard]] Bytes encode_request(
    OpCode op,
    std::string_view key,
    std::optional<std::span<const uint8_t>> value = std::nullopt);

// Parse a complete request frame.  Rejects unknown op codes, truncated
// fields, non-zero flags, and trailing bytes.
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::variant<Request, DecodeError> decode_request(std::span<const uint8_t> frame);

// ── Responses ─────────────────────────────────────────────────────────────────

// Encode one response frame: [status:u8][body_len:u32 LE][body].
[[nodiscard]] Bytes encode_response(uint8_t status, std::span<const uint8_t> body = {});

// Decode the 5-byte response header.
// Throws ClientError(IncompleteHeader) if `data` holds fewer than 5 bytes.
[[nodiscard]] ResponseHeader decode_response_header(std::span<const uint8_t> data);

// Read the response body announced by `header`.
//
// A non-SUCCESS header throws ClientError(ServerError) carrying the status
// and never calls `reader`.  Otherwise exactly header.body_length bytes are
// pulled through `reader` in chunks of at most `chunk_size`; a zero-byte read
// before the body is complete throws ClientError(ConnectionClosed).
[[nodiscard]] Bytes decode_response_body(
    const ResponseHeader& header,
    const ChunkReader& reader,
    std::size_t chunk_size = wire::kReadChunkSize);

} // namespace vault::network
