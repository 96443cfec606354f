#include "network/frame_codec.hpp"

#include "common/error.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace vault::network {

// ── Little-endian helpers ─────────────────────────────────────────────────────

namespace {

void write_u8(Bytes& buf, uint8_t v) {
    buf.push_back(v);
}

void write_u16_le(Bytes& buf, uint16_t v) {
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void write_u32_le(Bytes& buf, uint32_t v) {
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

void write_bytes(Bytes& buf, const void* data, std::size_t len) {
    const auto* p = static_cast<const uint8_t*>(data);
    buf.insert(buf.end(), p, p + len);
}

bool read_u16_le(const uint8_t*& ptr, const uint8_t* end, uint16_t& out) {
    if (end - ptr < 2) return false;
    out = static_cast<uint16_t>(
         static_cast<uint16_t>(ptr[0]) |
        (static_cast<uint16_t>(ptr[1]) << 8));
    ptr += 2;
    return true;
}

bool read_u32_le(const uint8_t*& ptr, const uint8_t* end, uint32_t& out) {
    if (end - ptr < 4) return false;
    out =  static_cast<uint32_t>(ptr[0]) |
          (static_cast<uint32_t>(ptr[1]) << 8) |
          (static_cast<uint32_t>(ptr[2]) << 16) |
          (static_cast<uint32_t>(ptr[3]) << 24);
    ptr += 4;
    return true;
}

} // anonymous namespace

std::string_view to_string(OpCode op) noexcept {
    switch (op) {
        case OpCode::Get:    return "GET";
        case OpCode::Set:    return "SET";
        case OpCode::Delete: return "DELETE";
        case OpCode::Health: return "HEALTH";
        case OpCode::Auth:   return "AUTH";
    }
    return "UNKNOWN";
}

std::string format_status(uint8_t status) {
    return fmt::format("0x{:02x}", status);
}

// ── encode_request ────────────────────────────────────────────────────────────

Bytes encode_request(OpCode op,
                     std::string_view key,
                     std::optional<std::span<const uint8_t>> value)
{
    const bool is_set = op == OpCode::Set;
    if (is_set && !value) {
        throw std::invalid_argument("SET request requires a value");
    }
    if (!is_set && value) {
        throw std::invalid_argument(
            fmt::format("{} request must not carry a value", to_string(op)));
    }

    if (key.size() > wire::kMaxKeyBytes) {
        throw ClientError(ErrorKind::FrameTooLarge,
            fmt::format("key is {} bytes, limit is {}", key.size(), wire::kMaxKeyBytes));
    }
    if (is_set && value->size() > wire::kMaxValueBytes) {
        throw ClientError(ErrorKind::FrameTooLarge,
            fmt::format("value is {} bytes, limit is {}", value->size(), wire::kMaxValueBytes));
    }

    Bytes buf;
    buf.reserve(wire::kRequestPrefixSize + key.size() +
                (is_set ? wire::kValuePrefixSize + value->size() : 0));

    write_u8(buf, static_cast<uint8_t>(op));
    write_u16_le(buf, static_cast<uint16_t>(key.size()));
    write_bytes(buf, key.data(), key.size());

    if (is_set) {
        write_u32_le(buf, static_cast<uint32_t>(value->size()));
        write_u8(buf, wire::kFlagUncompressed);
        write_bytes(buf, value->data(), value->size());
    }

    return buf;
}

// ── decode_request ────────────────────────────────────────────────────────────

std::variant<Request, DecodeError> decode_request(std::span<const uint8_t> frame) {
    const uint8_t* ptr = frame.data();
    const uint8_t* end = frame.data() + frame.size();

    if (ptr == end) {
        return DecodeError{"request: empty frame"};
    }
    const uint8_t raw_op = *ptr++;
    if (!is_known_op(raw_op)) {
        return DecodeError{"request: unknown op " + format_status(raw_op)};
    }
    const auto op = static_cast<OpCode>(raw_op);

    uint16_t key_len = 0;
    if (!read_u16_le(ptr, end, key_len)) {
        return DecodeError{"request: truncated key_len"};
    }
    if (end - ptr < key_len) {
        return DecodeError{"request: truncated key"};
    }
    Request req{op, std::string(reinterpret_cast<const char*>(ptr), key_len), std::nullopt};
    ptr += key_len;

    if (op == OpCode::Set) {
        uint32_t value_len = 0;
        if (!read_u32_le(ptr, end, value_len)) {
            return DecodeError{"request: truncated value_len"};
        }
        if (ptr == end) {
            return DecodeError{"request: truncated flags"};
        }
        const uint8_t flags = *ptr++;
        if (flags != wire::kFlagUncompressed) {
            return DecodeError{"request: unsupported value flags " + format_status(flags)};
        }
        if (static_cast<uint64_t>(end - ptr) < value_len) {
            return DecodeError{"request: truncated value"};
        }
        req.value = Bytes(ptr, ptr + value_len);
        ptr += value_len;
    }

    if (ptr != end) {
        return DecodeError{fmt::format("request: {} trailing bytes", end - ptr)};
    }
    return req;
}

// ── encode_response ───────────────────────────────────────────────────────────

Bytes encode_response(uint8_t status, std::span<const uint8_t> body) {
    Bytes buf;
    buf.reserve(wire::kHeaderSize + body.size());

    write_u8(buf, status);
    write_u32_le(buf, static_cast<uint32_t>(body.size()));
    write_bytes(buf, body.data(), body.size());

    return buf;
}

// ── decode_response_header ────────────────────────────────────────────────────

ResponseHeader decode_response_header(std::span<const uint8_t> data) {
    if (data.size() < wire::kHeaderSize) {
        throw ClientError(ErrorKind::IncompleteHeader,
            fmt::format("got {} of {} header bytes", data.size(), wire::kHeaderSize));
    }

    ResponseHeader header;
    header.status = data[0];
    const uint8_t* ptr = data.data() + 1;
    read_u32_le(ptr, data.data() + data.size(), header.body_length);
    return header;
}

// ── decode_response_body ──────────────────────────────────────────────────────

Bytes decode_response_body(const ResponseHeader& header,
                           const ChunkReader& reader,
                           std::size_t chunk_size)
{
    if (!header.ok()) {
        throw ClientError(ErrorKind::ServerError,
            "server returned status " + format_status(header.status),
            header.status);
    }

    chunk_size = std::max<std::size_t>(chunk_size, 1);

    // The declared length is untrusted; memory grows with the bytes received.
    const std::size_t total = header.body_length;
    Bytes body;
    body.reserve(std::min(total, chunk_size));

    Bytes chunk(std::min(total, chunk_size));
    while (body.size() < total) {
        const std::size_t want = std::min(chunk.size(), total - body.size());
        const std::size_t got  = reader(std::span<uint8_t>(chunk.data(), want));
        if (got == 0) {
            throw ClientError(ErrorKind::ConnectionClosed,
                fmt::format("stream ended after {} of {} body bytes", body.size(), total));
        }
        body.insert(body.end(), chunk.begin(), chunk.begin() + std::min(got, want));
    }
    return body;
}

} // namespace vault::network
