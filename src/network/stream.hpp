#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>

namespace vault::network {

struct Endpoint {
    std::string host;
    uint16_t    port = 0;
};

// ── Stream ────────────────────────────────────────────────────────────────────
//
// One open byte stream.  A Session owns exactly one Stream and closes it
// exactly once.  Implementations apply their I/O deadline internally.

class Stream {
public:
    virtual ~Stream() = default;

    // Write every byte of `data`.
    // Throws ClientError(WriteFailed) on error, timeout, or a short write.
    virtual void write_all(std::span<const uint8_t> data) = 0;

    // Read up to buffer.size() bytes.  Returns 0 when the stream is finished:
    // orderly EOF, read timeout, or a reset connection.
    [[nodiscard]] virtual std::size_t read_some(std::span<uint8_t> buffer) = 0;

    // Release the underlying connection.  Must be safe to call more than once.
    virtual void close() noexcept = 0;
};

// Opens a Stream to `endpoint` with `timeout` applied to connect and to every
// later read and write.  Throws ClientError(ConnectFailed) on failure.
using Connector = std::function<std::unique_ptr<Stream>(
    const Endpoint& endpoint, std::chrono::milliseconds timeout)>;

} // namespace vault::network
