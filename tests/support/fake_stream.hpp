#pragma once

#include "common/error.hpp"
#include "network/stream.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace vault::test {

// Shared view of what a FakeStream saw, kept alive after the Session that
// owned the stream has destroyed it.
struct FakeStreamLog {
    std::vector<uint8_t> written;
    std::size_t          close_calls = 0;
    std::size_t          reads       = 0;
};

// ── FakeStream ────────────────────────────────────────────────────────────────
// In-memory Stream: serves a scripted input in chunks of at most
// `chunk_size`, then reports end of stream.  Writes are appended to the log.

class FakeStream final : public network::Stream {
public:
    FakeStream(std::vector<uint8_t> input,
               std::shared_ptr<FakeStreamLog> log,
               std::size_t chunk_size = 4096,
               bool fail_writes = false)
        : input_(std::move(input)),
          log_(std::move(log)),
          chunk_size_(std::max<std::size_t>(chunk_size, 1)),
          fail_writes_(fail_writes) {}

    void write_all(std::span<const uint8_t> data) override {
        if (fail_writes_) {
            throw ClientError(ErrorKind::WriteFailed, "scripted write failure");
        }
        log_->written.insert(log_->written.end(), data.begin(), data.end());
    }

    std::size_t read_some(std::span<uint8_t> buffer) override {
        ++log_->reads;
        const std::size_t n = std::min({buffer.size(), chunk_size_, input_.size() - pos_});
        std::copy_n(input_.begin() + static_cast<std::ptrdiff_t>(pos_), n, buffer.begin());
        pos_ += n;
        return n;
    }

    void close() noexcept override {
        ++log_->close_calls;
    }

private:
    std::vector<uint8_t>           input_;
    std::size_t                    pos_ = 0;
    std::shared_ptr<FakeStreamLog> log_;
    std::size_t                    chunk_size_;
    bool                           fail_writes_;
};

// Connector that hands out one FakeStream per connection, all sharing `log`
// and replaying the same `input`.
inline network::Connector fake_connector(std::vector<uint8_t> input,
                                         std::shared_ptr<FakeStreamLog> log,
                                         std::size_t chunk_size = 4096,
                                         bool fail_writes = false) {
    return [input = std::move(input), log = std::move(log), chunk_size, fail_writes](
               const network::Endpoint&, std::chrono::milliseconds) -> std::unique_ptr<network::Stream> {
        return std::make_unique<FakeStream>(input, log, chunk_size, fail_writes);
    };
}

} // namespace vault::test
