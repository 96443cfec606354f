#pragma once

#include "client/kv_client.hpp"
#include "common/client_config.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace vault::client {

// ── Batch helpers ─────────────────────────────────────────────────────────────
//
// Fan single-key calls out over a worker pool of
// min(batch size, concurrency) threads.  Every key is attempted; a failing
// key never aborts the rest.  Completion order is unspecified.

// Fetch every key.  Only keys that returned a value appear in the result.
[[nodiscard]] std::map<std::string, Bytes> get_many(
    KvClient& client,
    const std::vector<std::string>& keys,
    std::size_t concurrency = kDefaultBatchConcurrency);

// Store every entry.  True iff every set() succeeded.
[[nodiscard]] bool set_many(
    KvClient& client,
    const std::map<std::string, Bytes>& entries,
    std::size_t concurrency = kDefaultBatchConcurrency);

} // namespace vault::client
