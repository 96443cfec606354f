#include "client/batch.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>

namespace vault::client {

namespace {

[[nodiscard]] std::size_t pool_size(std::size_t jobs, std::size_t concurrency) noexcept {
    return std::max<std::size_t>(1, std::min(jobs, concurrency));
}

} // anonymous namespace

std::map<std::string, Bytes> get_many(KvClient& client,
                                      const std::vector<std::string>& keys,
                                      std::size_t concurrency)
{
    std::map<std::string, Bytes> results;
    if (keys.empty()) {
        return results;
    }

    std::mutex results_mutex;
    boost::asio::thread_pool pool(pool_size(keys.size(), concurrency));

    for (const auto& key : keys) {
        boost::asio::post(pool, [&client, &key, &results, &results_mutex] {
            try {
                auto value = client.get(key);
                if (!value) return;
                std::lock_guard lock(results_mutex);
                results.insert_or_assign(key, std::move(*value));
            } catch (const std::exception& e) {
                // Caller error such as an oversized key.
                client.logger()->warn("get_many {}: {}", key, e.what());
            }
        });
    }

    pool.join();
    client.logger()->debug("get_many: {} of {} keys found", results.size(), keys.size());
    return results;
}

bool set_many(KvClient& client,
              const std::map<std::string, Bytes>& entries,
              std::size_t concurrency)
{
    if (entries.empty()) {
        return true;
    }

    std::atomic<std::size_t> failures{0};
    boost::asio::thread_pool pool(pool_size(entries.size(), concurrency));

    for (const auto& entry : entries) {
        boost::asio::post(pool, [&client, &entry, &failures] {
            try {
                if (!client.set(entry.first, entry.second)) {
                    failures.fetch_add(1, std::memory_order_relaxed);
                }
            } catch (const std::exception& e) {
                client.logger()->warn("set_many {}: {}", entry.first, e.what());
                failures.fetch_add(1, std::memory_order_relaxed);
            }
        });
    }

    pool.join();

    const auto failed = failures.load(std::memory_order_relaxed);
    if (failed > 0) {
        client.logger()->warn("set_many: {} of {} entries failed", failed, entries.size());
    }
    return failed == 0;
}

} // namespace vault::client
