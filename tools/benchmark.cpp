// Throughput benchmark against a running store.
//
// Runs N SET+GET cycles through the configured transport (one connection per
// call, as the clients do), then one get_many over the same keys to show the
// effect of the batch worker pool.
//
// Prints: total ops, elapsed time, ops/sec, and latency percentiles (p50,
// p90, p99, p999).

#include "client/batch.hpp"
#include "client/binary_client.hpp"
#include "client/http_client.hpp"
#include "common/client_config.hpp"
#include "common/logger.hpp"

#include <boost/program_options.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <memory>
#include <numeric>
#include <sstream>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

using clock = std::chrono::steady_clock;
using ns    = std::chrono::nanoseconds;

// ── Stats helpers ────────────────────────────────────────────────────────────

struct BenchResult {
    std::size_t total_ops{};
    std::size_t failed_ops{};
    double elapsed_sec{};
    double ops_per_sec{};
    double p50_us{};
    double p90_us{};
    double p99_us{};
    double p999_us{};
    double avg_us{};
};

BenchResult compute_stats(std::vector<int64_t>& latencies_ns) {
    BenchResult r;
    r.total_ops = latencies_ns.size();

    if (latencies_ns.empty()) return r;

    std::sort(latencies_ns.begin(), latencies_ns.end());

    auto total_ns = std::accumulate(latencies_ns.begin(), latencies_ns.end(), int64_t{0});
    r.elapsed_sec = static_cast<double>(total_ns) / 1e9;
    r.ops_per_sec = static_cast<double>(r.total_ops) / r.elapsed_sec;
    r.avg_us      = static_cast<double>(total_ns) / static_cast<double>(r.total_ops) / 1000.0;

    auto percentile = [&](double p) -> double {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(latencies_ns.size() - 1));
        return static_cast<double>(latencies_ns[idx]) / 1000.0; // ns → µs
    };

    r.p50_us  = percentile(0.50);
    r.p90_us  = percentile(0.90);
    r.p99_us  = percentile(0.99);
    r.p999_us = percentile(0.999);

    return r;
}

void print_result(const char* label, const BenchResult& r) {
    fprintf(stdout,
        "\n── %s ──\n"
        "  Total ops:    %zu (%zu failed)\n"
        "  Elapsed:      %.3f s\n"
        "  Throughput:   %.0f ops/sec\n"
        "  Avg latency:  %.1f µs\n"
        "  p50:          %.1f µs\n"
        "  p90:          %.1f µs\n"
        "  p99:          %.1f µs\n"
        "  p99.9:        %.1f µs\n",
        label, r.total_ops, r.failed_ops, r.elapsed_sec, r.ops_per_sec,
        r.avg_us, r.p50_us, r.p90_us, r.p99_us, r.p999_us);
}

// ── Benchmark runners ────────────────────────────────────────────────────────

BenchResult bench_sequential(vault::client::KvClient& client,
                             std::size_t num_cycles,
                             const vault::client::Bytes& value) {
    std::vector<int64_t> latencies;
    latencies.reserve(num_cycles * 2); // SET + GET per cycle
    std::size_t failed = 0;

    for (std::size_t i = 0; i < num_cycles; ++i) {
        const std::string key = "bench:" + std::to_string(i);

        // SET
        {
            auto t0 = clock::now();
            const bool ok = client.set(key, value);
            auto t1 = clock::now();
            latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
            if (!ok) ++failed;
        }

        // GET
        {
            auto t0 = clock::now();
            const bool found = client.get(key).has_value();
            auto t1 = clock::now();
            latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
            if (!found) ++failed;
        }
    }

    auto r = compute_stats(latencies);
    r.failed_ops = failed;
    return r;
}

BenchResult bench_batch(vault::client::KvClient& client,
                        std::size_t num_cycles,
                        std::size_t concurrency) {
    std::vector<std::string> keys;
    keys.reserve(num_cycles);
    for (std::size_t i = 0; i < num_cycles; ++i) {
        keys.push_back("bench:" + std::to_string(i));
    }

    auto t0 = clock::now();
    const auto found = vault::client::get_many(client, keys, concurrency);
    auto t1 = clock::now();

    BenchResult r;
    r.total_ops   = keys.size();
    r.failed_ops  = keys.size() - found.size();
    r.elapsed_sec = std::chrono::duration<double>(t1 - t0).count();
    r.ops_per_sec = r.elapsed_sec > 0 ? static_cast<double>(r.total_ops) / r.elapsed_sec : 0.0;
    r.avg_us      = r.total_ops > 0 ? r.elapsed_sec * 1e6 / static_cast<double>(r.total_ops) : 0.0;
    return r;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    po::options_description desc("vault-bench options");
    vault::add_options(desc);
    desc.add_options()
        ("cycles,n",   po::value<std::size_t>()->default_value(10'000), "SET+GET cycles")
        ("value-size", po::value<std::size_t>()->default_value(64),     "Value size in bytes");

    po::variables_map vm;
    vault::ClientConfig cfg;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            fprintf(stdout, "%s\n", oss.str().c_str());
            return 0;
        }
        po::notify(vm);
        cfg = vault::config_from_variables(vm);
    } catch (const std::exception& e) {
        fprintf(stderr, "Argument error: %s\n", e.what());
        return 1;
    }

    vault::init_default_logger(vault::parse_log_level(cfg.log_level));

    const auto num_cycles = std::max<std::size_t>(1, vm["cycles"].as<std::size_t>());
    const vault::client::Bytes value(vm["value-size"].as<std::size_t>(), 'x');

    const auto endpoint = cfg.transport == vault::Transport::Http
        ? cfg.http_endpoint() : cfg.binary_endpoint();

    fprintf(stdout,
        "Vault Client Benchmark\n"
        "======================\n"
        "Cycles:    %zu (each cycle = 1 SET + 1 GET = 2 ops)\n"
        "Value:     %zu bytes\n"
        "Server:    %s:%u (%s)\n",
        num_cycles, value.size(), endpoint.host.c_str(), endpoint.port,
        std::string(vault::to_string(cfg.transport)).c_str());

    try {
        std::unique_ptr<vault::client::KvClient> client;
        if (cfg.transport == vault::Transport::Http) {
            client = std::make_unique<vault::client::HttpClient>(cfg);
        } else {
            client = std::make_unique<vault::client::BinaryClient>(cfg);
        }

        auto sequential = bench_sequential(*client, num_cycles, value);
        auto batch      = bench_batch(*client, num_cycles, cfg.batch_concurrency);

        print_result("Sequential SET+GET", sequential);
        print_result("Batch get_many", batch);
        fprintf(stdout, "\n");

        return sequential.failed_ops == 0 ? 0 : 2;
    } catch (const std::exception& ex) {
        spdlog::error("vault-bench: {}", ex.what());
        return 1;
    }
}
