#pragma once

#include "network/stream.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>

namespace vault {

// Upper bound on concurrent calls issued by the batch helpers.
inline constexpr std::size_t kDefaultBatchConcurrency = 10;

// ── Transport ─────────────────────────────────────────────────────────────────

enum class Transport : uint8_t {
    Binary = 0,
    Http   = 1,
};

[[nodiscard]] std::string_view to_string(Transport t) noexcept;

// ── ClientConfig ──────────────────────────────────────────────────────────────
// Everything a client needs to reach the store.  Populated from CLI arguments
// by config_from_variables(), or filled in directly by library callers.

struct ClientConfig {
    std::string                host              = "127.0.0.1";
    uint16_t                   port              = 3000;   // binary protocol port
    uint16_t                   http_port         = 8080;   // HTTP transport port
    Transport                  transport         = Transport::Binary;
    std::optional<std::string> api_key;                    // AUTH credential / X-API-Key
    std::chrono::milliseconds  timeout{5000};              // connect, write and read deadline
    std::size_t                batch_concurrency = kDefaultBatchConcurrency;
    std::string                log_level         = "warn"; // spdlog level string

    [[nodiscard]] network::Endpoint binary_endpoint() const { return {host, port}; }
    [[nodiscard]] network::Endpoint http_endpoint() const { return {host, http_port}; }
};

// ── CliOptions ────────────────────────────────────────────────────────────────
// ClientConfig plus the positional command words given to vault-cli
// (e.g. "get", "user:1").  For SET, words after the key are joined with
// spaces into the value.  Empty command means interactive mode.

struct CliOptions {
    ClientConfig             client;
    std::vector<std::string> command;
};

// ── validate ──────────────────────────────────────────────────────────────────
// Throws std::runtime_error if:
//   - host is empty
//   - port or http_port is 0
//   - timeout is not positive
//   - batch_concurrency is 0
//   - api_key is longer than 65535 bytes (it travels as a frame key)

void validate(const ClientConfig& cfg);

// ── parse_address ─────────────────────────────────────────────────────────────
// Split "host:port" into an Endpoint.  The last ':' separates the port, so
// "::1:3000" is not supported; use --host/--port for IPv6 literals.
// Throws std::runtime_error on a missing host or an invalid port.

[[nodiscard]] network::Endpoint parse_address(std::string_view address);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with client options.
// Shared by vault-cli and vault-bench.

void add_options(boost::program_options::options_description& desc);

// Build and validate a ClientConfig from parsed variables.
// An empty --api-key is treated as no credential.
[[nodiscard]] ClientConfig config_from_variables(
    const boost::program_options::variables_map& vm);

// ── parse_cli_options ─────────────────────────────────────────────────────────
// Parse vault-cli arguments.
//
// On success: returns validated options.
// On error  : throws std::runtime_error with a human-readable message.
// On --help : throws std::runtime_error carrying the help text.

[[nodiscard]] CliOptions parse_cli_options(int argc, char* argv[]);

} // namespace vault
