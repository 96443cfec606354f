#include "common/client_config.hpp"

#include "network/frame_codec.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace vault {

namespace {

// ── Helpers ───────────────────────────────────────────────────────────────────

// Parse an unsigned integer from string_view.
// Returns the value or throws std::runtime_error on failure.
template <typename T>
[[nodiscard]] T parse_uint(std::string_view sv, std::string_view field_name) {
    T value{};
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
        throw std::runtime_error(
            fmt::format("Invalid integer for {}: '{}'", field_name, sv));
    }
    return value;
}

// Validate that a port number is in [1, 65535].
void validate_port(uint16_t port, std::string_view field_name) {
    if (port == 0) {
        throw std::runtime_error(
            fmt::format("Port for {} must be in [1, 65535], got 0", field_name));
    }
}

[[nodiscard]] Transport parse_transport(const std::string& s) {
    if (s == "binary") return Transport::Binary;
    if (s == "http")   return Transport::Http;
    throw std::runtime_error(
        fmt::format("--transport must be 'binary' or 'http', got '{}'", s));
}

} // anonymous namespace

std::string_view to_string(Transport t) noexcept {
    switch (t) {
        case Transport::Binary: return "binary";
        case Transport::Http:   return "http";
    }
    return "unknown";
}

// ── validate ──────────────────────────────────────────────────────────────────

void validate(const ClientConfig& cfg) {
    if (cfg.host.empty()) {
        throw std::runtime_error("--host must not be empty");
    }
    validate_port(cfg.port,      "--port");
    validate_port(cfg.http_port, "--http-port");

    if (cfg.timeout.count() <= 0) {
        throw std::runtime_error(
            fmt::format("--timeout-ms must be > 0, got {}", cfg.timeout.count()));
    }
    if (cfg.batch_concurrency == 0) {
        throw std::runtime_error("--concurrency must be > 0");
    }
    if (cfg.api_key && cfg.api_key->size() > network::wire::kMaxKeyBytes) {
        throw std::runtime_error(
            fmt::format("--api-key is {} bytes, limit is {}",
                        cfg.api_key->size(), network::wire::kMaxKeyBytes));
    }
}

// ── parse_address ─────────────────────────────────────────────────────────────

network::Endpoint parse_address(std::string_view address) {
    const auto colon = address.rfind(':');
    if (colon == std::string_view::npos) {
        throw std::runtime_error(
            fmt::format("Malformed address (expected host:port): '{}'", address));
    }

    network::Endpoint ep;
    ep.host = std::string(address.substr(0, colon));
    if (ep.host.empty()) {
        throw std::runtime_error(
            fmt::format("Address host must not be empty: '{}'", address));
    }
    ep.port = parse_uint<uint16_t>(address.substr(colon + 1), "address port");
    validate_port(ep.port, "address");
    return ep;
}

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("host",
            po::value<std::string>()->default_value("127.0.0.1"),
            "Server host")
        ("port,p",
            po::value<uint16_t>()->default_value(3000),
            "Binary protocol port")
        ("http-port",
            po::value<uint16_t>()->default_value(8080),
            "HTTP transport port")
        ("address,a",
            po::value<std::string>(),
            "Server address host:port (overrides --host/--port)")
        ("transport,t",
            po::value<std::string>()->default_value("binary"),
            "Transport: binary (default) or http")
        ("api-key,k",
            po::value<std::string>()->default_value(""),
            "API key sent as AUTH (binary) or X-API-Key (http)")
        ("timeout-ms",
            po::value<int64_t>()->default_value(5000),
            "Connect/read/write deadline in milliseconds")
        ("concurrency",
            po::value<std::size_t>()->default_value(kDefaultBatchConcurrency),
            "Maximum concurrent calls for batch commands")
        ("log-level,l",
            po::value<std::string>()->default_value("warn"),
            "Log level: trace|debug|info|warn|error|critical");
}

// ── config_from_variables ─────────────────────────────────────────────────────

ClientConfig config_from_variables(const po::variables_map& vm) {
    ClientConfig cfg;
    cfg.host              = vm["host"].as<std::string>();
    cfg.port              = vm["port"].as<uint16_t>();
    cfg.http_port         = vm["http-port"].as<uint16_t>();
    cfg.transport         = parse_transport(vm["transport"].as<std::string>());
    cfg.timeout           = std::chrono::milliseconds{vm["timeout-ms"].as<int64_t>()};
    cfg.batch_concurrency = vm["concurrency"].as<std::size_t>();
    cfg.log_level         = vm["log-level"].as<std::string>();

    if (vm.count("address")) {
        auto ep  = parse_address(vm["address"].as<std::string>());
        cfg.host = std::move(ep.host);
        if (cfg.transport == Transport::Http) {
            cfg.http_port = ep.port;
        } else {
            cfg.port = ep.port;
        }
    }

    auto key = vm["api-key"].as<std::string>();
    if (!key.empty()) {
        cfg.api_key = std::move(key);
    }

    validate(cfg);
    return cfg;
}

// ── parse_cli_options ─────────────────────────────────────────────────────────

CliOptions parse_cli_options(int argc, char* argv[]) {
    po::options_description desc("vault-cli options");
    add_options(desc);

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::vector<std::string>>(), "Command words");

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("command", -1);

    po::variables_map vm;
    try {
        po::store(
            po::command_line_parser(argc, argv)
                .options(all)
                .positional(positional)
                .run(),
            vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << "Usage: vault-cli [options] [GET k | SET k v | DEL k | EXISTS k | "
                   "MGET k... | HEALTH]\n\n"
                << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    CliOptions opts;
    opts.client = config_from_variables(vm);
    if (vm.count("command")) {
        opts.command = vm["command"].as<std::vector<std::string>>();
    }

    // SET takes the rest of the line as its value: `set k hello world`.
    auto& words = opts.command;
    if (words.size() > 3) {
        std::string cmd = words[0];
        std::transform(cmd.begin(), cmd.end(), cmd.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (cmd == "SET") {
            for (std::size_t i = 3; i < words.size(); ++i) {
                words[2] += ' ';
                words[2] += words[i];
            }
            words.resize(3);
        }
    }
    return opts;
}

} // namespace vault
