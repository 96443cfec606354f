#include "client/batch.hpp"
#include "client/binary_client.hpp"
#include "client/http_client.hpp"
#include "client/kv_client.hpp"
#include "common/client_config.hpp"
#include "common/logger.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

using vault::client::Bytes;
using vault::client::KvClient;

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// Split a REPL line into words.  SET keeps everything after the key as the
// value so values may contain spaces.
std::vector<std::string> split_line(const std::string& line) {
    std::vector<std::string> words;
    std::istringstream iss(line);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
        if (words.size() == 2 && upper(words[0]) == "SET") {
            std::string rest;
            std::getline(iss, rest);
            const auto start = rest.find_first_not_of(' ');
            if (start != std::string::npos) {
                words.push_back(rest.substr(start));
            }
            break;
        }
    }
    return words;
}

std::string as_text(const Bytes& value) {
    return std::string(value.begin(), value.end());
}

// Execute one command and print its result.  Returns false if the command
// was malformed or the operation failed.
bool run_command(KvClient& client, std::size_t concurrency,
                 const std::vector<std::string>& words) {
    if (words.empty()) {
        return true;
    }

    const auto cmd = upper(words[0]);

    if (cmd == "GET" && words.size() == 2) {
        auto value = client.get(words[1]);
        if (!value) {
            fprintf(stdout, "NOT_FOUND\n");
            return false;
        }
        fprintf(stdout, "VALUE %s\n", as_text(*value).c_str());
        return true;
    }

    if (cmd == "SET" && words.size() == 3) {
        const bool ok = client.set(words[1], vault::client::to_bytes(words[2]));
        fprintf(stdout, "%s\n", ok ? "OK" : "ERROR set failed");
        return ok;
    }

    if (cmd == "DEL" && words.size() == 2) {
        const bool ok = client.del(words[1]);
        fprintf(stdout, "%s\n", ok ? "DELETED" : "ERROR delete failed");
        return ok;
    }

    if (cmd == "EXISTS" && words.size() == 2) {
        fprintf(stdout, "%d\n", client.exists(words[1]) ? 1 : 0);
        return true;
    }

    if (cmd == "MGET" && words.size() >= 2) {
        const std::vector<std::string> keys(words.begin() + 1, words.end());
        const auto found = vault::client::get_many(client, keys, concurrency);
        for (const auto& key : keys) {
            auto it = found.find(key);
            if (it == found.end()) {
                fprintf(stdout, "%s NOT_FOUND\n", key.c_str());
            } else {
                fprintf(stdout, "%s VALUE %s\n", key.c_str(), as_text(it->second).c_str());
            }
        }
        return true;
    }

    if (cmd == "HEALTH" && words.size() == 1) {
        auto health = client.health();
        if (!health) {
            fprintf(stdout, "ERROR health check failed\n");
            return false;
        }
        fprintf(stdout, "%s\n", nlohmann::json(*health).dump(2).c_str());
        return true;
    }

    fprintf(stdout, "ERROR unknown or malformed command: %s\n", words[0].c_str());
    return false;
}

void repl(KvClient& client, std::size_t concurrency) {
    std::string line;
    while (true) {
        fprintf(stdout, "> ");
        fflush(stdout);

        if (!std::getline(std::cin, line)) {
            fprintf(stdout, "\n");
            break;
        }

        const auto words = split_line(line);
        if (words.empty()) {
            continue;
        }
        if (upper(words[0]) == "QUIT" || upper(words[0]) == "EXIT") {
            break;
        }
        run_command(client, concurrency, words);
    }
}

} // anonymous namespace

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    vault::CliOptions opts;
    try {
        opts = vault::parse_cli_options(argc, argv);
    } catch (const std::exception& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    const auto& cfg = opts.client;
    vault::init_default_logger(vault::parse_log_level(cfg.log_level));

    const auto endpoint = cfg.transport == vault::Transport::Http
        ? cfg.http_endpoint() : cfg.binary_endpoint();
    spdlog::debug("vault-cli using {}:{} ({})", endpoint.host, endpoint.port,
                  vault::to_string(cfg.transport));

    std::unique_ptr<KvClient> client;
    try {
        if (cfg.transport == vault::Transport::Http) {
            client = std::make_unique<vault::client::HttpClient>(cfg);
        } else {
            client = std::make_unique<vault::client::BinaryClient>(cfg);
        }

        if (!opts.command.empty()) {
            return run_command(*client, cfg.batch_concurrency, opts.command) ? 0 : 1;
        }

        fprintf(stdout, "Using %s:%u (%s). "
                "Type commands (GET k, SET k v, DEL k, EXISTS k, MGET k..., HEALTH). "
                "Ctrl+D to quit.\n",
                endpoint.host.c_str(), endpoint.port,
                std::string(vault::to_string(cfg.transport)).c_str());
        repl(*client, cfg.batch_concurrency);

    } catch (const std::exception& ex) {
        spdlog::error("vault-cli: {}", ex.what());
        return 1;
    }

    return 0;
}
