#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace vault {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger used by the CLI, tools, and any client
// constructed without an explicit logger.
// Call once at program start before any logging.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a named client logger.
//   name   – logger name embedded in every log line as [<name>]
//   level  – initial log level
std::shared_ptr<spdlog::logger> make_client_logger(
    const std::string& name,
    spdlog::level::level_enum level = spdlog::level::info);

// Returns `logger` if set, otherwise the spdlog default logger.
std::shared_ptr<spdlog::logger> logger_or_default(std::shared_ptr<spdlog::logger> logger);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace vault
