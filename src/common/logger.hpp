#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace ember {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger ("ember").  Components that log through
// the spdlog free functions (sessions, server) end up here.
// Call once at program start before any logging; later calls only adjust the
// level.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a named component logger, e.g.
// "blocking".  The name is embedded in every log line as [<name>].
std::shared_ptr<spdlog::logger> make_logger(
    const std::string& name,
    spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace ember
