#pragma once

#include <cstdint>
#include <string>

#include <boost/program_options.hpp>

namespace ember {

// ── ServerConfig ──────────────────────────────────────────────────────────────
// Full configuration for one ember-server process.
// Populated by parse_config() from CLI arguments.

struct ServerConfig {
    std::string host = "0.0.0.0";       // Bind address for client connections
    uint16_t    port = 6379;            // RESP client port
    uint32_t    threads = 0;            // io_context worker threads (0 = hardware concurrency)
    std::string log_level = "info";     // spdlog level string
    uint32_t    expire_interval_ms = 100; // Active expiry period (0 = lazy expiry only)
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a ServerConfig.
//
// On success: returns a fully validated ServerConfig.
// On error  : throws std::runtime_error with a human-readable message.
//             --help also throws, carrying the usage text.
//
// Validates:
//   - port in [1, 65535]
//   - host is not empty
//   - log level is one of trace|debug|info|warn|error|critical
//   - threads <= 1024

[[nodiscard]] ServerConfig parse_config(int argc, const char* const argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with ember-server
// options.  Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace ember
