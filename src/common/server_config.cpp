#include "common/server_config.hpp"

#include <array>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>
#include <fmt/format.h>

namespace po = boost::program_options;

namespace ember {

namespace {

constexpr uint32_t kMaxThreads = 1024;

constexpr std::array<std::string_view, 6> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical",
};

// Validate the fully populated ServerConfig.
void validate(const ServerConfig& cfg) {
    if (cfg.port == 0) {
        throw std::runtime_error("--port must be in [1, 65535], got 0");
    }
    if (cfg.host.empty()) {
        throw std::runtime_error("--host must not be empty");
    }
    if (cfg.threads > kMaxThreads) {
        throw std::runtime_error(
            fmt::format("--threads must be <= {}, got {}", kMaxThreads, cfg.threads));
    }

    bool known_level = false;
    for (auto level : kLogLevels) {
        if (cfg.log_level == level) {
            known_level = true;
            break;
        }
    }
    if (!known_level) {
        throw std::runtime_error(
            fmt::format("--log-level must be one of trace|debug|info|warn|error|critical, got '{}'",
                        cfg.log_level));
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    const ServerConfig defaults;
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("host",
            po::value<std::string>()->default_value(defaults.host),
            "Bind address for client connections")
        ("port,p",
            po::value<uint16_t>()->default_value(defaults.port),
            "Port for RESP client connections")
        ("threads",
            po::value<uint32_t>()->default_value(defaults.threads),
            "Worker threads running the event loop (0 = hardware concurrency)")
        ("log-level",
            po::value<std::string>()->default_value(defaults.log_level),
            "Log level: trace|debug|info|warn|error|critical")
        ("expire-interval-ms",
            po::value<uint32_t>()->default_value(defaults.expire_interval_ms),
            "Period of the active key-expiry sweep in ms (0 disables it)");
}

// ── parse_config ──────────────────────────────────────────────────────────────

ServerConfig parse_config(int argc, const char* const argv[]) {
    po::options_description desc("ember-server options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(
            po::parse_command_line(argc, argv, desc),
            vm);

        // Handle --help before notify() so validation errors don't hide it.
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    ServerConfig cfg;
    cfg.host               = vm["host"].as<std::string>();
    cfg.port               = vm["port"].as<uint16_t>();
    cfg.threads            = vm["threads"].as<uint32_t>();
    cfg.log_level          = vm["log-level"].as<std::string>();
    cfg.expire_interval_ms = vm["expire-interval-ms"].as<uint32_t>();

    validate(cfg);
    return cfg;
}

} // namespace ember
