#include "blocking/blocking_coordinator.hpp"
#include "common/clock.hpp"
#include "common/logger.hpp"
#include "common/server_config.hpp"
#include "common/server_stats.hpp"
#include "engine/command_engine.hpp"
#include "network/server.hpp"
#include "storage/storage.hpp"

#include <boost/system/system_error.hpp>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <stdexcept>

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    ember::ServerConfig cfg;
    try {
        cfg = ember::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    const auto level = ember::parse_log_level(cfg.log_level);
    ember::init_default_logger(level);

    spdlog::info("ember-server starting on {}:{} threads={} expire-interval={}ms",
                 cfg.host, cfg.port, cfg.threads, cfg.expire_interval_ms);

    // ── Engine ───────────────────────────────────────────────────────────────
    ember::SystemClock clock;
    ember::Storage storage{clock};
    ember::blocking::BlockingCoordinator coordinator{ember::make_logger("blocking", level)};
    storage.set_listener(&coordinator);

    ember::ServerStats stats;
    ember::engine::CommandEngine engine{storage, coordinator, stats};

    // ── Serve ────────────────────────────────────────────────────────────────
    try {
        ember::network::Server server{cfg, engine, stats};
        server.run();
    } catch (const boost::system::system_error& e) {
        spdlog::error("Failed to start server on {}:{}: {}", cfg.host, cfg.port, e.what());
        return 1;
    }

    spdlog::info("ember-server stopped");
    return 0;
}
