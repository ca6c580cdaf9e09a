#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace ember {

// Process-wide counters reported by INFO.  Updated lock-free from any session.
struct ServerStats {
    std::atomic<uint64_t> connected_clients{0};
    std::atomic<uint64_t> total_connections{0};
    std::atomic<uint64_t> total_commands{0};

    uint16_t tcp_port = 0;
    std::chrono::steady_clock::time_point started_at = std::chrono::steady_clock::now();
};

} // namespace ember
