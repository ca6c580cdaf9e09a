#pragma once

#include <chrono>
#include <cstdint>

namespace ember {

// ── Clock abstraction ────────────────────────────────────────────────────────
//
// Time source for key expiry and stream ID generation, so that tests can use a
// deterministic, manually-advanceable clock instead of wall-clock time.
//
// now()     : monotonic time, used for key deadlines.
// unix_ms() : wall-clock milliseconds since the epoch, used for XADD '*'.

class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    [[nodiscard]] virtual time_point now() const = 0;

    [[nodiscard]] virtual uint64_t unix_ms() const = 0;
};

// ── SystemClock ──────────────────────────────────────────────────────────────
//
// Production implementation: delegates to std::chrono.

class SystemClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override {
        return std::chrono::steady_clock::now();
    }

    [[nodiscard]] uint64_t unix_ms() const override {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch())
                .count());
    }
};

// ── MockClock ────────────────────────────────────────────────────────────────
//
// Test implementation: time only advances via explicit advance() calls.
// Both views move together.

class MockClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override {
        return now_;
    }

    [[nodiscard]] uint64_t unix_ms() const override {
        return unix_ms_;
    }

    void advance(std::chrono::milliseconds delta) {
        now_ += delta;
        unix_ms_ += static_cast<uint64_t>(delta.count());
    }

    void set_unix_ms(uint64_t ms) {
        unix_ms_ = ms;
    }

private:
    time_point now_{};
    uint64_t unix_ms_ = 0;
};

} // namespace ember
