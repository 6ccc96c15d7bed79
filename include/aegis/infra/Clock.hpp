#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace aegis {

constexpr uint64_t NS_PER_MS  = 1'000'000ULL;
constexpr uint64_t NS_PER_SEC = 1'000'000'000ULL;
constexpr uint64_t NS_PER_DAY = 86'400ULL * NS_PER_SEC;

// ---------------------------------------------------------------------------
// Time source for every component.
//
// wall_ns() is epoch-based because it is persisted (breaker trigger time,
// pipeline entry time, trace as_of) and must mean the same thing after a
// restart. mono_ns() is for measuring durations (latency) only.
//
// Components never call std::chrono directly for decisions; they take a
// Clock& so tests can drive time with ManualClock.
// ---------------------------------------------------------------------------
class Clock {
public:
    virtual ~Clock() = default;

    virtual uint64_t wall_ns() const = 0;
    virtual uint64_t mono_ns() const = 0;
};

class SystemClock final : public Clock {
public:
    uint64_t wall_ns() const override {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::system_clock::now().time_since_epoch()
            ).count()
        );
    }

    uint64_t mono_ns() const override {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::steady_clock::now().time_since_epoch()
            ).count()
        );
    }
};

// Deterministic clock for tests and replays. Both readings advance together.
class ManualClock final : public Clock {
public:
    explicit ManualClock(uint64_t start_wall_ns = 1'700'000'000ULL * NS_PER_SEC)
        : wall_(start_wall_ns), mono_(0) {}

    uint64_t wall_ns() const override { return wall_.load(); }
    uint64_t mono_ns() const override { return mono_.load(); }

    void advance_ns(uint64_t ns) {
        wall_.fetch_add(ns);
        mono_.fetch_add(ns);
    }

    void advance_ms(uint64_t ms)   { advance_ns(ms * NS_PER_MS); }
    void advance_sec(uint64_t sec) { advance_ns(sec * NS_PER_SEC); }

    void set_wall_ns(uint64_t ns) { wall_.store(ns); }

private:
    std::atomic<uint64_t> wall_;
    std::atomic<uint64_t> mono_;
};

inline double ns_to_days(uint64_t ns) {
    return static_cast<double>(ns) / static_cast<double>(NS_PER_DAY);
}

inline double ns_to_ms(uint64_t ns) {
    return static_cast<double>(ns) / static_cast<double>(NS_PER_MS);
}

} // namespace aegis
