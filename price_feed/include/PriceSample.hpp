#pragma once
#include <chrono>
#include <cstdint>
#include <functional>

// One accepted tick. Immutable; the next tick replaces it.
struct PriceSample {
    double value = 0.0;             // > 0
    std::int64_t observed_at_ms = 0; // monotonic ms (see MsClock)
};

// Millisecond clock used for staleness and scheduling. Injectable for tests.
using MsClock = std::function<std::int64_t()>;

inline std::int64_t steady_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()
    ).count();
}
