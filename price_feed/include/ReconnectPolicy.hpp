#pragma once
#include <algorithm>
#include <cstdint>

// Capped exponential backoff: base, 2*base, 4*base ... max.
// The counter is reset once a connection delivers data again.
class ReconnectPolicy {
public:
    ReconnectPolicy(std::int64_t base_ms, std::int64_t max_ms)
        : base_ms_(std::max<std::int64_t>(base_ms, 1)),
          max_ms_(std::max(max_ms, base_ms_))
    {}

    std::int64_t next_delay_ms() {
        std::int64_t delay = base_ms_;
        for (int i = 0; i < attempts_ && delay < max_ms_; ++i) delay *= 2;
        ++attempts_;
        return std::min(delay, max_ms_);
    }

    void reset() { attempts_ = 0; }

    int attempts() const { return attempts_; }

private:
    std::int64_t base_ms_;
    std::int64_t max_ms_;
    int attempts_ = 0;
};
