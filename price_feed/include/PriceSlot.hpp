#pragma once
#include "IPriceStream.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

// Single-slot "latest value" holder shared by the feed thread (writer) and
// the scheduler (reader). Writes overwrite; readers always see a whole sample.
// Listeners run on a dispatcher thread, never on the receive path, and only
// ever see the newest sample (intermediate ticks may be coalesced).
class PriceSlot {
public:
    PriceSlot(std::int64_t stale_after_ms, MsClock clock = steady_now_ms);
    ~PriceSlot();

    PriceSlot(const PriceSlot&) = delete;
    PriceSlot& operator=(const PriceSlot&) = delete;

    // Producer side. value must be > 0 (caller filters).
    void publish(double value);

    // Staleness-filtered read.
    std::optional<PriceSample> fresh() const;

    // Raw read, ignores staleness.
    std::optional<PriceSample> latest() const;

    void add_listener(IPriceStream::Listener cb);

    // Waits until at least one sample exists. Returns false on timeout.
    bool wait_for_first(std::int64_t timeout_ms);

    std::uint64_t published() const { return published_.load(); }

    std::int64_t stale_after_ms() const { return stale_after_ms_; }

private:
    void dispatch_loop();

private:
    std::int64_t stale_after_ms_;
    MsClock clock_;

    mutable std::mutex sample_mtx_;
    std::condition_variable first_cv_;
    std::optional<PriceSample> latest_;
    std::atomic<std::uint64_t> published_{0};

    std::mutex listeners_mtx_;
    std::condition_variable dispatch_cv_;
    std::vector<IPriceStream::Listener> listeners_;
    bool pending_ = false;
    bool closing_ = false;
    std::thread dispatcher_;
};
