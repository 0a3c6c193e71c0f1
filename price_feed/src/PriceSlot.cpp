#include "PriceSlot.hpp"
#include "log.hpp"

#include <chrono>

PriceSlot::PriceSlot(std::int64_t stale_after_ms, MsClock clock)
    : stale_after_ms_(stale_after_ms), clock_(std::move(clock))
{}

PriceSlot::~PriceSlot() {
    {
        std::lock_guard<std::mutex> lk(listeners_mtx_);
        closing_ = true;
    }
    dispatch_cv_.notify_all();
    if (dispatcher_.joinable()) dispatcher_.join();
}

void PriceSlot::publish(double value) {
    PriceSample s{value, clock_()};
    {
        std::lock_guard<std::mutex> lk(sample_mtx_);
        latest_ = s;
    }
    published_.fetch_add(1);
    first_cv_.notify_all();

    {
        std::lock_guard<std::mutex> lk(listeners_mtx_);
        if (listeners_.empty()) return;
        pending_ = true;
    }
    dispatch_cv_.notify_one();
}

std::optional<PriceSample> PriceSlot::fresh() const {
    std::optional<PriceSample> s = latest();
    if (!s) return std::nullopt;
    if (clock_() - s->observed_at_ms > stale_after_ms_) return std::nullopt;
    return s;
}

std::optional<PriceSample> PriceSlot::latest() const {
    std::lock_guard<std::mutex> lk(sample_mtx_);
    return latest_;
}

void PriceSlot::add_listener(IPriceStream::Listener cb) {
    std::lock_guard<std::mutex> lk(listeners_mtx_);
    listeners_.push_back(std::move(cb));
    if (!dispatcher_.joinable()) {
        dispatcher_ = std::thread(&PriceSlot::dispatch_loop, this);
    }
}

bool PriceSlot::wait_for_first(std::int64_t timeout_ms) {
    std::unique_lock<std::mutex> lk(sample_mtx_);
    return first_cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms),
                              [this]{ return latest_.has_value(); });
}

void PriceSlot::dispatch_loop() {
    while (true) {
        std::vector<IPriceStream::Listener> targets;
        {
            std::unique_lock<std::mutex> lk(listeners_mtx_);
            dispatch_cv_.wait(lk, [this]{ return pending_ || closing_; });
            if (closing_) break;
            pending_ = false;
            targets = listeners_;
        }

        std::optional<PriceSample> s = latest();
        if (!s) continue;

        for (auto& cb : targets) {
            try {
                cb(*s);
            } catch (const std::exception& e) {
                log_error("STREAM", "listener threw: ", e.what());
            } catch (...) {
                log_error("STREAM", "listener threw a non-std exception");
            }
        }
    }
}
