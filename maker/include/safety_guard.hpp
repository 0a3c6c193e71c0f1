#pragma once
#include "PriceSample.hpp"
#include "exchange_client.hpp"

#include <chrono>
#include <cstdint>
#include <optional>

struct SafetyLimits {
    double max_daily_loss = 20.0;
    int max_daily_trades = 500;
    std::int64_t balance_check_interval_ms = 30000;
};

inline std::int64_t system_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// Daily loss / fill-count ceilings. Counters roll over at UTC midnight.
// Uses wall-clock time (day boundaries), not the monotonic MsClock.
class SafetyGuard {
public:
    enum class Status { Ok, DailyLossBreached, TradeLimitBreached };

    SafetyGuard(IExchangeClient& exchange, SafetyLimits limits,
                MsClock wall_clock = system_now_ms);

    // Snapshot the day-start balance. Call once before the first check().
    void begin();

    // Executed orders; placements and cancels do not count.
    void record_fills(int n);

    // May poll the exchange balance (rate-limited by balance_check_interval).
    Status check();

    double daily_pnl() const { return daily_pnl_; }
    int daily_trades() const { return daily_trades_; }

private:
    static std::int64_t utc_day(std::int64_t ms) { return ms / 86400000; }
    void roll_day_if_needed(std::int64_t now);
    void refresh_balance(std::int64_t now);

    IExchangeClient& exchange_;
    SafetyLimits limits_;
    MsClock clock_;

    std::int64_t day_ = -1;
    std::optional<double> day_start_balance_;
    std::int64_t last_balance_check_ms_ = 0;
    bool polled_ = false;

    double daily_pnl_ = 0.0;
    int daily_trades_ = 0;
};

const char* safety_status_str(SafetyGuard::Status s);
