#include "safety_guard.hpp"
#include "log.hpp"

SafetyGuard::SafetyGuard(IExchangeClient& exchange, SafetyLimits limits, MsClock wall_clock)
    : exchange_(exchange), limits_(limits), clock_(std::move(wall_clock)) {}

void SafetyGuard::begin() {
    const std::int64_t now = clock_();
    day_ = utc_day(now);
    daily_trades_ = 0;
    daily_pnl_ = 0.0;

    day_start_balance_ = exchange_.balance();
    last_balance_check_ms_ = now;
    polled_ = true;

    if (day_start_balance_)
        log_info("SAFETY", "day-start balance $", *day_start_balance_);
    else
        log_warn("SAFETY", "balance unavailable; daily loss limit inactive until it is");
}

void SafetyGuard::record_fills(int n) {
    if (n <= 0) return;
    roll_day_if_needed(clock_());
    daily_trades_ += n;
}

SafetyGuard::Status SafetyGuard::check() {
    const std::int64_t now = clock_();
    roll_day_if_needed(now);
    refresh_balance(now);

    if (daily_pnl_ < -limits_.max_daily_loss) {
        log_warn("SAFETY", "Daily loss limit reached: $", daily_pnl_,
                 " (limit -$", limits_.max_daily_loss, ")");
        return Status::DailyLossBreached;
    }
    if (daily_trades_ >= limits_.max_daily_trades) {
        log_warn("SAFETY", "Daily trade limit reached: ", daily_trades_, " fills");
        return Status::TradeLimitBreached;
    }
    return Status::Ok;
}

void SafetyGuard::roll_day_if_needed(std::int64_t now) {
    const std::int64_t d = utc_day(now);
    if (d == day_) return;

    if (day_ >= 0)
        log_info("SAFETY", "UTC day rolled; resetting daily counters (trades=",
                 daily_trades_, " pnl=$", daily_pnl_, ")");

    day_ = d;
    daily_trades_ = 0;
    daily_pnl_ = 0.0;
    day_start_balance_ = exchange_.balance();
    last_balance_check_ms_ = now;
    polled_ = true;
}

void SafetyGuard::refresh_balance(std::int64_t now) {
    if (polled_ && now - last_balance_check_ms_ < limits_.balance_check_interval_ms)
        return;

    last_balance_check_ms_ = now;
    polled_ = true;

    std::optional<double> bal = exchange_.balance();
    if (!bal) {
        log_warn("SAFETY", "balance check failed; keeping last P&L $", daily_pnl_);
        return;
    }
    if (!day_start_balance_) {
        day_start_balance_ = bal;
        return;
    }
    daily_pnl_ = *bal - *day_start_balance_;
    log_debug("SAFETY", "balance $", *bal, " daily P&L $", daily_pnl_);
}

const char* safety_status_str(SafetyGuard::Status s) {
    switch (s) {
        case SafetyGuard::Status::Ok:                 return "OK";
        case SafetyGuard::Status::DailyLossBreached:  return "DAILY_LOSS";
        case SafetyGuard::Status::TradeLimitBreached: return "TRADE_LIMIT";
    }
    return "?";
}
