#include "requote_scheduler.hpp"
#include "fair_value.hpp"
#include "log.hpp"
#include "quote_gate.hpp"

#include <chrono>
#include <cmath>
#include <stdexcept>
#include <thread>

const char* engine_status_str(EngineStatus s) {
    switch (s) {
        case EngineStatus::Idle:      return "IDLE";
        case EngineStatus::Selecting: return "SELECTING";
        case EngineStatus::Streaming: return "STREAMING";
        case EngineStatus::Stopped:   return "STOPPED";
    }
    return "?";
}

const char* stop_reason_str(StopReason r) {
    switch (r) {
        case StopReason::None:        return "none";
        case StopReason::Requested:   return "requested";
        case StopReason::SafetyLimit: return "safety limit";
        case StopReason::Fault:       return "fault";
    }
    return "?";
}

bool requote_due(const EngineState& st, double price, std::int64_t now_ms,
                 std::int64_t interval_ms, double change_threshold) {
    if (!st.last_quoted_price) return true;
    if (now_ms - st.last_requote_at_ms >= interval_ms) return true;

    const double last = *st.last_quoted_price;
    return std::fabs(price - last) / last >= change_threshold;
}

RequoteScheduler::RequoteScheduler(const EngineConfig& cfg,
                                   IPriceStream& stream,
                                   MarketSelector& selector,
                                   OrderLifecycleManager& olm,
                                   SafetyGuard* guard,
                                   MsClock clock)
    : cfg_(cfg)
    , stream_(stream)
    , selector_(selector)
    , olm_(olm)
    , guard_(guard)
    , clock_(std::move(clock)) {}

RequoteScheduler::~RequoteScheduler() {
    stop();
}

void RequoteScheduler::start() {
    if (status_ == EngineStatus::Stopped)
        throw std::logic_error("scheduler already stopped; construct a new one");
    if (status_ != EngineStatus::Idle)
        throw std::logic_error("scheduler already started");

    status_ = EngineStatus::Selecting;
    log_info("SCHED", "Selecting ", cfg_.market_duration, " market...");
    try {
        instrument_ = selector_.select(cfg_.market_duration);
    } catch (const SelectionError&) {
        status_ = EngineStatus::Stopped;
        throw;
    }
    log_info("SCHED", "Market: ", instrument_->description);
    log_info("SCHED", "Strike: $", instrument_->strike);

    stream_.start();
    if (!stream_.is_healthy()) {
        stream_.stop();
        status_ = EngineStatus::Stopped;
        throw std::runtime_error("no price from " + cfg_.symbol +
                                 " stream within the startup window");
    }

    if (guard_) guard_->begin();

    started_at_ms_ = clock_();
    state_ = EngineState{};
    state_.running = true;
    veto_state_ = EngineState{};
    in_veto_ = false;
    status_ = EngineStatus::Streaming;
    log_info("SCHED", "Streaming; requote every ", cfg_.cancel_replace_interval_s,
             "s or on ", cfg_.quote_refresh_on_price_change * 100.0, "% move");
}

TickOutcome RequoteScheduler::tick() {
    if (status_ == EngineStatus::Stopped) return TickOutcome::Stopped;
    if (status_ != EngineStatus::Streaming)
        throw std::logic_error("tick() before start()");

    if (guard_ && guard_->check() != SafetyGuard::Status::Ok)
        return TickOutcome::SafetyStop;

    std::optional<PriceSample> sample = stream_.current();
    if (!sample) {
        log_debug("SCHED", "no fresh price; skipping tick");
        return TickOutcome::NoPrice;
    }

    const std::int64_t now = clock_();
    const double price = sample->value;
    if (!requote_due(in_veto_ ? veto_state_ : state_, price, now,
                     static_cast<std::int64_t>(cfg_.cancel_replace_interval_s) * 1000,
                     cfg_.quote_refresh_on_price_change)) {
        return TickOutcome::Idle;
    }

    ++cycles_;
    const Instrument& inst = *instrument_;
    const double fair = fair_price(price, inst.strike);

    CycleReport rep;
    rep.ts_ms = system_now_ms();
    rep.instrument_id = inst.id;
    rep.reference_price = price;
    rep.strike = inst.strike;
    rep.fair_price = fair;

    if (!quote_gate_allows(fair, cfg_.min_edge_bps)) {
        if (!in_veto_) {
            log_warn("SCHED", cfg_.symbol, " $", price, " | fair ", fair,
                     " inside fee danger zone (min edge ", cfg_.min_edge_bps,
                     " bps); flattening");
        } else {
            log_debug("SCHED", cfg_.symbol, " $", price, " | fair ", fair, " still vetoed");
        }
        olm_.cancel_all();
        if (guard_) guard_->record_fills(olm_.take_new_fills());

        in_veto_ = true;
        veto_state_.last_requote_at_ms = now;
        veto_state_.last_quoted_price = price;
        ++vetoes_;
        rep.vetoed = true;
        emit(rep);
        return TickOutcome::Vetoed;
    }

    if (in_veto_) log_info("SCHED", "fair ", fair, " clear of the fee zone; quoting resumes");
    in_veto_ = false;
    log_info("SCHED", cfg_.symbol, " $", price, " | strike $", inst.strike,
             " | fair ", fair);

    ReplaceResult res = olm_.replace(inst, fair, cfg_.spread_bps, cfg_.max_position_size);
    if (guard_) guard_->record_fills(olm_.take_new_fills());

    state_.last_requote_at_ms = now;
    state_.last_quoted_price = price;
    ++quotes_;

    rep.buy_price = res.quote.buy_price;
    rep.sell_price = res.quote.sell_price;
    rep.size = res.quote.size;
    rep.buy_id = res.buy_id;
    rep.sell_id = res.sell_id;
    emit(rep);

    return TickOutcome::Quoted;
}

StopReason RequoteScheduler::run() {
    StopReason reason = StopReason::Requested;
    int faults = 0;

    while (!stop_requested_.load()) {
        try {
            TickOutcome o = tick();
            faults = 0;
            if (o == TickOutcome::SafetyStop) {
                reason = StopReason::SafetyLimit;
                break;
            }
            if (o == TickOutcome::Stopped) break;
        } catch (const std::exception& e) {
            ++faults;
            log_error("SCHED", "tick failed (", faults, "/", MAX_CONSECUTIVE_FAULTS,
                      "): ", e.what());
            if (faults >= MAX_CONSECUTIVE_FAULTS) {
                reason = StopReason::Fault;
                break;
            }
        }
        sleep_interruptible(cfg_.tick_interval_ms);
    }

    if (reason == StopReason::SafetyLimit)
        log_warn("SCHED", "Safety limit reached; stopping");
    else if (reason == StopReason::Fault)
        log_error("SCHED", "Too many consecutive faults; stopping");

    stop_reason_ = reason;
    stop();
    return reason;
}

void RequoteScheduler::stop() {
    if (status_ == EngineStatus::Stopped) return;

    const bool was_streaming = (status_ == EngineStatus::Streaming);
    status_ = EngineStatus::Stopped;
    if (stop_reason_ == StopReason::None) stop_reason_ = StopReason::Requested;

    log_info("SCHED", "Stopping...");
    try {
        const std::size_t n = olm_.cancel_all();
        if (n) log_info("SCHED", "Cancelled ", n, " resting orders");
        if (!cfg_.dry_run) olm_.sweep_open_orders();
    } catch (const std::exception& e) {
        log_error("SCHED", "cancel on stop failed: ", e.what());
    }

    try {
        stream_.stop();
    } catch (const std::exception& e) {
        log_error("SCHED", "stream stop failed: ", e.what());
    }

    state_.running = false;
    if (was_streaming) log_stats();
}

void RequoteScheduler::emit(const CycleReport& r) {
    if (!sink_) return;
    try {
        sink_(r);
    } catch (const std::exception& e) {
        log_warn("SCHED", "cycle sink threw: ", e.what());
    }
}

void RequoteScheduler::sleep_interruptible(std::int64_t ms) {
    constexpr std::int64_t slice = 50;
    while (ms > 0 && !stop_requested_.load()) {
        const std::int64_t step = ms < slice ? ms : slice;
        std::this_thread::sleep_for(std::chrono::milliseconds(step));
        ms -= step;
    }
}

void RequoteScheduler::log_stats() {
    const double runtime_s = (clock_() - started_at_ms_) / 1000.0;
    log_info("SCHED", "==================== FINAL STATISTICS ====================");
    log_info("SCHED", "Runtime:          ", runtime_s, " s");
    log_info("SCHED", "Stop reason:      ", stop_reason_str(stop_reason_));
    log_info("SCHED", "Requote cycles:   ", cycles_);
    log_info("SCHED", "Quotes placed:    ", quotes_);
    log_info("SCHED", "Gate vetoes:      ", vetoes_);
    log_info("SCHED", "Orders submitted: ", olm_.orders_submitted());
    log_info("SCHED", "Fills detected:   ", olm_.fills_detected());
    if (guard_) {
        log_info("SCHED", "Daily trades:     ", guard_->daily_trades());
        log_info("SCHED", "Daily P&L:        $", guard_->daily_pnl());
    }
    log_info("SCHED", "==========================================================");
}
