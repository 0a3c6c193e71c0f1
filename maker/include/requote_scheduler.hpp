#pragma once
#include "IPriceStream.hpp"
#include "PriceSample.hpp"
#include "cycle_report.hpp"
#include "engine_config.hpp"
#include "instrument.hpp"
#include "market_selector.hpp"
#include "order_lifecycle_manager.hpp"
#include "safety_guard.hpp"

#include <atomic>
#include <cstdint>
#include <optional>

enum class EngineStatus { Idle, Selecting, Streaming, Stopped };

enum class TickOutcome {
    NoPrice,     // no fresh sample; skipped
    Idle,        // fresh sample, trigger not met
    Quoted,
    Vetoed,      // gate said no; resting orders flattened
    SafetyStop,  // daily limit hit
    Stopped
};

enum class StopReason { None, Requested, SafetyLimit, Fault };

struct EngineState {
    std::int64_t last_requote_at_ms = 0;
    std::optional<double> last_quoted_price;
    bool running = false;
};

const char* engine_status_str(EngineStatus s);
const char* stop_reason_str(StopReason r);

// Trigger policy: never quoted, interval elapsed, or relative move >= threshold.
bool requote_due(const EngineState& st, double price, std::int64_t now_ms,
                 std::int64_t interval_ms, double change_threshold);

// Idle -> Selecting -> Streaming -> Stopped. Single-threaded; only
// request_stop() may be called from elsewhere (signal handler included).
class RequoteScheduler {
public:
    static constexpr int MAX_CONSECUTIVE_FAULTS = 5;

    RequoteScheduler(const EngineConfig& cfg,
                     IPriceStream& stream,
                     MarketSelector& selector,
                     OrderLifecycleManager& olm,
                     SafetyGuard* guard = nullptr,
                     MsClock clock = steady_now_ms);
    ~RequoteScheduler();

    RequoteScheduler(const RequoteScheduler&) = delete;
    RequoteScheduler& operator=(const RequoteScheduler&) = delete;

    void set_cycle_sink(CycleSink sink) { sink_ = std::move(sink); }

    // Selects the instrument then starts the stream. Throws SelectionError or
    // std::runtime_error (no price within the startup window); the scheduler
    // is Stopped afterwards in both cases. Throws std::logic_error if called
    // on a stopped scheduler.
    void start();

    TickOutcome tick();

    // Ticks every tick_interval until a stop request, a safety breach or
    // repeated faults. Always leaves the scheduler Stopped.
    StopReason run();

    void request_stop() { stop_requested_.store(true); }

    // Cancel everything, disconnect the stream. Idempotent; never throws.
    void stop();

    EngineStatus status() const { return status_; }
    const EngineState& state() const { return state_; }
    const std::optional<Instrument>& instrument() const { return instrument_; }
    StopReason stop_reason() const { return stop_reason_; }

    std::uint64_t cycles() const { return cycles_; }
    std::uint64_t quotes() const { return quotes_; }
    std::uint64_t vetoes() const { return vetoes_; }

private:
    void emit(const CycleReport& r);
    void sleep_interruptible(std::int64_t ms);
    void log_stats();

    const EngineConfig& cfg_;
    IPriceStream& stream_;
    MarketSelector& selector_;
    OrderLifecycleManager& olm_;
    SafetyGuard* guard_;
    MsClock clock_;
    CycleSink sink_;

    EngineStatus status_ = EngineStatus::Idle;
    EngineState state_;
    // While consecutive cycles are vetoed the trigger is measured from the
    // last veto rather than from the last quote.
    EngineState veto_state_;
    bool in_veto_ = false;
    std::optional<Instrument> instrument_;
    StopReason stop_reason_ = StopReason::None;
    std::atomic<bool> stop_requested_{false};

    std::int64_t started_at_ms_ = 0;
    std::uint64_t cycles_ = 0;
    std::uint64_t quotes_ = 0;
    std::uint64_t vetoes_ = 0;
};
