#pragma once
#include "exchange_client.hpp"
#include "instrument.hpp"
#include "order_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct ReplaceResult {
    QuoteIntent quote;
    std::optional<std::string> buy_id;
    std::optional<std::string> sell_id;
};

// Sole owner of this engine's resting orders. Not thread-safe: confined to
// the scheduler's thread.
class OrderLifecycleManager {
public:
    static constexpr int MAX_CANCEL_ATTEMPTS = 3;

    OrderLifecycleManager(IExchangeClient& exchange, double max_position_size);

    // detect fills -> cancel all tracked -> price -> submit buy, submit sell
    // -> track. Individual failures are logged and yield an absent id; never
    // throws.
    ReplaceResult replace(const Instrument& inst, double fair_price,
                          int spread_bps, double size);

    // Best-effort cancel of every tracked order, after fill detection.
    // Returns how many cancels succeeded.
    std::size_t cancel_all();

    // Cancels everything the exchange reports open, tracked or not.
    std::size_t sweep_open_orders();

    static QuoteIntent make_quote(double fair_price, int spread_bps, double size);

    const std::vector<RestingOrder>& resting() const { return resting_; }
    std::vector<std::string> pending_cancel_ids() const;
    std::uint64_t orders_submitted() const { return submitted_; }

    // A tracked order missing from the exchange's open listing has executed.
    std::uint64_t fills_detected() const { return fills_; }
    // Fills detected since the previous call.
    int take_new_fills();

private:
    struct PendingCancel {
        std::string order_id;
        int attempts = 0;
    };

    void detect_fills();
    std::size_t cancel_tracked();
    void retry_pending_cancels();
    std::optional<std::string> submit_side(const Instrument& inst, Side side,
                                           double price, double size);

    IExchangeClient& exchange_;
    double max_position_size_;

    std::vector<RestingOrder> resting_;
    std::vector<PendingCancel> pending_;
    std::uint64_t submitted_ = 0;
    std::uint64_t fills_ = 0;
    int new_fills_ = 0;
};
