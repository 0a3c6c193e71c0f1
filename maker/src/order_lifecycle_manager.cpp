#include "order_lifecycle_manager.hpp"
#include "fair_value.hpp"
#include "log.hpp"

#include <algorithm>

OrderLifecycleManager::OrderLifecycleManager(IExchangeClient& exchange,
                                             double max_position_size)
    : exchange_(exchange), max_position_size_(max_position_size) {}

QuoteIntent OrderLifecycleManager::make_quote(double fair_price, int spread_bps, double size) {
    const double spread = spread_bps / 10000.0;
    QuoteIntent q;
    q.buy_price  = clamp_price(fair_price - spread / 2.0);
    q.sell_price = clamp_price(fair_price + spread / 2.0);
    q.size       = size;
    return q;
}

ReplaceResult OrderLifecycleManager::replace(const Instrument& inst,
                                             double fair_price,
                                             int spread_bps,
                                             double size) {
    ReplaceResult out;

    // 1) withdraw everything we have out
    retry_pending_cancels();
    detect_fills();
    cancel_tracked();

    // 2) price
    const double sz = std::min(size, max_position_size_);
    out.quote = make_quote(fair_price, spread_bps, sz);

    if (sz <= 0.0) {
        log_warn("OLM", "size ", size, " not positive; nothing submitted");
        return out;
    }

    log_info("OLM", "Quoting: BUY $", out.quote.buy_price, " | SELL $",
             out.quote.sell_price, " | size ", sz);

    // 3) both sides independently
    out.buy_id  = submit_side(inst, Side::Buy,  out.quote.buy_price,  sz);
    out.sell_id = submit_side(inst, Side::Sell, out.quote.sell_price, sz);

    // 4) track what made it
    if (out.buy_id)
        resting_.push_back(RestingOrder{*out.buy_id, Side::Buy, out.quote.buy_price, sz});
    if (out.sell_id)
        resting_.push_back(RestingOrder{*out.sell_id, Side::Sell, out.quote.sell_price, sz});

    return out;
}

std::size_t OrderLifecycleManager::cancel_all() {
    retry_pending_cancels();
    detect_fills();
    return cancel_tracked();
}

int OrderLifecycleManager::take_new_fills() {
    const int n = new_fills_;
    new_fills_ = 0;
    return n;
}

std::size_t OrderLifecycleManager::sweep_open_orders() {
    std::optional<std::vector<std::string>> open = exchange_.list_open_orders();
    if (!open) {
        log_warn("OLM", "sweep: open orders unavailable; cancelling tracked only");
        return cancel_all();
    }

    std::size_t ok = 0;
    for (const auto& id : *open) {
        if (exchange_.cancel(id)) ++ok;
        else log_warn("OLM", "sweep: cancel failed for ", id);
    }
    if (!open->empty())
        log_info("OLM", "Cancelled ", ok, "/", open->size(), " open orders");

    resting_.clear();
    pending_.clear();
    return ok;
}

std::vector<std::string> OrderLifecycleManager::pending_cancel_ids() const {
    std::vector<std::string> ids;
    for (const auto& p : pending_) ids.push_back(p.order_id);
    return ids;
}

void OrderLifecycleManager::detect_fills() {
    if (resting_.empty()) return;

    std::optional<std::vector<std::string>> open = exchange_.list_open_orders();
    if (!open) {
        log_warn("OLM", "open orders unavailable; fill check skipped this cycle");
        return;
    }

    std::vector<RestingOrder> still;
    for (const auto& o : resting_) {
        if (std::find(open->begin(), open->end(), o.order_id) != open->end()) {
            still.push_back(o);
            continue;
        }
        log_info("OLM", "FILL ", side_str(o.side), " ", o.order_id, ": ", o.size,
                 " @ $", o.price);
        ++fills_;
        ++new_fills_;
    }
    resting_.swap(still);
}

std::size_t OrderLifecycleManager::cancel_tracked() {
    std::size_t ok = 0;
    for (const auto& o : resting_) {
        if (exchange_.cancel(o.order_id)) {
            ++ok;
            continue;
        }
        log_warn("OLM", "cancel failed for ", side_str(o.side), " ", o.order_id,
                 " (will retry)");
        pending_.push_back(PendingCancel{o.order_id, 1});
    }
    resting_.clear();
    return ok;
}

void OrderLifecycleManager::retry_pending_cancels() {
    if (pending_.empty()) return;

    std::vector<PendingCancel> still;
    for (auto& p : pending_) {
        if (exchange_.cancel(p.order_id)) {
            log_info("OLM", "cancelled ", p.order_id, " on retry ", p.attempts);
            continue;
        }
        ++p.attempts;
        if (p.attempts >= MAX_CANCEL_ATTEMPTS) {
            log_error("OLM", "giving up on cancel of ", p.order_id, " after ",
                      p.attempts, " attempts; it may still be resting");
            continue;
        }
        still.push_back(p);
    }
    pending_.swap(still);
}

std::optional<std::string> OrderLifecycleManager::submit_side(const Instrument& inst,
                                                              Side side,
                                                              double price,
                                                              double size) {
    // fee rate is part of the signed order; never guess it
    std::optional<int> fee = exchange_.fee_rate(inst.yes_token);
    if (!fee) {
        log_error("OLM", "no fee rate for token; ", side_str(side), " not submitted");
        return std::nullopt;
    }

    std::optional<std::string> id = exchange_.submit(inst.yes_token, side, price, size, *fee);
    if (!id) {
        log_error("OLM", side_str(side), " submit failed @ $", price);
        return std::nullopt;
    }
    ++submitted_;
    return id;
}
