#pragma once
#include "IPriceStream.hpp"
#include "PriceSample.hpp"
#include "catalog_client.hpp"
#include "exchange_client.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

// Manually advanced millisecond clock.
struct FakeClock {
    std::int64_t now = 0;

    MsClock fn() { return [this]{ return now; }; }
    void advance(std::int64_t ms) { now += ms; }
};

// Scriptable exchange: records every call, fails on request.
class FakeExchange : public IExchangeClient {
public:
    struct Submission {
        std::string token;
        Side side;
        double price;
        double size;
        int fee_bps;
    };

    std::optional<std::string> submit(const std::string& token_id, Side side,
                                      double price, double size,
                                      int fee_rate_bps) override {
        submissions.push_back(Submission{token_id, side, price, size, fee_rate_bps});
        if (side == Side::Buy && fail_buy) return std::nullopt;
        if (side == Side::Sell && fail_sell) return std::nullopt;

        std::string id = "ord-" + std::to_string(++next_id);
        open.insert(id);
        return id;
    }

    bool cancel(const std::string& order_id) override {
        cancel_calls.push_back(order_id);
        if (fail_cancel.count(order_id)) return false;
        return open.erase(order_id) > 0;
    }

    std::optional<std::vector<std::string>> list_open_orders() override {
        ++list_calls;
        if (fail_list) return std::nullopt;
        return std::vector<std::string>(open.begin(), open.end());
    }

    // Simulates an execution: the order leaves the open set without a cancel.
    void fill(const std::string& order_id) { open.erase(order_id); }

    std::optional<int> fee_rate(const std::string&) override {
        ++fee_queries;
        if (throw_on_fee) throw std::runtime_error("fee endpoint exploded");
        return fee;
    }

    std::optional<double> balance() override {
        ++balance_queries;
        return bal;
    }

    std::set<std::string> open;
    std::set<std::string> fail_cancel;
    bool fail_buy = false;
    bool fail_sell = false;
    bool throw_on_fee = false;
    bool fail_list = false;
    std::optional<int> fee = 0;
    std::optional<double> bal = 100.0;

    std::vector<Submission> submissions;
    std::vector<std::string> cancel_calls;
    int fee_queries = 0;
    int balance_queries = 0;
    int list_calls = 0;
    int next_id = 0;
};

class FakeCatalog : public ICatalogClient {
public:
    std::vector<CatalogEntry> active_instruments() override {
        ++calls;
        return entries;
    }

    void add(const std::string& id, const std::string& description,
             std::vector<std::string> tokens = {"yes-token", "no-token"},
             bool active = true) {
        entries.push_back(CatalogEntry{id, description, active, std::move(tokens)});
    }

    std::vector<CatalogEntry> entries;
    int calls = 0;
};

// Price stream driven by the test; staleness follows the injected clock.
class FakePriceStream : public IPriceStream {
public:
    explicit FakePriceStream(MsClock clock, std::int64_t stale_after_ms = 10000)
        : clock_(std::move(clock)), stale_after_ms_(stale_after_ms) {}

    void start() override {
        ++starts;
        running = true;
    }
    void stop() override {
        ++stops;
        running = false;
    }

    std::optional<PriceSample> current() const override {
        if (!sample) return std::nullopt;
        if (clock_() - sample->observed_at_ms > stale_after_ms_) return std::nullopt;
        return sample;
    }

    bool is_healthy() const override {
        return running && (healthy_without_price || current().has_value());
    }

    void on_update(Listener cb) override { listeners.push_back(std::move(cb)); }

    void push(double value) {
        sample = PriceSample{value, clock_()};
        for (auto& cb : listeners) cb(*sample);
    }

    std::optional<PriceSample> sample;
    std::vector<Listener> listeners;
    bool running = false;
    bool healthy_without_price = false;
    int starts = 0;
    int stops = 0;

private:
    MsClock clock_;
    std::int64_t stale_after_ms_;
};
