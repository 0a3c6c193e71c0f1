#pragma once
#include "IPriceStream.hpp"
#include "PriceSlot.hpp"
#include "ReconnectPolicy.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

struct TickerStreamParams {
    std::string symbol = "BTCUSDT";
    std::string host   = "stream.binance.com";
    std::string port   = "9443";

    std::int64_t stale_after_ms     = 10000;
    std::int64_t startup_timeout_ms = 10000;
    std::int64_t reconnect_base_ms  = 5000;
    std::int64_t reconnect_max_ms   = 60000;
    std::int64_t idle_timeout_ms    = 15000; // no frame for this long -> reconnect
};

// Binance single-symbol 24hrTicker over TLS websocket (wss://host:port/ws/<sym>@ticker).
// One background thread owns the connection and reconnects with capped
// exponential backoff for as long as the stream is running.
class BinanceTickerStream : public IPriceStream {
public:
    explicit BinanceTickerStream(TickerStreamParams p, MsClock clock = steady_now_ms);
    ~BinanceTickerStream() override;

    void start() override;
    void stop() override;

    std::optional<PriceSample> current() const override;
    bool is_healthy() const override;
    void on_update(Listener cb) override;

    // Feeds one raw frame through parse/accept. Returns true if a sample was
    // accepted. Called from the session; public for replay tooling and tests.
    bool handle_message(const std::string& text);

    std::uint64_t accepted_ticks() const { return slot_.published(); }
    std::uint64_t malformed_frames() const { return malformed_.load(); }
    // Sessions begun since construction, successful or not.
    std::uint64_t connection_attempts() const { return attempts_.load(); }

private:
    void connection_loop();
    void run_session();

private:
    TickerStreamParams p_;
    PriceSlot slot_;
    ReconnectPolicy backoff_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> malformed_{0};
    std::atomic<std::uint64_t> session_ticks_{0};
    std::atomic<std::uint64_t> attempts_{0};

    std::mutex ctl_mtx_;
    std::condition_variable ctl_cv_;
    std::function<void()> interrupt_; // stops the live io_context, guarded by ctl_mtx_

    std::thread worker_;
};
