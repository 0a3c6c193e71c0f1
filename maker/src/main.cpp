#include "BinanceTickerStream.hpp"
#include "catalog_client.hpp"
#include "core/zmq_publisher.hpp"
#include "dry_run_exchange.hpp"
#include "engine_config.hpp"
#include "log.hpp"
#include "market_selector.hpp"
#include "order_lifecycle_manager.hpp"
#include "polymarket_client.hpp"
#include "requote_scheduler.hpp"
#include "safety_guard.hpp"
#include "storage/quote_journal.hpp"

#include <curl/curl.h>

#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

constexpr int EXIT_CONFIG  = 1;
constexpr int EXIT_STARTUP = 2;
constexpr int EXIT_FAULT   = 3;

RequoteScheduler* g_scheduler = nullptr;

void on_signal(int) {
    if (g_scheduler) g_scheduler->request_stop();
}

struct CliArgs {
    std::string config_path = "config.json";
    bool live = false;
};

bool parse_args(int argc, char** argv, CliArgs& out) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--live") == 0) {
            out.live = true;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            out.config_path = argv[++i];
        } else {
            std::cerr << "usage: " << argv[0] << " [--config <path>] [--live]\n";
            return false;
        }
    }
    return true;
}

// curl_global_init / cleanup for the lifetime of main
struct CurlGlobal {
    CurlGlobal()  { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_args(argc, argv, args)) return EXIT_CONFIG;

    // ---------- Config ----------
    EngineConfig cfg;
    try {
        cfg = EngineConfig::load(args.config_path);
        if (args.live) cfg.dry_run = false;
        cfg.validate();
    } catch (const ConfigError& e) {
        std::cerr << "[MAIN] configuration error: " << e.what() << "\n";
        return EXIT_CONFIG;
    }

    log_init(parse_log_level(cfg.log_level), cfg.log_file);
    std::cout << cfg.describe() << "\n";

    if (!cfg.dry_run) {
        log_warn("MAIN", "LIVE TRADING MODE: real orders with real funds");
        log_warn("MAIN", "Press Ctrl+C within 2 seconds to abort");
        std::this_thread::sleep_for(std::chrono::seconds(2));
    }

    CurlGlobal curl_guard;

    // ---------- Collaborators ----------
    std::unique_ptr<IExchangeClient> exchange;
    if (cfg.dry_run) {
        exchange = std::make_unique<DryRunExchange>(cfg.initial_capital, cfg.dry_run_fee_bps);
    } else {
        auto poly = std::make_unique<PolymarketClient>(cfg.clob_url, cfg.creds, cfg.http_timeout_ms);
        if (!poly->ready())
            log_warn("MAIN", "no order signer configured; submissions will be rejected");
        exchange = std::move(poly);
    }

    GammaCatalogClient catalog(cfg.gamma_url, cfg.http_timeout_ms);
    MarketSelector selector(catalog, cfg.market_keywords);

    TickerStreamParams sp;
    sp.symbol             = cfg.symbol;
    sp.host               = cfg.binance_ws_host;
    sp.port               = cfg.binance_ws_port;
    sp.stale_after_ms     = cfg.stale_after_ms;
    sp.startup_timeout_ms = cfg.startup_timeout_ms;
    sp.reconnect_base_ms  = cfg.reconnect_base_ms;
    sp.reconnect_max_ms   = cfg.reconnect_max_ms;
    BinanceTickerStream stream(sp);

    OrderLifecycleManager olm(*exchange, cfg.max_position_size);

    SafetyLimits limits;
    limits.max_daily_loss = cfg.max_daily_loss;
    limits.max_daily_trades = cfg.max_daily_trades;
    limits.balance_check_interval_ms =
        static_cast<std::int64_t>(cfg.balance_check_interval_s) * 1000;
    SafetyGuard guard(*exchange, limits);

    // ---------- Outputs ----------
    std::unique_ptr<QuoteJournal> journal;
    if (!cfg.journal_path.empty()) {
        journal = std::make_unique<QuoteJournal>(cfg.journal_path);
        if (!journal->start()) {
            log_warn("MAIN", "quote journal unavailable; continuing without it");
            journal.reset();
        }
    }

    std::unique_ptr<CyclePublisher> publisher;
    if (!cfg.publish_endpoint.empty()) {
        try {
            publisher = std::make_unique<CyclePublisher>(cfg.publish_endpoint, cfg.symbol);
        } catch (const zmq::error_t& e) {
            log_warn("MAIN", "cannot bind ", cfg.publish_endpoint, ": ", e.what());
        }
    }

    RequoteScheduler scheduler(cfg, stream, selector, olm, &guard);
    scheduler.set_cycle_sink([&](const CycleReport& r) {
        if (journal) journal->push(r);
        if (publisher) publisher->publish(r);
    });

    g_scheduler = &scheduler;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    // ---------- Run ----------
    int rc = 0;
    try {
        scheduler.start();
    } catch (const SelectionError& e) {
        log_error("MAIN", "market selection failed: ", e.what());
        rc = EXIT_STARTUP;
    } catch (const std::exception& e) {
        log_error("MAIN", "startup failed: ", e.what());
        rc = EXIT_STARTUP;
    }

    if (rc == 0) {
        StopReason why = scheduler.run();
        log_info("MAIN", "engine stopped (", stop_reason_str(why), ")");
        if (why == StopReason::Fault) rc = EXIT_FAULT;
    }

    g_scheduler = nullptr;
    scheduler.stop();
    if (journal) journal->stop();
    log_shutdown();
    return rc;
}
