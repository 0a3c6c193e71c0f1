#pragma once
#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// CLOB L2 credentials. Only ever read from the environment.
struct ApiCredentials {
    std::string api_key;
    std::string api_secret;   // base64 (url-safe) as issued by the CLOB
    std::string passphrase;
    std::string address;      // wallet address, 0x...

    bool complete() const {
        return !api_key.empty() && !api_secret.empty() &&
               !passphrase.empty() && !address.empty();
    }
};

struct EngineConfig {
    // market
    std::string symbol = "BTCUSDT";
    std::vector<std::string> market_keywords{"btc", "bitcoin"};
    std::string market_duration = "15m";

    // trading
    double initial_capital = 100.0;
    double max_position_size = 20.0;
    int spread_bps = 50;
    int cancel_replace_interval_s = 2;
    double quote_refresh_on_price_change = 0.001;
    int min_edge_bps = 200;
    int min_profit_bps = 10;

    // safety
    double max_daily_loss = 20.0;
    int max_daily_trades = 500;
    bool dry_run = true;
    int dry_run_fee_bps = 0;
    int balance_check_interval_s = 30;

    // timing
    std::int64_t tick_interval_ms = 1000;
    std::int64_t stale_after_ms = 10000;
    std::int64_t startup_timeout_ms = 10000;
    std::int64_t reconnect_base_ms = 5000;
    std::int64_t reconnect_max_ms = 60000;
    long http_timeout_ms = 10000;

    // endpoints
    std::string clob_url = "https://clob.polymarket.com";
    std::string gamma_url = "https://gamma-api.polymarket.com";
    std::string binance_ws_host = "stream.binance.com";
    std::string binance_ws_port = "9443";

    // outputs
    std::string journal_path = "quotes.db";
    std::string publish_endpoint;   // e.g. "tcp://*:5556"; empty = off
    std::string log_level = "INFO";
    std::string log_file = "logs/poly_maker.log";

    ApiCredentials creds;

    // Missing keys keep their defaults. Throws ConfigError on wrong types.
    static EngineConfig from_json(const nlohmann::json& j);

    // from_json(file) + POLY_* secrets from the environment.
    static EngineConfig load(const std::string& path);

    void load_credentials_from_env();

    // Throws ConfigError. Must pass before any network activity.
    void validate() const;

    std::string describe() const;
};
