#include "engine_config.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

static std::string env_or(const char* k, const std::string& defv) {
    const char* v = std::getenv(k);
    return v ? std::string(v) : defv;
}

template <typename T>
static void read_key(const json& j, const char* key, T& out) {
    if (!j.contains(key) || j[key].is_null()) return;
    try {
        out = j[key].get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("config key '") + key + "': " + e.what());
    }
}

EngineConfig EngineConfig::from_json(const json& j) {
    if (!j.is_object()) throw ConfigError("config root must be a JSON object");

    EngineConfig c;
    read_key(j, "symbol", c.symbol);
    read_key(j, "market_keywords", c.market_keywords);
    read_key(j, "market_duration", c.market_duration);

    read_key(j, "initial_capital", c.initial_capital);
    read_key(j, "max_position_size", c.max_position_size);
    read_key(j, "spread_bps", c.spread_bps);
    read_key(j, "cancel_replace_interval_s", c.cancel_replace_interval_s);
    read_key(j, "quote_refresh_on_price_change", c.quote_refresh_on_price_change);
    read_key(j, "min_edge_bps", c.min_edge_bps);
    read_key(j, "min_profit_bps", c.min_profit_bps);

    read_key(j, "max_daily_loss", c.max_daily_loss);
    read_key(j, "max_daily_trades", c.max_daily_trades);
    read_key(j, "dry_run", c.dry_run);
    read_key(j, "dry_run_fee_bps", c.dry_run_fee_bps);
    read_key(j, "balance_check_interval_s", c.balance_check_interval_s);

    read_key(j, "tick_interval_ms", c.tick_interval_ms);
    read_key(j, "stale_after_ms", c.stale_after_ms);
    read_key(j, "startup_timeout_ms", c.startup_timeout_ms);
    read_key(j, "reconnect_base_ms", c.reconnect_base_ms);
    read_key(j, "reconnect_max_ms", c.reconnect_max_ms);
    read_key(j, "http_timeout_ms", c.http_timeout_ms);

    read_key(j, "clob_url", c.clob_url);
    read_key(j, "gamma_url", c.gamma_url);
    read_key(j, "binance_ws_host", c.binance_ws_host);
    read_key(j, "binance_ws_port", c.binance_ws_port);

    read_key(j, "journal_path", c.journal_path);
    read_key(j, "publish_endpoint", c.publish_endpoint);
    read_key(j, "log_level", c.log_level);
    read_key(j, "log_file", c.log_file);
    return c;
}

EngineConfig EngineConfig::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) throw ConfigError("cannot open config file " + path);

    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) throw ConfigError("config file " + path + " is not valid JSON");

    EngineConfig c = from_json(j);
    c.load_credentials_from_env();
    return c;
}

void EngineConfig::load_credentials_from_env() {
    creds.api_key    = env_or("POLY_API_KEY", "");
    creds.api_secret = env_or("POLY_API_SECRET", "");
    creds.passphrase = env_or("POLY_PASSPHRASE", "");
    creds.address    = env_or("POLY_ADDRESS", "");
}

void EngineConfig::validate() const {
    if (symbol.empty()) throw ConfigError("symbol must not be empty");
    if (market_keywords.empty()) throw ConfigError("market_keywords must not be empty");
    if (market_duration.empty()) throw ConfigError("market_duration must not be empty");

    if (spread_bps < 10)
        throw ConfigError("spread_bps too low (minimum 10 = 0.1%)");
    if (cancel_replace_interval_s < 1)
        throw ConfigError("cancel_replace_interval_s too low (minimum 1 second)");
    if (max_position_size <= 0.0)
        throw ConfigError("max_position_size must be positive");
    if (max_position_size > initial_capital)
        throw ConfigError("max_position_size cannot exceed initial_capital");
    if (min_edge_bps < 0)
        throw ConfigError("min_edge_bps must not be negative");
    if (quote_refresh_on_price_change <= 0.0)
        throw ConfigError("quote_refresh_on_price_change must be positive");
    if (max_daily_loss < 0.0 || max_daily_trades < 1)
        throw ConfigError("max_daily_loss must be >= 0 and max_daily_trades >= 1");
    if (tick_interval_ms < 100)
        throw ConfigError("tick_interval_ms too low (minimum 100)");
    if (stale_after_ms <= 0 || startup_timeout_ms <= 0)
        throw ConfigError("stale_after_ms and startup_timeout_ms must be positive");
    if (reconnect_base_ms <= 0 || reconnect_max_ms < reconnect_base_ms)
        throw ConfigError("reconnect_base_ms must be positive and <= reconnect_max_ms");
    if (http_timeout_ms <= 0)
        throw ConfigError("http_timeout_ms must be positive");

    if (!dry_run && !creds.complete())
        throw ConfigError("POLY_API_KEY, POLY_API_SECRET, POLY_PASSPHRASE and "
                          "POLY_ADDRESS are required when dry_run=false");
}

static std::string mask_address(const std::string& a) {
    if (a.size() < 12) return a.empty() ? "Not configured" : "***";
    return a.substr(0, 6) + "..." + a.substr(a.size() - 4);
}

std::string EngineConfig::describe() const {
    char buf[1024];
    std::snprintf(buf, sizeof(buf),
        "============================================================\n"
        "poly_maker configuration\n"
        "============================================================\n"
        "Mode:              %s\n"
        "Symbol / market:   %s / %s\n"
        "Initial Capital:   $%.2f\n"
        "Max Position:      $%.2f\n"
        "Spread:            %.2f%%\n"
        "Cancel/Replace:    %ds (or %.2f%% move)\n"
        "Min Edge:          %.2f%%\n"
        "Max Daily Loss:    $%.2f\n"
        "Max Daily Trades:  %d\n"
        "Wallet:            %s\n"
        "============================================================",
        dry_run ? "DRY-RUN" : "LIVE",
        symbol.c_str(), market_duration.c_str(),
        initial_capital,
        max_position_size,
        spread_bps / 100.0,
        cancel_replace_interval_s, quote_refresh_on_price_change * 100.0,
        min_edge_bps / 100.0,
        max_daily_loss,
        max_daily_trades,
        mask_address(creds.address).c_str());
    return std::string(buf);
}
