#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

// What one triggered requote cycle decided and did.
struct CycleReport {
    std::int64_t ts_ms = 0;          // wall clock
    std::string instrument_id;
    double reference_price = 0.0;
    double strike = 0.0;
    double fair_price = 0.0;
    bool vetoed = false;

    double buy_price = 0.0;
    double sell_price = 0.0;
    double size = 0.0;
    std::optional<std::string> buy_id;
    std::optional<std::string> sell_id;
};

using CycleSink = std::function<void(const CycleReport&)>;

std::string cycle_report_json(const CycleReport& r);
