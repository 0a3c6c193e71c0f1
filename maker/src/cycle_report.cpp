#include "cycle_report.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::string cycle_report_json(const CycleReport& r) {
    json j;
    j["ts_ms"]           = r.ts_ms;
    j["instrument"]      = r.instrument_id;
    j["reference_price"] = r.reference_price;
    j["strike"]          = r.strike;
    j["fair_price"]      = r.fair_price;
    j["vetoed"]          = r.vetoed;

    if (!r.vetoed) {
        j["buy_price"]  = r.buy_price;
        j["sell_price"] = r.sell_price;
        j["size"]       = r.size;
        j["buy_id"]     = r.buy_id ? json(*r.buy_id) : json(nullptr);
        j["sell_id"]    = r.sell_id ? json(*r.sell_id) : json(nullptr);
    }
    return j.dump();
}
