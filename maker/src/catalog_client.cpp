#include "catalog_client.hpp"
#include "log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static std::string id_to_string(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    return std::string();
}

// Gamma fields are often null or string-typed; only a real boolean counts.
static bool flag(const json& m, const char* key) {
    auto it = m.find(key);
    return it != m.end() && it->is_boolean() && it->get<bool>();
}

static std::vector<std::string> parse_token_ids(const json& m) {
    std::vector<std::string> out;

    if (m.contains("tokens") && m["tokens"].is_array()) {
        for (const auto& t : m["tokens"]) {
            if (!t.is_object() || !t.contains("token_id")) continue;
            std::string s = id_to_string(t["token_id"]);
            if (!s.empty()) out.push_back(s);
        }
        if (!out.empty()) return out;
    }

    if (m.contains("clobTokenIds")) {
        json ids = m["clobTokenIds"];
        if (ids.is_string()) ids = json::parse(ids.get<std::string>(), nullptr, false);
        if (ids.is_array()) {
            for (const auto& t : ids) {
                std::string s = id_to_string(t);
                if (!s.empty()) out.push_back(s);
            }
        }
    }
    return out;
}

GammaCatalogClient::GammaCatalogClient(std::string gamma_url, long timeout_ms)
    : gamma_url_(std::move(gamma_url)), http_(timeout_ms) {}

std::vector<CatalogEntry> GammaCatalogClient::active_instruments() {
    HttpResponse r = http_.get(gamma_url_ + "/markets?active=true&closed=false&limit=500");
    if (!r.ok()) {
        log_error("GAMMA", "Failed to fetch markets: ",
                  r.error.empty() ? ("http " + std::to_string(r.status)) : r.error);
        return {};
    }

    auto markets = parse_markets(r.body);
    log_debug("GAMMA", "Fetched ", markets.size(), " active markets");
    return markets;
}

std::vector<CatalogEntry> GammaCatalogClient::parse_markets(const std::string& body) {
    std::vector<CatalogEntry> out;

    json j = json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        log_error("GAMMA", "markets response is not JSON");
        return out;
    }

    // listing is a bare array; the CLOB flavour wraps it in {"data":[...]}
    const json* list = &j;
    if (j.is_object() && j.contains("data")) list = &j["data"];
    if (!list->is_array()) {
        log_error("GAMMA", "markets response is not a list");
        return out;
    }

    std::size_t skipped = 0;
    for (const auto& m : *list) {
        if (!m.is_object()) continue;
        if (!flag(m, "active")) continue;
        if (flag(m, "closed")) continue;

        auto q = m.find("question");
        if (q == m.end() || !q->is_string()) {
            ++skipped;
            continue;
        }

        try {
            CatalogEntry e;
            e.active = true;
            if (m.contains("id")) e.id = id_to_string(m["id"]);
            else if (m.contains("condition_id")) e.id = id_to_string(m["condition_id"]);
            e.description = q->get<std::string>();
            e.token_ids = parse_token_ids(m);
            out.push_back(std::move(e));
        } catch (const json::exception& ex) {
            log_warn("GAMMA", "skipping malformed market: ", ex.what());
            ++skipped;
        }
    }
    if (skipped)
        log_debug("GAMMA", "skipped ", skipped, " malformed markets");
    return out;
}
