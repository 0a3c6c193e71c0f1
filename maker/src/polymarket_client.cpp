#include "polymarket_client.hpp"
#include "log.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <chrono>
#include <cmath>
#include <random>

using json = nlohmann::json;

static const char* ZERO_ADDRESS = "0x0000000000000000000000000000000000000000";

static long long now_sec() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

static std::string b64url_decode(const std::string& in) {
    std::string s = in;
    for (auto& c : s) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
    }
    while (s.size() % 4 != 0) s.push_back('=');

    std::string out(s.size() / 4 * 3, '\0');
    int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(s.data()),
                            static_cast<int>(s.size()));
    if (n < 0) return std::string();

    // EVP_DecodeBlock counts padding as zero bytes
    std::size_t pad = 0;
    if (!s.empty() && s[s.size() - 1] == '=') ++pad;
    if (s.size() > 1 && s[s.size() - 2] == '=') ++pad;
    out.resize(static_cast<std::size_t>(n) - pad);
    return out;
}

static std::string b64url_encode(const unsigned char* data, std::size_t len) {
    std::string out(4 * ((len + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data,
                            static_cast<int>(len));
    out.resize(static_cast<std::size_t>(n));
    for (auto& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

std::string poly_l2_signature(const std::string& secret_b64,
                              long long ts_sec,
                              const std::string& method,
                              const std::string& request_path,
                              const std::string& body) {
    const std::string key = b64url_decode(secret_b64);
    const std::string msg = std::to_string(ts_sec) + method + request_path + body;

    unsigned int outlen = 0;
    unsigned char out[EVP_MAX_MD_SIZE];
    HMAC(EVP_sha256(),
         key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(msg.data()), msg.size(),
         out, &outlen);
    return b64url_encode(out, outlen);
}

// 6-decimal fixed point used by the CTF exchange for both USDC and shares
static std::string to_base_units(double x) {
    return std::to_string(static_cast<long long>(std::llround(x * 1e6)));
}

PolymarketClient::PolymarketClient(std::string clob_url,
                                   ApiCredentials creds,
                                   long timeout_ms,
                                   OrderSigner signer)
    : clob_url_(std::move(clob_url)),
      creds_(std::move(creds)),
      http_(timeout_ms),
      signer_(std::move(signer))
{}

bool PolymarketClient::ready() const {
    return creds_.complete() && static_cast<bool>(signer_);
}

std::vector<std::string> PolymarketClient::auth_headers(const std::string& method,
                                                        const std::string& request_path,
                                                        const std::string& body,
                                                        long long ts_sec) const {
    const std::string sig = poly_l2_signature(creds_.api_secret, ts_sec, method,
                                              request_path, body);
    return {
        "POLY_ADDRESS: " + creds_.address,
        "POLY_SIGNATURE: " + sig,
        "POLY_TIMESTAMP: " + std::to_string(ts_sec),
        "POLY_API_KEY: " + creds_.api_key,
        "POLY_PASSPHRASE: " + creds_.passphrase,
    };
}

json PolymarketClient::build_order(const std::string& token_id, Side side,
                                   double price, double size, int fee_rate_bps) const {
    static thread_local std::mt19937_64 rng{std::random_device{}()};

    const double notional = price * size;
    const bool buy = (side == Side::Buy);

    json order;
    order["salt"]          = static_cast<long long>(rng() >> 12);
    order["maker"]         = creds_.address;
    order["signer"]        = creds_.address;
    order["taker"]         = ZERO_ADDRESS;
    order["tokenId"]       = token_id;
    order["makerAmount"]   = to_base_units(buy ? notional : size);
    order["takerAmount"]   = to_base_units(buy ? size : notional);
    order["expiration"]    = "0";
    order["nonce"]         = "0";
    order["feeRateBps"]    = std::to_string(fee_rate_bps);
    order["side"]          = side_str(side);
    order["signatureType"] = 0;
    return order;
}

std::optional<std::string> PolymarketClient::submit(const std::string& token_id,
                                                    Side side,
                                                    double price,
                                                    double size,
                                                    int fee_rate_bps) {
    if (!signer_) {
        log_error("POLY", "no order signer configured; ", side_str(side),
                  " order not submitted");
        return std::nullopt;
    }

    json order = build_order(token_id, side, price, size, fee_rate_bps);
    std::optional<std::string> sig = signer_(order);
    if (!sig) {
        log_error("POLY", "order signer declined ", side_str(side), " order");
        return std::nullopt;
    }
    order["signature"] = *sig;

    json body;
    body["order"]     = order;
    body["owner"]     = creds_.api_key;
    body["orderType"] = "GTC";
    const std::string payload = body.dump();

    const std::string path = "/order";
    HttpResponse r = http_.post(clob_url_ + path, payload,
                                auth_headers("POST", path, payload, now_sec()));
    if (!r.error.empty()) {
        log_error("POLY", "Failed to create order: ", r.error);
        return std::nullopt;
    }

    json j = json::parse(r.body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        log_error("POLY", "Failed to create order: http ", r.status, " ", r.body.substr(0, 200));
        return std::nullopt;
    }

    std::string id;
    try {
        id = j.value("orderID", std::string());
        if (!r.ok() || !j.value("success", false) || id.empty()) {
            log_error("POLY", "Failed to create order: http ", r.status, " ",
                      j.value("errorMsg", j.value("error", std::string("unknown"))));
            return std::nullopt;
        }
    } catch (const json::exception& ex) {
        log_error("POLY", "Failed to create order: http ", r.status, " ", ex.what());
        return std::nullopt;
    }

    log_info("POLY", "Created ", side_str(side), " order ", id.substr(0, 10), ": ",
             size, " @ $", price);
    return id;
}

bool PolymarketClient::cancel(const std::string& order_id) {
    json body;
    body["orderID"] = order_id;
    const std::string payload = body.dump();

    const std::string path = "/order";
    HttpResponse r = http_.del(clob_url_ + path, payload,
                               auth_headers("DELETE", path, payload, now_sec()));
    if (!r.ok()) {
        log_warn("POLY", "Failed to cancel order ", order_id.substr(0, 10), ": ",
                 r.error.empty() ? ("http " + std::to_string(r.status)) : r.error);
        return false;
    }

    json j = json::parse(r.body, nullptr, false);
    if (j.is_discarded() || !j.contains("canceled") || !j["canceled"].is_array()) {
        log_warn("POLY", "Unexpected cancel response for ", order_id.substr(0, 10));
        return false;
    }
    for (const auto& c : j["canceled"]) {
        if (c.is_string() && c.get<std::string>() == order_id) {
            log_debug("POLY", "Cancelled order ", order_id.substr(0, 10));
            return true;
        }
    }

    std::string reason = "not cancelled";
    if (j.contains("not_canceled") && j["not_canceled"].is_object() &&
        j["not_canceled"].contains(order_id)) {
        reason = j["not_canceled"][order_id].dump();
    }
    log_warn("POLY", "Failed to cancel order ", order_id.substr(0, 10), ": ", reason);
    return false;
}

std::optional<std::vector<std::string>> PolymarketClient::list_open_orders() {
    static const std::string END_CURSOR = "LTE=";
    const std::string path = "/data/orders";

    std::vector<std::string> ids;
    std::string cursor = "MA==";

    for (int page = 0; page < 20 && cursor != END_CURSOR; ++page) {
        HttpResponse r = http_.get(clob_url_ + path + "?next_cursor=" + cursor,
                                   auth_headers("GET", path, "", now_sec()));
        if (!r.ok()) {
            log_error("POLY", "Failed to list open orders: ",
                      r.error.empty() ? ("http " + std::to_string(r.status)) : r.error);
            return std::nullopt;
        }

        json j = json::parse(r.body, nullptr, false);
        if (j.is_discarded() || !j.contains("data") || !j["data"].is_array()) {
            log_error("POLY", "Unexpected open-orders response");
            return std::nullopt;
        }
        for (const auto& o : j["data"]) {
            if (o.contains("id") && o["id"].is_string())
                ids.push_back(o["id"].get<std::string>());
        }
        auto nc = j.find("next_cursor");
        if (nc == j.end() || !nc->is_string()) break;
        cursor = nc->get<std::string>();
        if (cursor.empty()) break;
    }
    return ids;
}

std::optional<int> PolymarketClient::fee_rate(const std::string& token_id) {
    HttpResponse r = http_.get(clob_url_ + "/fee-rate?token_id=" + token_id);
    if (!r.ok()) {
        log_warn("POLY", "Failed to get fee rate: ",
                 r.error.empty() ? ("http " + std::to_string(r.status)) : r.error);
        return std::nullopt;
    }

    json j = json::parse(r.body, nullptr, false);
    if (j.is_discarded() || !j.contains("base_fee")) {
        log_warn("POLY", "Fee rate response without base_fee");
        return std::nullopt;
    }

    try {
        const json& f = j["base_fee"];
        int bps = f.is_string() ? std::stoi(f.get<std::string>()) : f.get<int>();
        log_debug("POLY", "Token ", token_id.substr(0, 8), "...: ", bps, " bps fee");
        return bps;
    } catch (const std::exception& e) {
        log_warn("POLY", "Bad base_fee: ", e.what());
        return std::nullopt;
    }
}

std::optional<double> PolymarketClient::balance() {
    const std::string path = "/balance-allowance";
    HttpResponse r = http_.get(clob_url_ + path + "?asset_type=COLLATERAL&signature_type=0",
                               auth_headers("GET", path, "", now_sec()));
    if (!r.ok()) {
        log_error("POLY", "Failed to get balance: ",
                  r.error.empty() ? ("http " + std::to_string(r.status)) : r.error);
        return std::nullopt;
    }

    json j = json::parse(r.body, nullptr, false);
    if (j.is_discarded() || !j.contains("balance")) return std::nullopt;

    try {
        const json& b = j["balance"];
        double raw = b.is_string() ? std::stod(b.get<std::string>()) : b.get<double>();
        return raw / 1e6;
    } catch (const std::exception& e) {
        log_error("POLY", "Bad balance value: ", e.what());
        return std::nullopt;
    }
}
