#pragma once
#include "engine_config.hpp"
#include "exchange_client.hpp"
#include "http_client.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

// Produces the EIP-712 signature for an order payload (wallet key handling
// lives outside this process). Returns nullopt if it cannot sign.
using OrderSigner = std::function<std::optional<std::string>(const nlohmann::json& order)>;

// url-safe base64 HMAC-SHA256 over ts + method + path + body, keyed with the
// base64-decoded API secret.
std::string poly_l2_signature(const std::string& secret_b64,
                              long long ts_sec,
                              const std::string& method,
                              const std::string& request_path,
                              const std::string& body);

// Polymarket CLOB REST client (live mode). Calls authenticate with L2 headers.
class PolymarketClient : public IExchangeClient {
public:
    PolymarketClient(std::string clob_url,
                     ApiCredentials creds,
                     long timeout_ms,
                     OrderSigner signer = nullptr);

    // Credentials present and a signer installed.
    bool ready() const;

    std::optional<std::string> submit(const std::string& token_id, Side side,
                                      double price, double size,
                                      int fee_rate_bps) override;
    bool cancel(const std::string& order_id) override;
    std::optional<std::vector<std::string>> list_open_orders() override;
    std::optional<int> fee_rate(const std::string& token_id) override;
    std::optional<double> balance() override;

    // Unsigned order body as posted to /order (before "signature" is added).
    nlohmann::json build_order(const std::string& token_id, Side side,
                               double price, double size, int fee_rate_bps) const;

    std::vector<std::string> auth_headers(const std::string& method,
                                          const std::string& request_path,
                                          const std::string& body,
                                          long long ts_sec) const;

private:
    std::string clob_url_;
    ApiCredentials creds_;
    HttpClient http_;
    OrderSigner signer_;
};
