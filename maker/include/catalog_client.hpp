#pragma once
#include "http_client.hpp"

#include <string>
#include <vector>

struct CatalogEntry {
    std::string id;
    std::string description;               // market question
    bool active = false;
    std::vector<std::string> token_ids;    // outcome tokens, YES first
};

class ICatalogClient {
public:
    virtual ~ICatalogClient() = default;

    // Active instruments in the order the listing returns them.
    // Empty on transport or parse failure.
    virtual std::vector<CatalogEntry> active_instruments() = 0;
};

// Gamma markets listing (REST).
class GammaCatalogClient : public ICatalogClient {
public:
    GammaCatalogClient(std::string gamma_url, long timeout_ms);

    std::vector<CatalogEntry> active_instruments() override;

    // Accepts both "tokens":[{"token_id":..}] and the JSON-encoded
    // "clobTokenIds" string. Keeps active entries only.
    static std::vector<CatalogEntry> parse_markets(const std::string& body);

private:
    std::string gamma_url_;
    HttpClient http_;
};
