#pragma once
#include "catalog_client.hpp"
#include "instrument.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class SelectionError : public std::runtime_error {
public:
    enum class Reason { NoActiveInstrument, NoStrikeFound };

    SelectionError(Reason r, const std::string& what)
        : std::runtime_error(what), reason_(r) {}

    Reason reason() const { return reason_; }

private:
    Reason reason_;
};

// "$83,000" -> 83000, "$2,450.50" -> 2450.5. First currency amount wins.
std::optional<double> extract_strike(const std::string& description);

// "15m" matches "15m" or "15 minute"; "1h" matches "1h" or "1 hour".
bool matches_duration(const std::string& description, const std::string& duration_class);

class MarketSelector {
public:
    MarketSelector(ICatalogClient& catalog, std::vector<std::string> keywords);

    // Throws SelectionError. Picks the first match in listing order.
    Instrument select(const std::string& duration_class);

private:
    bool matches_symbol(const std::string& lower_description) const;

    ICatalogClient& catalog_;
    std::vector<std::string> keywords_; // lower-case
};
