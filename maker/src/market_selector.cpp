#include "market_selector.hpp"
#include "log.hpp"

#include <cctype>
#include <regex>

static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::optional<double> extract_strike(const std::string& description) {
    static const std::regex re(R"(\$\s?([0-9]{1,3}(?:,[0-9]{3})+|[0-9]+)(\.[0-9]+)?)");

    std::smatch m;
    if (!std::regex_search(description, m, re)) return std::nullopt;

    std::string digits;
    for (char c : m[1].str()) {
        if (c != ',') digits.push_back(c);
    }
    if (m[2].matched) digits += m[2].str();

    try {
        return std::stod(digits);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool matches_duration(const std::string& description, const std::string& duration_class) {
    const std::string d = to_lower(description);
    const std::string cls = to_lower(duration_class);
    if (cls.empty()) return false;
    if (d.find(cls) != std::string::npos) return true;

    // spelled-out form: "15m" -> "15 minute", "1h" -> "1 hour"
    const char unit = cls.back();
    const std::string qty = cls.substr(0, cls.size() - 1);
    if (qty.empty()) return false;

    std::string spelled;
    if (unit == 'm') spelled = qty + " minute";
    else if (unit == 'h') spelled = qty + " hour";
    else return false;

    return d.find(spelled) != std::string::npos;
}

MarketSelector::MarketSelector(ICatalogClient& catalog, std::vector<std::string> keywords)
    : catalog_(catalog)
{
    for (auto& k : keywords) keywords_.push_back(to_lower(k));
}

bool MarketSelector::matches_symbol(const std::string& lower_description) const {
    for (const auto& k : keywords_) {
        if (!k.empty() && lower_description.find(k) != std::string::npos) return true;
    }
    return false;
}

Instrument MarketSelector::select(const std::string& duration_class) {
    std::vector<CatalogEntry> listing = catalog_.active_instruments();

    const CatalogEntry* pick = nullptr;
    for (const auto& e : listing) {
        if (!e.active || e.token_ids.empty()) continue;
        const std::string d = to_lower(e.description);
        if (!matches_symbol(d) || !matches_duration(d, duration_class)) continue;
        pick = &e;
        break;
    }

    if (!pick) {
        log_error("SELECT", "No active ", duration_class, " markets found among ",
                  listing.size(), " listed");
        throw SelectionError(SelectionError::Reason::NoActiveInstrument,
                             "no active " + duration_class + " instrument");
    }

    std::optional<double> strike = extract_strike(pick->description);
    if (!strike) {
        log_error("SELECT", "Could not extract strike price from: ", pick->description);
        throw SelectionError(SelectionError::Reason::NoStrikeFound,
                             "no strike in '" + pick->description + "'");
    }

    Instrument inst;
    inst.id          = pick->id;
    inst.description = pick->description;
    inst.strike      = *strike;
    inst.yes_token   = pick->token_ids[0];
    if (pick->token_ids.size() > 1) inst.no_token = pick->token_ids[1];

    log_info("SELECT", "Selected market: ", inst.description);
    log_info("SELECT", "Strike: $", inst.strike, " | Token ID: ",
             inst.yes_token.substr(0, 16), "...");
    return inst;
}
