#include "TickerParser.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cmath>

using json = nlohmann::json;

static bool same_symbol(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

TickerParse parse_ticker_frame(const std::string& text, const std::string& symbol) {
    TickerParse out;

    json msg = json::parse(text, nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) {
        out.kind = TickerParse::Kind::Malformed;
        return out;
    }

    if (msg.contains("stream") && msg.contains("data") && msg["data"].is_object()) {
        json inner = msg["data"];
        msg = std::move(inner);
    }

    if (!msg.contains("e") || !msg["e"].is_string() ||
        msg["e"].get<std::string>() != "24hrTicker") {
        return out; // ack / unrelated event
    }

    if (msg.contains("s") && msg["s"].is_string() &&
        !same_symbol(msg["s"].get<std::string>(), symbol)) {
        return out;
    }

    if (!msg.contains("c")) {
        out.kind = TickerParse::Kind::Malformed;
        return out;
    }

    double px = 0.0;
    const json& c = msg["c"];
    try {
        if (c.is_string())      px = std::stod(c.get<std::string>());
        else if (c.is_number()) px = c.get<double>();
        else {
            out.kind = TickerParse::Kind::Malformed;
            return out;
        }
    } catch (const std::exception&) {
        out.kind = TickerParse::Kind::Malformed;
        return out;
    }

    if (!std::isfinite(px) || px <= 0.0) {
        out.kind = TickerParse::Kind::Malformed;
        return out;
    }

    out.kind = TickerParse::Kind::Price;
    out.price = px;
    return out;
}
