#pragma once
#include <string>

struct TickerParse {
    enum class Kind {
        Price,     // 24hrTicker for our symbol with a positive close
        Ignored,   // well-formed but not a price (subscription ack, other symbol)
        Malformed  // not JSON, or a ticker without a usable price
    };

    Kind kind = Kind::Ignored;
    double price = 0.0;
};

// Binance 24hrTicker frame:
//   {"e":"24hrTicker","E":1700000000000,"s":"BTCUSDT","c":"50000.00",...}
// Combined-stream envelopes ({"stream":..,"data":{..}}) are unwrapped.
TickerParse parse_ticker_frame(const std::string& text, const std::string& symbol);
