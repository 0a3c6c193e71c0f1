#pragma once
#include <string>

enum class Side { Buy, Sell };

inline const char* side_str(Side s) { return s == Side::Buy ? "BUY" : "SELL"; }

// Two-sided quote derived each requote cycle; never stored.
struct QuoteIntent {
    double buy_price  = 0.0;
    double sell_price = 0.0;
    double size       = 0.0;
};

// An order this engine believes is resting at the exchange.
struct RestingOrder {
    std::string order_id;
    Side side = Side::Buy;
    double price = 0.0;
    double size  = 0.0;
};
