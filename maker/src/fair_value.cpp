#include "fair_value.hpp"
#include <algorithm>
#include <cmath>

double clamp_price(double p) {
    if (std::isnan(p)) return 0.50;
    return std::max(FAIR_PRICE_MIN, std::min(FAIR_PRICE_MAX, p));
}

double fair_price(double reference_price, double strike) {
    const double d = reference_price - strike;
    if (std::isnan(d)) return 0.50;

    const double ad = std::abs(d);
    double p;
    if (ad < 100.0)       p = 0.50 + (d / 100.0) * 0.01; // 1% per $100
    else if (ad < 300.0)  p = d > 0 ? 0.60 : 0.40;
    else if (ad < 500.0)  p = d > 0 ? 0.75 : 0.25;
    else                  p = d > 0 ? 0.90 : 0.10;

    // table stays inside the range today; the clamp keeps it that way
    return clamp_price(p);
}
