#include "quote_gate.hpp"
#include <cmath>

bool quote_gate_allows(double fair_price, double min_edge_bps) {
    if (std::isnan(fair_price)) return false;
    const double distance = std::abs(fair_price - 0.50);
    const double required = min_edge_bps / 10000.0 / 2.0;
    return !(distance < required);
}
