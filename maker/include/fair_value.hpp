#pragma once

constexpr double FAIR_PRICE_MIN = 0.01;
constexpr double FAIR_PRICE_MAX = 0.99;

// Piecewise map of (reference - strike) in dollars to a YES price, symmetric
// around 0.50. Deterministic, total, result always in [0.01, 0.99].
double fair_price(double reference_price, double strike);

double clamp_price(double p);
