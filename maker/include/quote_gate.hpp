#pragma once

// Taker fees peak at 0.50, so quoting there cannot pay. Veto (false) iff
// |fair - 0.50| < min_edge_bps / 10000 / 2. Strict: exactly at the boundary
// quoting is allowed.
bool quote_gate_allows(double fair_price, double min_edge_bps);
