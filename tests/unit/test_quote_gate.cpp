#include <gtest/gtest.h>
#include "quote_gate.hpp"

#include <limits>

TEST(QuoteGateTest, VetoesAtHalf) {
    EXPECT_FALSE(quote_gate_allows(0.50, 200));
}

TEST(QuoteGateTest, AllowsWellAwayFromHalf) {
    EXPECT_TRUE(quote_gate_allows(0.60, 200));
    EXPECT_TRUE(quote_gate_allows(0.40, 200));
    EXPECT_TRUE(quote_gate_allows(0.90, 200));
    EXPECT_TRUE(quote_gate_allows(0.10, 200));
}

// 200 bps -> required distance 0.01
TEST(QuoteGateTest, BracketsTheBoundary) {
    EXPECT_TRUE(quote_gate_allows(0.489, 200));   // distance 0.011
    EXPECT_FALSE(quote_gate_allows(0.491, 200));  // distance 0.009
    EXPECT_TRUE(quote_gate_allows(0.511, 200));
    EXPECT_FALSE(quote_gate_allows(0.509, 200));
}

TEST(QuoteGateTest, ZeroEdgeNeverVetoes) {
    EXPECT_TRUE(quote_gate_allows(0.50, 0));
    EXPECT_TRUE(quote_gate_allows(0.5001, 0));
}

TEST(QuoteGateTest, WideEdgeVetoesMiddleBand) {
    // 2000 bps -> 0.10
    EXPECT_FALSE(quote_gate_allows(0.59, 2000));
    EXPECT_TRUE(quote_gate_allows(0.75, 2000));
}

TEST(QuoteGateTest, NaNIsVetoed) {
    EXPECT_FALSE(quote_gate_allows(std::numeric_limits<double>::quiet_NaN(), 200));
}
