#include <gtest/gtest.h>
#include "fakes.hpp"
#include "catalog_client.hpp"
#include "market_selector.hpp"

TEST(StrikeExtractionTest, CommaGroupedAmount) {
    auto s = extract_strike("Will Bitcoin be above $83,000 at 3:15PM ET?");
    ASSERT_TRUE(s.has_value());
    EXPECT_DOUBLE_EQ(*s, 83000.0);
}

TEST(StrikeExtractionTest, DecimalsAndPlainDigits) {
    EXPECT_DOUBLE_EQ(*extract_strike("ETH above $2,450.50 in 15 minutes"), 2450.5);
    EXPECT_DOUBLE_EQ(*extract_strike("BTC over $97000?"), 97000.0);
    EXPECT_DOUBLE_EQ(*extract_strike("BTC over $ 97000?"), 97000.0);
}

TEST(StrikeExtractionTest, FirstAmountWins) {
    EXPECT_DOUBLE_EQ(*extract_strike("BTC $84,000 or $85,000"), 84000.0);
}

TEST(StrikeExtractionTest, NoAmount) {
    EXPECT_FALSE(extract_strike("Bitcoin up or down in 15 minutes?").has_value());
    EXPECT_FALSE(extract_strike("").has_value());
}

TEST(DurationMatchTest, ShortAndSpelledForms) {
    EXPECT_TRUE(matches_duration("BTC 15m market", "15m"));
    EXPECT_TRUE(matches_duration("Bitcoin in 15 minutes", "15m"));
    EXPECT_TRUE(matches_duration("Bitcoin in 1 hour", "1h"));
    EXPECT_FALSE(matches_duration("Bitcoin in 5 minutes", "15m"));
    EXPECT_FALSE(matches_duration("anything", ""));
}

class MarketSelectorTest : public ::testing::Test {
protected:
    FakeCatalog catalog;
    MarketSelector selector{catalog, {"BTC", "bitcoin"}};
};

TEST_F(MarketSelectorTest, PicksFirstMatchInListingOrder) {
    catalog.add("m0", "Will ETH be above $3,000 in 15 minutes?");
    catalog.add("m1", "Will Bitcoin be above $83,000 in 15 minutes?", {"yes-1", "no-1"});
    catalog.add("m2", "Will BTC be above $84,000 in 15 minutes?", {"yes-2", "no-2"});

    Instrument inst = selector.select("15m");
    EXPECT_EQ(inst.id, "m1");
    EXPECT_DOUBLE_EQ(inst.strike, 83000.0);
    EXPECT_EQ(inst.yes_token, "yes-1");
    EXPECT_EQ(inst.no_token, "no-1");
    EXPECT_EQ(catalog.calls, 1);
}

TEST_F(MarketSelectorTest, SkipsInactiveAndTokenless) {
    catalog.add("m1", "Bitcoin above $80,000 in 15 minutes", {"y", "n"}, false);
    catalog.add("m2", "Bitcoin above $81,000 in 15 minutes", {});
    catalog.add("m3", "Bitcoin above $82,000 in 15 minutes");

    EXPECT_EQ(selector.select("15m").id, "m3");
}

TEST_F(MarketSelectorTest, EmptyListingIsNoActiveInstrument) {
    try {
        selector.select("15m");
        FAIL() << "expected SelectionError";
    } catch (const SelectionError& e) {
        EXPECT_EQ(e.reason(), SelectionError::Reason::NoActiveInstrument);
    }
}

TEST_F(MarketSelectorTest, WrongDurationIsNoActiveInstrument) {
    catalog.add("m1", "Bitcoin above $80,000 in 1 hour");
    try {
        selector.select("15m");
        FAIL() << "expected SelectionError";
    } catch (const SelectionError& e) {
        EXPECT_EQ(e.reason(), SelectionError::Reason::NoActiveInstrument);
    }
}

TEST_F(MarketSelectorTest, MatchWithoutStrikeIsNoStrikeFound) {
    catalog.add("m1", "Bitcoin up or down in 15 minutes?");
    catalog.add("m2", "Bitcoin above $80,000 in 15 minutes");
    try {
        selector.select("15m");
        FAIL() << "expected SelectionError";
    } catch (const SelectionError& e) {
        EXPECT_EQ(e.reason(), SelectionError::Reason::NoStrikeFound);
    }
}

TEST_F(MarketSelectorTest, MalformedListingEntriesDoNotHideValidMarket) {
    catalog.entries = GammaCatalogClient::parse_markets(R"([
        {"id":"m1","question":null,"active":true,"clobTokenIds":"[\"a\",\"b\"]"},
        {"id":"m2","question":"Will Bitcoin be above $83,000 in 15 minutes?",
         "active":true,"closed":null,"clobTokenIds":"[\"yes-2\",\"no-2\"]"}
    ])");

    Instrument inst = selector.select("15m");
    EXPECT_EQ(inst.id, "m2");
    EXPECT_DOUBLE_EQ(inst.strike, 83000.0);
    EXPECT_EQ(inst.yes_token, "yes-2");
}
