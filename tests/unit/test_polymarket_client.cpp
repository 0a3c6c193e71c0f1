#include <gtest/gtest.h>
#include "polymarket_client.hpp"

static ApiCredentials creds() {
    ApiCredentials c;
    c.api_key = "api-key";
    c.api_secret = "c2VjcmV0";   // "secret"
    c.passphrase = "pass";
    c.address = "0x1234567890abcdef1234567890abcdef12345678";
    return c;
}

TEST(PolySignatureTest, MatchesReferenceHmac) {
    EXPECT_EQ(poly_l2_signature("c2VjcmV0", 1700000000, "POST", "/order", R"({"a":1})"),
              "RG08Lr_BXWneCX42aD1tpDtvA9AAzyktUouVy2A61gk=");
    EXPECT_EQ(poly_l2_signature("c2VjcmV0", 1700000000, "GET", "/data/orders", ""),
              "rght4Ai-8fubeLpGeBeoKAOna_ak8s8DmrlZwiqNDRU=");
}

TEST(PolymarketClientTest, AuthHeadersCarryAllFields) {
    PolymarketClient c("https://clob.example", creds(), 1000);
    auto h = c.auth_headers("GET", "/data/orders", "", 1700000000);
    ASSERT_EQ(h.size(), 5u);
    EXPECT_EQ(h[0], "POLY_ADDRESS: 0x1234567890abcdef1234567890abcdef12345678");
    EXPECT_EQ(h[1], "POLY_SIGNATURE: rght4Ai-8fubeLpGeBeoKAOna_ak8s8DmrlZwiqNDRU=");
    EXPECT_EQ(h[2], "POLY_TIMESTAMP: 1700000000");
    EXPECT_EQ(h[3], "POLY_API_KEY: api-key");
    EXPECT_EQ(h[4], "POLY_PASSPHRASE: pass");
}

TEST(PolymarketClientTest, BuyOrderAmounts) {
    PolymarketClient c("https://clob.example", creds(), 1000);
    auto o = c.build_order("tok-1", Side::Buy, 0.45, 10.0, 7);
    EXPECT_EQ(o["tokenId"], "tok-1");
    EXPECT_EQ(o["side"], "BUY");
    EXPECT_EQ(o["makerAmount"], "4500000");   // USDC paid
    EXPECT_EQ(o["takerAmount"], "10000000");  // shares received
    EXPECT_EQ(o["feeRateBps"], "7");
    EXPECT_EQ(o["maker"], creds().address);
}

TEST(PolymarketClientTest, SellOrderAmounts) {
    PolymarketClient c("https://clob.example", creds(), 1000);
    auto o = c.build_order("tok-1", Side::Sell, 0.55, 10.0, 0);
    EXPECT_EQ(o["side"], "SELL");
    EXPECT_EQ(o["makerAmount"], "10000000");
    EXPECT_EQ(o["takerAmount"], "5500000");
}

TEST(PolymarketClientTest, NoSignerMeansNoSubmission) {
    PolymarketClient c("https://clob.invalid", creds(), 1000);
    EXPECT_FALSE(c.ready());
    EXPECT_FALSE(c.submit("tok-1", Side::Buy, 0.45, 10.0, 0).has_value());
}

TEST(PolymarketClientTest, DecliningSignerMeansNoSubmission) {
    int calls = 0;
    PolymarketClient c("https://clob.invalid", creds(), 1000,
                       [&](const nlohmann::json&) -> std::optional<std::string> {
                           ++calls;
                           return std::nullopt;
                       });
    EXPECT_TRUE(c.ready());
    EXPECT_FALSE(c.submit("tok-1", Side::Buy, 0.45, 10.0, 0).has_value());
    EXPECT_EQ(calls, 1);
}
