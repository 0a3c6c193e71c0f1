#include <gtest/gtest.h>
#include "catalog_client.hpp"

TEST(CatalogParseTest, BareArrayWithClobTokenIdsString) {
    const std::string body = R"([
        {"id":"512","question":"Bitcoin above $83,000 in 15 minutes?","active":true,
         "closed":false,"clobTokenIds":"[\"111\",\"222\"]"},
        {"id":"513","question":"Closed one","active":true,"closed":true,
         "clobTokenIds":"[\"333\",\"444\"]"},
        {"id":"514","question":"Inactive","active":false}
    ])";
    auto v = GammaCatalogClient::parse_markets(body);
    ASSERT_EQ(v.size(), 1u);
    EXPECT_EQ(v[0].id, "512");
    EXPECT_TRUE(v[0].active);
    ASSERT_EQ(v[0].token_ids.size(), 2u);
    EXPECT_EQ(v[0].token_ids[0], "111");
    EXPECT_EQ(v[0].token_ids[1], "222");
}

TEST(CatalogParseTest, DataEnvelopeWithTokenObjects) {
    const std::string body = R"({"data":[
        {"condition_id":"0xabc","question":"BTC above $90,000?","active":true,
         "tokens":[{"token_id":"y1","outcome":"Yes"},{"token_id":"n1","outcome":"No"}]}
    ]})";
    auto v = GammaCatalogClient::parse_markets(body);
    ASSERT_EQ(v.size(), 1u);
    EXPECT_EQ(v[0].id, "0xabc");
    EXPECT_EQ(v[0].description, "BTC above $90,000?");
    ASSERT_EQ(v[0].token_ids.size(), 2u);
    EXPECT_EQ(v[0].token_ids[0], "y1");
}

TEST(CatalogParseTest, NumericIdsAreStringified) {
    auto v = GammaCatalogClient::parse_markets(
        R"([{"id":42,"question":"q","active":true,"clobTokenIds":[7,8]}])");
    ASSERT_EQ(v.size(), 1u);
    EXPECT_EQ(v[0].id, "42");
    EXPECT_EQ(v[0].token_ids[0], "7");
}

TEST(CatalogParseTest, GarbageYieldsEmpty) {
    EXPECT_TRUE(GammaCatalogClient::parse_markets("<html>").empty());
    EXPECT_TRUE(GammaCatalogClient::parse_markets(R"({"error":"rate limited"})").empty());
    EXPECT_TRUE(GammaCatalogClient::parse_markets("[]").empty());
}

TEST(CatalogParseTest, NullAndMistypedFieldsSkipOnlyThatEntry) {
    const std::string body = R"([
        {"id":"600","question":null,"active":true,"clobTokenIds":"[\"1\",\"2\"]"},
        {"id":"601","question":"Bitcoin above $82,000 in 15 minutes?","active":"true",
         "clobTokenIds":"[\"3\",\"4\"]"},
        {"id":"602","question":"Bitcoin above $84,000 in 15 minutes?","active":null},
        {"id":"603","question":42,"active":true,"closed":null},
        {"id":"604","question":"Bitcoin above $83,000 in 15 minutes?","active":true,
         "closed":null,"clobTokenIds":"[\"yes-83\",\"no-83\"]"}
    ])";
    std::vector<CatalogEntry> v;
    ASSERT_NO_THROW(v = GammaCatalogClient::parse_markets(body));
    ASSERT_EQ(v.size(), 1u);
    EXPECT_EQ(v[0].id, "604");
    ASSERT_EQ(v[0].token_ids.size(), 2u);
    EXPECT_EQ(v[0].token_ids[0], "yes-83");
}

TEST(CatalogParseTest, MistypedTokenFieldsLeaveEntryTokenless) {
    auto v = GammaCatalogClient::parse_markets(
        R"([{"id":"700","question":"q","active":true,
             "tokens":[{"token_id":null}],"clobTokenIds":{"a":1}}])");
    ASSERT_EQ(v.size(), 1u);
    EXPECT_TRUE(v[0].token_ids.empty());
}
