#include <gtest/gtest.h>
#include "cycle_report.hpp"
#include "storage/quote_journal.hpp"

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include <cstdio>
#include <string>

namespace {

CycleReport quoted_report() {
    CycleReport r;
    r.ts_ms = 1700000000000;
    r.instrument_id = "m1";
    r.reference_price = 83400.0;
    r.strike = 83000.0;
    r.fair_price = 0.75;
    r.buy_price = 0.7475;
    r.sell_price = 0.7525;
    r.size = 20.0;
    r.buy_id = "ord-1";
    return r;
}

CycleReport vetoed_report() {
    CycleReport r;
    r.ts_ms = 1700000001000;
    r.instrument_id = "m1";
    r.reference_price = 83000.0;
    r.strike = 83000.0;
    r.fair_price = 0.50;
    r.vetoed = true;
    return r;
}

int count_rows(const std::string& path, const char* where) {
    sqlite3* db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        sqlite3_close(db);
        return -1;
    }
    std::string sql = std::string("SELECT COUNT(*) FROM quote_cycles ") + where + ";";
    sqlite3_stmt* st = nullptr;
    int n = -1;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) == SQLITE_OK &&
        sqlite3_step(st) == SQLITE_ROW) {
        n = sqlite3_column_int(st, 0);
    }
    sqlite3_finalize(st);
    sqlite3_close(db);
    return n;
}

} // namespace

class QuoteJournalTest : public ::testing::Test {
protected:
    void TearDown() override {
        std::remove(path.c_str());
        std::remove((path + "-wal").c_str());
        std::remove((path + "-shm").c_str());
    }

    std::string path = "quote_journal_test.db";
};

TEST_F(QuoteJournalTest, WritesEveryCycleOnStop) {
    QuoteJournal j(path, 50);
    ASSERT_TRUE(j.start());
    j.push(quoted_report());
    j.push(vetoed_report());
    j.stop();

    EXPECT_EQ(j.written(), 2u);
    EXPECT_EQ(count_rows(path, ""), 2);
    EXPECT_EQ(count_rows(path, "WHERE vetoed = 1 AND buy_price IS NULL"), 1);
    EXPECT_EQ(count_rows(path, "WHERE buy_order_id = 'ord-1' AND sell_order_id IS NULL"), 1);
}

TEST_F(QuoteJournalTest, PushBeforeStartIsIgnored) {
    QuoteJournal j(path);
    j.push(quoted_report());
    ASSERT_TRUE(j.start());
    j.stop();
    EXPECT_EQ(j.written(), 0u);
}

TEST_F(QuoteJournalTest, BadPathFailsToStart) {
    QuoteJournal j("no/such/dir/journal.db");
    EXPECT_FALSE(j.start());
}

TEST(CycleReportJsonTest, VetoedOmitsQuote) {
    auto j = nlohmann::json::parse(cycle_report_json(vetoed_report()));
    EXPECT_TRUE(j["vetoed"].get<bool>());
    EXPECT_FALSE(j.contains("buy_price"));
    EXPECT_DOUBLE_EQ(j["fair_price"].get<double>(), 0.50);
}

TEST(CycleReportJsonTest, QuotedCarriesIds) {
    auto j = nlohmann::json::parse(cycle_report_json(quoted_report()));
    EXPECT_FALSE(j["vetoed"].get<bool>());
    EXPECT_EQ(j["buy_id"].get<std::string>(), "ord-1");
    EXPECT_TRUE(j["sell_id"].is_null());
    EXPECT_DOUBLE_EQ(j["sell_price"].get<double>(), 0.7525);
}
