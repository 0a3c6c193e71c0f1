#include "quote_journal.hpp"
#include "log.hpp"

#include <chrono>

static void log_sqlite_err(sqlite3* db, const char* where) {
    log_error("JOURNAL", where, " sqlite_err=", db ? sqlite3_errmsg(db) : "null-db");
}

static bool exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        log_error("JOURNAL", "sqlite_exec failed: ", err ? err : "", " [", sql, "]");
        sqlite3_free(err);
        return false;
    }
    return true;
}

QuoteJournal::QuoteJournal(std::string db_path, int flush_ms, std::size_t max_queue)
    : db_path_(std::move(db_path))
    , flush_ms_(flush_ms)
    , max_queue_(max_queue)
{}

QuoteJournal::~QuoteJournal() {
    stop();
}

bool QuoteJournal::start() {
    if (running_.exchange(true)) return true;

    if (!open_connection() || !init_schema_and_pragmas() || !prepare_statements()) {
        running_ = false;
        finalize_statements();
        close_connection();
        return false;
    }

    writer_ = std::thread(&QuoteJournal::writer_loop, this);
    log_info("JOURNAL", "writing cycles to ", db_path_);
    return true;
}

void QuoteJournal::stop() {
    if (!running_.exchange(false)) return;

    cv_.notify_all();
    if (writer_.joinable()) writer_.join();

    finalize_statements();
    close_connection();
    log_info("JOURNAL", "closed (", written_.load(), " written, ",
             dropped_.load(), " dropped)");
}

void QuoteJournal::push(CycleReport r) {
    if (!running_) return;

    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (q_.size() >= max_queue_) {
            q_.pop_front();
            ++dropped_;
        }
        q_.push_back(std::move(r));
    }
    cv_.notify_one();
}

bool QuoteJournal::open_connection() {
    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        log_sqlite_err(db_, "sqlite3_open");
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    return true;
}

void QuoteJournal::close_connection() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool QuoteJournal::init_schema_and_pragmas() {
    if (!exec_sql(db_, "PRAGMA journal_mode=WAL;")) return false;
    if (!exec_sql(db_, "PRAGMA synchronous=NORMAL;")) return false;
    if (!exec_sql(db_, "PRAGMA busy_timeout=2000;")) return false;

    const char* create_sql =
        "CREATE TABLE IF NOT EXISTS quote_cycles ("
        "  ts_ms INTEGER NOT NULL,"
        "  instrument TEXT NOT NULL,"
        "  reference_price REAL NOT NULL,"
        "  strike REAL NOT NULL,"
        "  fair_price REAL NOT NULL,"
        "  vetoed INTEGER NOT NULL,"
        "  buy_price REAL,"
        "  sell_price REAL,"
        "  size REAL,"
        "  buy_order_id TEXT,"
        "  sell_order_id TEXT"
        ");";
    if (!exec_sql(db_, create_sql)) return false;

    if (!exec_sql(db_, "CREATE INDEX IF NOT EXISTS idx_quote_cycles_ts ON quote_cycles(ts_ms);"))
        return false;
    return true;
}

bool QuoteJournal::prepare_statements() {
    const char* ins =
        "INSERT INTO quote_cycles ("
        " ts_ms, instrument, reference_price, strike, fair_price, vetoed,"
        " buy_price, sell_price, size, buy_order_id, sell_order_id"
        ") VALUES (?,?,?,?,?,?,?,?,?,?,?);";

    int rc = sqlite3_prepare_v2(db_, ins, -1, &stmt_insert_, nullptr);
    if (rc != SQLITE_OK) {
        log_sqlite_err(db_, "sqlite3_prepare_v2(insert)");
        stmt_insert_ = nullptr;
        return false;
    }
    return true;
}

void QuoteJournal::finalize_statements() {
    if (stmt_insert_) {
        sqlite3_finalize(stmt_insert_);
        stmt_insert_ = nullptr;
    }
}

static void bind_opt_text(sqlite3_stmt* st, int idx, const std::optional<std::string>& v) {
    if (v) sqlite3_bind_text(st, idx, v->c_str(), -1, SQLITE_TRANSIENT);
    else   sqlite3_bind_null(st, idx);
}

bool QuoteJournal::insert_batch(const std::vector<CycleReport>& batch) {
    if (batch.empty()) return true;

    if (!exec_sql(db_, "BEGIN IMMEDIATE TRANSACTION;")) return false;

    for (const auto& r : batch) {
        sqlite3_reset(stmt_insert_);
        sqlite3_clear_bindings(stmt_insert_);

        int idx = 1;
        sqlite3_bind_int64(stmt_insert_, idx++, static_cast<sqlite3_int64>(r.ts_ms));
        sqlite3_bind_text(stmt_insert_, idx++, r.instrument_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(stmt_insert_, idx++, r.reference_price);
        sqlite3_bind_double(stmt_insert_, idx++, r.strike);
        sqlite3_bind_double(stmt_insert_, idx++, r.fair_price);
        sqlite3_bind_int(stmt_insert_, idx++, r.vetoed ? 1 : 0);

        if (r.vetoed) {
            // no quote was computed
            for (int i = 0; i < 5; ++i) sqlite3_bind_null(stmt_insert_, idx++);
        } else {
            sqlite3_bind_double(stmt_insert_, idx++, r.buy_price);
            sqlite3_bind_double(stmt_insert_, idx++, r.sell_price);
            sqlite3_bind_double(stmt_insert_, idx++, r.size);
            bind_opt_text(stmt_insert_, idx++, r.buy_id);
            bind_opt_text(stmt_insert_, idx++, r.sell_id);
        }

        int rc = sqlite3_step(stmt_insert_);
        if (rc != SQLITE_DONE) {
            log_sqlite_err(db_, "sqlite3_step(insert)");
            exec_sql(db_, "ROLLBACK;");
            return false;
        }
    }

    if (!exec_sql(db_, "COMMIT;")) {
        exec_sql(db_, "ROLLBACK;");
        return false;
    }
    written_ += batch.size();
    return true;
}

void QuoteJournal::writer_loop() {
    std::vector<CycleReport> batch;
    batch.reserve(256);

    while (running_) {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait_for(lk, std::chrono::milliseconds(flush_ms_), [&]{
            return !running_ || !q_.empty();
        });

        if (!running_ && q_.empty())
            break;

        batch.clear();
        while (!q_.empty()) {
            batch.push_back(std::move(q_.front()));
            q_.pop_front();
        }
        lk.unlock();

        if (!insert_batch(batch))
            log_warn("JOURNAL", "insert_batch failed; ", batch.size(), " cycles lost");
    }

    // final flush
    std::vector<CycleReport> tail;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        while (!q_.empty()) {
            tail.push_back(std::move(q_.front()));
            q_.pop_front();
        }
    }
    if (!tail.empty() && !insert_batch(tail))
        log_warn("JOURNAL", "final flush failed; ", tail.size(), " cycles lost");
}
