#pragma once
#include "cycle_report.hpp"

#include <sqlite3.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Append-only SQLite log of every requote cycle. push() is cheap; a writer
// thread drains the queue in one transaction per batch.
class QuoteJournal {
public:
    explicit QuoteJournal(std::string db_path,
                          int flush_ms = 500,
                          std::size_t max_queue = 10000);
    ~QuoteJournal();

    QuoteJournal(const QuoteJournal&) = delete;
    QuoteJournal& operator=(const QuoteJournal&) = delete;

    // Drops the oldest entry when the queue is full.
    void push(CycleReport r);

    bool start();
    void stop();   // flushes what is queued

    std::uint64_t written() const { return written_.load(); }
    std::uint64_t dropped() const { return dropped_.load(); }

private:
    bool open_connection();
    void close_connection();
    bool init_schema_and_pragmas();

    bool prepare_statements();
    void finalize_statements();

    void writer_loop();
    bool insert_batch(const std::vector<CycleReport>& batch);

    std::string db_path_;
    int flush_ms_;
    std::size_t max_queue_;

    sqlite3* db_{nullptr};
    sqlite3_stmt* stmt_insert_{nullptr};

    std::atomic<bool> running_{false};
    std::thread writer_;

    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<CycleReport> q_;

    std::atomic<std::uint64_t> written_{0};
    std::atomic<std::uint64_t> dropped_{0};
};
