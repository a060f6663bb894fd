#pragma once

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryEntry {
    int64_t id;
    std::string timestamp;
    std::string text;
    double audio_duration;
    double processing_time;
    std::string provider;
    bool used_fallback;
    std::string output_method;
};

class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool insert(const std::string& text, double audio_duration, double processing_time,
                const std::string& provider, bool used_fallback,
                const std::string& output_method);

    std::vector<HistoryEntry> recent(int limit = 10);
    // Case-insensitive substring match on the text, newest first.
    std::vector<HistoryEntry> search(const std::string& query, int limit = 10);

    bool remove(int64_t id);
    bool clear();
    int64_t count();

    // Deletes entries older than retention_days. Returns rows removed, -1 on error.
    int prune(int retention_days);

private:
    bool create_tables();
    bool prepare(const char* sql, sqlite3_stmt** stmt, const char* what);
    std::vector<HistoryEntry> read_entries(sqlite3_stmt* stmt);

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
    sqlite3_stmt* search_stmt_ = nullptr;
    sqlite3_stmt* remove_stmt_ = nullptr;
};
