#include "history_db.hpp"

#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;

namespace {

constexpr const char* select_columns =
    "SELECT id, timestamp, text, audio_duration, processing_time, "
    "provider, used_fallback, output_method FROM transcriptions ";

} // namespace

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

bool HistoryDb::open(const std::string& path) {
    // Ensure parent directory exists
    fs::path p(path);
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) {
        close();
        return false;
    }

    const char* insert_sql =
        "INSERT INTO transcriptions (text, audio_duration, processing_time, "
        "provider, used_fallback, output_method) VALUES (?, ?, ?, ?, ?, ?)";
    auto recent_sql = std::format("{}ORDER BY id DESC LIMIT ?", select_columns);
    auto search_sql = std::format(
        "{}WHERE text LIKE '%' || ? || '%' ESCAPE '\\' ORDER BY id DESC LIMIT ?",
        select_columns);
    const char* remove_sql = "DELETE FROM transcriptions WHERE id = ?";

    if (!prepare(insert_sql, &insert_stmt_, "insert") ||
        !prepare(recent_sql.c_str(), &recent_stmt_, "recent") ||
        !prepare(search_sql.c_str(), &search_stmt_, "search") ||
        !prepare(remove_sql, &remove_stmt_, "remove")) {
        close();
        return false;
    }

    return true;
}

bool HistoryDb::prepare(const char* sql, sqlite3_stmt** stmt, const char* what) {
    if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare {} failed: {}", what, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

void HistoryDb::close() {
    for (auto** stmt : {&insert_stmt_, &recent_stmt_, &search_stmt_, &remove_stmt_}) {
        if (*stmt) { sqlite3_finalize(*stmt); *stmt = nullptr; }
    }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool HistoryDb::insert(const std::string& text, double audio_duration, double processing_time,
                       const std::string& provider, bool used_fallback,
                       const std::string& output_method) {
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(insert_stmt_, 2, audio_duration);
    sqlite3_bind_double(insert_stmt_, 3, processing_time);

    auto bind_nullable = [this](int idx, const std::string& val) {
        if (val.empty()) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val.c_str(), -1, SQLITE_TRANSIENT);
    };

    bind_nullable(4, provider);
    sqlite3_bind_int(insert_stmt_, 5, used_fallback ? 1 : 0);
    bind_nullable(6, output_method);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<HistoryEntry> HistoryDb::recent(int limit) {
    if (!recent_stmt_) return {};

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);
    return read_entries(recent_stmt_);
}

std::vector<HistoryEntry> HistoryDb::search(const std::string& query, int limit) {
    if (!search_stmt_) return {};

    // LIKE wildcards in the query are matched literally.
    std::string escaped;
    for (char c : query) {
        if (c == '%' || c == '_' || c == '\\') escaped += '\\';
        escaped += c;
    }

    sqlite3_reset(search_stmt_);
    sqlite3_bind_text(search_stmt_, 1, escaped.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(search_stmt_, 2, limit);
    return read_entries(search_stmt_);
}

std::vector<HistoryEntry> HistoryDb::read_entries(sqlite3_stmt* stmt) {
    std::vector<HistoryEntry> entries;

    auto get_text = [](sqlite3_stmt* s, int col) -> std::string {
        auto* p = sqlite3_column_text(s, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        HistoryEntry e;
        e.id = sqlite3_column_int64(stmt, 0);
        e.timestamp = get_text(stmt, 1);
        e.text = get_text(stmt, 2);
        e.audio_duration = sqlite3_column_double(stmt, 3);
        e.processing_time = sqlite3_column_double(stmt, 4);
        e.provider = get_text(stmt, 5);
        e.used_fallback = sqlite3_column_int(stmt, 6) != 0;
        e.output_method = get_text(stmt, 7);
        entries.push_back(std::move(e));
    }

    return entries;
}

bool HistoryDb::remove(int64_t id) {
    if (!remove_stmt_) return false;

    sqlite3_reset(remove_stmt_);
    sqlite3_bind_int64(remove_stmt_, 1, id);
    if (sqlite3_step(remove_stmt_) != SQLITE_DONE) {
        std::println(stderr, "db: remove failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return sqlite3_changes(db_) > 0;
}

bool HistoryDb::clear() {
    if (!db_) return false;

    char* err = nullptr;
    if (sqlite3_exec(db_, "DELETE FROM transcriptions", nullptr, nullptr, &err) != SQLITE_OK) {
        std::println(stderr, "db: clear failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}

int64_t HistoryDb::count() {
    if (!db_) return 0;

    sqlite3_stmt* stmt = nullptr;
    if (!prepare("SELECT COUNT(*) FROM transcriptions", &stmt, "count")) return 0;

    int64_t n = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) n = sqlite3_column_int64(stmt, 0);
    sqlite3_finalize(stmt);
    return n;
}

int HistoryDb::prune(int retention_days) {
    if (!db_) return -1;
    if (retention_days <= 0) return 0;

    sqlite3_stmt* stmt = nullptr;
    const char* sql =
        "DELETE FROM transcriptions WHERE timestamp < "
        "strftime('%Y-%m-%dT%H:%M:%f', 'now', ?)";
    if (!prepare(sql, &stmt, "prune")) return -1;

    auto modifier = std::format("-{} days", retention_days);
    sqlite3_bind_text(stmt, 1, modifier.c_str(), -1, SQLITE_TRANSIENT);

    int removed = -1;
    if (sqlite3_step(stmt) == SQLITE_DONE) {
        removed = sqlite3_changes(db_);
    } else {
        std::println(stderr, "db: prune failed: {}", sqlite3_errmsg(db_));
    }
    sqlite3_finalize(stmt);
    return removed;
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS transcriptions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            text TEXT NOT NULL,
            audio_duration REAL,
            processing_time REAL,
            provider TEXT,
            used_fallback INTEGER NOT NULL DEFAULT 0,
            output_method TEXT
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
