#include <catch2/catch_test_macros.hpp>

#include "storage/history_db.hpp"

#include <filesystem>
#include <sqlite3.h>
#include <string>
#include <unistd.h>

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("vr_test_db_" + std::to_string(getpid()) + ".sqlite");
    }

    ~TmpDb() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

// Moves every row's timestamp into the past through a second connection.
void age_entries(const std::string& path, int days) {
    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    auto sql = "UPDATE transcriptions SET timestamp = strftime('%Y-%m-%dT%H:%M:%f', 'now', '-" +
               std::to_string(days) + " days')";
    REQUIRE(sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(db);
}

} // namespace

TEST_CASE("HistoryDb", "[history]") {
    TmpDb tmp;

    SECTION("OpenCreatesFile") {
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.is_open());
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("InsertAndRetrieve") {
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert("hello world", 2.5, 0.3, "groq", false, "clipboard"));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].text == "hello world");
        REQUIRE(entries[0].audio_duration == 2.5);
        REQUIRE(entries[0].processing_time == 0.3);
        REQUIRE(entries[0].provider == "groq");
        REQUIRE_FALSE(entries[0].used_fallback);
        REQUIRE(entries[0].output_method == "clipboard");
        REQUIRE_FALSE(entries[0].timestamp.empty());
    }

    SECTION("FallbackFlagStored") {
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.insert("via backup", 1.0, 0.1, "deepgram", true, "paste"));

        auto entries = db.recent(1);
        REQUIRE(entries.at(0).used_fallback);
        REQUIRE(entries[0].provider == "deepgram");
    }

    SECTION("EmptyFieldsAreNull") {
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.insert("bare", 1.0, 0.1, "", false, ""));

        auto entries = db.recent(1);
        REQUIRE(entries.at(0).provider.empty());
        REQUIRE(entries[0].output_method.empty());
    }

    SECTION("RecentOrderAndLimit") {
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        for (int i = 0; i < 5; ++i) {
            REQUIRE(db.insert("entry " + std::to_string(i), 1.0, 0.1, "groq", false, "clipboard"));
        }

        auto entries = db.recent(3);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].text == "entry 4");
        REQUIRE(entries[2].text == "entry 2");
        REQUIRE(db.count() == 5);
    }

    SECTION("SearchMatchesSubstring") {
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.insert("Buy milk tomorrow", 1.0, 0.1, "groq", false, "clipboard"));
        REQUIRE(db.insert("Call the plumber", 1.0, 0.1, "groq", false, "clipboard"));
        REQUIRE(db.insert("milkshake recipe", 1.0, 0.1, "groq", false, "clipboard"));

        auto hits = db.search("MILK");
        REQUIRE(hits.size() == 2);
        REQUIRE(hits[0].text == "milkshake recipe");
        REQUIRE(hits[1].text == "Buy milk tomorrow");

        REQUIRE(db.search("nothing like this").empty());
    }

    SECTION("SearchTreatsWildcardsLiterally") {
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.insert("100% done", 1.0, 0.1, "groq", false, "clipboard"));
        REQUIRE(db.insert("100 done", 1.0, 0.1, "groq", false, "clipboard"));

        auto hits = db.search("100%");
        REQUIRE(hits.size() == 1);
        REQUIRE(hits[0].text == "100% done");
    }

    SECTION("RemoveAndClear") {
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.insert("one", 1.0, 0.1, "groq", false, "clipboard"));
        REQUIRE(db.insert("two", 1.0, 0.1, "groq", false, "clipboard"));

        auto id = db.recent(1).at(0).id;
        REQUIRE(db.remove(id));
        REQUIRE_FALSE(db.remove(id));
        REQUIRE(db.count() == 1);
        REQUIRE(db.recent(1).at(0).text == "one");

        REQUIRE(db.clear());
        REQUIRE(db.count() == 0);
    }

    SECTION("PruneDropsOldEntries") {
        {
            HistoryDb db;
            REQUIRE(db.open(tmp.path));
            REQUIRE(db.insert("old", 1.0, 0.1, "groq", false, "clipboard"));
        }
        age_entries(tmp.path, 40);

        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.insert("new", 1.0, 0.1, "groq", false, "clipboard"));

        REQUIRE(db.prune(30) == 1);
        REQUIRE(db.count() == 1);
        REQUIRE(db.recent(1).at(0).text == "new");
        REQUIRE(db.prune(0) == 0);
    }

    SECTION("PersistsAcrossReopen") {
        {
            HistoryDb db;
            REQUIRE(db.open(tmp.path));
            REQUIRE(db.insert("persisted", 3.0, 0.5, "sarvam", false, "paste"));
        }

        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        auto entries = db.recent(10);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].text == "persisted");
    }

    SECTION("ClosedDbRejectsOperations") {
        HistoryDb db;
        REQUIRE_FALSE(db.insert("x", 1.0, 0.1, "groq", false, "clipboard"));
        REQUIRE(db.recent(5).empty());
        REQUIRE(db.count() == 0);
        REQUIRE(db.prune(30) == -1);
    }
}
