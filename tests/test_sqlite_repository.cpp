#include <chtest.hpp>

#include "repository_contract.h"

#include <countrydir/country/sqlite_country_repository.h>

#include <sqlite3.h>

#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>

using countrydir::country::Country;
using countrydir::country::SqliteCountryRepository;

namespace {

std::unique_ptr<SqliteCountryRepository> OpenMemory() {
    auto repo = SqliteCountryRepository::Open(":memory:");
    if (!repo.ok()) {
        throw std::runtime_error(repo.status().ToString());
    }
    return std::move(repo).value();
}

// Removes the database file (and WAL/journal companions) on scope exit.
struct TempDbFile {
    std::string path;

    explicit TempDbFile(std::string p) : path(std::move(p)) { Cleanup(); }
    ~TempDbFile() { Cleanup(); }

    void Cleanup() const {
        std::remove(path.c_str());
        std::remove((path + "-journal").c_str());
        std::remove((path + "-wal").c_str());
        std::remove((path + "-shm").c_str());
    }
};

} // namespace

TEST_CASE("SqliteCountryRepository insert then find") {
    auto repo = OpenMemory();
    repository_contract::InsertThenFind(*repo);
}

TEST_CASE("SqliteCountryRepository rejects duplicate ids") {
    auto repo = OpenMemory();
    repository_contract::DuplicateIdConflicts(*repo);
}

TEST_CASE("SqliteCountryRepository assigns ids after the current max") {
    auto repo = OpenMemory();
    repository_contract::AssignsIdsAfterMax(*repo);
}

TEST_CASE("SqliteCountryRepository lists in insertion order") {
    auto repo = OpenMemory();
    repository_contract::ListKeepsInsertionOrder(*repo);
}

TEST_CASE("SqliteCountryRepository name lookup returns the earliest match") {
    auto repo = OpenMemory();
    repository_contract::FindFirstByNamePrefersEarliest(*repo);
}

TEST_CASE("SqliteCountryRepository reports missing ids") {
    auto repo = OpenMemory();
    repository_contract::ReplaceAndEraseMissing(*repo);
}

TEST_CASE("SqliteCountryRepository erase returns the removed record") {
    auto repo = OpenMemory();
    repository_contract::EraseReturnsRemoved(*repo);
}

TEST_CASE("SqliteCountryRepository concurrent creates of one id") {
    auto repo = OpenMemory();
    repository_contract::ConcurrentInsertSameId(*repo);
}

TEST_CASE("SqliteCountryRepository keeps data across reopen") {
    TempDbFile db("countrydir_test_reopen.db");

    {
        auto repo = SqliteCountryRepository::Open(db.path);
        REQUIRE(repo.ok());
        REQUIRE(repo.value()->Insert(Country{1, "France", "Paris"}).ok());
        REQUIRE(repo.value()->Insert(Country{2, "Spain", "Madrid"}).ok());
        REQUIRE(repo.value()->Replace(Country{1, "France", "Lyon"}).ok());
    }

    auto reopened = SqliteCountryRepository::Open(db.path);
    REQUIRE(reopened.ok());
    auto list = reopened.value()->List();
    REQUIRE(list.ok());
    REQUIRE(list.value().size() == 2);
    REQUIRE(list.value()[0] == (Country{1, "France", "Lyon"}));
    REQUIRE(list.value()[1] == (Country{2, "Spain", "Madrid"}));
}

TEST_CASE("SqliteCountryRepository stores text verbatim") {
    auto repo = OpenMemory();
    Country tricky{3, "O'Land; DROP TABLE country;--", "Quote \" City"};
    REQUIRE(repo->Insert(tricky).ok());
    REQUIRE(repo->FindFirstByName(tricky.name).value() == tricky);
    REQUIRE(repo->Count().value() == 1);
}

TEST_CASE("SqliteCountryRepository open fails for an unusable path") {
    auto repo = SqliteCountryRepository::Open("/nonexistent-dir/countrydir/x.db");
    REQUIRE(!repo.ok());
    REQUIRE(repo.status().code() == countrydir::StatusCode::unavailable);
}

TEST_CASE("SqliteCountryRepository orders by insertion sequence, not id") {
    TempDbFile db("countrydir_test_schema.db");

    {
        auto repo = SqliteCountryRepository::Open(db.path);
        REQUIRE(repo.ok());
        REQUIRE(repo.value()->Insert(Country{1, "France", "Paris"}).ok());
        REQUIRE(repo.value()->Insert(Country{2, "Spain", "Madrid"}).ok());
        REQUIRE(repo.value()->Erase(1).ok());
        REQUIRE(repo.value()->Insert(Country{1, "France", "Lyon"}).ok());

        auto list = repo.value()->List().value();
        REQUIRE(list.size() == 2);
        REQUIRE(list[0].id == 2);
        REQUIRE(list[1].id == 1);
    }

    sqlite3* raw = nullptr;
    REQUIRE(sqlite3_open_v2(db.path.c_str(), &raw, SQLITE_OPEN_READONLY, nullptr) == SQLITE_OK);
    std::unique_ptr<sqlite3, int (*)(sqlite3*)> conn(raw, &sqlite3_close);

    sqlite3_stmt* stmt = nullptr;
    REQUIRE(sqlite3_prepare_v2(conn.get(), "SELECT name, pk FROM pragma_table_info('country') ORDER BY cid", -1, &stmt, nullptr) == SQLITE_OK);
    std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)> guard(stmt, &sqlite3_finalize);

    std::string columns;
    std::string primary_key;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        std::string col = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        columns += col + ",";
        if (sqlite3_column_int(stmt, 1) != 0) {
            primary_key = col;
        }
    }
    REQUIRE(columns == "seq,id_country,name,capital,");
    REQUIRE(primary_key == "seq");
}
