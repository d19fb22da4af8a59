#include <countrydir/country/sqlite_country_repository.h>

#include <countrydir/core/log.h>

#include <limits>
#include <string_view>

namespace countrydir::country {
namespace {

constexpr const char* kSchema =
    "CREATE TABLE IF NOT EXISTS country ("
    " seq INTEGER PRIMARY KEY AUTOINCREMENT,"
    " id_country INTEGER NOT NULL UNIQUE,"
    " name TEXT NOT NULL,"
    " capital TEXT NOT NULL);"
    "CREATE INDEX IF NOT EXISTS country_name_idx ON country(name);";

countrydir::Status SqliteStatus(sqlite3* db, int rc, std::string_view what) {
    std::string msg(what);
    msg += ": ";
    msg += db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc);

    switch (rc & 0xff) {
        case SQLITE_CONSTRAINT:
            return countrydir::Status::AlreadyExists(std::move(msg));
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_CANTOPEN:
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_READONLY:
            return countrydir::Status::Unavailable(std::move(msg));
        default:
            return countrydir::Status::Internal(std::move(msg));
    }
}

// Prepared statement, finalized on scope exit.
class Statement {
public:
    Statement(sqlite3* db, std::string_view sql) : db_(db), stmt_(nullptr, &sqlite3_finalize) {
        sqlite3_stmt* raw = nullptr;
        rc_ = sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &raw, nullptr);
        stmt_.reset(raw);
    }

    countrydir::Status Prepared() const {
        if (rc_ != SQLITE_OK) {
            return SqliteStatus(db_, rc_, "prepare");
        }
        return countrydir::Status::Ok();
    }

    countrydir::Status Bind(int idx, std::int64_t v) {
        return Check(sqlite3_bind_int64(stmt_.get(), idx, v), "bind");
    }

    countrydir::Status Bind(int idx, std::string_view v) {
        return Check(sqlite3_bind_text(stmt_.get(), idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT), "bind");
    }

    // SQLITE_ROW or SQLITE_DONE on success; anything else is an error code.
    int Step() { return sqlite3_step(stmt_.get()); }

    std::int64_t Int64(int col) const { return sqlite3_column_int64(stmt_.get(), col); }

    std::string Text(int col) const {
        const auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt_.get(), col));
        if (p == nullptr) {
            return {};
        }
        return std::string(p, static_cast<std::size_t>(sqlite3_column_bytes(stmt_.get(), col)));
    }

    // Expects columns (id_country, name, capital).
    Country Row() const {
        Country c;
        c.id = Int64(0);
        c.name = Text(1);
        c.capital = Text(2);
        return c;
    }

    countrydir::Status Error(int rc, std::string_view what) const { return SqliteStatus(db_, rc, what); }

private:
    countrydir::Status Check(int rc, std::string_view what) const {
        if (rc != SQLITE_OK) {
            return SqliteStatus(db_, rc, what);
        }
        return countrydir::Status::Ok();
    }

    sqlite3* db_;
    int rc_ = SQLITE_OK;
    std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)> stmt_;
};

countrydir::Status NoSuchId(std::int64_t id) {
    return countrydir::Status::NotFound("country " + std::to_string(id) + " not found");
}

} // namespace

SqliteCountryRepository::SqliteCountryRepository(DbHandle db) : db_(std::move(db)) {}

countrydir::Result<std::unique_ptr<SqliteCountryRepository>> SqliteCountryRepository::Open(const std::string& path) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &raw,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    DbHandle db(raw, &sqlite3_close);
    if (rc != SQLITE_OK) {
        return SqliteStatus(db.get(), rc, "open " + path);
    }

    sqlite3_busy_timeout(db.get(), 5000);

    char* err = nullptr;
    rc = sqlite3_exec(db.get(), kSchema, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = "create schema: ";
        msg += err != nullptr ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        return countrydir::Status::Unavailable(std::move(msg));
    }

    countrydir::log::info("SQLite country store opened at {}", path);
    return std::unique_ptr<SqliteCountryRepository>(new SqliteCountryRepository(std::move(db)));
}

countrydir::Result<std::vector<Country>> SqliteCountryRepository::List() const {
    std::lock_guard<std::mutex> lk(mu_);
    Statement st(db_.get(), "SELECT id_country, name, capital FROM country ORDER BY seq");
    if (auto s = st.Prepared(); !s.ok()) {
        return s;
    }

    std::vector<Country> out;
    int rc;
    while ((rc = st.Step()) == SQLITE_ROW) {
        out.push_back(st.Row());
    }
    if (rc != SQLITE_DONE) {
        return st.Error(rc, "list");
    }
    return out;
}

countrydir::Result<Country> SqliteCountryRepository::FindByIdLocked(std::int64_t id) const {
    Statement st(db_.get(), "SELECT id_country, name, capital FROM country WHERE id_country = ?1");
    if (auto s = st.Prepared(); !s.ok()) {
        return s;
    }
    if (auto s = st.Bind(1, id); !s.ok()) {
        return s;
    }

    int rc = st.Step();
    if (rc == SQLITE_ROW) {
        return st.Row();
    }
    if (rc == SQLITE_DONE) {
        return NoSuchId(id);
    }
    return st.Error(rc, "find by id");
}

countrydir::Result<Country> SqliteCountryRepository::FindById(std::int64_t id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return FindByIdLocked(id);
}

countrydir::Result<Country> SqliteCountryRepository::FindFirstByName(std::string_view name) const {
    std::lock_guard<std::mutex> lk(mu_);
    Statement st(db_.get(), "SELECT id_country, name, capital FROM country WHERE name = ?1 ORDER BY seq LIMIT 1");
    if (auto s = st.Prepared(); !s.ok()) {
        return s;
    }
    if (auto s = st.Bind(1, name); !s.ok()) {
        return s;
    }

    int rc = st.Step();
    if (rc == SQLITE_ROW) {
        return st.Row();
    }
    if (rc == SQLITE_DONE) {
        return countrydir::Status::NotFound("country named '" + std::string(name) + "' not found");
    }
    return st.Error(rc, "find by name");
}

countrydir::Result<Country> SqliteCountryRepository::Insert(Country c) {
    std::lock_guard<std::mutex> lk(mu_);

    if (c.id == 0) {
        Statement top(db_.get(), "SELECT COALESCE(MAX(id_country), 0) FROM country");
        if (auto s = top.Prepared(); !s.ok()) {
            return s;
        }
        int rc = top.Step();
        if (rc != SQLITE_ROW) {
            return top.Error(rc, "next id");
        }
        auto max_id = top.Int64(0);
        if (max_id == std::numeric_limits<std::int64_t>::max()) {
            return countrydir::Status::Unavailable("id space exhausted");
        }
        c.id = max_id + 1;
    }

    Statement st(db_.get(), "INSERT INTO country (id_country, name, capital) VALUES (?1, ?2, ?3)");
    if (auto s = st.Prepared(); !s.ok()) {
        return s;
    }
    for (auto s : {st.Bind(1, c.id), st.Bind(2, std::string_view(c.name)), st.Bind(3, std::string_view(c.capital))}) {
        if (!s.ok()) {
            return s;
        }
    }

    int rc = st.Step();
    if (rc != SQLITE_DONE) {
        auto s = st.Error(rc, "insert");
        if (s.code() == countrydir::StatusCode::already_exists) {
            return countrydir::Status::AlreadyExists("country " + std::to_string(c.id) + " already exists");
        }
        return s;
    }
    return c;
}

countrydir::Result<Country> SqliteCountryRepository::Replace(Country c) {
    std::lock_guard<std::mutex> lk(mu_);
    Statement st(db_.get(), "UPDATE country SET name = ?2, capital = ?3 WHERE id_country = ?1");
    if (auto s = st.Prepared(); !s.ok()) {
        return s;
    }
    for (auto s : {st.Bind(1, c.id), st.Bind(2, std::string_view(c.name)), st.Bind(3, std::string_view(c.capital))}) {
        if (!s.ok()) {
            return s;
        }
    }

    int rc = st.Step();
    if (rc != SQLITE_DONE) {
        return st.Error(rc, "update");
    }
    if (sqlite3_changes(db_.get()) == 0) {
        return NoSuchId(c.id);
    }
    return c;
}

countrydir::Result<Country> SqliteCountryRepository::Erase(std::int64_t id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto existing = FindByIdLocked(id);
    if (!existing.ok()) {
        return existing.status();
    }

    Statement st(db_.get(), "DELETE FROM country WHERE id_country = ?1");
    if (auto s = st.Prepared(); !s.ok()) {
        return s;
    }
    if (auto s = st.Bind(1, id); !s.ok()) {
        return s;
    }
    int rc = st.Step();
    if (rc != SQLITE_DONE) {
        return st.Error(rc, "delete");
    }
    return std::move(existing).value();
}

countrydir::Result<std::size_t> SqliteCountryRepository::Count() const {
    std::lock_guard<std::mutex> lk(mu_);
    Statement st(db_.get(), "SELECT COUNT(*) FROM country");
    if (auto s = st.Prepared(); !s.ok()) {
        return s;
    }
    int rc = st.Step();
    if (rc != SQLITE_ROW) {
        return st.Error(rc, "count");
    }
    return static_cast<std::size_t>(st.Int64(0));
}

} // namespace countrydir::country
