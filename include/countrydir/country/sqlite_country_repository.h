#pragma once

#include <memory>
#include <mutex>
#include <string>

#include <sqlite3.h>

#include <countrydir/country/country_repository.h>

namespace countrydir::country {

// Records live in table `country`; column `seq` keeps insertion order.
// One connection, serialised by a mutex.
class SqliteCountryRepository final : public ICountryRepository {
public:
    // `path` may be ":memory:". Creates the schema when missing.
    static countrydir::Result<std::unique_ptr<SqliteCountryRepository>> Open(const std::string& path);

    countrydir::Result<std::vector<Country>> List() const override;
    countrydir::Result<Country> FindById(std::int64_t id) const override;
    countrydir::Result<Country> FindFirstByName(std::string_view name) const override;
    countrydir::Result<Country> Insert(Country c) override;
    countrydir::Result<Country> Replace(Country c) override;
    countrydir::Result<Country> Erase(std::int64_t id) override;
    countrydir::Result<std::size_t> Count() const override;

private:
    using DbHandle = std::unique_ptr<sqlite3, int (*)(sqlite3*)>;

    explicit SqliteCountryRepository(DbHandle db);

    countrydir::Result<Country> FindByIdLocked(std::int64_t id) const;

    mutable std::mutex mu_;
    DbHandle db_;
};

} // namespace countrydir::country
