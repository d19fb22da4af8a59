#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <shared_mutex>
#include <string_view>
#include <vector>

#include <countrydir/core/status.h>
#include <countrydir/country/country.h>

namespace countrydir::country {

// Storage capability behind the directory service. Implementations keep
// records in insertion order and make every call atomic.
class ICountryRepository {
public:
    virtual ~ICountryRepository() = default;

    // Thread-safe
    virtual countrydir::Result<std::vector<Country>> List() const = 0;

    // Thread-safe. not_found if absent.
    virtual countrydir::Result<Country> FindById(std::int64_t id) const = 0;

    // Thread-safe. Earliest inserted record with exactly this name; not_found if none.
    virtual countrydir::Result<Country> FindFirstByName(std::string_view name) const = 0;

    // Thread-safe. c.id == 0 assigns max(id) + 1. already_exists if c.id is taken.
    virtual countrydir::Result<Country> Insert(Country c) = 0;

    // Thread-safe. Replaces name/capital of record c.id in place; not_found if absent.
    virtual countrydir::Result<Country> Replace(Country c) = 0;

    // Thread-safe. Returns the removed record; not_found if absent.
    virtual countrydir::Result<Country> Erase(std::int64_t id) = 0;

    // Thread-safe
    virtual countrydir::Result<std::size_t> Count() const = 0;
};

class InMemoryCountryRepository final : public ICountryRepository {
public:
    countrydir::Result<std::vector<Country>> List() const override;
    countrydir::Result<Country> FindById(std::int64_t id) const override;
    countrydir::Result<Country> FindFirstByName(std::string_view name) const override;
    countrydir::Result<Country> Insert(Country c) override;
    countrydir::Result<Country> Replace(Country c) override;
    countrydir::Result<Country> Erase(std::int64_t id) override;
    countrydir::Result<std::size_t> Count() const override;

private:
    mutable std::shared_mutex mu_;
    std::uint64_t next_seq_ = 0;
    std::map<std::uint64_t, Country> by_seq_;     // insertion order
    std::map<std::int64_t, std::uint64_t> by_id_; // id -> seq, ordered for max id
};

} // namespace countrydir::country
