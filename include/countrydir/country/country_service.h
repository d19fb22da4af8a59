#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include <countrydir/core/metrics.h>
#include <countrydir/core/status.h>
#include <countrydir/country/country.h>
#include <countrydir/country/country_repository.h>

namespace countrydir::country {

// The country directory: CRUD over an injected repository. Holds no state of
// its own, so every call sees the repository's current contents.
class CountryService {
public:
    explicit CountryService(std::shared_ptr<ICountryRepository> repo,
        countrydir::MetricsRegistry& metrics = countrydir::DefaultMetrics());

    // Thread-safe
    countrydir::Result<std::vector<Country>> ListAll() const;
    countrydir::Result<Country> GetById(std::int64_t id) const;
    countrydir::Result<Country> GetByName(std::string_view name) const;

    // Thread-safe. payload.id == 0 lets the repository assign one.
    countrydir::Result<Country> Create(Country payload);

    // Thread-safe. `id` wins over payload.id.
    countrydir::Result<Country> Update(std::int64_t id, Country payload);

    // Thread-safe. Returns the removed record.
    countrydir::Result<Country> Delete(std::int64_t id);

private:
    template <class T>
    countrydir::Result<T> Record(std::string_view op, countrydir::Result<T> r) const;

    void SeedRecordCount();

    std::shared_ptr<ICountryRepository> repo_;
    countrydir::MetricsRegistry& metrics_;
    // Seeded from Count() once, then moved by +1/-1 per successful create/delete.
    countrydir::Gauge& records_;
};

} // namespace countrydir::country
