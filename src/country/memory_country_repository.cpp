#include <countrydir/country/country_repository.h>

#include <limits>
#include <mutex>

namespace countrydir::country {
namespace {

countrydir::Status NoSuchId(std::int64_t id) {
    return countrydir::Status::NotFound("country " + std::to_string(id) + " not found");
}

} // namespace

countrydir::Result<std::vector<Country>> InMemoryCountryRepository::List() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    std::vector<Country> out;
    out.reserve(by_seq_.size());
    for (const auto& kv : by_seq_) {
        out.push_back(kv.second);
    }
    return out;
}

countrydir::Result<Country> InMemoryCountryRepository::FindById(std::int64_t id) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) {
        return NoSuchId(id);
    }
    return by_seq_.at(it->second);
}

countrydir::Result<Country> InMemoryCountryRepository::FindFirstByName(std::string_view name) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    for (const auto& kv : by_seq_) {
        if (kv.second.name == name) {
            return kv.second;
        }
    }
    return countrydir::Status::NotFound("country named '" + std::string(name) + "' not found");
}

countrydir::Result<Country> InMemoryCountryRepository::Insert(Country c) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    if (c.id == 0) {
        std::int64_t max_id = by_id_.empty() ? 0 : by_id_.rbegin()->first;
        if (max_id == std::numeric_limits<std::int64_t>::max()) {
            return countrydir::Status::Unavailable("id space exhausted");
        }
        c.id = max_id + 1;
    } else if (by_id_.count(c.id) != 0) {
        return countrydir::Status::AlreadyExists("country " + std::to_string(c.id) + " already exists");
    }

    auto seq = next_seq_++;
    by_id_.emplace(c.id, seq);
    by_seq_.emplace(seq, c);
    return c;
}

countrydir::Result<Country> InMemoryCountryRepository::Replace(Country c) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto it = by_id_.find(c.id);
    if (it == by_id_.end()) {
        return NoSuchId(c.id);
    }
    by_seq_.at(it->second) = c;
    return c;
}

countrydir::Result<Country> InMemoryCountryRepository::Erase(std::int64_t id) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) {
        return NoSuchId(id);
    }
    auto sit = by_seq_.find(it->second);
    Country removed = std::move(sit->second);
    by_seq_.erase(sit);
    by_id_.erase(it);
    return removed;
}

countrydir::Result<std::size_t> InMemoryCountryRepository::Count() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return by_id_.size();
}

} // namespace countrydir::country
