#include <countrydir/country/country_service.h>

#include <countrydir/core/log.h>

#include <stdexcept>

namespace countrydir::country {

CountryService::CountryService(std::shared_ptr<ICountryRepository> repo, countrydir::MetricsRegistry& metrics)
    : repo_(std::move(repo)),
      metrics_(metrics),
      records_(metrics.GaugeMetric("country_records", "Country records currently stored")) {
    if (!repo_) {
        throw std::invalid_argument("CountryService requires a repository");
    }
    SeedRecordCount();
}

template <class T>
countrydir::Result<T> CountryService::Record(std::string_view op, countrydir::Result<T> r) const {
    const auto& st = r.status();
    metrics_.CounterMetric(
        "country_operations_total",
        "Country directory operations by outcome",
        countrydir::MetricLabels{{{"op", std::string(op)}, {"result", std::string(countrydir::StatusCodeName(st.code()))}}})
        .Inc(1);

    switch (st.code()) {
        case countrydir::StatusCode::ok:
        case countrydir::StatusCode::not_found:
            break;
        case countrydir::StatusCode::invalid_argument:
        case countrydir::StatusCode::already_exists:
            countrydir::log::warn("{} rejected: {}", op, st.ToString());
            break;
        default:
            countrydir::log::error("{} failed: {}", op, st.ToString());
            break;
    }
    return r;
}

void CountryService::SeedRecordCount() {
    auto n = repo_->Count();
    if (!n.ok()) {
        countrydir::log::warn("record count unavailable: {}", n.status().ToString());
        return;
    }
    records_.Set(static_cast<double>(n.value()));
}

countrydir::Result<std::vector<Country>> CountryService::ListAll() const {
    return Record("list", repo_->List());
}

countrydir::Result<Country> CountryService::GetById(std::int64_t id) const {
    return Record("get_by_id", repo_->FindById(id));
}

countrydir::Result<Country> CountryService::GetByName(std::string_view name) const {
    if (name.empty()) {
        return Record<Country>("get_by_name", countrydir::Status::InvalidArgument("missing query param: name"));
    }
    return Record("get_by_name", repo_->FindFirstByName(name));
}

countrydir::Result<Country> CountryService::Create(Country payload) {
    if (auto st = Validate(payload); !st.ok()) {
        return Record<Country>("create", st);
    }

    auto r = Record("create", repo_->Insert(std::move(payload)));
    if (r.ok()) {
        countrydir::log::info("created country {} ({})", r.value().id, r.value().name);
        records_.Add(1);
    }
    return r;
}

countrydir::Result<Country> CountryService::Update(std::int64_t id, Country payload) {
    payload.id = id;
    if (auto st = Validate(payload); !st.ok()) {
        return Record<Country>("update", st);
    }

    auto r = Record("update", repo_->Replace(std::move(payload)));
    if (r.ok()) {
        countrydir::log::info("updated country {}", id);
    }
    return r;
}

countrydir::Result<Country> CountryService::Delete(std::int64_t id) {
    auto r = Record("delete", repo_->Erase(id));
    if (r.ok()) {
        countrydir::log::info("deleted country {}", id);
        records_.Add(-1);
    }
    return r;
}

} // namespace countrydir::country
