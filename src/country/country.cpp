#include <countrydir/country/country.h>

#include <charconv>

namespace countrydir::country {
namespace {

constexpr std::string_view kIdField = "idCountry";
constexpr std::string_view kNameField = "name";
constexpr std::string_view kCapitalField = "capital";

countrydir::Status CheckText(std::string_view field, const std::string& v) {
    if (v.empty()) {
        return countrydir::Status::InvalidArgument("field '" + std::string(field) + "' must not be empty");
    }
    if (v.size() > kMaxFieldBytes) {
        return countrydir::Status::InvalidArgument(
            "field '" + std::string(field) + "' exceeds " + std::to_string(kMaxFieldBytes) + " bytes");
    }
    return countrydir::Status::Ok();
}

countrydir::Status ReadString(const chjson::sv_value& root, std::string_view field, std::string& out) {
    const auto* v = root.find(field);
    if (v == nullptr) {
        return countrydir::Status::InvalidArgument("missing field: " + std::string(field));
    }
    if (!v->is_string()) {
        return countrydir::Status::InvalidArgument("field '" + std::string(field) + "' must be a string");
    }
    out = std::string(v->as_string_view());
    return countrydir::Status::Ok();
}

} // namespace

countrydir::Status Validate(const Country& c) {
    if (c.id < 0) {
        return countrydir::Status::InvalidArgument("field 'idCountry' must not be negative");
    }
    if (auto st = CheckText(kNameField, c.name); !st.ok()) {
        return st;
    }
    return CheckText(kCapitalField, c.capital);
}

countrydir::Result<std::int64_t> ParseId(std::string_view s) {
    std::int64_t id = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), id);
    if (s.empty() || ec != std::errc() || ptr != s.data() + s.size()) {
        return countrydir::Status::InvalidArgument("invalid id '" + std::string(s) + "'");
    }
    if (id <= 0) {
        return countrydir::Status::InvalidArgument("id must be positive");
    }
    return id;
}

chjson::value ToJson(const Country& c) {
    return chjson::value(chjson::value::object{
        {std::string(kIdField), chjson::value::integer(c.id)},
        {std::string(kNameField), chjson::value(c.name)},
        {std::string(kCapitalField), chjson::value(c.capital)},
    });
}

std::string ToJsonString(const Country& c) {
    return chjson::dump(ToJson(c));
}

std::string ToJsonString(const std::vector<Country>& list) {
    chjson::value::array items;
    items.reserve(list.size());
    for (const auto& c : list) {
        items.push_back(ToJson(c));
    }
    return chjson::dump(chjson::value(std::move(items)));
}

countrydir::Result<Country> FromJson(std::string_view body) {
    auto r = chjson::parse(body);
    if (r.err) {
        return countrydir::Status::InvalidArgument("invalid json");
    }
    const auto& root = r.doc.root();
    if (!root.is_object()) {
        return countrydir::Status::InvalidArgument("body must be a JSON object");
    }

    Country c;
    if (const auto* id = root.find(kIdField); id != nullptr) {
        if (!id->is_number() || !id->is_int()) {
            return countrydir::Status::InvalidArgument("field 'idCountry' must be an integer");
        }
        c.id = static_cast<std::int64_t>(id->as_int());
    }
    if (auto st = ReadString(root, kNameField, c.name); !st.ok()) {
        return st;
    }
    if (auto st = ReadString(root, kCapitalField, c.capital); !st.ok()) {
        return st;
    }
    return c;
}

} // namespace countrydir::country
