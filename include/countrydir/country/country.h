#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <countrydir/core/status.h>

#include <chjson/chjson.hpp>

namespace countrydir::country {

// Longest accepted name/capital, in bytes.
inline constexpr std::size_t kMaxFieldBytes = 255;

struct Country {
    std::int64_t id = 0; // 0 = not yet assigned
    std::string name;
    std::string capital;

    bool operator==(const Country& o) const = default;
};

// Field checks shared by create and update. `id` may be 0 (store assigns it).
countrydir::Status Validate(const Country& c);

// Parses a path segment as a positive id.
countrydir::Result<std::int64_t> ParseId(std::string_view s);

// JSON shape: {"idCountry": int, "name": string, "capital": string}
chjson::value ToJson(const Country& c);
std::string ToJsonString(const Country& c);
std::string ToJsonString(const std::vector<Country>& list);

// Decodes a request body. "idCountry" is optional (missing reads as 0);
// "name" and "capital" must be strings. Does not call Validate().
countrydir::Result<Country> FromJson(std::string_view body);

} // namespace countrydir::country
