#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <countrydir/core/status.h>

#include <chjson/chjson.hpp>

namespace countrydir::config {

// A parsed JSON object with typed accessors for its top-level keys.
class Config {
public:
    static countrydir::Result<Config> LoadFile(std::string path);
    static countrydir::Result<Config> Parse(std::string_view text);

    bool Has(std::string_view key) const;

    countrydir::Result<std::string> GetString(std::string_view key) const;
    countrydir::Result<std::int64_t> GetInt(std::string_view key) const;

    const chjson::sv_value& raw() const { return doc_.root(); }

private:
    chjson::document doc_;
};

enum class StorageKind {
    memory,
    sqlite,
};

countrydir::Result<StorageKind> ParseStorageKind(std::string_view s);

// "host:port" with a non-empty host and a port in 1..65535.
countrydir::Status ParseHostPort(std::string_view s, std::string& host, std::uint16_t& port);

// Upper bounds accepted for `threads` and `max_body_bytes`.
inline constexpr std::size_t kMaxThreads = 1024;
inline constexpr std::size_t kMaxBodyBytes = 16 * 1024 * 1024;

struct ServiceConfig {
    std::string listen_host = "0.0.0.0";
    std::uint16_t listen_port = 8087;
    std::size_t threads = 0; // 0 = hardware concurrency
    std::string log_level = "info";
    StorageKind storage = StorageKind::memory;
    std::string sqlite_path = "countries.db";
    std::size_t max_body_bytes = 64 * 1024;

    // Keys absent from `cfg` keep their defaults; present keys must be well-formed.
    static countrydir::Result<ServiceConfig> FromConfig(const Config& cfg);
};

} // namespace countrydir::config
