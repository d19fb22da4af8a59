#include <countrydir/config/config.h>

#include <countrydir/core/log.h>

#include <charconv>
#include <cstdint>
#include <fstream>
#include <sstream>

namespace countrydir::config {

namespace {

const char* ErrorCodeToString(chjson::error_code code) {
    switch (code) {
        case chjson::error_code::ok: return "ok";
        case chjson::error_code::unexpected_eof: return "unexpected_eof";
        case chjson::error_code::invalid_value: return "invalid_value";
        case chjson::error_code::invalid_number: return "invalid_number";
        case chjson::error_code::invalid_string: return "invalid_string";
        case chjson::error_code::invalid_escape: return "invalid_escape";
        case chjson::error_code::invalid_unicode_escape: return "invalid_unicode_escape";
        case chjson::error_code::invalid_utf16_surrogate: return "invalid_utf16_surrogate";
        case chjson::error_code::expected_colon: return "expected_colon";
        case chjson::error_code::expected_comma_or_end: return "expected_comma_or_end";
        case chjson::error_code::expected_key_string: return "expected_key_string";
        case chjson::error_code::trailing_characters: return "trailing_characters";
        case chjson::error_code::nesting_too_deep: return "nesting_too_deep";
        case chjson::error_code::out_of_memory: return "out_of_memory";
    }
    return "unknown";
}

std::string FormatParseError(const chjson::error& e) {
    std::ostringstream oss;
    oss << "invalid json: " << ErrorCodeToString(e.code)
        << " at line " << e.line << ", col " << e.column;
    return oss.str();
}

countrydir::Status KeyError(std::string_view key, const countrydir::Status& st) {
    return countrydir::Status(st.code(), "config key '" + std::string(key) + "': " + st.message());
}

// Range-checked in 64 bits before narrowing.
countrydir::Result<std::size_t> GetBounded(const Config& cfg, std::string_view key, std::int64_t lo, std::size_t hi) {
    auto v = cfg.GetInt(key);
    if (!v.ok()) {
        return KeyError(key, v.status());
    }
    if (v.value() < lo || v.value() > static_cast<std::int64_t>(hi)) {
        return KeyError(key, countrydir::Status::InvalidArgument(
            "must be in [" + std::to_string(lo) + ", " + std::to_string(hi) + "], got " + std::to_string(v.value())));
    }
    return static_cast<std::size_t>(v.value());
}

} // namespace

countrydir::Result<Config> Config::LoadFile(std::string path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return countrydir::Status::NotFound("config file not found: " + path);
    }

    std::ostringstream ss;
    ss << ifs.rdbuf();
    return Parse(ss.str());
}

countrydir::Result<Config> Config::Parse(std::string_view text) {
    auto r = chjson::parse(text);
    if (r.err) {
        return countrydir::Status::InvalidArgument(FormatParseError(r.err));
    }

    if (!r.doc.root().is_object()) {
        return countrydir::Status::InvalidArgument("config root must be a JSON object");
    }

    Config c;
    c.doc_ = std::move(r.doc);
    return c;
}

bool Config::Has(std::string_view key) const {
    return doc_.root().find(key) != nullptr;
}

countrydir::Result<std::string> Config::GetString(std::string_view key) const {
    const auto* v = doc_.root().find(key);
    if (v == nullptr) {
        return countrydir::Status::NotFound("missing key");
    }
    if (!v->is_string()) {
        return countrydir::Status::InvalidArgument("not a string");
    }
    return std::string(v->as_string_view());
}

countrydir::Result<std::int64_t> Config::GetInt(std::string_view key) const {
    const auto* v = doc_.root().find(key);
    if (v == nullptr) {
        return countrydir::Status::NotFound("missing key");
    }
    if (!v->is_number() || !v->is_int()) {
        return countrydir::Status::InvalidArgument("not an int");
    }
    return static_cast<std::int64_t>(v->as_int());
}

countrydir::Result<StorageKind> ParseStorageKind(std::string_view s) {
    if (s == "memory") {
        return StorageKind::memory;
    }
    if (s == "sqlite") {
        return StorageKind::sqlite;
    }
    return countrydir::Status::InvalidArgument("unknown storage '" + std::string(s) + "', expected memory or sqlite");
}

countrydir::Status ParseHostPort(std::string_view s, std::string& host, std::uint16_t& port) {
    auto colon = s.rfind(':');
    if (colon == std::string_view::npos) {
        return countrydir::Status::InvalidArgument("expected host:port");
    }
    auto host_sv = s.substr(0, colon);
    auto port_sv = s.substr(colon + 1);
    if (host_sv.empty() || port_sv.empty()) {
        return countrydir::Status::InvalidArgument("expected host:port");
    }

    int p = 0;
    auto [ptr, ec] = std::from_chars(port_sv.data(), port_sv.data() + port_sv.size(), p);
    if (ec != std::errc() || ptr != port_sv.data() + port_sv.size() || p <= 0 || p > 65535) {
        return countrydir::Status::InvalidArgument("invalid port '" + std::string(port_sv) + "'");
    }

    host = std::string(host_sv);
    port = static_cast<std::uint16_t>(p);
    return countrydir::Status::Ok();
}

countrydir::Result<ServiceConfig> ServiceConfig::FromConfig(const Config& cfg) {
    ServiceConfig out;

    if (cfg.Has("listen")) {
        auto v = cfg.GetString("listen");
        if (!v.ok()) {
            return KeyError("listen", v.status());
        }
        auto st = ParseHostPort(v.value(), out.listen_host, out.listen_port);
        if (!st.ok()) {
            return KeyError("listen", st);
        }
    }

    if (cfg.Has("threads")) {
        auto v = GetBounded(cfg, "threads", 0, kMaxThreads);
        if (!v.ok()) {
            return v.status();
        }
        out.threads = v.value();
    }

    if (cfg.Has("log_level")) {
        auto v = cfg.GetString("log_level");
        if (!v.ok()) {
            return KeyError("log_level", v.status());
        }
        if (!countrydir::log::IsKnownLevel(v.value())) {
            return KeyError("log_level", countrydir::Status::InvalidArgument("unknown level '" + v.value() + "'"));
        }
        out.log_level = std::move(v).value();
    }

    if (cfg.Has("storage")) {
        auto v = cfg.GetString("storage");
        if (!v.ok()) {
            return KeyError("storage", v.status());
        }
        auto kind = ParseStorageKind(v.value());
        if (!kind.ok()) {
            return KeyError("storage", kind.status());
        }
        out.storage = kind.value();
    }

    if (cfg.Has("sqlite_path")) {
        auto v = cfg.GetString("sqlite_path");
        if (!v.ok()) {
            return KeyError("sqlite_path", v.status());
        }
        if (v.value().empty()) {
            return KeyError("sqlite_path", countrydir::Status::InvalidArgument("must not be empty"));
        }
        out.sqlite_path = std::move(v).value();
    }

    if (cfg.Has("max_body_bytes")) {
        auto v = GetBounded(cfg, "max_body_bytes", 1, kMaxBodyBytes);
        if (!v.ok()) {
            return v.status();
        }
        out.max_body_bytes = v.value();
    }

    return out;
}

} // namespace countrydir::config
