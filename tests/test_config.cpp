#include <chtest.hpp>

#include <countrydir/config/config.h>

#include <cstdio>
#include <fstream>
#include <string>

using countrydir::config::Config;
using countrydir::config::ServiceConfig;
using countrydir::config::StorageKind;

TEST_CASE("ServiceConfig defaults apply for an empty object") {
    auto cfg = Config::Parse("{}");
    REQUIRE(cfg.ok());

    auto sc = ServiceConfig::FromConfig(cfg.value());
    REQUIRE(sc.ok());
    REQUIRE(sc.value().listen_host == "0.0.0.0");
    REQUIRE(sc.value().listen_port == 8087);
    REQUIRE(sc.value().threads == 0);
    REQUIRE(sc.value().log_level == "info");
    REQUIRE(sc.value().storage == StorageKind::memory);
    REQUIRE(sc.value().max_body_bytes == 64 * 1024);
}

TEST_CASE("ServiceConfig reads every key") {
    auto cfg = Config::Parse(R"({
        "listen": "127.0.0.1:9000",
        "threads": 3,
        "log_level": "debug",
        "storage": "sqlite",
        "sqlite_path": "/tmp/c.db",
        "max_body_bytes": 1024
    })");
    REQUIRE(cfg.ok());

    auto sc = ServiceConfig::FromConfig(cfg.value());
    REQUIRE(sc.ok());
    REQUIRE(sc.value().listen_host == "127.0.0.1");
    REQUIRE(sc.value().listen_port == 9000);
    REQUIRE(sc.value().threads == 3);
    REQUIRE(sc.value().log_level == "debug");
    REQUIRE(sc.value().storage == StorageKind::sqlite);
    REQUIRE(sc.value().sqlite_path == "/tmp/c.db");
    REQUIRE(sc.value().max_body_bytes == 1024);
}

TEST_CASE("ServiceConfig rejects malformed values") {
    const char* bad[] = {
        R"({"listen": "nohost"})",
        R"({"listen": "host:99999"})",
        R"({"listen": 8087})",
        R"({"threads": -1})",
        R"({"threads": "four"})",
        R"({"log_level": "loud"})",
        R"({"storage": "redis"})",
        R"({"sqlite_path": ""})",
        R"({"max_body_bytes": 0})",
        R"({"max_body_bytes": 16777217})",
        R"({"threads": 1025})",
    };
    for (const char* text : bad) {
        auto cfg = Config::Parse(text);
        REQUIRE(cfg.ok());
        auto sc = ServiceConfig::FromConfig(cfg.value());
        REQUIRE(!sc.ok());
        REQUIRE(sc.status().code() == countrydir::StatusCode::invalid_argument);
    }
}

TEST_CASE("Config rejects invalid json and non-object roots") {
    REQUIRE(!Config::Parse("{\"listen\":").ok());
    REQUIRE(Config::Parse("[1, 2]").status().code() == countrydir::StatusCode::invalid_argument);
}

TEST_CASE("Config loads from file") {
    std::string path = "countrydir_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"storage": "memory", "threads": 2})";
    }

    auto cfg = Config::LoadFile(path);
    std::remove(path.c_str());

    REQUIRE(cfg.ok());
    REQUIRE(cfg.value().Has("threads"));
    REQUIRE(cfg.value().GetInt("threads").value() == 2);
    REQUIRE(cfg.value().GetString("storage").value() == "memory");
    REQUIRE(cfg.value().GetString("threads").status().code() == countrydir::StatusCode::invalid_argument);
    REQUIRE(cfg.value().GetString("absent").status().code() == countrydir::StatusCode::not_found);
}

TEST_CASE("Config reports a missing file as not_found") {
    auto cfg = Config::LoadFile("does/not/exist.json");
    REQUIRE(cfg.status().code() == countrydir::StatusCode::not_found);
}

TEST_CASE("ParseHostPort splits on the last colon") {
    std::string host;
    std::uint16_t port = 0;
    REQUIRE(countrydir::config::ParseHostPort("::1:8087", host, port).ok());
    REQUIRE(host == "::1");
    REQUIRE(port == 8087);
    REQUIRE(!countrydir::config::ParseHostPort("localhost:80x", host, port).ok());
    REQUIRE(!countrydir::config::ParseHostPort(":80", host, port).ok());
}

TEST_CASE("ServiceConfig range-checks integers wider than int") {
    // 2^32 + 1 and 2^32 would read as 1 and 0 if narrowed first.
    const char* wide[] = {
        R"({"max_body_bytes": 4294967297})",
        R"({"threads": 4294967296})",
        R"({"threads": -4294967296})",
    };
    for (const char* text : wide) {
        auto cfg = Config::Parse(text);
        REQUIRE(cfg.ok());
        auto sc = ServiceConfig::FromConfig(cfg.value());
        REQUIRE(!sc.ok());
        REQUIRE(sc.status().code() == countrydir::StatusCode::invalid_argument);
    }

    auto cfg = Config::Parse(R"({"big": 4294967297})");
    REQUIRE(cfg.ok());
    REQUIRE(cfg.value().GetInt("big").value() == 4294967297LL);
}

TEST_CASE("ServiceConfig accepts the upper bounds") {
    auto cfg = Config::Parse(R"({"threads": 1024, "max_body_bytes": 16777216})");
    REQUIRE(cfg.ok());
    auto sc = ServiceConfig::FromConfig(cfg.value());
    REQUIRE(sc.ok());
    REQUIRE(sc.value().threads == countrydir::config::kMaxThreads);
    REQUIRE(sc.value().max_body_bytes == countrydir::config::kMaxBodyBytes);
}
