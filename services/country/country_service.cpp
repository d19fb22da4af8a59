#include <countrydir/config/command_line.h>
#include <countrydir/config/config.h>
#include <countrydir/core/log.h>
#include <countrydir/core/metrics.h>
#include <countrydir/country/country_repository.h>
#include <countrydir/country/country_routes.h>
#include <countrydir/country/country_service.h>
#include <countrydir/country/sqlite_country_repository.h>
#include <countrydir/http/http_server.h>
#include <countrydir/http/router.h>
#include <countrydir/runtime/app.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace {

using countrydir::config::ServiceConfig;

std::string MakeRequestId() {
    static std::atomic<std::uint64_t> seq{0};
    auto now = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now().time_since_epoch()).count());
    auto s = seq.fetch_add(1, std::memory_order_relaxed);
    return std::to_string(now) + "-" + std::to_string(s);
}

countrydir::Result<std::shared_ptr<countrydir::country::ICountryRepository>> OpenRepository(const ServiceConfig& cfg) {
    using countrydir::config::StorageKind;
    if (cfg.storage == StorageKind::sqlite) {
        auto repo = countrydir::country::SqliteCountryRepository::Open(cfg.sqlite_path);
        if (!repo.ok()) {
            return repo.status();
        }
        return std::shared_ptr<countrydir::country::ICountryRepository>(std::move(repo).value());
    }
    return std::shared_ptr<countrydir::country::ICountryRepository>(
        std::make_shared<countrydir::country::InMemoryCountryRepository>());
}

int RunService(const ServiceConfig& cfg) {
    countrydir::AppOptions opt;
    opt.io_threads = cfg.threads;
    opt.log_level = cfg.log_level;

    countrydir::App app(opt);

    auto repo = OpenRepository(cfg);
    if (!repo.ok()) {
        countrydir::log::error("Cannot open country store: {}", repo.status().ToString());
        return 1;
    }
    auto service = std::make_shared<countrydir::country::CountryService>(repo.value());

    countrydir::http::Router r;

    // Middleware: propagate / generate request-id.
    r.Use([](const countrydir::http::Request& req, countrydir::http::Response& resp, countrydir::http::Next next) {
        std::string req_id;
        if (auto it = req.raw.find("x-request-id"); it != req.raw.end()) {
            req_id.assign(it->value().data(), it->value().size());
        } else {
            req_id = MakeRequestId();
        }
        resp.headers["x-request-id"] = req_id;
        next();
    });

    countrydir::country::RegisterCountryRoutes(r, service);
    countrydir::country::RegisterOpsRoutes(r, countrydir::DefaultMetrics());

    countrydir::http::HttpServerOptions server_opts;
    server_opts.max_body_bytes = cfg.max_body_bytes;

    auto& ioc = app.Io().Next();
    auto server = std::make_shared<countrydir::http::HttpServer>(
        ioc, countrydir::http::ListenAddress{cfg.listen_host, cfg.listen_port}, std::move(r), server_opts);
    app.AddServer(server);

    countrydir::log::info("Country directory: http://{}:{} (storage={}, threads={})",
        cfg.listen_host, cfg.listen_port,
        cfg.storage == countrydir::config::StorageKind::sqlite ? cfg.sqlite_path : std::string("memory"),
        app.Io().size());
    countrydir::log::info("Press Ctrl+C to stop.");
    return app.Run();
}

} // namespace

int main(int argc, char** argv) {
    ServiceConfig cfg;
    switch (countrydir::config::ApplyCommandLine(argc, argv, cfg, std::cerr)) {
        case countrydir::config::CliOutcome::run: break;
        case countrydir::config::CliOutcome::help: return 0;
        case countrydir::config::CliOutcome::error: return 2;
    }

    try {
        return RunService(cfg);
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
}
