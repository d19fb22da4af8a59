#include <countrydir/config/command_line.h>

#include <countrydir/core/log.h>

#include <charconv>
#include <ostream>
#include <string>
#include <string_view>

namespace countrydir::config {
namespace {

void PrintUsage(std::ostream& out, const char* argv0) {
    out << "Usage: " << argv0 << " [options]\n"
        << "  --config FILE     JSON config file\n"
        << "  --listen HOST:PORT  (default 0.0.0.0:8087)\n"
        << "  --threads N       io threads, 0 = hardware concurrency\n"
        << "  --log LEVEL       trace|debug|info|warn|error|critical|off\n"
        << "  --storage KIND    memory|sqlite\n"
        << "  --db PATH         SQLite database file\n";
}

bool ParseCount(std::string_view s, std::size_t& out) {
    std::size_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (s.empty() || ec != std::errc() || ptr != s.data() + s.size()) {
        return false;
    }
    out = v;
    return true;
}

} // namespace

CliOutcome ApplyCommandLine(int argc, const char* const* argv, ServiceConfig& cfg, std::ostream& err) {
    const char* argv0 = argc > 0 ? argv[0] : "country_service";

    for (int i = 1; i < argc; ++i) {
        std::string_view a(argv[i]);
        if (a == "--help" || a == "-h") {
            PrintUsage(err, argv0);
            return CliOutcome::help;
        }
    }

    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string_view(argv[i]) == "--config") {
            auto file = Config::LoadFile(argv[i + 1]);
            if (!file.ok()) {
                err << "Cannot load config: " << file.status().message() << "\n";
                return CliOutcome::error;
            }
            auto parsed = ServiceConfig::FromConfig(file.value());
            if (!parsed.ok()) {
                err << "Invalid config: " << parsed.status().message() << "\n";
                return CliOutcome::error;
            }
            cfg = std::move(parsed).value();
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string_view a(argv[i]);
        if (i + 1 >= argc) {
            err << "Missing value for " << a << "\n";
            return CliOutcome::error;
        }
        std::string_view v(argv[++i]);
        if (a == "--config") {
            continue;
        } else if (a == "--listen") {
            auto st = ParseHostPort(v, cfg.listen_host, cfg.listen_port);
            if (!st.ok()) {
                err << "Invalid --listen: " << st.message() << "\n";
                return CliOutcome::error;
            }
        } else if (a == "--threads") {
            std::size_t n = 0;
            if (!ParseCount(v, n) || n > kMaxThreads) {
                err << "Invalid --threads, expected 0.." << kMaxThreads << "\n";
                return CliOutcome::error;
            }
            cfg.threads = n;
        } else if (a == "--log") {
            if (!countrydir::log::IsKnownLevel(v)) {
                err << "Invalid --log level '" << v << "'\n";
                return CliOutcome::error;
            }
            cfg.log_level = std::string(v);
        } else if (a == "--storage") {
            auto kind = ParseStorageKind(v);
            if (!kind.ok()) {
                err << "Invalid --storage: " << kind.status().message() << "\n";
                return CliOutcome::error;
            }
            cfg.storage = kind.value();
        } else if (a == "--db") {
            if (v.empty()) {
                err << "Invalid --db, expected a path\n";
                return CliOutcome::error;
            }
            cfg.sqlite_path = std::string(v);
        } else {
            err << "Unknown option " << a << "\n";
            PrintUsage(err, argv0);
            return CliOutcome::error;
        }
    }
    return CliOutcome::run;
}

} // namespace countrydir::config
