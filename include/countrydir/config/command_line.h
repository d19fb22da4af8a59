#pragma once

#include <iosfwd>

#include <countrydir/config/config.h>

namespace countrydir::config {

enum class CliOutcome {
    run,   // start the service with `cfg`
    help,  // usage was printed on request
    error, // a problem was printed
};

// Applies `--config FILE` first, then the remaining flags on top of it.
// Usage and errors go to `err`.
CliOutcome ApplyCommandLine(int argc, const char* const* argv, ServiceConfig& cfg, std::ostream& err);

} // namespace countrydir::config
