#pragma once

#include <memory>

#include <countrydir/core/metrics.h>
#include <countrydir/core/status.h>
#include <countrydir/country/country_service.h>
#include <countrydir/http/router.h>

namespace countrydir::country {

// HTTP status for a failed operation: invalid_argument 400, not_found 404,
// already_exists 409, unavailable 503, timeout 504, internal_error 500.
unsigned HttpStatusFor(countrydir::StatusCode code);

// Writes {"error": <kind>, "message": <text>} with the mapped status.
void WriteError(countrydir::http::Response& resp, const countrydir::Status& st);

// GET  /getcountries
// GET  /getcountries/{id}
// GET  /getcountries/countryname?name=X
// POST /addcountry
// PUT  /updatecountry/{id}
// DELETE /deletecountry/{id}
void RegisterCountryRoutes(countrydir::http::Router& router, std::shared_ptr<CountryService> service);

// /health and /metrics, plus the /actuator/health and /actuator/prometheus aliases.
void RegisterOpsRoutes(countrydir::http::Router& router, countrydir::MetricsRegistry& metrics = countrydir::DefaultMetrics());

} // namespace countrydir::country
