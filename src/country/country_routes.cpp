#include <countrydir/country/country_routes.h>

#include <chjson/chjson.hpp>

#include <string>

namespace countrydir::country {
namespace {

using countrydir::http::Request;
using countrydir::http::Response;

void SetJson(Response& resp, std::string json, unsigned status = 200) {
    resp.status = status;
    resp.SetJson(std::move(json));
}

template <class T, class OnOk>
void Respond(Response& resp, const countrydir::Result<T>& r, OnOk on_ok) {
    if (!r.ok()) {
        WriteError(resp, r.status());
        return;
    }
    on_ok(r.value());
}

} // namespace

unsigned HttpStatusFor(countrydir::StatusCode code) {
    switch (code) {
        case countrydir::StatusCode::ok: return 200;
        case countrydir::StatusCode::invalid_argument: return 400;
        case countrydir::StatusCode::not_found: return 404;
        case countrydir::StatusCode::already_exists: return 409;
        case countrydir::StatusCode::timeout: return 504;
        case countrydir::StatusCode::unavailable: return 503;
        case countrydir::StatusCode::internal_error: return 500;
    }
    return 500;
}

void WriteError(Response& resp, const countrydir::Status& st) {
    chjson::value j(chjson::value::object{
        {"error", chjson::value(std::string(countrydir::StatusCodeName(st.code())))},
        {"message", chjson::value(st.message())},
    });
    SetJson(resp, chjson::dump(j), HttpStatusFor(st.code()));
}

void RegisterCountryRoutes(countrydir::http::Router& r, std::shared_ptr<CountryService> service) {
    r.Get("/getcountries", [service](const Request&, Response& resp) {
        Respond(resp, service->ListAll(), [&](const std::vector<Country>& list) {
            SetJson(resp, ToJsonString(list));
        });
    });

    // Registered as an exact path, so it is matched before "/getcountries/{id}".
    r.Get("/getcountries/countryname", [service](const Request& req, Response& resp) {
        Respond(resp, service->GetByName(req.Query("name")), [&](const Country& c) {
            SetJson(resp, ToJsonString(c));
        });
    });

    r.Get("/getcountries/{id}", [service](const Request& req, Response& resp) {
        auto id = ParseId(req.Param("id"));
        if (!id.ok()) {
            return WriteError(resp, id.status());
        }
        Respond(resp, service->GetById(id.value()), [&](const Country& c) {
            SetJson(resp, ToJsonString(c));
        });
    });

    r.Post("/addcountry", [service](const Request& req, Response& resp) {
        auto payload = FromJson(req.raw.body());
        if (!payload.ok()) {
            return WriteError(resp, payload.status());
        }
        Respond(resp, service->Create(std::move(payload).value()), [&](const Country& c) {
            resp.headers["location"] = "/getcountries/" + std::to_string(c.id);
            SetJson(resp, ToJsonString(c), 201);
        });
    });

    r.Put("/updatecountry/{id}", [service](const Request& req, Response& resp) {
        auto id = ParseId(req.Param("id"));
        if (!id.ok()) {
            return WriteError(resp, id.status());
        }
        auto payload = FromJson(req.raw.body());
        if (!payload.ok()) {
            return WriteError(resp, payload.status());
        }
        Respond(resp, service->Update(id.value(), std::move(payload).value()), [&](const Country& c) {
            SetJson(resp, ToJsonString(c));
        });
    });

    r.Delete("/deletecountry/{id}", [service](const Request& req, Response& resp) {
        auto id = ParseId(req.Param("id"));
        if (!id.ok()) {
            return WriteError(resp, id.status());
        }
        Respond(resp, service->Delete(id.value()), [&](const Country& c) {
            chjson::value j(chjson::value::object{
                {"deleted", chjson::value(true)},
                {"idCountry", chjson::value::integer(c.id)},
            });
            SetJson(resp, chjson::dump(j));
        });
    });
}

void RegisterOpsRoutes(countrydir::http::Router& r, countrydir::MetricsRegistry& metrics) {
    auto health = [](const Request&, Response& resp) {
        resp.SetText(200, "ok");
    };
    auto scrape = [&metrics](const Request&, Response& resp) {
        resp.status = 200;
        resp.content_type = "text/plain; version=0.0.4; charset=utf-8";
        resp.body = metrics.ToPrometheusText();
    };

    r.Get("/health", health);
    r.Get("/actuator/health", health);
    r.Get("/metrics", scrape);
    r.Get("/actuator/prometheus", scrape);
}

} // namespace countrydir::country
