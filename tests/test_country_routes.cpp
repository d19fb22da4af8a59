#include <chtest.hpp>

#include <countrydir/core/metrics.h>
#include <countrydir/country/country_repository.h>
#include <countrydir/country/country_routes.h>
#include <countrydir/country/country_service.h>
#include <countrydir/http/router.h>

#include <chjson/chjson.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace beast_http = boost::beast::http;

namespace {

class RouteHarness {
public:
    RouteHarness()
        : service_(std::make_shared<countrydir::country::CountryService>(
              std::make_shared<countrydir::country::InMemoryCountryRepository>(), metrics_)) {
        countrydir::country::RegisterCountryRoutes(router_, service_);
        countrydir::country::RegisterOpsRoutes(router_, metrics_);
    }

    countrydir::http::Response Call(beast_http::verb method, std::string target, std::string body = {}) {
        countrydir::http::Request req;
        req.raw.method(method);
        req.raw.target(target);
        req.raw.body() = std::move(body);
        req.SetTarget(target);

        countrydir::http::Response resp;
        router_.Handle(req, resp);
        return resp;
    }

private:
    countrydir::MetricsRegistry metrics_;
    std::shared_ptr<countrydir::country::CountryService> service_;
    countrydir::http::Router router_;
};

bool Contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

// Top-level string field of a JSON object body, empty if absent.
std::string StringField(const std::string& body, std::string_view key) {
    auto r = chjson::parse(body);
    if (r.err || !r.doc.root().is_object()) {
        return {};
    }
    const auto* v = r.doc.root().find(key);
    if (v == nullptr || !v->is_string()) {
        return {};
    }
    return std::string(v->as_string_view());
}

countrydir::country::Country Decode(const std::string& body) {
    auto c = countrydir::country::FromJson(body);
    return c.ok() ? c.value() : countrydir::country::Country{};
}

} // namespace

TEST_CASE("POST /addcountry creates and GET reads back") {
    RouteHarness h;

    auto created = h.Call(beast_http::verb::post, "/addcountry", R"({"idCountry":1,"name":"France","capital":"Paris"})");
    REQUIRE(created.status == 201);
    REQUIRE(created.headers["location"] == "/getcountries/1");
    REQUIRE(Contains(created.content_type, "application/json"));
    REQUIRE(Decode(created.body) == (countrydir::country::Country{1, "France", "Paris"}));

    auto one = h.Call(beast_http::verb::get, "/getcountries/1");
    REQUIRE(one.status == 200);
    REQUIRE(Decode(one.body).name == "France");

    auto all = h.Call(beast_http::verb::get, "/getcountries");
    REQUIRE(all.status == 200);
    REQUIRE(all.body.front() == '[');
    REQUIRE(Contains(all.body, "France"));
}

TEST_CASE("GET /getcountries on an empty store is an empty array") {
    RouteHarness h;
    auto all = h.Call(beast_http::verb::get, "/getcountries");
    REQUIRE(all.status == 200);
    REQUIRE(all.body.front() == '[');
    REQUIRE(!Contains(all.body, "idCountry"));
}

TEST_CASE("countryname is not captured as an id") {
    RouteHarness h;
    REQUIRE(h.Call(beast_http::verb::post, "/addcountry", R"({"idCountry":7,"name":"New Zealand","capital":"Wellington"})").status == 201);

    auto found = h.Call(beast_http::verb::get, "/getcountries/countryname?name=New%20Zealand");
    REQUIRE(found.status == 200);
    REQUIRE(Decode(found.body).id == 7);

    auto missing = h.Call(beast_http::verb::get, "/getcountries/countryname?name=Atlantis");
    REQUIRE(missing.status == 404);
    REQUIRE(StringField(missing.body, "error") == "not_found");

    auto no_name = h.Call(beast_http::verb::get, "/getcountries/countryname");
    REQUIRE(no_name.status == 400);
}

TEST_CASE("Errors map to status codes with a JSON body") {
    RouteHarness h;

    REQUIRE(h.Call(beast_http::verb::get, "/getcountries/99").status == 404);
    REQUIRE(h.Call(beast_http::verb::get, "/getcountries/abc").status == 400);
    REQUIRE(h.Call(beast_http::verb::get, "/getcountries/-1").status == 400);

    auto bad_json = h.Call(beast_http::verb::post, "/addcountry", "{oops");
    REQUIRE(bad_json.status == 400);
    REQUIRE(StringField(bad_json.body, "error") == "invalid_argument");
    REQUIRE(!StringField(bad_json.body, "message").empty());

    REQUIRE(h.Call(beast_http::verb::post, "/addcountry", R"({"idCountry":1,"name":"France","capital":"Paris"})").status == 201);
    auto conflict = h.Call(beast_http::verb::post, "/addcountry", R"({"idCountry":1,"name":"France","capital":"Paris"})");
    REQUIRE(conflict.status == 409);
    REQUIRE(StringField(conflict.body, "error") == "conflict");
}

TEST_CASE("PUT /updatecountry replaces the record") {
    RouteHarness h;
    REQUIRE(h.Call(beast_http::verb::post, "/addcountry", R"({"idCountry":1,"name":"France","capital":"Paris"})").status == 201);

    auto updated = h.Call(beast_http::verb::put, "/updatecountry/1", R"({"name":"France","capital":"Lyon"})");
    REQUIRE(updated.status == 200);
    REQUIRE(Decode(updated.body) == (countrydir::country::Country{1, "France", "Lyon"}));
    REQUIRE(Decode(h.Call(beast_http::verb::get, "/getcountries/1").body).capital == "Lyon");

    REQUIRE(h.Call(beast_http::verb::put, "/updatecountry/2", R"({"name":"X","capital":"Y"})").status == 404);
    REQUIRE(h.Call(beast_http::verb::put, "/updatecountry/1", R"({"name":"France"})").status == 400);
}

TEST_CASE("DELETE /deletecountry confirms and removes") {
    RouteHarness h;
    REQUIRE(h.Call(beast_http::verb::post, "/addcountry", R"({"idCountry":1,"name":"France","capital":"Paris"})").status == 201);

    auto deleted = h.Call(beast_http::verb::delete_, "/deletecountry/1");
    REQUIRE(deleted.status == 200);
    REQUIRE(Contains(deleted.body, "true"));
    REQUIRE(h.Call(beast_http::verb::get, "/getcountries/1").status == 404);
    REQUIRE(h.Call(beast_http::verb::delete_, "/deletecountry/1").status == 404);
}

TEST_CASE("Wrong verb on a country path is 405") {
    RouteHarness h;
    auto resp = h.Call(beast_http::verb::get, "/deletecountry/1");
    REQUIRE(resp.status == 405);
    REQUIRE(resp.headers["allow"] == "DELETE");
}

TEST_CASE("Health and metrics endpoints respond") {
    RouteHarness h;
    REQUIRE(h.Call(beast_http::verb::get, "/health").body == "ok");
    REQUIRE(h.Call(beast_http::verb::get, "/actuator/health").status == 200);

    REQUIRE(h.Call(beast_http::verb::post, "/addcountry", R"({"name":"France","capital":"Paris"})").status == 201);
    auto metrics = h.Call(beast_http::verb::get, "/actuator/prometheus");
    REQUIRE(metrics.status == 200);
    REQUIRE(Contains(metrics.content_type, "version=0.0.4"));
    REQUIRE(Contains(metrics.body, "country_records 1"));
    REQUIRE(h.Call(beast_http::verb::get, "/metrics").body == metrics.body);
}

TEST_CASE("HttpStatusFor covers every failure kind") {
    using countrydir::StatusCode;
    REQUIRE(countrydir::country::HttpStatusFor(StatusCode::invalid_argument) == 400);
    REQUIRE(countrydir::country::HttpStatusFor(StatusCode::not_found) == 404);
    REQUIRE(countrydir::country::HttpStatusFor(StatusCode::already_exists) == 409);
    REQUIRE(countrydir::country::HttpStatusFor(StatusCode::unavailable) == 503);
    REQUIRE(countrydir::country::HttpStatusFor(StatusCode::timeout) == 504);
    REQUIRE(countrydir::country::HttpStatusFor(StatusCode::internal_error) == 500);
}
