#include <chtest.hpp>

#include <countrydir/http/router.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace {

countrydir::http::Request MakeRequest(boost::beast::http::verb method, std::string target) {
    countrydir::http::Request req;
    req.raw.method(method);
    req.raw.target(target);
    req.SetTarget(target);
    return req;
}

} // namespace

TEST_CASE("Router routes exact path") {
    countrydir::http::Router r;
    bool called = false;

    r.Get("/health", [&](const countrydir::http::Request&, countrydir::http::Response& resp) {
        called = true;
        resp.status = 200;
        resp.body = "ok";
    });

    auto req = MakeRequest(boost::beast::http::verb::get, "/health");
    countrydir::http::Response resp;
    r.Handle(req, resp);

    REQUIRE(called);
    REQUIRE(resp.status == 200);
    REQUIRE(resp.body == "ok");
    REQUIRE(req.route == "/health");
}

TEST_CASE("Router returns 404 when missing") {
    countrydir::http::Router r;

    auto req = MakeRequest(boost::beast::http::verb::get, "/missing");
    countrydir::http::Response resp;
    r.Handle(req, resp);

    REQUIRE(resp.status == 404);
    REQUIRE(req.route.empty());
}

TEST_CASE("Router captures path parameters") {
    countrydir::http::Router r;
    std::string seen;

    r.Get("/items/{id}", [&](const countrydir::http::Request& req, countrydir::http::Response&) {
        seen = std::string(req.Param("id"));
    });

    auto req = MakeRequest(boost::beast::http::verb::get, "/items/42");
    countrydir::http::Response resp;
    r.Handle(req, resp);

    REQUIRE(resp.status == 200);
    REQUIRE(seen == "42");
    REQUIRE(req.route == "/items/{id}");
}

TEST_CASE("Router prefers exact routes over patterns") {
    countrydir::http::Router r;
    std::string hit;

    r.Get("/items/{id}", [&](const countrydir::http::Request&, countrydir::http::Response&) { hit = "pattern"; });
    r.Get("/items/special", [&](const countrydir::http::Request&, countrydir::http::Response&) { hit = "exact"; });

    auto req = MakeRequest(boost::beast::http::verb::get, "/items/special?x=1");
    countrydir::http::Response resp;
    r.Handle(req, resp);
    REQUIRE(hit == "exact");

    auto other = MakeRequest(boost::beast::http::verb::get, "/items/7");
    r.Handle(other, resp);
    REQUIRE(hit == "pattern");
}

TEST_CASE("Router does not match empty or extra segments") {
    countrydir::http::Router r;
    r.Get("/items/{id}", [](const countrydir::http::Request&, countrydir::http::Response&) {});

    countrydir::http::Response empty_resp;
    auto empty = MakeRequest(boost::beast::http::verb::get, "/items/");
    r.Handle(empty, empty_resp);
    REQUIRE(empty_resp.status == 404);

    countrydir::http::Response extra_resp;
    auto extra = MakeRequest(boost::beast::http::verb::get, "/items/1/more");
    r.Handle(extra, extra_resp);
    REQUIRE(extra_resp.status == 404);
}

TEST_CASE("Router answers 405 with allowed methods") {
    countrydir::http::Router r;
    r.Put("/things/{id}", [](const countrydir::http::Request&, countrydir::http::Response&) {});
    r.Delete("/things/{id}", [](const countrydir::http::Request&, countrydir::http::Response&) {});

    auto req = MakeRequest(boost::beast::http::verb::get, "/things/3");
    countrydir::http::Response resp;
    r.Handle(req, resp);

    REQUIRE(resp.status == 405);
    REQUIRE(resp.headers["allow"] == "DELETE, PUT");
}

TEST_CASE("Router runs middleware in order around the handler") {
    countrydir::http::Router r;
    std::vector<std::string> trace;

    r.Use([&](const countrydir::http::Request&, countrydir::http::Response&, countrydir::http::Next next) {
        trace.push_back("first");
        next();
        trace.push_back("first-after");
    });
    r.Use([&](const countrydir::http::Request&, countrydir::http::Response&, countrydir::http::Next next) {
        trace.push_back("second");
        next();
    });
    r.Post("/run", [&](const countrydir::http::Request&, countrydir::http::Response&) {
        trace.push_back("handler");
    });

    auto req = MakeRequest(boost::beast::http::verb::post, "/run");
    countrydir::http::Response resp;
    r.Handle(req, resp);

    REQUIRE(trace.size() == 4);
    REQUIRE(trace[0] == "first");
    REQUIRE(trace[1] == "second");
    REQUIRE(trace[2] == "handler");
    REQUIRE(trace[3] == "first-after");
}

TEST_CASE("Router turns handler exceptions into 500") {
    countrydir::http::Router r;
    r.Use([](const countrydir::http::Request&, countrydir::http::Response& resp, countrydir::http::Next next) {
        resp.headers["x-request-id"] = "req-7";
        next();
    });
    r.Get("/boom", [](const countrydir::http::Request&, countrydir::http::Response& resp) {
        resp.body = "partial";
        resp.content_type = "text/html";
        throw std::runtime_error("boom");
    });

    auto req = MakeRequest(boost::beast::http::verb::get, "/boom");
    countrydir::http::Response resp;
    r.Handle(req, resp);

    REQUIRE(resp.status == 500);
    REQUIRE(resp.body == "{\"error\":\"internal_error\"}");
    REQUIRE(resp.content_type.find("application/json") != std::string::npos);
    REQUIRE(resp.headers.count("x-request-id") == 1);
    REQUIRE(resp.headers["x-request-id"] == "req-7");
}

TEST_CASE("Request decodes query parameters") {
    countrydir::http::Request req;
    req.SetTarget("/getcountries/countryname?name=United%20Kingdom&flag&city=Port+Louis&name=ignored");

    REQUIRE(req.path == "/getcountries/countryname");
    REQUIRE(req.Query("name") == "United Kingdom");
    REQUIRE(req.Query("city") == "Port Louis");
    REQUIRE(req.query.count("flag") == 1);
    REQUIRE(req.Query("missing").empty());
}

TEST_CASE("PercentDecode keeps malformed escapes") {
    REQUIRE(countrydir::http::PercentDecode("100%") == "100%");
    REQUIRE(countrydir::http::PercentDecode("%zz") == "%zz");
    REQUIRE(countrydir::http::PercentDecode("C%C3%B4te") == "C\xC3\xB4te");
}
