#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <boost/beast/http.hpp>

#include <countrydir/http/types.h>

namespace countrydir::http {

using Handler = std::function<void(const Request&, Response&)>;
using Next = std::function<void()>;
using Middleware = std::function<void(const Request&, Response&, Next)>;

// Routes are either exact paths ("/getcountries") or patterns whose "{name}"
// segments capture one path segment each ("/getcountries/{id}"). Exact routes
// win over patterns; patterns are tried in registration order.
class Router {
public:
    // Thread-safe for read after construction. Build routes before serving.
    void Use(Middleware mw);

    void AddRoute(boost::beast::http::verb method, std::string path, Handler handler);

    void Get(std::string path, Handler handler) { AddRoute(boost::beast::http::verb::get, std::move(path), std::move(handler)); }
    void Post(std::string path, Handler handler) { AddRoute(boost::beast::http::verb::post, std::move(path), std::move(handler)); }
    void Put(std::string path, Handler handler) { AddRoute(boost::beast::http::verb::put, std::move(path), std::move(handler)); }
    void Delete(std::string path, Handler handler) { AddRoute(boost::beast::http::verb::delete_, std::move(path), std::move(handler)); }

    // Fills req.params and req.route, then runs middleware and the handler.
    // Unknown paths get 404, known paths with another verb get 405.
    // Exceptions thrown by handlers become 500 responses.
    void Handle(Request& req, Response& resp) const;

private:
    struct RouteKey {
        boost::beast::http::verb method;
        std::string path;

        bool operator==(const RouteKey& o) const { return method == o.method && path == o.path; }
    };

    struct RouteKeyHash {
        std::size_t operator()(const RouteKey& k) const;
    };

    struct PatternRoute {
        boost::beast::http::verb method;
        std::string pattern;
        std::vector<std::string> segments;
        Handler handler;
    };

    static std::vector<std::string_view> SplitPath(std::string_view path);
    static bool IsParamSegment(std::string_view segment);
    static bool MatchPattern(const PatternRoute& route,
        const std::vector<std::string_view>& parts,
        std::unordered_map<std::string, std::string>* params);

    std::vector<std::string> AllowedMethods(const std::string& path, const std::vector<std::string_view>& parts) const;
    void Run(const Request& req, Response& resp, const Handler& handler) const;

    std::vector<Middleware> middleware_;
    std::unordered_map<RouteKey, Handler, RouteKeyHash> routes_;
    std::vector<PatternRoute> patterns_;
};

} // namespace countrydir::http
