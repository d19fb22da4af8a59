#include <countrydir/http/router.h>

#include <countrydir/core/log.h>

#include <boost/functional/hash.hpp>

#include <algorithm>
#include <exception>

namespace countrydir::http {
namespace {

std::string VerbName(boost::beast::http::verb method) {
    auto sv = boost::beast::http::to_string(method);
    return std::string(sv.data(), sv.size());
}

} // namespace

std::size_t Router::RouteKeyHash::operator()(const RouteKey& k) const {
    std::size_t seed = 0;
    boost::hash_combine(seed, static_cast<unsigned>(k.method));
    boost::hash_combine(seed, k.path);
    return seed;
}

std::vector<std::string_view> Router::SplitPath(std::string_view path) {
    std::vector<std::string_view> parts;
    if (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    while (true) {
        auto slash = path.find('/');
        parts.push_back(path.substr(0, slash));
        if (slash == std::string_view::npos) {
            break;
        }
        path.remove_prefix(slash + 1);
    }
    return parts;
}

bool Router::IsParamSegment(std::string_view segment) {
    return segment.size() > 2 && segment.front() == '{' && segment.back() == '}';
}

bool Router::MatchPattern(const PatternRoute& route,
    const std::vector<std::string_view>& parts,
    std::unordered_map<std::string, std::string>* params) {
    if (parts.size() != route.segments.size()) {
        return false;
    }
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const auto& seg = route.segments[i];
        if (IsParamSegment(seg)) {
            if (parts[i].empty()) {
                return false;
            }
            if (params != nullptr) {
                (*params)[seg.substr(1, seg.size() - 2)] = PercentDecode(parts[i]);
            }
        } else if (seg != parts[i]) {
            return false;
        }
    }
    return true;
}

void Router::Use(Middleware mw) {
    middleware_.push_back(std::move(mw));
}

void Router::AddRoute(boost::beast::http::verb method, std::string path, Handler handler) {
    auto parts = SplitPath(path);
    bool is_pattern = std::any_of(parts.begin(), parts.end(), IsParamSegment);
    if (!is_pattern) {
        routes_[RouteKey{method, std::move(path)}] = std::move(handler);
        return;
    }

    PatternRoute route;
    route.method = method;
    route.segments.assign(parts.begin(), parts.end());
    route.pattern = std::move(path);
    route.handler = std::move(handler);
    patterns_.push_back(std::move(route));
}

std::vector<std::string> Router::AllowedMethods(const std::string& path, const std::vector<std::string_view>& parts) const {
    std::vector<std::string> allowed;
    auto add = [&](boost::beast::http::verb m) {
        auto name = VerbName(m);
        if (std::find(allowed.begin(), allowed.end(), name) == allowed.end()) {
            allowed.push_back(std::move(name));
        }
    };
    for (const auto& kv : routes_) {
        if (kv.first.path == path) {
            add(kv.first.method);
        }
    }
    for (const auto& p : patterns_) {
        if (MatchPattern(p, parts, nullptr)) {
            add(p.method);
        }
    }
    std::sort(allowed.begin(), allowed.end());
    return allowed;
}

void Router::Run(const Request& req, Response& resp, const Handler& handler) const {
    try {
        // Build middleware chain.
        std::size_t idx = 0;
        std::function<void()> run;
        run = [&]() {
            if (idx < middleware_.size()) {
                auto& mw = middleware_[idx++];
                mw(req, resp, run);
                return;
            }
            handler(req, resp);
        };

        run();
    } catch (const std::exception& e) {
        countrydir::log::error("{} {} failed: {}", VerbName(req.raw.method()), req.path, e.what());
        // Headers set by middleware (e.g. x-request-id) are kept.
        resp.status = 500;
        resp.SetJson("{\"error\":\"internal_error\"}");
    }
}

void Router::Handle(Request& req, Response& resp) const {
    req.params.clear();
    req.route.clear();

    if (auto it = routes_.find(RouteKey{req.raw.method(), req.path}); it != routes_.end()) {
        req.route = req.path;
        Run(req, resp, it->second);
        return;
    }

    auto parts = SplitPath(req.path);
    for (const auto& p : patterns_) {
        if (p.method != req.raw.method()) {
            continue;
        }
        std::unordered_map<std::string, std::string> params;
        if (MatchPattern(p, parts, &params)) {
            req.params = std::move(params);
            req.route = p.pattern;
            Run(req, resp, p.handler);
            return;
        }
    }

    auto allowed = AllowedMethods(req.path, parts);
    if (!allowed.empty()) {
        std::string allow;
        for (const auto& m : allowed) {
            if (!allow.empty()) {
                allow += ", ";
            }
            allow += m;
        }
        resp.status = 405;
        resp.headers["allow"] = std::move(allow);
        resp.SetJson("{\"error\":\"method_not_allowed\"}");
        return;
    }

    resp.status = 404;
    resp.SetJson("{\"error\":\"not_found\"}");
}

} // namespace countrydir::http
