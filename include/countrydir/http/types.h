#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

#include <boost/beast/http.hpp>

namespace countrydir::http {

namespace beast_http = boost::beast::http;

struct Request {
    beast_http::request<beast_http::string_body> raw;
    std::string path; // target without query
    std::unordered_map<std::string, std::string> query; // percent-decoded
    std::unordered_map<std::string, std::string> params; // filled by Router from "{name}" segments
    std::string route; // matched route pattern, empty when nothing matched

    std::string_view Query(std::string_view key) const;
    std::string_view Param(std::string_view key) const;

    // Splits `target` into path and query parameters.
    void SetTarget(std::string_view target);
};

struct Response {
    unsigned status = 200;
    std::string body;
    std::string content_type = "text/plain; charset=utf-8";
    std::unordered_map<std::string, std::string> headers;

    void SetJson(std::string json);
    void SetText(unsigned code, std::string text);
};

// application/x-www-form-urlencoded decoding: "%XX" escapes and '+' as space.
// Malformed escapes are kept verbatim.
std::string PercentDecode(std::string_view s);

} // namespace countrydir::http
