#pragma once

#include <chrono>
#include <string>

#include <boost/beast/http/verb.hpp>

#include <countrydir/core/status.h>

namespace countrydir::http {

struct HttpClientRequest {
    boost::beast::http::verb method = boost::beast::http::verb::get;
    std::string target = "/";
    std::string body;
    std::string content_type = "application/json";
};

struct HttpClientResponse {
    int status = 0;
    std::string body;
    std::string content_type;
};

class HttpClient {
public:
    // Thread-safe: each call uses a local io_context. One request per connection.
    static countrydir::Result<HttpClientResponse> Send(
        std::string host,
        std::string port,
        HttpClientRequest request,
        std::chrono::milliseconds timeout);

    static countrydir::Result<HttpClientResponse> Get(
        std::string host,
        std::string port,
        std::string target,
        std::chrono::milliseconds timeout);
};

} // namespace countrydir::http
