#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio/ip/tcp.hpp>

#include <countrydir/core/metrics.h>
#include <countrydir/core/status.h>
#include <countrydir/runtime/app.h>
#include <countrydir/http/router.h>

namespace countrydir::http {

struct ListenAddress {
    std::string host;
    std::uint16_t port = 0; // 0 picks an ephemeral port, see HttpServer::port()
};

struct HttpServerOptions {
    std::size_t max_body_bytes = 64 * 1024;
    std::chrono::seconds idle_timeout{30};
    // Receives http_server_* series; nullptr means DefaultMetrics().
    countrydir::MetricsRegistry* metrics = nullptr;
};

class HttpServer final : public countrydir::IHttpServer, public std::enable_shared_from_this<HttpServer> {
public:
    HttpServer(boost::asio::io_context& ioc, ListenAddress addr, Router router, HttpServerOptions opts = {});

    // Binds and listens synchronously, then accepts asynchronously on `ioc`.
    countrydir::Status Start() override;
    void Stop() override;

    // Bound port; valid after a successful Start().
    std::uint16_t port() const { return bound_port_.load(std::memory_order_acquire); }

private:
    void DoAccept();

    boost::asio::io_context& ioc_;
    ListenAddress addr_;
    std::shared_ptr<const Router> router_; // shared with live sessions
    HttpServerOptions opts_;

    boost::asio::ip::tcp::acceptor acceptor_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> bound_port_{0};
};

} // namespace countrydir::http
