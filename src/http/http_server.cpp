#include <countrydir/http/http_server.h>

#include <countrydir/core/metrics.h>
#include <countrydir/http/types.h>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <countrydir/core/log.h>

#include <chrono>
#include <optional>
#include <string_view>

namespace countrydir::http {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

constexpr const char* kServerName = "countrydir/1.0";

void RecordRequest(countrydir::MetricsRegistry& metrics, const Request& req, const Response& resp, double elapsed_ms) {
    // Label by route pattern, not raw path, so ids do not create new series.
    std::string route = req.route.empty() ? "unmatched" : req.route;
    auto method = http::to_string(req.raw.method());

    metrics.HistogramMetric(
        "http_server_request_ms",
        "HTTP server request latency (ms)",
        {0.25, 0.5, 1, 2, 5, 10, 25, 50, 100, 250},
        MetricLabels{{{"route", route}}})
        .Observe(elapsed_ms);
    metrics.CounterMetric(
        "http_server_requests_total",
        "HTTP server requests total",
        MetricLabels{{{"route", route}, {"method", std::string(method.data(), method.size())}, {"status", std::to_string(resp.status)}}})
        .Inc(1);
}

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, std::shared_ptr<const Router> router, HttpServerOptions opts)
        : stream_(std::move(socket)), router_(std::move(router)), opts_(opts) {}

    void Run() {
        Read();
    }

private:
    void Read() {
        parser_.emplace();
        parser_->body_limit(opts_.max_body_bytes);
        stream_.expires_after(opts_.idle_timeout);
        http::async_read(stream_, buffer_, *parser_,
            beast::bind_front_handler(&HttpSession::OnRead, shared_from_this()));
    }

    void OnRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return DoClose();
        }
        if (ec == http::error::body_limit) {
            countrydir::log::warn("request body exceeds {} bytes, closing connection", opts_.max_body_bytes);
            Response resp;
            resp.status = 413;
            resp.SetJson("{\"error\":\"payload_too_large\"}");
            return Write(parser_->get().version(), false, std::move(resp));
        }
        if (ec) {
            if (ec != beast::error::timeout) {
                countrydir::log::debug("read failed: {}", ec.message());
            }
            return;
        }

        auto start = std::chrono::steady_clock::now();

        Request req;
        req.raw = parser_->release();
        req.SetTarget(std::string_view(req.raw.target().data(), req.raw.target().size()));

        Response resp;
        router_->Handle(req, resp);

        auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        RecordRequest(*opts_.metrics, req, resp, elapsed);

        Write(req.raw.version(), req.raw.keep_alive(), std::move(resp));
    }

    void Write(unsigned version, bool keep_alive, Response resp) {
        auto out = std::make_shared<http::response<http::string_body>>(http::status(resp.status), version);
        out->keep_alive(keep_alive);
        out->set(http::field::server, kServerName);
        out->set(http::field::content_type, resp.content_type);
        for (const auto& h : resp.headers) {
            out->set(h.first, h.second);
        }
        out->body() = std::move(resp.body);
        out->prepare_payload();

        http::async_write(stream_, *out,
            beast::bind_front_handler(&HttpSession::OnWrite, shared_from_this(), out->need_eof(), out));
    }

    void OnWrite(bool close, std::shared_ptr<void>, beast::error_code ec, std::size_t) {
        if (ec) {
            countrydir::log::debug("write failed: {}", ec.message());
            return;
        }
        if (close) {
            return DoClose();
        }
        Read();
    }

    void DoClose() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<const Router> router_;
    HttpServerOptions opts_;
};

} // namespace

HttpServer::HttpServer(boost::asio::io_context& ioc, ListenAddress addr, Router router, HttpServerOptions opts)
    : ioc_(ioc),
      addr_(std::move(addr)),
      router_(std::make_shared<const Router>(std::move(router))),
      opts_(opts),
      acceptor_(ioc) {
    if (opts_.metrics == nullptr) {
        opts_.metrics = &countrydir::DefaultMetrics();
    }
}

countrydir::Status HttpServer::Start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return countrydir::Status::Ok();
    }

    auto fail = [this](std::string what, const beast::error_code& ec) {
        running_.store(false, std::memory_order_release);
        beast::error_code ignored;
        acceptor_.close(ignored);
        countrydir::log::error("{}: {}", what, ec.message());
        return countrydir::Status::Unavailable(what + ": " + ec.message());
    };

    beast::error_code ec;
    auto address = boost::asio::ip::make_address(addr_.host, ec);
    if (ec) {
        return fail("invalid listen address " + addr_.host, ec);
    }
    tcp::endpoint endpoint{address, addr_.port};

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        return fail("acceptor open failed", ec);
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
        countrydir::log::warn("acceptor set_option failed: {}", ec.message());
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        return fail("acceptor bind failed", ec);
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        return fail("acceptor listen failed", ec);
    }

    auto local = acceptor_.local_endpoint(ec);
    bound_port_.store(ec ? addr_.port : local.port(), std::memory_order_release);

    countrydir::log::info("HTTP server listening on {}:{}", addr_.host, port());
    DoAccept();
    return countrydir::Status::Ok();
}

void HttpServer::Stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }

    // The acceptor is only touched from its own executor once accepting.
    boost::asio::post(acceptor_.get_executor(), [self = shared_from_this()] {
        beast::error_code ec;
        self->acceptor_.cancel(ec);
        self->acceptor_.close(ec);
    });
}

void HttpServer::DoAccept() {
    acceptor_.async_accept(boost::asio::make_strand(ioc_),
        [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
            if (ec) {
                if (self->running_.load(std::memory_order_relaxed)) {
                    countrydir::log::warn("accept failed: {}", ec.message());
                    self->DoAccept();
                }
                return;
            }

            std::make_shared<HttpSession>(std::move(socket), self->router_, self->opts_)->Run();
            self->DoAccept();
        });
}

} // namespace countrydir::http
