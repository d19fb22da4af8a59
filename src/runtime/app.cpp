#include <countrydir/runtime/app.h>

#include <countrydir/core/log.h>

#include <csignal>
#include <thread>

#include <boost/asio/signal_set.hpp>

namespace countrydir {

std::size_t App::ResolveThreads(std::size_t requested) {
    if (requested != 0) {
        return requested;
    }
    auto hc = static_cast<std::size_t>(std::thread::hardware_concurrency());
    return hc == 0 ? static_cast<std::size_t>(1) : hc;
}

App::App(AppOptions options)
    : options_(std::move(options)),
      io_(ResolveThreads(options_.io_threads)) {
    countrydir::log::Init(options_.log_level);
}

App::~App() {
    Stop();
}

IoContextPool& App::Io() {
    return io_;
}

void App::AddServer(std::shared_ptr<IHttpServer> server) {
    servers_.push_back(std::move(server));
}

int App::Run() {
    {
        std::lock_guard<std::mutex> lk(wake_mu_);
        wake_ = false;
    }
    stop_requested_.store(false, std::memory_order_release);

    // Keep the signal_set alive by capturing it.
    auto signals = std::make_shared<boost::asio::signal_set>(io_.Next(), SIGINT, SIGTERM);
    signals->async_wait([this, signals](const boost::system::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        countrydir::log::info("Received signal {}", signo);
        this->RequestStop();
    });

    io_.Start();

    for (auto& s : servers_) {
        auto st = s->Start();
        if (!st.ok()) {
            countrydir::log::error("Server failed to start: {}", st.ToString());
            Stop();
            return 1;
        }
    }

    {
        std::unique_lock<std::mutex> lk(wake_mu_);
        wake_cv_.wait(lk, [&] { return wake_; });
    }

    Stop();
    return 0;
}

void App::RequestStop() {
    {
        std::lock_guard<std::mutex> lk(wake_mu_);
        wake_ = true;
    }
    wake_cv_.notify_all();
}

void App::Stop() {
    if (stop_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    countrydir::log::info("Stopping app...");
    for (auto& s : servers_) {
        s->Stop();
    }
    io_.Stop();
    countrydir::log::info("Stopped.");

    RequestStop();
}

} // namespace countrydir
