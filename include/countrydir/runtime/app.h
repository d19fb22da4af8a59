#pragma once

#include <atomic>
#include <cstddef>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <countrydir/core/status.h>
#include <countrydir/runtime/io_context_pool.h>

namespace countrydir {

class IHttpServer {
public:
    virtual ~IHttpServer() = default;
    virtual countrydir::Status Start() = 0;
    virtual void Stop() = 0;
};

struct AppOptions {
    std::size_t io_threads = 0; // 0 = hardware concurrency
    std::string log_level = "info";
};

class App {
public:
    explicit App(AppOptions options);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    IoContextPool& Io();

    void AddServer(std::shared_ptr<IHttpServer> server);

    // Blocks until Stop(), SIGINT or SIGTERM. Returns the process exit code:
    // 0 after a clean stop, 1 if a server failed to start.
    int Run();

    // Thread-safe, idempotent. Joins the io threads, so it must not be called
    // from a handler running on the pool; use RequestStop() there.
    void Stop();

    // Thread-safe, callable from io threads. Wakes Run(), which then stops.
    void RequestStop();

private:
    static std::size_t ResolveThreads(std::size_t requested);

    AppOptions options_;
    IoContextPool io_;
    std::vector<std::shared_ptr<IHttpServer>> servers_;

    std::atomic<bool> stop_requested_{false};
    std::mutex wake_mu_;
    std::condition_variable wake_cv_;
    bool wake_{false};
};

} // namespace countrydir
