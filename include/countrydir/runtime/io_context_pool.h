#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>

namespace countrydir {

// One single-threaded io_context per worker thread; Next() hands them out round-robin.
class IoContextPool {
public:
    explicit IoContextPool(std::size_t threads);
    ~IoContextPool();

    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    // Thread-safe
    boost::asio::io_context& Next();

    std::size_t size() const { return contexts_.size(); }

    // Start() after Stop() restarts the contexts; work queued meanwhile is kept.
    void Start();
    void Stop();

private:
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    struct Slot {
        std::unique_ptr<boost::asio::io_context> ioc;
        std::optional<WorkGuard> guard;
        std::thread worker;
    };

    std::vector<Slot> contexts_;
    std::atomic<std::size_t> rr_{0};
    std::atomic<bool> started_{false};
};

} // namespace countrydir
