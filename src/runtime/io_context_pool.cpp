#include <countrydir/runtime/io_context_pool.h>

#include <countrydir/core/log.h>

#include <stdexcept>

namespace countrydir {

IoContextPool::IoContextPool(std::size_t threads) {
    if (threads == 0) {
        throw std::invalid_argument("IoContextPool threads must be > 0");
    }

    contexts_.resize(threads);
    for (auto& slot : contexts_) {
        slot.ioc = std::make_unique<boost::asio::io_context>(1);
    }
}

IoContextPool::~IoContextPool() {
    Stop();
}

boost::asio::io_context& IoContextPool::Next() {
    auto idx = rr_.fetch_add(1, std::memory_order_relaxed) % contexts_.size();
    return *contexts_[idx].ioc;
}

void IoContextPool::Start() {
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true)) {
        return;
    }

    for (auto& slot : contexts_) {
        if (slot.ioc->stopped()) {
            slot.ioc->restart();
        }
        slot.guard.emplace(boost::asio::make_work_guard(*slot.ioc));
        slot.worker = std::thread([c = slot.ioc.get()] {
            try {
                c->run();
            } catch (const std::exception& e) {
                countrydir::log::error("io thread terminated by exception: {}", e.what());
            }
        });
    }
    countrydir::log::debug("io pool started with {} threads", contexts_.size());
}

void IoContextPool::Stop() {
    bool expected = true;
    if (!started_.compare_exchange_strong(expected, false)) {
        return;
    }

    for (auto& slot : contexts_) {
        slot.guard.reset();
        slot.ioc->stop();
    }
    for (auto& slot : contexts_) {
        if (slot.worker.joinable()) {
            slot.worker.join();
        }
    }
}

} // namespace countrydir
