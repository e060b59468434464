#include <meshdest/runtime/io_context_pool.h>

#include <stdexcept>

namespace meshdest {

IoContextPool::IoContextPool(std::size_t threads) {
    if (threads == 0) {
        throw std::invalid_argument("IoContextPool threads must be > 0");
    }

    contexts_.reserve(threads);
    guards_.resize(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        contexts_.push_back(std::make_unique<boost::asio::io_context>(1));
    }
}

IoContextPool::~IoContextPool() {
    Stop();
}

boost::asio::io_context& IoContextPool::Next() {
    auto idx = rr_.fetch_add(1, std::memory_order_relaxed) % contexts_.size();
    return *contexts_[idx];
}

void IoContextPool::Start() {
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true)) {
        return;
    }

    workers_.reserve(contexts_.size());
    for (std::size_t i = 0; i < contexts_.size(); ++i) {
        auto* ctx = contexts_[i].get();
        ctx->restart();
        guards_[i].emplace(boost::asio::make_work_guard(*ctx));
        workers_.emplace_back([ctx] { ctx->run(); });
    }
}

void IoContextPool::Stop() {
    bool expected = true;
    if (!started_.compare_exchange_strong(expected, false)) {
        return;
    }

    for (auto& g : guards_) {
        g.reset();
    }
    for (auto& ctx : contexts_) {
        ctx->stop();
    }
    for (auto& t : workers_) {
        if (t.joinable()) {
            t.join();
        }
    }
    workers_.clear();
}

} // namespace meshdest
