#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace meshdest {

// One io_context per thread, handed out round-robin.
class IoContextPool {
public:
    explicit IoContextPool(std::size_t threads);
    ~IoContextPool();

    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    // Thread-safe
    boost::asio::io_context& Next();

    std::size_t Size() const { return contexts_.size(); }

    // Start() after Stop() runs the contexts again.
    void Start();
    void Stop();

private:
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    std::vector<std::unique_ptr<boost::asio::io_context>> contexts_;
    std::vector<std::optional<WorkGuard>> guards_;
    std::vector<std::thread> workers_;
    std::atomic<std::size_t> rr_{0};
    std::atomic<bool> started_{false};
};

} // namespace meshdest
