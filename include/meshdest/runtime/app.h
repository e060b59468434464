#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <meshdest/runtime/io_context_pool.h>

namespace meshdest {

class IHttpServer {
public:
    virtual ~IHttpServer() = default;
    virtual void Start() = 0;
    virtual void Stop() = 0;
};

struct AppOptions {
    std::size_t io_threads = 0; // 0: one per core
    std::string log_level = "info";
};

// Process runtime: logging, the io thread pool and the servers on top of it.
class App {
public:
    explicit App(AppOptions options);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    IoContextPool& Io();

    void AddServer(std::shared_ptr<IHttpServer> server);

    // Blocks until Stop(), SIGINT or SIGTERM. Servers are stopped in reverse
    // order of registration while the io threads still run.
    int Run();

    // Thread-safe, idempotent.
    void Stop();

private:
    AppOptions options_;
    IoContextPool io_;
    std::vector<std::shared_ptr<IHttpServer>> servers_;

    std::atomic<bool> stop_requested_{false};
    std::mutex stop_mu_;
    std::condition_variable stop_cv_;
    bool stopped_{false};
};

} // namespace meshdest
