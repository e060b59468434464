#include <meshdest/runtime/app.h>

#include <meshdest/core/log.h>

#include <csignal>
#include <thread>

#include <boost/asio/signal_set.hpp>

namespace meshdest {
namespace {

std::size_t ThreadCount(std::size_t requested) {
    if (requested != 0) {
        return requested;
    }
    auto hc = static_cast<std::size_t>(std::thread::hardware_concurrency());
    return hc == 0 ? static_cast<std::size_t>(1) : hc;
}

} // namespace

App::App(AppOptions options) : options_(std::move(options)), io_(ThreadCount(options_.io_threads)) {
    meshdest::log::Init(options_.log_level);
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
        std::lock_guard<std::mutex> lk(stop_mu_);
        stopped_ = false;
    }
    stop_requested_.store(false, std::memory_order_release);

    auto signals = std::make_shared<boost::asio::signal_set>(io_.Next(), SIGINT, SIGTERM);
    signals->async_wait([this, signals](const boost::system::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        meshdest::log::info("received signal {}", signo);
        // Stop() joins the io threads, so it cannot run on one of them.
        std::thread([this] { Stop(); }).detach();
    });

    io_.Start();
    for (auto& s : servers_) {
        s->Start();
    }
    meshdest::log::info("running with {} io threads", io_.Size());

    std::unique_lock<std::mutex> lk(stop_mu_);
    stop_cv_.wait(lk, [&] { return stopped_; });
    return 0;
}

void App::Stop() {
    if (stop_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    meshdest::log::info("stopping...");
    for (auto it = servers_.rbegin(); it != servers_.rend(); ++it) {
        (*it)->Stop();
    }
    io_.Stop();
    meshdest::log::info("stopped");

    {
        std::lock_guard<std::mutex> lk(stop_mu_);
        stopped_ = true;
    }
    stop_cv_.notify_all();
}

} // namespace meshdest
