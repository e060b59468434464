#include <meshdest/destination/registry.h>

#include <meshdest/core/log.h>

namespace meshdest::destination {

Registry::Registry(boost::asio::io_context& ioc, ResolverList resolvers, WatchOptions options)
    : ioc_(ioc), resolvers_(std::move(resolvers)), options_(options) {}

Registry::~Registry() {
    Shutdown();
}

std::shared_ptr<Subscription> Registry::Subscribe(const Destination& dst) {
    ReapRetired();

    for (;;) {
        std::shared_ptr<Watch> watch;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (shutdown_) {
                return Subscription::MakeClosed(Status(StatusCode::unavailable, "destination registry is shut down"));
            }
            if (auto it = watches_.find(dst); it != watches_.end()) {
                watch = it->second;
            }
        }

        if (!watch) {
            // Built outside the lock; a caller that lost the race drops its spare.
            auto fresh = std::make_shared<Watch>(dst, resolvers_, options_, ioc_,
                                                 [this](const std::shared_ptr<Watch>& w) { OnWatchClosed(w); });
            std::lock_guard<std::mutex> lk(mu_);
            if (shutdown_) {
                return Subscription::MakeClosed(Status(StatusCode::unavailable, "destination registry is shut down"));
            }
            auto [it, inserted] = watches_.try_emplace(dst, fresh);
            if (inserted) {
                log::debug("new watch for {}", dst.ToString());
            }
            watch = it->second;
        }

        if (auto sub = watch->Attach()) {
            return sub;
        }

        // The watch is closing. Only the first caller to notice replaces it.
        std::lock_guard<std::mutex> lk(mu_);
        auto it = watches_.find(dst);
        if (it != watches_.end() && it->second == watch) {
            watches_.erase(it);
            retired_.push_back(std::move(watch));
        }
    }
}

std::size_t Registry::WatchCount() const {
    std::lock_guard<std::mutex> lk(mu_);
    return watches_.size();
}

void Registry::OnWatchClosed(const std::shared_ptr<Watch>& watch) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = watches_.find(watch->destination());
    if (it != watches_.end() && it->second == watch) {
        watches_.erase(it);
    }
    if (!shutdown_) {
        retired_.push_back(watch);
    }
}

void Registry::ReapRetired() {
    std::vector<std::shared_ptr<Watch>> retired;
    {
        std::lock_guard<std::mutex> lk(mu_);
        retired.swap(retired_);
    }

    std::vector<std::shared_ptr<Watch>> pending;
    for (auto& w : retired) {
        if (w->exited()) {
            w->Join();
        } else {
            pending.push_back(std::move(w));
        }
    }

    if (!pending.empty()) {
        std::lock_guard<std::mutex> lk(mu_);
        retired_.insert(retired_.end(), pending.begin(), pending.end());
    }
}

void Registry::Shutdown() {
    std::vector<std::shared_ptr<Watch>> all;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (shutdown_) {
            return;
        }
        shutdown_ = true;
        for (auto& [_, w] : watches_) {
            all.push_back(w);
        }
        watches_.clear();
        all.insert(all.end(), retired_.begin(), retired_.end());
        retired_.clear();
    }

    log::info("shutting down {} watches", all.size());
    for (auto& w : all) {
        w->Close();
    }
    for (auto& w : all) {
        w->Join();
    }
}

} // namespace meshdest::destination
