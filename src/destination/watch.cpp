#include <meshdest/destination/watch.h>

#include <meshdest/core/log.h>
#include <meshdest/destination/differ.h>

namespace meshdest::destination {

std::string_view WatchStateName(WatchState state) {
    switch (state) {
        case WatchState::idle:
            return "idle";
        case WatchState::resolving:
            return "resolving";
        case WatchState::active:
            return "active";
        case WatchState::draining:
            return "draining";
        case WatchState::closed:
            return "closed";
    }
    return "unknown";
}

Watch::Watch(Destination destination, ResolverList resolvers, WatchOptions options,
             boost::asio::io_context& ioc, ClosedFn on_closed)
    : destination_(std::move(destination)),
      resolvers_(std::move(resolvers)),
      options_(options),
      on_closed_(std::move(on_closed)),
      linger_timer_(ioc) {}

Watch::~Watch() {
    done_.Fire();
    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

WatchState Watch::state() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

std::size_t Watch::subscriber_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return subscribers_.size();
}

std::string Watch::resolver_name() const {
    std::lock_guard<std::mutex> lk(mu_);
    return resolver_ ? std::string(resolver_->Name()) : std::string();
}

bool Watch::exited() const {
    std::lock_guard<std::mutex> lk(mu_);
    return exited_;
}

void Watch::RegisterMetricsLocked() {
    auto& m = DefaultMetrics();
    metrics_.labels.kv["destination"] = destination_.ToString();
    // A watch for the same destination may still be finishing; these series
    // replace its ones.
    metrics_.subscribers =
        m.AddGauge("destination_subscribers", "Subscriptions attached per destination", metrics_.labels);
    metrics_.exists = m.AddGauge("destination_exists", "Whether the destination currently exists", metrics_.labels);
    metrics_.endpoints = m.AddGauge("destination_endpoints", "Endpoints in the latest snapshot", metrics_.labels);
    metrics_.updates = m.AddCounter("destination_updates_total", "Deltas published to subscribers", metrics_.labels);
}

void Watch::RemoveMetricsLocked() {
    if (!metrics_.updates) {
        return;
    }
    auto& m = DefaultMetrics();
    m.RemoveGauge("destination_subscribers", metrics_.labels, metrics_.subscribers.get());
    m.RemoveGauge("destination_exists", metrics_.labels, metrics_.exists.get());
    m.RemoveGauge("destination_endpoints", metrics_.labels, metrics_.endpoints.get());
    m.RemoveCounter("destination_updates_total", metrics_.labels, metrics_.updates.get());
}

std::vector<std::shared_ptr<Subscription>> Watch::LiveSubscribersLocked() {
    std::vector<std::shared_ptr<Subscription>> live;
    live.reserve(subscribers_.size());
    for (auto it = subscribers_.begin(); it != subscribers_.end();) {
        if (auto s = it->second.lock()) {
            live.push_back(std::move(s));
            ++it;
        } else {
            it = subscribers_.erase(it);
            metrics_.subscribers->Add(-1);
        }
    }
    return live;
}

std::shared_ptr<Subscription> Watch::Attach() {
    std::shared_ptr<Subscription> sub;
    bool unresolvable = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ == WatchState::closed) {
            return nullptr;
        }

        sub = std::make_shared<Subscription>(next_id_++, options_.subscription_buffer, weak_from_this());

        switch (state_) {
            case WatchState::idle: {
                auto resolver = SelectResolver(resolvers_, destination_);
                if (!resolver) {
                    unresolvable = true;
                    state_ = WatchState::closed;
                    sub->Close(Status(StatusCode::invalid_argument,
                                      "cannot resolve destination " + destination_.ToString()));
                    break;
                }
                resolver_ = resolver;
                RegisterMetricsLocked();
                state_ = WatchState::resolving;
                exited_ = false;
                worker_ = std::thread([this, resolver] { Run(resolver); });
                break;
            }
            case WatchState::draining:
                ++linger_generation_;
                linger_timer_.cancel();
                state_ = last_ ? WatchState::active : WatchState::resolving;
                log::debug("watch {} revived before linger expired", destination_.ToString());
                break;
            default:
                break;
        }

        if (!unresolvable) {
            subscribers_.emplace(sub->id(), sub);
            metrics_.subscribers->Add(1);
            if (last_) {
                // Late join: catch up from the latest snapshot.
                if (!sub->Push(Diff(nullptr, *last_))) {
                    subscribers_.erase(sub->id());
                    metrics_.subscribers->Add(-1);
                }
            }
        }
    }

    if (unresolvable) {
        log::warn("no resolver accepts {}", destination_.ToString());
        if (on_closed_) {
            on_closed_(shared_from_this());
        }
    }
    return sub;
}

void Watch::Detach(Subscription::Id id) {
    std::lock_guard<std::mutex> lk(mu_);
    if (subscribers_.erase(id) == 0) {
        return;
    }
    metrics_.subscribers->Add(-1);
    if (subscribers_.empty() && (state_ == WatchState::resolving || state_ == WatchState::active)) {
        EnterDrainingLocked();
    }
}

void Watch::EnterDrainingLocked() {
    state_ = WatchState::draining;
    const auto generation = ++linger_generation_;
    if (options_.linger.count() <= 0) {
        BeginCloseLocked();
        return;
    }

    log::debug("watch {} draining for {}ms", destination_.ToString(), options_.linger.count());
    linger_timer_.expires_after(options_.linger);
    linger_timer_.async_wait([weak = weak_from_this(), generation](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        if (auto self = weak.lock()) {
            self->OnLingerExpired(generation);
        }
    });
}

void Watch::OnLingerExpired(std::uint64_t generation) {
    std::lock_guard<std::mutex> lk(mu_);
    if (generation != linger_generation_ || state_ != WatchState::draining) {
        return;
    }
    BeginCloseLocked();
}

void Watch::BeginCloseLocked() {
    state_ = WatchState::closed;
    ++linger_generation_;
    linger_timer_.cancel();
    done_.Fire();
}

void Watch::Close() {
    bool never_started = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ == WatchState::closed) {
            return;
        }
        never_started = state_ == WatchState::idle;
        BeginCloseLocked();
    }
    if (never_started && on_closed_) {
        on_closed_(shared_from_this());
    }
}

void Watch::Join() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lk(mu_);
        worker = std::move(worker_);
    }
    if (worker.joinable()) {
        if (worker.get_id() == std::this_thread::get_id()) {
            worker.detach();
            return;
        }
        worker.join();
    }

    std::unique_lock<std::mutex> lk(mu_);
    exited_cv_.wait(lk, [&] { return exited_; });
}

void Watch::Run(std::shared_ptr<IResolver> resolver) {
    log::info("resolving {} with {} resolver", destination_.ToString(), resolver->Name());
    Status st = resolver->StreamResolution(
        destination_, [this](EndpointSet next) { OnSnapshot(std::move(next)); }, done_);
    Finish(std::move(st));
}

void Watch::OnSnapshot(EndpointSet next) {
    // Subscriptions released by their last strong reference must not be
    // destroyed under mu_: their destructor calls back into Detach.
    std::vector<std::shared_ptr<Subscription>> live;
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ == WatchState::closed) {
        return;
    }

    Delta delta = Diff(last_ ? &*last_ : nullptr, next);
    const auto previous_size = last_ ? static_cast<std::int64_t>(last_->size()) : 0;
    metrics_.endpoints->Add(static_cast<std::int64_t>(next.size()) - previous_size);
    metrics_.exists->Set(next.exists() ? 1 : 0);
    last_ = std::move(next);

    if (state_ == WatchState::resolving) {
        state_ = WatchState::active;
    }
    if (delta.empty()) {
        return;
    }

    metrics_.updates->Inc();
    live = LiveSubscribersLocked();
    for (const auto& s : live) {
        if (!s->Push(delta)) {
            log::warn("dropping slow subscriber {} of {}", s->id(), destination_.ToString());
            subscribers_.erase(s->id());
            metrics_.subscribers->Add(-1);
        }
    }
    if (subscribers_.empty() && state_ == WatchState::active) {
        EnterDrainingLocked();
    }
}

void Watch::Finish(Status status) {
    std::vector<std::shared_ptr<Subscription>> live;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!status.ok()) {
            log::error("resolution of {} failed: {}", destination_.ToString(), status.ToString());
        } else if (state_ != WatchState::closed) {
            log::warn("resolver for {} ended unexpectedly", destination_.ToString());
        } else {
            log::debug("watch {} closed", destination_.ToString());
        }

        state_ = WatchState::closed;
        ++linger_generation_;
        linger_timer_.cancel();

        live = LiveSubscribersLocked();
        for (const auto& s : live) {
            s->Close(status);
        }
        subscribers_.clear();

        RemoveMetricsLocked();
        exited_ = true;
    }
    done_.Fire();
    exited_cv_.notify_all();

    if (on_closed_) {
        if (auto self = weak_from_this().lock()) {
            on_closed_(self);
        }
    }
}

} // namespace meshdest::destination
