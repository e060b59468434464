#include <meshdest/destination/subscription.h>

#include <meshdest/destination/watch.h>

namespace meshdest::destination {

Subscription::Subscription(Id id, std::size_t capacity, std::weak_ptr<Watch> watch)
    : id_(id), capacity_(capacity == 0 ? 1 : capacity), watch_(std::move(watch)) {}

Subscription::~Subscription() {
    Cancel();
}

std::shared_ptr<Subscription> Subscription::MakeClosed(Status status) {
    auto sub = std::make_shared<Subscription>(0, 1, std::weak_ptr<Watch>());
    sub->Close(std::move(status));
    return sub;
}

RecvResult Subscription::PopLocked(Delta& out) {
    if (!queue_.empty()) {
        out = std::move(queue_.front());
        queue_.pop_front();
        return RecvResult::delta;
    }
    return RecvResult::closed;
}

RecvResult Subscription::Recv(Delta& out) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [&] { return !queue_.empty() || closed_; });
    return PopLocked(out);
}

RecvResult Subscription::RecvFor(std::chrono::milliseconds timeout, Delta& out) {
    std::unique_lock<std::mutex> lk(mu_);
    if (!cv_.wait_for(lk, timeout, [&] { return !queue_.empty() || closed_; })) {
        return RecvResult::timeout;
    }
    return PopLocked(out);
}

void Subscription::Cancel() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        // A closed subscription was already dropped by its Watch.
        if (closed_) {
            return;
        }
        cancelled_ = true;
        closed_ = true;
        queue_.clear();
    }
    cv_.notify_all();

    // Must not hold mu_ here: the Watch locks itself before touching
    // subscriptions.
    if (auto w = watch_.lock()) {
        w->Detach(id_);
    }
}

bool Subscription::closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
}

bool Subscription::cancelled() const {
    std::lock_guard<std::mutex> lk(mu_);
    return cancelled_;
}

bool Subscription::stale() const {
    std::lock_guard<std::mutex> lk(mu_);
    return stale_;
}

Status Subscription::status() const {
    std::lock_guard<std::mutex> lk(mu_);
    return status_;
}

std::size_t Subscription::pending() const {
    std::lock_guard<std::mutex> lk(mu_);
    return queue_.size();
}

bool Subscription::Push(const Delta& delta) {
    bool accepted = true;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) {
            return false;
        }
        if (queue_.size() >= capacity_) {
            // Slow consumer: drop the backlog and close; the caller has to
            // resubscribe.
            accepted = false;
            stale_ = true;
            closed_ = true;
            queue_.clear();
            status_ = Status(StatusCode::resource_exhausted, "subscription buffer overflow");
        } else {
            queue_.push_back(delta);
        }
    }
    cv_.notify_all();
    return accepted;
}

void Subscription::Close(Status status) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) {
            return;
        }
        closed_ = true;
        status_ = std::move(status);
    }
    cv_.notify_all();
}

} // namespace meshdest::destination
