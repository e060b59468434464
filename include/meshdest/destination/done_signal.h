#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace meshdest::destination {

// One-shot cancellation signal handed to a resolver. Fire() is idempotent.
class DoneSignal {
public:
    using Waker = std::function<void()>;

    DoneSignal() = default;

    DoneSignal(const DoneSignal&) = delete;
    DoneSignal& operator=(const DoneSignal&) = delete;

    // Thread-safe
    void Fire() {
        std::vector<Waker> wakers;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (fired_) {
                return;
            }
            fired_ = true;
            wakers.swap(wakers_);
        }
        cv_.notify_all();
        for (auto& w : wakers) {
            w();
        }
    }

    bool Fired() const {
        std::lock_guard<std::mutex> lk(mu_);
        return fired_;
    }

    void Wait() const {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&] { return fired_; });
    }

    // Returns true if the signal fired within `timeout`.
    template <class Rep, class Period>
    bool WaitFor(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock<std::mutex> lk(mu_);
        return cv_.wait_for(lk, timeout, [&] { return fired_; });
    }

    // Runs `waker` once when the signal fires (right away if it already
    // has), so callers blocked on their own condition variable can wake up.
    // The waker runs without the signal's lock held; whatever it captures
    // must stay valid for the signal's lifetime.
    void AddWaker(Waker waker) const {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (!fired_) {
                wakers_.push_back(std::move(waker));
                return;
            }
        }
        waker();
    }

private:
    mutable std::mutex mu_;
    mutable std::condition_variable cv_;
    mutable std::vector<Waker> wakers_;
    bool fired_ = false;
};

} // namespace meshdest::destination
