#include <meshdest/resolvers/service_watch.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

#include <meshdest/core/log.h>

namespace meshdest::resolvers {

namespace {

// Hand-off between cluster callbacks and the resolver thread.
struct Mailbox {
    std::mutex mu;
    std::condition_variable cv;
    std::optional<cluster::ServiceState> state;
    std::optional<Status> error;
    bool woken = false;
};

} // namespace

Status FollowService(cluster::IClusterState& state, const cluster::ServiceId& id,
                     const resilience::RetryPolicy& retry, const destination::DoneSignal& done,
                     const ServiceStateFn& on_state) {
    auto box = std::make_shared<Mailbox>();
    done.AddWaker([box] {
        std::lock_guard<std::mutex> lk(box->mu);
        box->woken = true;
        box->cv.notify_all();
    });

    resilience::Backoff backoff(retry);
    for (;;) {
        {
            std::lock_guard<std::mutex> lk(box->mu);
            if (box->woken) {
                return Status::Ok();
            }
            box->state.reset();
            box->error.reset();
        }

        cluster::ServiceWatchCallbacks callbacks;
        callbacks.on_state = [box](const cluster::ServiceState& s) {
            std::lock_guard<std::mutex> lk(box->mu);
            box->state = s;
            box->cv.notify_all();
        };
        callbacks.on_error = [box](const Status& st) {
            std::lock_guard<std::mutex> lk(box->mu);
            box->error = st;
            box->cv.notify_all();
        };
        const auto token = state.Watch(id, std::move(callbacks));

        Status failure;
        bool cancelled = false;
        for (;;) {
            std::optional<cluster::ServiceState> next;
            {
                std::unique_lock<std::mutex> lk(box->mu);
                box->cv.wait(lk, [&] { return box->woken || box->state || box->error; });
                if (box->woken) {
                    cancelled = true;
                    break;
                }
                if (box->state) {
                    next = std::move(box->state);
                    box->state.reset();
                } else {
                    failure = *box->error;
                    break;
                }
            }
            backoff.Reset();
            on_state(*next);
        }
        state.Unwatch(token);

        if (cancelled) {
            return Status::Ok();
        }

        auto delay = backoff.OnFailure();
        if (!delay) {
            log::error("watch on service {} failed {} times, giving up: {}", id.ToString(), backoff.failures(),
                       failure.ToString());
            return Status(StatusCode::unavailable, "cluster state unavailable for " + id.ToString() + ": " +
                                                       failure.message());
        }
        log::warn("watch on service {} failed: {}; retrying in {}ms", id.ToString(), failure.ToString(),
                  delay->count());
        if (done.WaitFor(*delay)) {
            return Status::Ok();
        }
    }
}

} // namespace meshdest::resolvers
