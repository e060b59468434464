#include <meshdest/http/router.h>

#include <set>

#include <boost/functional/hash.hpp>

namespace meshdest::http {

std::size_t Router::RouteKeyHash::operator()(const RouteKey& k) const {
    std::size_t seed = 0;
    boost::hash_combine(seed, static_cast<unsigned>(k.method));
    boost::hash_combine(seed, k.path);
    return seed;
}

void Router::Use(Middleware mw) {
    middleware_.push_back(std::move(mw));
}

void Router::AddRoute(boost::beast::http::verb method, std::string path, Handler handler) {
    routes_[RouteKey{method, std::move(path)}] = std::move(handler);
}

void Router::AddStreamRoute(boost::beast::http::verb method, std::string path, StreamHandler handler) {
    stream_routes_[RouteKey{method, std::move(path)}] = std::move(handler);
}

const StreamHandler* Router::FindStream(const Request& req) const {
    auto it = stream_routes_.find(RouteKey{req.raw.method(), req.path});
    return it == stream_routes_.end() ? nullptr : &it->second;
}

std::string Router::AllowedMethods(const std::string& path) const {
    std::set<std::string> methods;
    auto collect = [&](const auto& table) {
        for (const auto& [key, _] : table) {
            if (key.path == path) {
                auto name = boost::beast::http::to_string(key.method);
                methods.emplace(name.data(), name.size());
            }
        }
    };
    collect(routes_);
    collect(stream_routes_);

    std::string out;
    for (const auto& m : methods) {
        if (!out.empty()) {
            out += ", ";
        }
        out += m;
    }
    return out;
}

void Router::Handle(const Request& req, Response& resp) const {
    auto it = routes_.find(RouteKey{req.raw.method(), req.path});
    if (it == routes_.end()) {
        auto allowed = AllowedMethods(req.path);
        if (allowed.empty()) {
            resp.status = 404;
            resp.body = "not found\n";
        } else {
            resp.status = 405;
            resp.headers["allow"] = std::move(allowed);
            resp.body = "method not allowed\n";
        }
        return;
    }

    const auto& handler = it->second;

    // Build middleware chain.
    std::size_t idx = 0;
    std::function<void()> run;
    run = [&]() {
        if (idx < middleware_.size()) {
            auto& mw = middleware_[idx++];
            mw(req, resp, run);
            return;
        }
        handler(req, resp);
    };

    run();
}

} // namespace meshdest::http
