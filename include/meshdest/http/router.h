#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/beast/http.hpp>

#include <meshdest/http/types.h>

namespace meshdest::http {

using Handler = std::function<void(const Request&, Response&)>;
using Next = std::function<void()>;
using Middleware = std::function<void(const Request&, Response&, Next)>;

// Runs on an io thread and must return promptly; the stream is driven from
// elsewhere afterwards.
using StreamHandler = std::function<void(const Request&, std::shared_ptr<ResponseStream>)>;

class Router {
public:
    // Thread-safe for read after construction. Build routes before serving.
    void Use(Middleware mw);

    void AddRoute(boost::beast::http::verb method, std::string path, Handler handler);
    void AddStreamRoute(boost::beast::http::verb method, std::string path, StreamHandler handler);

    void Get(std::string path, Handler handler) { AddRoute(boost::beast::http::verb::get, std::move(path), std::move(handler)); }
    void Post(std::string path, Handler handler) { AddRoute(boost::beast::http::verb::post, std::move(path), std::move(handler)); }
    void PostStream(std::string path, StreamHandler handler) {
        AddStreamRoute(boost::beast::http::verb::post, std::move(path), std::move(handler));
    }

    // Middleware applies to plain routes only. A path served under other
    // methods gets 405 with an Allow header, an unknown path 404.
    void Handle(const Request& req, Response& resp) const;

    // nullptr when `req` is not for a stream route.
    const StreamHandler* FindStream(const Request& req) const;

private:
    struct RouteKey {
        boost::beast::http::verb method;
        std::string path;

        bool operator==(const RouteKey& o) const { return method == o.method && path == o.path; }
    };

    struct RouteKeyHash {
        std::size_t operator()(const RouteKey& k) const;
    };

    // "GET, POST" style list of the methods routed for `path`; empty if none.
    std::string AllowedMethods(const std::string& path) const;

    std::vector<Middleware> middleware_;
    std::unordered_map<RouteKey, Handler, RouteKeyHash> routes_;
    std::unordered_map<RouteKey, StreamHandler, RouteKeyHash> stream_routes_;
};

} // namespace meshdest::http
