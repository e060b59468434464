#pragma once

#include <chrono>
#include <map>
#include <string>

#include <meshdest/core/status.h>

namespace meshdest::http {

struct HttpClientResponse {
    int status = 0;
    std::string body;
    std::string content_type;
    std::map<std::string, std::string> headers; // lower-case names
};

class HttpClient {
public:
    // Thread-safe: each call uses a local io_context.
    static meshdest::Result<HttpClientResponse> Get(
        std::string host,
        std::string port,
        std::string target,
        std::chrono::milliseconds timeout);

    static meshdest::Result<HttpClientResponse> Post(
        std::string host,
        std::string port,
        std::string target,
        std::string content_type,
        std::string body,
        std::chrono::milliseconds timeout);
};

} // namespace meshdest::http
