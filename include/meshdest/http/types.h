#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include <boost/beast/http.hpp>

namespace meshdest::http {

namespace beast_http = boost::beast::http;

struct Request {
    beast_http::request<beast_http::string_body> raw;
    std::string path; // target without query
};

struct Response {
    unsigned status = 200;
    std::string body;
    std::string content_type = "text/plain; charset=utf-8";
    std::unordered_map<std::string, std::string> headers;
};

// A long-lived response written from the handler's own thread. The
// connection is closed once the response ends.
//
// Thread-safe. Every call blocks until the bytes are handed to the socket,
// so none of them may run on the server's io threads.
class ResponseStream {
public:
    virtual ~ResponseStream() = default;

    // Sends a complete, non-streamed response instead of a stream.
    virtual bool Reply(Response resp) = 0;

    // Sends status and headers of a chunked response.
    virtual bool WriteHead(unsigned status, std::string content_type,
                           std::unordered_map<std::string, std::string> headers = {}) = 0;

    // Sends one chunk. Returns false once the peer is gone.
    virtual bool WriteChunk(std::string data) = 0;

    // Terminates the chunked body cleanly.
    virtual void Finish() = 0;

    // Drops the connection, so the peer sees a truncated body.
    virtual void Abort() = 0;

    // `fn` runs once, on an io thread, when the connection goes away for any
    // reason. Runs right away if it already has.
    virtual void OnClose(std::function<void()> fn) = 0;
};

} // namespace meshdest::http
