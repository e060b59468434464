#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include <meshdest/api/destination.pb.h>
#include <meshdest/core/status.h>

namespace meshdest::client {

// Blocking client for one destination stream of a DestinationServer.
// Not thread-safe; use one instance per stream.
class DestinationClient {
public:
    DestinationClient(std::string host, std::string port, std::chrono::milliseconds connect_timeout);
    ~DestinationClient();

    DestinationClient(const DestinationClient&) = delete;
    DestinationClient& operator=(const DestinationClient&) = delete;

    // Sends the request and reads the response head. An error reported by the
    // server (linkerd-error) is returned here.
    Status Open(std::string_view scheme, std::string_view authority);

    // Blocks for the next update. out_of_range when the server ended the
    // stream cleanly, data_loss or unavailable when it was cut short.
    Result<api::destination::Update> Recv();

    // Drops the connection; the server sees the client go away.
    void Close();

private:
    struct Conn;

    std::string host_;
    std::string port_;
    std::chrono::milliseconds connect_timeout_;
    std::unique_ptr<Conn> conn_;
};

} // namespace meshdest::client
