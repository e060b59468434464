#include <meshdest/client/destination_client.h>

#include <array>
#include <cstdint>
#include <limits>
#include <optional>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <meshdest/protohttp/framing.h>
#include <meshdest/protohttp/protohttp.h>

namespace meshdest::client {

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

struct DestinationClient::Conn {
    boost::asio::io_context ioc;
    beast::tcp_stream stream{ioc};
    beast::flat_buffer buffer;
    http::response_parser<http::buffer_body> parser;
    std::optional<protohttp::FrameReader> reader;

    // Body bytes read off the chunked response; 0 at the end of the body.
    Result<std::size_t> ReadBody(char* buf, std::size_t len) {
        while (!parser.is_done()) {
            parser.get().body().data = buf;
            parser.get().body().size = len;
            beast::error_code ec;
            http::read_some(stream, buffer, parser, ec);
            if (ec == http::error::need_buffer) {
                ec = {};
            }
            if (ec) {
                return Status(StatusCode::unavailable, "destination stream broken: " + ec.message());
            }
            const auto n = len - parser.get().body().size;
            if (n > 0) {
                return n;
            }
        }
        return static_cast<std::size_t>(0);
    }
};

DestinationClient::DestinationClient(std::string host, std::string port, std::chrono::milliseconds connect_timeout)
    : host_(std::move(host)), port_(std::move(port)), connect_timeout_(connect_timeout) {}

DestinationClient::~DestinationClient() {
    Close();
}

Status DestinationClient::Open(std::string_view scheme, std::string_view authority) {
    Close();
    conn_ = std::make_unique<Conn>();
    auto& c = *conn_;

    api::destination::GetDestination get;
    get.set_scheme(std::string(scheme));
    get.set_path(std::string(authority));
    std::string body;
    if (!get.SerializeToString(&body)) {
        return Status(StatusCode::internal_error, "cannot encode GetDestination");
    }

    beast::error_code ec;
    tcp::resolver resolver(c.ioc);
    auto results = resolver.resolve(host_, port_, ec);
    if (ec) {
        return Status(StatusCode::unavailable, "resolve " + host_ + ": " + ec.message());
    }
    // tcp_stream timeouts only apply to asynchronous operations.
    c.stream.expires_after(connect_timeout_);
    c.stream.async_connect(results, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
    c.ioc.run();
    c.ioc.restart();
    c.stream.expires_never();
    if (ec) {
        return Status(StatusCode::unavailable, "connect " + host_ + ":" + port_ + ": " + ec.message());
    }

    http::request<http::string_body> req{http::verb::post, "/api/v1/Get", 11};
    req.set(http::field::host, host_);
    req.set(http::field::user_agent, "meshdest/0.1");
    req.set(http::field::content_type, std::string(protohttp::kContentType));
    req.body() = std::move(body);
    req.prepare_payload();
    http::write(c.stream, req, ec);
    if (ec) {
        return Status(StatusCode::unavailable, "send request: " + ec.message());
    }

    c.parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    http::read_header(c.stream, c.buffer, c.parser, ec);
    if (ec) {
        return Status(StatusCode::unavailable, "read response head: " + ec.message());
    }
    c.reader.emplace([&c](char* buf, std::size_t len) { return c.ReadBody(buf, len); });

    const auto& head = c.parser.get();
    const int status = static_cast<int>(head.result_int());
    std::optional<std::string> error_header;
    if (auto it = head.find(std::string(protohttp::kErrorHeader)); it != head.end()) {
        error_header = std::string(it->value().data(), it->value().size());
    }
    if (status == 200 && !error_header) {
        return Status::Ok();
    }

    std::string error_body;
    std::array<char, 4096> buf{};
    for (;;) {
        auto n = c.ReadBody(buf.data(), buf.size());
        if (!n.ok() || n.value() == 0) {
            break;
        }
        error_body.append(buf.data(), n.value());
    }
    auto st = protohttp::CheckResponseForError(status, error_header, error_body);
    Close();
    return st;
}

Result<api::destination::Update> DestinationClient::Recv() {
    if (!conn_ || !conn_->reader) {
        return Status(StatusCode::failed_precondition, "stream is not open");
    }
    auto frame = conn_->reader->Next();
    if (!frame.ok()) {
        return frame.status();
    }
    api::destination::Update update;
    if (!update.ParseFromString(frame.value())) {
        return Status(StatusCode::data_loss, "malformed Update frame");
    }
    return update;
}

void DestinationClient::Close() {
    if (!conn_) {
        return;
    }
    beast::error_code ec;
    conn_->stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    conn_->stream.socket().close(ec);
    conn_.reset();
}

} // namespace meshdest::client
