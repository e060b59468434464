#include <meshdest/http/http_client.h>

#include <algorithm>
#include <cctype>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace meshdest::http {
namespace {
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

struct ClientOpState {
    boost::asio::io_context ioc;
    tcp::resolver resolver{ioc};
    beast::tcp_stream stream{ioc};
    boost::asio::steady_timer timer{ioc};
    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    http::response<http::string_body> resp;
    beast::error_code ec;
    bool timed_out = false;
};

std::string Lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

meshdest::Result<HttpClientResponse> RoundTrip(ClientOpState& st, const std::string& host, const std::string& port,
                                               std::chrono::milliseconds timeout) {
    st.req.version(11);
    st.req.set(http::field::host, host);
    st.req.set(http::field::user_agent, "meshdest/0.1");
    st.req.prepare_payload();

    st.timer.expires_after(timeout);
    st.timer.async_wait([&](beast::error_code ec) {
        if (ec) {
            return;
        }
        st.timed_out = true;
        st.stream.cancel();
    });

    st.resolver.async_resolve(host, port, [&](beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            st.ec = ec;
            st.timer.cancel();
            return;
        }
        st.stream.async_connect(results, [&](beast::error_code ec, const tcp::resolver::results_type::endpoint_type&) {
            if (ec) {
                st.ec = ec;
                st.timer.cancel();
                return;
            }
            http::async_write(st.stream, st.req, [&](beast::error_code ec, std::size_t) {
                if (ec) {
                    st.ec = ec;
                    st.timer.cancel();
                    return;
                }
                http::async_read(st.stream, st.buffer, st.resp, [&](beast::error_code ec, std::size_t) {
                    st.timer.cancel();
                    if (ec) {
                        st.ec = ec;
                        return;
                    }
                    beast::error_code ec2;
                    st.stream.socket().shutdown(tcp::socket::shutdown_both, ec2);
                });
            });
        });
    });

    st.ioc.run();

    if (st.timed_out) {
        return meshdest::Status(meshdest::StatusCode::timeout, "http client timeout");
    }
    if (st.ec) {
        return meshdest::Status(meshdest::StatusCode::unavailable, st.ec.message());
    }

    HttpClientResponse out;
    out.status = static_cast<int>(st.resp.result_int());
    out.body = st.resp.body();
    for (const auto& field : st.resp) {
        auto name = field.name_string();
        auto value = field.value();
        out.headers[Lower({name.data(), name.size()})] = std::string(value.data(), value.size());
    }
    if (auto it = st.resp.find(http::field::content_type); it != st.resp.end()) {
        out.content_type = std::string(it->value().data(), it->value().size());
    }
    return out;
}

} // namespace

meshdest::Result<HttpClientResponse> HttpClient::Get(std::string host, std::string port, std::string target, std::chrono::milliseconds timeout) {
    ClientOpState st;
    st.req.method(http::verb::get);
    st.req.target(target);
    return RoundTrip(st, host, port, timeout);
}

meshdest::Result<HttpClientResponse> HttpClient::Post(std::string host, std::string port, std::string target,
                                                      std::string content_type, std::string body,
                                                      std::chrono::milliseconds timeout) {
    ClientOpState st;
    st.req.method(http::verb::post);
    st.req.target(target);
    st.req.set(http::field::content_type, content_type);
    st.req.body() = std::move(body);
    return RoundTrip(st, host, port, timeout);
}

} // namespace meshdest::http
