#include <meshdest/client/destination_client.h>
#include <meshdest/protohttp/update_codec.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace {

struct Options {
    std::string host = "127.0.0.1";
    std::string port = "8086";
    std::string scheme = "k8s";
    std::string authority;
    int connect_timeout_ms = 2000;
};

void PrintUsage() {
    std::cout << "meshdest_endpoints [options] <host[:port]>\n"
              << "  --host <host>\n"
              << "  --port <port>\n"
              << "  --scheme <k8s|ip|mirror>\n"
              << "  --timeout-ms <ms>\n";
}

std::string AddrText(const meshdest::api::net::TcpAddress& addr) {
    auto parsed = meshdest::protohttp::FromProto(addr);
    return parsed.ok() ? parsed.value().ToString() : "<invalid address>";
}

void PrintUpdate(const meshdest::api::destination::Update& update) {
    switch (update.update_case()) {
        case meshdest::api::destination::Update::kAdd:
            for (const auto& a : update.add().addrs()) {
                std::cout << "add    " << AddrText(a.addr()) << " weight=" << a.weight();
                if (!a.tls_identity().empty()) {
                    std::cout << " identity=" << a.tls_identity();
                }
                if (a.opaque_protocol()) {
                    std::cout << " opaque";
                }
                if (!a.hostname().empty()) {
                    std::cout << " hostname=" << a.hostname();
                }
                std::cout << "\n";
            }
            break;
        case meshdest::api::destination::Update::kRemove:
            for (const auto& a : update.remove().addrs()) {
                std::cout << "remove " << AddrText(a) << "\n";
            }
            break;
        case meshdest::api::destination::Update::kNoEndpoints:
            std::cout << "no endpoints (exists=" << (update.no_endpoints().exists() ? "true" : "false") << ")\n";
            break;
        case meshdest::api::destination::Update::UPDATE_NOT_SET:
            std::cout << "empty update\n";
            break;
    }
    std::cout.flush();
}

} // namespace

int main(int argc, char** argv) {
    Options opt;

    for (int i = 1; i < argc; ++i) {
        std::string_view a(argv[i]);
        auto need = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << name << "\n";
                std::exit(2);
            }
            return argv[++i];
        };

        if (a == "--host") {
            opt.host = need("--host");
        } else if (a == "--port") {
            opt.port = need("--port");
        } else if (a == "--scheme") {
            opt.scheme = need("--scheme");
        } else if (a == "--timeout-ms") {
            opt.connect_timeout_ms = std::atoi(need("--timeout-ms"));
        } else if (a == "--help" || a == "-h") {
            PrintUsage();
            return 0;
        } else {
            opt.authority = std::string(a);
        }
    }

    if (opt.authority.empty()) {
        PrintUsage();
        return 2;
    }

    meshdest::client::DestinationClient client(opt.host, opt.port, std::chrono::milliseconds(opt.connect_timeout_ms));
    if (auto st = client.Open(opt.scheme, opt.authority); !st.ok()) {
        std::cerr << "error: " << st.ToString() << "\n";
        return 1;
    }

    for (;;) {
        auto update = client.Recv();
        if (!update.ok()) {
            if (update.status().code() == meshdest::StatusCode::out_of_range) {
                std::cout << "stream closed\n";
                return 0;
            }
            std::cerr << "error: " << update.status().ToString() << "\n";
            return 1;
        }
        PrintUpdate(update.value());
    }
}
