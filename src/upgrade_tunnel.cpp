#include "upgrade_tunnel.hpp"
#include "logger.hpp"
#include "upstream.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/fmt/fmt.h>
#include <array>
#include <atomic>
#include <limits>
#include <thread>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace slb {

namespace {

constexpr size_t kPumpBufferSize = 16 * 1024;

// Copies bytes from one socket to the other until read or write fails.
uint64_t pump(tcp::socket& from, tcp::socket& to) {
    std::array<char, kPumpBufferSize> buf;
    uint64_t total = 0;
    beast::error_code ec;
    for (;;) {
        size_t n = from.read_some(net::buffer(buf), ec);
        if (ec) {
            break;
        }
        net::write(to, net::buffer(buf.data(), n), ec);
        if (ec) {
            break;
        }
        total += n;
    }
    return total;
}

void close_both(tcp::socket& a, tcp::socket& b) {
    beast::error_code ignored;
    a.shutdown(tcp::socket::shutdown_both, ignored);
    b.shutdown(tcp::socket::shutdown_both, ignored);
}

http::request<http::string_body> build_upgrade_request(const UpstreamAddress& address,
                                                       const ProxyRequest& request) {
    http::request<http::string_body> req;
    req.version(11);
    auto verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
        req.method_string(request.method);
    } else {
        req.method(verb);
    }
    req.target(address.join_path(request.target));

    Headers headers = request.headers;
    std::string upgrade = request.header("Upgrade");
    remove_hop_by_hop_headers(headers);
    headers.erase("Host");
    headers.erase("Content-Length");
    headers.erase("X-Forwarded-For");

    for (const auto& [name, value] : headers) {
        req.insert(name, value);
    }
    req.set(http::field::host, address.host_header());
    req.set("X-Forwarded-For", forwarded_for(request));
    req.set(http::field::connection, "Upgrade");
    req.set(http::field::upgrade, upgrade);

    if (!request.body.empty()) {
        req.body() = request.body;
        req.prepare_payload();
    }
    return req;
}

std::string serialize_head(const http::response_header<>& head) {
    std::string raw = fmt::format("HTTP/1.1 {} {}\r\n", head.result_int(),
                                  std::string(head.reason()));
    for (const auto& field : head) {
        raw += fmt::format("{}: {}\r\n", std::string(field.name_string()),
                           std::string(field.value()));
    }
    raw += "\r\n";
    return raw;
}

// Clears the sink's abort hook before the tunnel's I/O objects go away.
struct AbortRegistration {
    ResponseSink& sink;

    ~AbortRegistration() { sink.on_abort({}); }
};

// Runs one asynchronous step to completion under the stream deadline.
template <class Initiate>
beast::error_code run_with_deadline(net::io_context& ioc,
                                    beast::tcp_stream& stream,
                                    std::chrono::milliseconds timeout,
                                    const std::atomic<bool>& aborted,
                                    Initiate&& initiate) {
    if (aborted) {
        return net::error::operation_aborted;
    }

    beast::error_code result;
    stream.expires_after(timeout);
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
}

} // namespace

void tunnel_upgrade(const UpstreamAddress& address,
                    ResponseSink& sink,
                    const ProxyRequest& request,
                    const ForwardTimeouts& timeouts) {
    net::io_context ioc;
    beast::tcp_stream stream(ioc);
    beast::error_code ec;

    // Stop the pending handshake step when the client connection goes away
    std::atomic<bool> aborted{false};
    sink.on_abort([&ioc, &stream, &aborted] {
        aborted = true;
        net::post(ioc, [&stream] { stream.cancel(); });
    });
    AbortRegistration registration{sink};

    tcp::resolver resolver(ioc);
    auto endpoints = resolver.resolve(address.host, std::to_string(address.port), ec);
    if (ec) {
        Logger::error(Logger::Component::Proxy,
            fmt::format("Upstream {} resolve failure: {}", address.text, ec.message()));
        write_bad_gateway(sink, ec.message());
        return;
    }

    ec = run_with_deadline(ioc, stream, timeouts.connect, aborted, [&](auto handler) {
        stream.async_connect(endpoints, std::move(handler));
    });
    if (ec) {
        Logger::error(Logger::Component::Proxy,
            fmt::format("Upstream {} connection failure: {}", address.text, ec.message()));
        write_bad_gateway(sink, ec.message());
        return;
    }

    auto req = build_upgrade_request(address, request);
    ec = run_with_deadline(ioc, stream, timeouts.write, aborted, [&](auto handler) {
        http::async_write(stream, req, std::move(handler));
    });
    if (ec) {
        write_bad_gateway(sink, ec.message());
        return;
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    ec = run_with_deadline(ioc, stream, timeouts.read, aborted, [&](auto handler) {
        http::async_read_header(stream, buffer, parser, std::move(handler));
    });
    if (ec) {
        Logger::error(Logger::Component::Proxy,
            fmt::format("Upstream {} upgrade handshake failed: {}", address.text, ec.message()));
        write_bad_gateway(sink, ec.message());
        return;
    }

    const auto& head = parser.get();
    if (head.result() != http::status::switching_protocols) {
        // Backend declined the upgrade, relay its answer as a plain response
        ec = run_with_deadline(ioc, stream, timeouts.read, aborted, [&](auto handler) {
            http::async_read(stream, buffer, parser, std::move(handler));
        });
        if (ec) {
            write_bad_gateway(sink, ec.message());
            return;
        }
        const auto& res = parser.get();
        Headers headers;
        for (const auto& field : res) {
            headers.emplace(std::string(field.name_string()), std::string(field.value()));
        }
        remove_hop_by_hop_headers(headers);
        headers.erase("Content-Length");
        sink.write_head(res.result_int(), headers);
        if (!res.body().empty()) {
            sink.write(res.body());
        }
        return;
    }

    stream.expires_never();
    tcp::socket& backend = stream.socket();

    std::string client_buffered;
    tcp::socket* client = sink.hijack(client_buffered);
    if (client == nullptr) {
        Logger::error(Logger::Component::Proxy,
            fmt::format("Cannot switch protocols towards {}: connection not hijackable",
                address.text));
        write_bad_gateway(sink, "connection cannot be upgraded");
        return;
    }

    net::write(*client, net::buffer(serialize_head(head)), ec);
    if (!ec && buffer.size() > 0) {
        net::write(*client, buffer.data(), ec);
    }
    if (!ec && !client_buffered.empty()) {
        net::write(backend, net::buffer(client_buffered), ec);
    }
    if (ec) {
        close_both(*client, backend);
        return;
    }

    // From here on the pumps block in plain socket calls
    sink.on_abort([&backend] {
        beast::error_code ignored;
        backend.shutdown(tcp::socket::shutdown_both, ignored);
    });

    Logger::info(Logger::Component::Proxy,
        fmt::format("{} tunnel to {} established", request.header("Upgrade"), address.text));

    std::atomic<uint64_t> downstream_bytes{0};
    uint64_t upstream_bytes = 0;
    {
        std::jthread backend_to_client([&] {
            downstream_bytes = pump(backend, *client);
            close_both(*client, backend);
        });
        upstream_bytes = pump(*client, backend);
        close_both(*client, backend);
    }

    Logger::info(Logger::Component::Proxy,
        fmt::format("Tunnel to {} closed ({} bytes up, {} bytes down)",
            address.text, upstream_bytes, downstream_bytes.load()));
}

} // namespace slb
