#include "upstream.hpp"
#include "logger.hpp"
#include "upgrade_tunnel.hpp"
#include <httplib.h>
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace slb {

namespace {

// httplib takes timeouts as seconds plus microseconds.
std::pair<time_t, time_t> split_timeout(std::chrono::milliseconds timeout) {
    return {static_cast<time_t>(timeout.count() / 1000),
            static_cast<time_t>((timeout.count() % 1000) * 1000)};
}

} // namespace

HttpUpstream::HttpUpstream(UpstreamAddress address,
                           std::shared_ptr<HealthProbe> probe,
                           std::chrono::milliseconds health_ttl,
                           ForwardTimeouts timeouts)
    : address_(std::move(address)), probe_(std::move(probe)),
      health_ttl_(health_ttl), timeouts_(timeouts) {}

bool HttpUpstream::is_alive() {
    std::lock_guard lock(health_mutex_);

    if (last_checked_ && std::chrono::steady_clock::now() - *last_checked_ < health_ttl_) {
        return cached_alive_;
    }

    auto start = std::chrono::steady_clock::now();
    bool alive = probe_->probe(address_);
    auto end = std::chrono::steady_clock::now();
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

    if (!last_checked_) {
        Logger::info(Logger::Component::HealthCheck,
            fmt::format("Upstream {}: {} ({}ms)", address_.text,
                alive ? "HEALTHY" : "UNHEALTHY", duration_ms));
    } else if (cached_alive_ && !alive) {
        Logger::warn(Logger::Component::HealthCheck,
            fmt::format("Upstream {}: state changed HEALTHY → UNHEALTHY ({}ms)",
                address_.text, duration_ms));
    } else if (!cached_alive_ && alive) {
        Logger::info(Logger::Component::HealthCheck,
            fmt::format("Upstream {}: state changed UNHEALTHY → HEALTHY", address_.text));
    }

    cached_alive_ = alive;
    last_checked_ = end;
    return alive;
}

void HttpUpstream::serve(ResponseSink& sink, const ProxyRequest& request) {
    if (request.is_upgrade()) {
        tunnel_upgrade(address_, sink, request, timeouts_);
        return;
    }
    forward_http(sink, request);
}

void HttpUpstream::forward_http(ResponseSink& sink, const ProxyRequest& request) {
    try {
        httplib::Client client(address_.host, address_.port);
        auto [connect_sec, connect_usec] = split_timeout(timeouts_.connect);
        auto [read_sec, read_usec] = split_timeout(timeouts_.read);
        auto [write_sec, write_usec] = split_timeout(timeouts_.write);
        client.set_connection_timeout(connect_sec, connect_usec);
        client.set_read_timeout(read_sec, read_usec);
        client.set_write_timeout(write_sec, write_usec);
        client.set_keep_alive(false);
        client.set_decompress(false);
        client.set_url_encode(false);

        httplib::Request outbound;
        outbound.method = request.method;
        outbound.path = address_.join_path(request.target);
        outbound.body = request.body;

        Headers headers = request.headers;
        remove_hop_by_hop_headers(headers);
        // httplib writes Host and Content-Length for the outbound request
        headers.erase("Host");
        headers.erase("Content-Length");
        headers.erase("X-Forwarded-For");
        for (const auto& [name, value] : headers) {
            outbound.headers.emplace(name, value);
        }
        outbound.headers.emplace("Host", address_.host_header());
        outbound.headers.emplace("X-Forwarded-For", forwarded_for(request));

        // Relay the head as soon as it arrives, then the body chunk by chunk
        outbound.response_handler = [&sink, &request](const httplib::Response& res) {
            Headers response_headers(res.headers.begin(), res.headers.end());
            remove_hop_by_hop_headers(response_headers);
            if (request.method != "HEAD") {
                response_headers.erase("Content-Length");
            }
            sink.write_head(res.status, response_headers);
            return true;
        };
        outbound.content_receiver = [&sink](const char* data, size_t length, uint64_t, uint64_t) {
            sink.write(std::string_view(data, length));
            return true;
        };

        auto res = client.send(outbound);
        if (!res) {
            Logger::error(Logger::Component::Proxy,
                fmt::format("Upstream {} connection failure: {}",
                    address_.text, httplib::to_string(res.error())));
            write_bad_gateway(sink, httplib::to_string(res.error()));
        }

    } catch (const std::exception& e) {
        Logger::error(Logger::Component::Proxy,
            fmt::format("Exception forwarding to upstream {}: {}", address_.text, e.what()));
        write_bad_gateway(sink, e.what());
    }
}

void write_bad_gateway(ResponseSink& sink, const std::string& reason) {
    Headers headers{{"Content-Type", "text/plain; charset=utf-8"}};
    sink.write_head(502, headers);
    sink.write(fmt::format("Bad Gateway: {}\n", reason));
}

} // namespace slb
