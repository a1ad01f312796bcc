#pragma once

#include "health_probe.hpp"
#include "http_message.hpp"
#include "upstream_address.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace slb {

// Capability set shared by backends and the interceptor chain around them.
class Upstream {
public:
    virtual ~Upstream() = default;

    virtual const std::string& address() const = 0;
    virtual bool is_alive() = 0;
    virtual void serve(ResponseSink& sink, const ProxyRequest& request) = 0;
};

// Bounds for one forwarded exchange. `read` also caps the wait for an upgrade
// handshake answer.
struct ForwardTimeouts {
    std::chrono::milliseconds connect{5000};
    std::chrono::milliseconds read{60000};
    std::chrono::milliseconds write{60000};
};

class HttpUpstream : public Upstream {
public:
    HttpUpstream(UpstreamAddress address,
                 std::shared_ptr<HealthProbe> probe,
                 std::chrono::milliseconds health_ttl,
                 ForwardTimeouts timeouts = {});

    HttpUpstream(const HttpUpstream&) = delete;
    HttpUpstream& operator=(const HttpUpstream&) = delete;

    const std::string& address() const override { return address_.text; }

    // Cached for health_ttl; the probe and the cache update happen under one
    // lock, so concurrent callers wait for the in-flight probe and reuse it.
    bool is_alive() override;

    void serve(ResponseSink& sink, const ProxyRequest& request) override;

private:
    void forward_http(ResponseSink& sink, const ProxyRequest& request);

    UpstreamAddress address_;
    std::shared_ptr<HealthProbe> probe_;
    std::chrono::milliseconds health_ttl_;
    ForwardTimeouts timeouts_;

    std::mutex health_mutex_;
    std::optional<std::chrono::steady_clock::time_point> last_checked_;
    bool cached_alive_ = false;
};

// 502 with the transport error as body, as written when a backend cannot be reached.
void write_bad_gateway(ResponseSink& sink, const std::string& reason);

} // namespace slb
