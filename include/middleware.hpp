#pragma once

#include "config_state.hpp"
#include "upstream.hpp"
#include <functional>
#include <memory>
#include <vector>

namespace slb {

using ServeFn = std::function<void(ResponseSink&, const ProxyRequest&)>;

// Runs around a serve call; must invoke next to reach the backend.
using Interceptor = std::function<void(ResponseSink&, const ProxyRequest&, const ServeFn& next)>;

// An upstream with an ordered interceptor list applied around serve. The first
// interceptor is the outermost; address and is_alive pass straight through.
class InterceptedUpstream : public Upstream {
public:
    InterceptedUpstream(std::unique_ptr<Upstream> inner, std::vector<Interceptor> interceptors);

    const std::string& address() const override { return inner_->address(); }
    bool is_alive() override { return inner_->is_alive(); }
    void serve(ResponseSink& sink, const ProxyRequest& request) override;

private:
    std::unique_ptr<Upstream> inner_;
    std::vector<Interceptor> interceptors_;
};

// Counts the request and writes an access log line.
Interceptor make_logging_interceptor(ConfigState& state, std::string address);

// Measures serve latency; logged only in debug mode.
Interceptor make_telemetry_interceptor(ConfigState& state, std::string address);

// Wraps an upstream in the reference chain: logging, then telemetry.
std::unique_ptr<Upstream> with_default_middleware(std::unique_ptr<Upstream> upstream,
                                                  ConfigState& state);

} // namespace slb
