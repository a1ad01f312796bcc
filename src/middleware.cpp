#include "middleware.hpp"
#include "logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <chrono>

namespace slb {

InterceptedUpstream::InterceptedUpstream(std::unique_ptr<Upstream> inner,
                                         std::vector<Interceptor> interceptors)
    : inner_(std::move(inner)), interceptors_(std::move(interceptors)) {}

void InterceptedUpstream::serve(ResponseSink& sink, const ProxyRequest& request) {
    // Build the chain from the innermost call outwards
    ServeFn next = [this](ResponseSink& s, const ProxyRequest& r) { inner_->serve(s, r); };
    for (auto it = interceptors_.rbegin(); it != interceptors_.rend(); ++it) {
        next = [interceptor = &*it, inner = std::move(next)](ResponseSink& s, const ProxyRequest& r) {
            (*interceptor)(s, r, inner);
        };
    }
    next(sink, request);
}

Interceptor make_logging_interceptor(ConfigState& state, std::string address) {
    return [&state, address = std::move(address)](ResponseSink& sink, const ProxyRequest& request,
                                                  const ServeFn& next) {
        state.increment_global_counter();
        Logger::info(Logger::Component::Access,
            fmt::format("{} request to {}", request.method, address));
        next(sink, request);
    };
}

Interceptor make_telemetry_interceptor(ConfigState& state, std::string address) {
    return [&state, address = std::move(address)](ResponseSink& sink, const ProxyRequest& request,
                                                  const ServeFn& next) {
        auto start = std::chrono::steady_clock::now();
        next(sink, request);
        auto duration_us = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start).count();

        if (state.debug_mode()) {
            Logger::info(Logger::Component::Telemetry,
                fmt::format("Upstream {} latency: {:.3f}ms", address, duration_us / 1000.0));
        }
    };
}

std::unique_ptr<Upstream> with_default_middleware(std::unique_ptr<Upstream> upstream,
                                                  ConfigState& state) {
    std::string address = upstream->address();
    std::vector<Interceptor> interceptors;
    interceptors.push_back(make_logging_interceptor(state, address));
    interceptors.push_back(make_telemetry_interceptor(state, address));
    return std::make_unique<InterceptedUpstream>(std::move(upstream), std::move(interceptors));
}

} // namespace slb
