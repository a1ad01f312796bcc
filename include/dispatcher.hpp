#pragma once

#include "config_state.hpp"
#include "http_message.hpp"
#include "response_sampler.hpp"
#include "routing_policy.hpp"
#include "sticky_table.hpp"
#include "upstream.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace slb {

struct DispatcherOptions {
    std::string session_param = "document_id";
    size_t sticky_capacity = 65536;
    std::chrono::milliseconds sticky_idle_ttl = std::chrono::hours(1);
    size_t sample_capacity = 1024;   // 0 disables response sampling
};

// Picks an upstream for every inbound request: round robin per traffic class,
// with session affinity when the request names a document.
class Dispatcher {
public:
    // Throws std::invalid_argument when upstreams is empty.
    Dispatcher(std::vector<std::unique_ptr<Upstream>> upstreams,
               ConfigState& state,
               DispatcherOptions options = {});

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // First alive upstream from the class cursor. When none is alive the
    // first upstream is returned and the HTTP cursor goes back to its reset
    // value.
    Upstream& select_upstream(bool is_websocket);

    // Sticky lookup with failover to select_upstream. Two first-time routings
    // racing on one session may pick different upstreams; the later one sticks.
    Upstream& route_for_session(const std::string& session_id, bool is_websocket);

    std::optional<SessionToken> session_token(const std::string& session_id);

    // nullptr for unknown or expired tokens.
    Upstream* upstream_for_token(const SessionToken& token);

    void handle_request(ResponseSink& sink, const ProxyRequest& request);

    size_t size() const { return upstreams_.size(); }
    size_t http_cursor() const;
    size_t ws_cursor() const;
    size_t sticky_sessions() const { return sticky_.size(); }
    std::string last_response_sample() const;

private:
    Upstream* find_by_address(const std::string& address) const;

    std::vector<std::unique_ptr<Upstream>> upstreams_;
    ConfigState& state_;
    DispatcherOptions options_;

    mutable std::mutex dispatch_mutex_;
    RoundRobinCursor http_cursor_;
    RoundRobinCursor ws_cursor_;
    size_t http_reset_value_;

    StickyTable sticky_;
    std::unique_ptr<ResponseSampleBuffer> sampler_;
};

} // namespace slb
