#include "dispatcher.hpp"
#include "logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <numeric>
#include <stdexcept>

namespace slb {

namespace {

size_t require_upstreams(const std::vector<std::unique_ptr<Upstream>>& upstreams) {
    if (upstreams.empty()) {
        throw std::invalid_argument("Dispatcher requires at least one upstream");
    }
    return upstreams.size();
}

} // namespace

Dispatcher::Dispatcher(std::vector<std::unique_ptr<Upstream>> upstreams,
                       ConfigState& state,
                       DispatcherOptions options)
    : upstreams_(std::move(upstreams)),
      state_(state),
      options_(std::move(options)),
      http_cursor_(require_upstreams(upstreams_), 1),
      ws_cursor_(upstreams_.size(), static_cast<size_t>(state.tunables().ws_round_robin_step)),
      http_reset_value_(static_cast<size_t>(state.tunables().http_cursor_reset_value)),
      sticky_(options_.sticky_capacity, options_.sticky_idle_ttl) {
    if (options_.sample_capacity > 0) {
        sampler_ = std::make_unique<ResponseSampleBuffer>(options_.sample_capacity);
    }

    const size_t step = static_cast<size_t>(state.tunables().ws_round_robin_step);
    const size_t ring = upstreams_.size();
    if (ring > 1 && std::gcd(step, ring) != 1) {
        Logger::warn(Logger::Component::Router,
            fmt::format("WebSocket step {} shares a factor with {} upstreams; "
                        "WebSocket round robin will visit only {} of them",
                        step, ring, ring / std::gcd(step, ring)));
    }
}

Upstream& Dispatcher::select_upstream(bool is_websocket) {
    std::lock_guard lock(dispatch_mutex_);

    RoundRobinCursor& cursor = is_websocket ? ws_cursor_ : http_cursor_;

    for (size_t i = 0; i < upstreams_.size(); ++i) {
        size_t idx = cursor.candidate(i);
        Upstream& candidate = *upstreams_[idx];
        if (candidate.is_alive()) {
            cursor.advance_from(idx);
            return candidate;
        }
    }

    if (!is_websocket) {
        http_cursor_.reset(http_reset_value_);
    }

    Logger::warn(Logger::Component::Router,
        fmt::format("No upstream is alive, falling back to {}", upstreams_.front()->address()));
    return *upstreams_.front();
}

Upstream& Dispatcher::route_for_session(const std::string& session_id, bool is_websocket) {
    const std::string key = trim(session_id);

    if (auto address = sticky_.find(key)) {
        Upstream* pinned = find_by_address(*address);
        if (pinned != nullptr && pinned->is_alive()) {
            return *pinned;
        }
        Logger::info(Logger::Component::Router,
            fmt::format("Session '{}' lost upstream {}, re-routing", key, *address));
    }

    Upstream& target = select_upstream(is_websocket);
    sticky_.assign(key, target.address());

    Logger::debug(Logger::Component::Router,
        fmt::format("Session '{}' pinned to {}", key, target.address()));
    return target;
}

std::optional<SessionToken> Dispatcher::session_token(const std::string& session_id) {
    return sticky_.token_for(trim(session_id));
}

Upstream* Dispatcher::upstream_for_token(const SessionToken& token) {
    auto address = sticky_.address_for_token(token);
    if (!address) {
        return nullptr;
    }
    return find_by_address(*address);
}

void Dispatcher::handle_request(ResponseSink& sink, const ProxyRequest& request) {
    const std::string session_id = trim(request.query_param(options_.session_param));
    const bool websocket = request.is_websocket_upgrade();

    Upstream& target = session_id.empty()
        ? select_upstream(websocket)
        : route_for_session(session_id, websocket);

    if (!sampler_) {
        target.serve(sink, request);
        return;
    }

    SamplingResponseSink sampling(sink, *sampler_);
    target.serve(sampling, request);
}

size_t Dispatcher::http_cursor() const {
    std::lock_guard lock(dispatch_mutex_);
    return http_cursor_.position();
}

size_t Dispatcher::ws_cursor() const {
    std::lock_guard lock(dispatch_mutex_);
    return ws_cursor_.position();
}

std::string Dispatcher::last_response_sample() const {
    return sampler_ ? sampler_->snapshot() : std::string();
}

Upstream* Dispatcher::find_by_address(const std::string& address) const {
    for (const auto& upstream : upstreams_) {
        if (upstream->address() == address) {
            return upstream.get();
        }
    }
    return nullptr;
}

} // namespace slb
