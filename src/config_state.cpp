#include "config_state.hpp"
#include <mutex>

namespace slb {

ConfigState::ConfigState(RoutingTunables tunables, bool debug_mode)
    : global_request_counter_(0), tunables_(tunables), debug_mode_(debug_mode) {}

void ConfigState::increment_global_counter() noexcept {
    global_request_counter_.fetch_add(1, std::memory_order_relaxed);
}

uint64_t ConfigState::global_counter() const noexcept {
    return global_request_counter_.load(std::memory_order_relaxed);
}

RoutingTunables ConfigState::tunables() const {
    std::shared_lock lock(mutex_);
    return tunables_;
}

} // namespace slb
