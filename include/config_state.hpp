#pragma once

#include <atomic>
#include <cstdint>
#include <shared_mutex>

namespace slb {

struct RoutingTunables {
    int ws_round_robin_step = 2;
    int http_cursor_reset_value = 0;
};

// Process-wide routing state shared by the dispatcher, upstreams and
// interceptors. Constructed once in main and passed by reference.
class ConfigState {
public:
    explicit ConfigState(RoutingTunables tunables = {}, bool debug_mode = false);

    ConfigState(const ConfigState&) = delete;
    ConfigState& operator=(const ConfigState&) = delete;

    void increment_global_counter() noexcept;
    uint64_t global_counter() const noexcept;

    RoutingTunables tunables() const;

    bool debug_mode() const noexcept { return debug_mode_; }

private:
    std::atomic<uint64_t> global_request_counter_;
    RoutingTunables tunables_;
    const bool debug_mode_;
    mutable std::shared_mutex mutex_;
};

} // namespace slb
