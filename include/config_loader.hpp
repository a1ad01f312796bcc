#pragma once

#include <string>
#include <vector>
#include <expected>
#include <cstdint>

namespace slb {

struct LoadBalancerConfig {
    int port;
    std::string log_file;
    std::string log_level;
    bool debug;
    std::string session_param;
};

struct HealthCheckConfig {
    int ttl_ms = 1000;
    int timeout_ms = 2000;
};

struct RoutingConfig {
    int ws_round_robin_step = 2;
    int http_cursor_reset = 0;
};

struct StickyConfig {
    int64_t capacity = 65536;
    int idle_ttl_seconds = 3600;
};

struct SamplerConfig {
    int64_t capacity_bytes = 1024;
};

struct Config {
    LoadBalancerConfig load_balancer;
    std::vector<std::string> backends;
    HealthCheckConfig health_check;
    RoutingConfig routing;
    StickyConfig sticky;
    SamplerConfig sampler;
};

class ConfigLoader {
public:
    static std::expected<Config, std::string> load(const std::string& config_path);

    static std::expected<Config, std::string> parse_config(const std::string& content);

private:
    static std::expected<void, std::string> validate_config(const Config& config);
};

} // namespace slb
