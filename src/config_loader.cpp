#include "config_loader.hpp"
#include "upstream_address.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <fstream>
#include <sstream>


using json = nlohmann::json;

namespace slb {

std::expected<Config, std::string> ConfigLoader::load(const std::string& config_path) {
    // Try multiple locations for the config file
    std::vector<std::string> search_paths = {
        config_path,                           // Current directory
        "../" + config_path,                   // Parent directory (for build dirs)
        "../../" + config_path                 // Two levels up (for nested builds)
    };

    std::ifstream file;

    for (const auto& path : search_paths) {
        file.open(path);
        if (file.is_open()) {
            break;
        }
        file.clear(); // Clear error flags before next attempt
    }

    if (!file.is_open()) {
        return std::unexpected("Failed to open config file: " + config_path +
                             " (searched in: ., .., ../..)");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return parse_config(buffer.str());
}

std::expected<Config, std::string> ConfigLoader::parse_config(const std::string& content) {
    try {
        json j = json::parse(content);

        Config config;

        // Parse load_balancer section
        if (!j.contains("load_balancer")) {
            return std::unexpected("Missing 'load_balancer' section");
        }
        auto& lb = j["load_balancer"];
        config.load_balancer.port = lb.value("port", 7000);
        config.load_balancer.log_file = lb.value("log_file", "lb.log");
        config.load_balancer.log_level = lb.value("log_level", "INFO");
        config.load_balancer.debug = lb.value("debug", false);
        config.load_balancer.session_param = lb.value("session_param", "document_id");

        // Parse backends section: plain URL strings or {"address": ...} objects
        if (!j.contains("backends") || !j["backends"].is_array()) {
            return std::unexpected("Missing 'backends' section");
        }
        for (const auto& backend : j["backends"]) {
            if (backend.is_string()) {
                config.backends.push_back(backend.get<std::string>());
            } else if (backend.is_object() && backend.contains("address")) {
                config.backends.push_back(backend["address"].get<std::string>());
            } else {
                return std::unexpected("Backend entry must be a URL string or have an 'address'");
            }
        }

        if (j.contains("health_check")) {
            auto& hc = j["health_check"];
            config.health_check.ttl_ms = hc.value("ttl_ms", config.health_check.ttl_ms);
            config.health_check.timeout_ms = hc.value("timeout_ms", config.health_check.timeout_ms);
        }

        if (j.contains("routing")) {
            auto& routing = j["routing"];
            config.routing.ws_round_robin_step =
                routing.value("ws_round_robin_step", config.routing.ws_round_robin_step);
            config.routing.http_cursor_reset =
                routing.value("http_cursor_reset", config.routing.http_cursor_reset);
        }

        if (j.contains("sticky")) {
            auto& sticky = j["sticky"];
            config.sticky.capacity = sticky.value("capacity", config.sticky.capacity);
            config.sticky.idle_ttl_seconds =
                sticky.value("idle_ttl_seconds", config.sticky.idle_ttl_seconds);
        }

        if (j.contains("sampler")) {
            config.sampler.capacity_bytes =
                j["sampler"].value("capacity_bytes", config.sampler.capacity_bytes);
        }

        // Validate
        auto valid = validate_config(config);
        if (!valid.has_value()) {
            return std::unexpected("Configuration validation failed: " + valid.error());
        }

        return config;

    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parsing error: ") + e.what());
    }
}

std::expected<void, std::string> ConfigLoader::validate_config(const Config& config) {
    if (config.backends.empty()) {
        return std::unexpected("at least one backend is required");
    }

    for (const auto& backend : config.backends) {
        auto address = UpstreamAddress::parse(backend);
        if (!address.has_value()) {
            return std::unexpected(address.error());
        }
    }

    if (config.load_balancer.port < 1 || config.load_balancer.port > 65535) {
        return std::unexpected(fmt::format("load_balancer.port {} is outside 1-65535",
                                           config.load_balancer.port));
    }

    if (config.health_check.ttl_ms < 0) {
        return std::unexpected("health_check.ttl_ms must not be negative");
    }

    if (config.health_check.timeout_ms <= 0) {
        return std::unexpected("health_check.timeout_ms must be positive");
    }

    if (config.routing.ws_round_robin_step < 1) {
        return std::unexpected("routing.ws_round_robin_step must be at least 1");
    }

    if (config.routing.http_cursor_reset < 0) {
        return std::unexpected("routing.http_cursor_reset must not be negative");
    }

    if (config.sticky.capacity < 0) {
        return std::unexpected("sticky.capacity must not be negative");
    }

    if (config.sampler.capacity_bytes < 0) {
        return std::unexpected("sampler.capacity_bytes must not be negative");
    }

    if (config.sticky.idle_ttl_seconds < 0) {
        return std::unexpected(
            fmt::format("sticky.idle_ttl_seconds must not be negative (got {})",
                        config.sticky.idle_ttl_seconds));
    }

    return {};
}

} // namespace slb
