#include "config_loader.hpp"
#include "config_state.hpp"
#include "dispatcher.hpp"
#include "health_probe.hpp"
#include "logger.hpp"
#include "middleware.hpp"
#include "proxy_server.hpp"
#include "upstream.hpp"
#include "upstream_address.hpp"
#include <spdlog/fmt/fmt.h>
#include <csignal>
#include <atomic>
#include <iostream>
#include <thread>

using namespace slb;

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        shutdown_requested.store(true);
    }
}

int main(int argc, char* argv[]) {
    // Install signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const std::string config_path = argc > 1 ? argv[1] : "config.json";

    // Load configuration
    auto config_result = ConfigLoader::load(config_path);
    if (!config_result.has_value()) {
        std::cerr << "Failed to load configuration: " << config_result.error() << std::endl;
        return 1;
    }

    Config config = config_result.value();

    // Initialize logger
    Logger::init(config.load_balancer.log_file, config.load_balancer.log_level);
    Logger::info(Logger::Component::Config,
        fmt::format("Loaded {} upstreams (health ttl {}ms, timeout {}ms, ws step {}, debug {})",
            config.backends.size(),
            config.health_check.ttl_ms,
            config.health_check.timeout_ms,
            config.routing.ws_round_robin_step,
            config.load_balancer.debug));

    ConfigState state(
        RoutingTunables{config.routing.ws_round_robin_step, config.routing.http_cursor_reset},
        config.load_balancer.debug);

    auto probe = std::make_shared<HttpHealthProbe>(
        std::chrono::milliseconds(config.health_check.timeout_ms));

    // Build upstreams wrapped in logging and telemetry
    std::vector<std::unique_ptr<Upstream>> upstreams;
    for (const auto& backend : config.backends) {
        auto address = UpstreamAddress::parse(backend);
        if (!address.has_value()) {
            Logger::error(Logger::Component::Config, address.error());
            Logger::shutdown();
            return 1;
        }
        auto upstream = std::make_unique<HttpUpstream>(
            std::move(address.value()), probe,
            std::chrono::milliseconds(config.health_check.ttl_ms));
        upstreams.push_back(with_default_middleware(std::move(upstream), state));
    }

    DispatcherOptions options;
    options.session_param = config.load_balancer.session_param;
    options.sticky_capacity = static_cast<size_t>(config.sticky.capacity);
    options.sticky_idle_ttl = std::chrono::seconds(config.sticky.idle_ttl_seconds);
    options.sample_capacity = static_cast<size_t>(config.sampler.capacity_bytes);

    Dispatcher dispatcher(std::move(upstreams), state, options);

    ProxyServer server(dispatcher, "0.0.0.0", static_cast<uint16_t>(config.load_balancer.port));
    try {
        server.bind();
    } catch (const std::exception& e) {
        Logger::error(Logger::Component::LB,
            fmt::format("Cannot listen on port {}: {}", config.load_balancer.port, e.what()));
        Logger::shutdown();
        return 1;
    }

    std::cout << fmt::format("Load balancer started on port {}\n", config.load_balancer.port);
    std::cout << "Press Ctrl+C to stop\n";

    // Run server in a separate thread to allow graceful shutdown
    std::thread server_thread([&]() {
        try {
            server.listen();
        } catch (const std::exception& e) {
            Logger::error(Logger::Component::LB, fmt::format("Listener failed: {}", e.what()));
            shutdown_requested.store(true);
        }
    });

    // Wait for shutdown signal
    while (!shutdown_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // Graceful shutdown
    std::cout << "\nShutting down gracefully...\n";
    Logger::info(Logger::Component::LB,
        fmt::format("Shutting down after {} forwarded requests", state.global_counter()));

    server.stop();

    if (server_thread.joinable()) {
        server_thread.join();
    }

    Logger::shutdown();

    std::cout << "Shutdown complete\n";
    return 0;
}
