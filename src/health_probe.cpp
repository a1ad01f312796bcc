#include "health_probe.hpp"
#include "logger.hpp"
#include <httplib.h>
#include <spdlog/fmt/fmt.h>

namespace slb {

HttpHealthProbe::HttpHealthProbe(std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

bool HttpHealthProbe::probe(const UpstreamAddress& address) {
    try {
        const auto seconds = static_cast<time_t>(timeout_.count() / 1000);
        const auto microseconds = static_cast<time_t>((timeout_.count() % 1000) * 1000);

        httplib::Client client(address.host, address.port);
        client.set_connection_timeout(seconds, microseconds);
        client.set_read_timeout(seconds, microseconds);
        client.set_write_timeout(seconds, microseconds);
        client.set_keep_alive(false);

        auto res = client.Get(address.join_path("/health"));

        if (res && res->status == 200) {
            return true;
        }

        if (res) {
            Logger::debug(Logger::Component::HealthCheck,
                fmt::format("Upstream {} health check returned {}", address.text, res->status));
        } else {
            Logger::debug(Logger::Component::HealthCheck,
                fmt::format("Upstream {} health check failed: {}",
                    address.text, httplib::to_string(res.error())));
        }
        return false;

    } catch (const std::exception& e) {
        Logger::debug(Logger::Component::HealthCheck,
            fmt::format("Upstream {} health check exception: {}", address.text, e.what()));
        return false;
    }
}

} // namespace slb
