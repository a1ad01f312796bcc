#include <gtest/gtest.h>
#include "health_probe.hpp"
#include "test_support.hpp"

using namespace slb;
using namespace std::chrono_literals;
using slb::test::TestBackend;

namespace {

UpstreamAddress address_of(const std::string& url) {
    auto parsed = UpstreamAddress::parse(url);
    EXPECT_TRUE(parsed.has_value()) << parsed.error();
    return parsed.value_or(UpstreamAddress{});
}

} // namespace

TEST(HttpHealthProbeTest, OkMeansAlive) {
    TestBackend backend;
    backend.server().Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("OK", "text/plain");
    });
    backend.start();

    HttpHealthProbe probe(1000ms);
    EXPECT_TRUE(probe.probe(address_of(backend.url())));
}

TEST(HttpHealthProbeTest, ErrorStatusMeansDead) {
    TestBackend backend;
    backend.server().Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.status = 503;
    });
    backend.start();

    HttpHealthProbe probe(1000ms);
    EXPECT_FALSE(probe.probe(address_of(backend.url())));
}

TEST(HttpHealthProbeTest, MissingEndpointMeansDead) {
    TestBackend backend;
    backend.start();

    HttpHealthProbe probe(1000ms);
    EXPECT_FALSE(probe.probe(address_of(backend.url())));
}

TEST(HttpHealthProbeTest, RefusedConnectionMeansDead) {
    HttpHealthProbe probe(500ms);
    EXPECT_FALSE(probe.probe(address_of("http://127.0.0.1:1")));
}

TEST(HttpHealthProbeTest, SlowBackendTimesOut) {
    TestBackend backend;
    backend.server().Get("/health", [](const httplib::Request&, httplib::Response& res) {
        std::this_thread::sleep_for(1500ms);
        res.set_content("late", "text/plain");
    });
    backend.start();

    HttpHealthProbe probe(300ms);

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(probe.probe(address_of(backend.url())));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, 1200ms);
}

TEST(HttpHealthProbeTest, ProbesUnderBasePath) {
    TestBackend backend;
    backend.server().Get("/app/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("OK", "text/plain");
    });
    backend.start();

    HttpHealthProbe probe(1000ms);
    EXPECT_TRUE(probe.probe(address_of(backend.url() + "/app")));
    EXPECT_FALSE(probe.probe(address_of(backend.url())));
}
