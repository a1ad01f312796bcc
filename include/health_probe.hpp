#pragma once

#include "upstream_address.hpp"
#include <chrono>

namespace slb {

// One out-of-band liveness check against a backend.
class HealthProbe {
public:
    virtual ~HealthProbe() = default;

    virtual bool probe(const UpstreamAddress& address) = 0;
};

// GET {address}/health; only a 200 counts as alive. Connect and read are each
// bounded by the timeout.
class HttpHealthProbe : public HealthProbe {
public:
    explicit HttpHealthProbe(std::chrono::milliseconds timeout);

    bool probe(const UpstreamAddress& address) override;

private:
    std::chrono::milliseconds timeout_;
};

} // namespace slb
