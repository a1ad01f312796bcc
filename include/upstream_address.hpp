#pragma once

#include <cstdint>
#include <expected>
#include <string>

namespace slb {

// Parsed backend base URL, e.g. "http://10.0.0.5:8080/app".
struct UpstreamAddress {
    std::string text;       // as configured, used for logging and sticky entries
    std::string host;
    uint16_t port = 80;
    std::string base_path;  // without trailing slash, may be empty

    // Only plain http:// addresses are accepted.
    static std::expected<UpstreamAddress, std::string> parse(const std::string& url);

    // Joins the request path onto base_path with exactly one slash between them.
    std::string join_path(const std::string& request_path) const;

    std::string host_header() const;
};

} // namespace slb
