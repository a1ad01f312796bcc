#include "upstream_address.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace slb {

namespace {

constexpr std::string_view kScheme = "http://";

bool starts_with_icase(const std::string& s, std::string_view prefix) {
    if (s.size() < prefix.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), s.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    });
}

} // namespace

std::expected<UpstreamAddress, std::string> UpstreamAddress::parse(const std::string& url) {
    auto malformed = [&url](const std::string& reason) {
        return std::unexpected(fmt::format("Malformed upstream address '{}': {}", url, reason));
    };

    if (starts_with_icase(url, "https://")) {
        return malformed("TLS upstreams are not supported");
    }
    if (!starts_with_icase(url, kScheme)) {
        return malformed("expected an http:// URL");
    }

    std::string rest = url.substr(kScheme.size());
    if (rest.find_first_of("?#") != std::string::npos) {
        return malformed("query and fragment are not allowed");
    }

    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    std::string path = slash == std::string::npos ? "" : rest.substr(slash);

    if (authority.empty()) {
        return malformed("missing host");
    }
    if (authority.find('@') != std::string::npos) {
        return malformed("credentials are not allowed");
    }

    UpstreamAddress address;
    address.text = url;

    std::string port_text;
    if (authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            return malformed("unterminated IPv6 literal");
        }
        address.host = authority.substr(1, close - 1);
        std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                return malformed("unexpected characters after IPv6 literal");
            }
            port_text = tail.substr(1);
        }
    } else {
        size_t colon = authority.rfind(':');
        address.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
        }
    }

    if (address.host.empty()) {
        return malformed("missing host");
    }

    if (!port_text.empty()) {
        unsigned int port = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        if (ec != std::errc() || ptr != port_text.data() + port_text.size() ||
            port == 0 || port > 65535) {
            return malformed(fmt::format("invalid port '{}'", port_text));
        }
        address.port = static_cast<uint16_t>(port);
    }

    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    address.base_path = path;

    return address;
}

std::string UpstreamAddress::join_path(const std::string& request_path) const {
    if (request_path.empty()) {
        return base_path.empty() ? "/" : base_path;
    }
    if (request_path.front() == '/') {
        return base_path + request_path;
    }
    return base_path + "/" + request_path;
}

std::string UpstreamAddress::host_header() const {
    std::string host_part = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (port == 80) {
        return host_part;
    }
    return fmt::format("{}:{}", host_part, port);
}

} // namespace slb
