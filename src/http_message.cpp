#include "http_message.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <vector>

namespace slb {

namespace {

constexpr std::array<std::string_view, 8> kHopByHopHeaders = {
    "Connection",
    "Keep-Alive",
    "Proxy-Authenticate",
    "Proxy-Authorization",
    "Te",
    "Trailer",
    "Transfer-Encoding",
    "Upgrade",
};

char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](char x, char y) { return lower(x) == lower(y); });
}

// Splits a comma separated header value into trimmed, non-empty tokens.
std::vector<std::string> split_tokens(std::string_view value) {
    std::vector<std::string> tokens;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string_view::npos) {
            comma = value.size();
        }
        std::string token = trim(value.substr(start, comma - start));
        if (!token.empty()) {
            tokens.push_back(std::move(token));
        }
        start = comma + 1;
    }
    return tokens;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
                                        [](char x, char y) { return lower(x) < lower(y); });
}

std::string ProxyRequest::path() const {
    return target.substr(0, target.find('?'));
}

std::string ProxyRequest::query_param(const std::string& name) const {
    size_t question = target.find('?');
    if (question == std::string::npos) {
        return "";
    }

    std::string_view query(target);
    query.remove_prefix(question + 1);
    query = query.substr(0, query.find('#'));

    while (!query.empty()) {
        size_t amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        size_t eq = pair.find('=');
        std::string key = url_decode(pair.substr(0, eq));
        if (key == name) {
            return eq == std::string_view::npos ? "" : url_decode(pair.substr(eq + 1));
        }
        if (amp == std::string_view::npos) {
            break;
        }
        query.remove_prefix(amp + 1);
    }
    return "";
}

std::string ProxyRequest::header(const std::string& name) const {
    auto it = headers.find(name);
    return it == headers.end() ? "" : it->second;
}

bool ProxyRequest::is_upgrade() const {
    return header_has_token(headers, "Connection", "upgrade") && headers.contains("Upgrade");
}

bool ProxyRequest::is_websocket_upgrade() const {
    return is_upgrade() && iequals(trim(header("Upgrade")), "websocket");
}

void remove_hop_by_hop_headers(Headers& headers) {
    // Headers named by Connection are hop-by-hop as well
    auto [first, last] = headers.equal_range("Connection");
    std::vector<std::string> named;
    for (auto it = first; it != last; ++it) {
        for (auto& token : split_tokens(it->second)) {
            named.push_back(std::move(token));
        }
    }

    for (const auto& name : named) {
        headers.erase(name);
    }
    for (auto name : kHopByHopHeaders) {
        headers.erase(std::string(name));
    }
}

std::string forwarded_for(const ProxyRequest& request) {
    std::string chain;
    auto [first, last] = request.headers.equal_range("X-Forwarded-For");
    for (auto it = first; it != last; ++it) {
        if (!chain.empty()) {
            chain += ", ";
        }
        chain += it->second;
    }
    if (request.remote_addr.empty()) {
        return chain;
    }
    return chain.empty() ? request.remote_addr : chain + ", " + request.remote_addr;
}

bool header_has_token(const Headers& headers, const std::string& name, std::string_view token) {
    auto [first, last] = headers.equal_range(name);
    for (auto it = first; it != last; ++it) {
        for (const auto& candidate : split_tokens(it->second)) {
            if (iequals(candidate, token)) {
                return true;
            }
        }
    }
    return false;
}

std::string trim(std::string_view s) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return std::string(s);
}

std::string url_decode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '+') {
            out.push_back(' ');
        } else if (s[i] == '%' && i + 2 < s.size() && hex_value(s[i + 1]) >= 0 &&
                   hex_value(s[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2])));
            i += 2;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

} // namespace slb
