#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace slb {

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using Headers = std::multimap<std::string, std::string, CaseInsensitiveLess>;

// Transport-neutral view of an inbound request.
struct ProxyRequest {
    std::string method;
    std::string target;       // origin-form: path plus raw query
    Headers headers;
    std::string body;
    std::string remote_addr;

    std::string path() const;
    std::string query_param(const std::string& name) const;
    std::string header(const std::string& name) const;

    // Connection: upgrade together with an Upgrade header
    bool is_upgrade() const;
    bool is_websocket_upgrade() const;
};

// Where a proxied response is written. Implemented by the inbound transport,
// decorated by the response sampler, and faked by tests.
class ResponseSink {
public:
    virtual ~ResponseSink() = default;

    virtual void write_head(int status, const Headers& headers) = 0;
    virtual void write(std::string_view chunk) = 0;

    // Hands the client socket over after a successful protocol switch.
    // `buffered` receives bytes already read past the request head. Returns
    // nullptr when the transport cannot give up its connection.
    virtual boost::asio::ip::tcp::socket* hijack(std::string& buffered) = 0;

    // Registers a callback that aborts outbound I/O made for this response
    // when the client connection is torn down. An empty function clears it.
    virtual void on_abort(std::function<void()>) {}
};

// Removes Connection, Keep-Alive, Proxy-*, Te, Trailer, Transfer-Encoding,
// Upgrade and every header listed in Connection.
void remove_hop_by_hop_headers(Headers& headers);

// Existing X-Forwarded-For chain with the client address appended.
std::string forwarded_for(const ProxyRequest& request);

bool header_has_token(const Headers& headers, const std::string& name, std::string_view token);

std::string trim(std::string_view s);

std::string url_decode(std::string_view s);

} // namespace slb
