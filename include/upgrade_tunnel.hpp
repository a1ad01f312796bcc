#pragma once

#include "http_message.hpp"
#include "upstream.hpp"
#include "upstream_address.hpp"

namespace slb {

// Relays an upgrade handshake (WebSocket and friends) to the backend. On a 101
// the client connection is taken from the sink and bytes are copied both ways
// until either side closes; any other answer is passed back as a normal
// response. Connect, request write and the wait for the answer are each bounded
// by the matching timeout and can be cut short through the sink's abort hook.
void tunnel_upgrade(const UpstreamAddress& address,
                    ResponseSink& sink,
                    const ProxyRequest& request,
                    const ForwardTimeouts& timeouts);

} // namespace slb
