#include "proxy_server.hpp"
#include "logger.hpp"
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/fmt/fmt.h>
#include <functional>
#include <thread>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace slb {

namespace {

constexpr uint32_t kHeaderLimit = 64 * 1024;
constexpr uint64_t kBodyLimit = 64ull * 1024 * 1024;

// Bodies must not carry framing on these statuses.
bool is_bodyless_status(int status) {
    return (status >= 100 && status < 200) || status == 204 || status == 304;
}

// Writes the proxied response back on the client connection. HTTP/1.1 bodies
// are streamed with chunked encoding as they arrive; HTTP/1.0 and bodyless
// responses are buffered and sent by finish().
class BeastResponseSink : public ResponseSink {
public:
    using AbortRegistrar = std::function<void(std::function<void()>)>;

    BeastResponseSink(tcp::socket& socket, beast::flat_buffer& buffer,
                      unsigned version, bool keep_alive, bool head_request,
                      AbortRegistrar register_abort)
        : socket_(socket), buffer_(buffer), version_(version),
          keep_alive_(keep_alive), head_request_(head_request),
          register_abort_(std::move(register_abort)) {}

    void write_head(int status, const Headers& headers) override {
        if (head_sent_) {
            // Status line already on the wire, the client only sees a cut response
            broken_ = true;
            return;
        }
        status_ = status;
        headers_ = headers;
        body_.clear();
    }

    void write(std::string_view chunk) override {
        if (broken_ || chunk.empty()) {
            return;
        }
        if (!streams_body()) {
            body_.append(chunk);
            return;
        }
        if (!head_sent_) {
            send_chunked_head();
            if (broken_) {
                return;
            }
        }
        beast::error_code ec;
        net::write(socket_, http::make_chunk(net::buffer(chunk.data(), chunk.size())), ec);
        if (ec) {
            broken_ = true;
        }
    }

    tcp::socket* hijack(std::string& buffered) override {
        buffered = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        hijacked_ = true;
        return &socket_;
    }

    void on_abort(std::function<void()> abort) override {
        register_abort_(std::move(abort));
    }

    bool hijacked() const { return hijacked_; }
    bool keep_alive() const { return keep_alive_; }

    void finish(beast::error_code& ec) {
        if (broken_) {
            ec = net::error::connection_aborted;
            return;
        }
        if (head_sent_) {
            net::write(socket_, http::make_chunk_last(), ec);
            return;
        }

        http::response<http::string_body> res;
        res.version(version_);
        res.result(static_cast<unsigned>(status_));
        for (const auto& [name, value] : headers_) {
            res.insert(name, value);
        }
        if (!head_request_ && !is_bodyless_status(status_)) {
            res.body() = std::move(body_);
            res.prepare_payload();
        }
        res.keep_alive(keep_alive_);
        http::write(socket_, res, ec);
    }

private:
    bool streams_body() const {
        return version_ >= 11 && !head_request_ && !is_bodyless_status(status_);
    }

    void send_chunked_head() {
        http::response<http::empty_body> res;
        res.version(version_);
        res.result(static_cast<unsigned>(status_));
        for (const auto& [name, value] : headers_) {
            res.insert(name, value);
        }
        res.chunked(true);
        res.keep_alive(keep_alive_);

        http::response_serializer<http::empty_body> serializer{res};
        beast::error_code ec;
        http::write_header(socket_, serializer, ec);
        head_sent_ = true;
        if (ec) {
            broken_ = true;
        }
    }

    tcp::socket& socket_;
    beast::flat_buffer& buffer_;
    unsigned version_;
    bool keep_alive_;
    bool head_request_;
    AbortRegistrar register_abort_;

    int status_ = 502;
    Headers headers_;
    std::string body_;
    bool head_sent_ = false;
    bool broken_ = false;
    bool hijacked_ = false;
};

ProxyRequest to_proxy_request(http::request<http::string_body>& req, const std::string& remote_addr) {
    ProxyRequest request;
    request.method = std::string(req.method_string());
    request.target = std::string(req.target());
    for (const auto& field : req) {
        request.headers.emplace(std::string(field.name_string()), std::string(field.value()));
    }
    request.body = std::move(req.body());
    request.remote_addr = remote_addr;
    return request;
}

} // namespace

ProxyServer::ProxyServer(Dispatcher& dispatcher, std::string bind_address, uint16_t port)
    : dispatcher_(dispatcher), bind_address_(std::move(bind_address)), port_(port),
      acceptor_(ioc_) {}

ProxyServer::~ProxyServer() {
    stop();
}

uint16_t ProxyServer::bind() {
    tcp::endpoint endpoint(net::ip::make_address(bind_address_), port_);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
    port_ = acceptor_.local_endpoint().port();
    return port_;
}

void ProxyServer::listen() {
    if (!acceptor_.is_open()) {
        bind();
    }

    Logger::info(Logger::Component::LB,
        fmt::format("Listening on {}:{}", bind_address_, port_));

    do_accept();
    ioc_.run();
}

void ProxyServer::stop() {
    if (stopping_.exchange(true)) {
        return;
    }

    net::post(ioc_, [this] {
        beast::error_code ignored;
        acceptor_.close(ignored);
    });

    std::unique_lock lock(sessions_mutex_);
    for (auto& [id, session] : sessions_) {
        if (session.abort) {
            session.abort();
        }
        beast::error_code ignored;
        session.socket->shutdown(tcp::socket::shutdown_both, ignored);
    }
    sessions_cv_.wait(lock, [this] { return sessions_.empty(); });
    lock.unlock();

    ioc_.stop();
}

size_t ProxyServer::active_connections() const {
    std::lock_guard lock(sessions_mutex_);
    return sessions_.size();
}

void ProxyServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (!acceptor_.is_open() || stopping_) {
                return;
            }
            Logger::warn(Logger::Component::LB, fmt::format("Accept failed: {}", ec.message()));
        } else {
            start_session(std::move(socket));
        }
        do_accept();
    });
}

void ProxyServer::start_session(tcp::socket socket) {
    auto shared = std::make_shared<tcp::socket>(std::move(socket));

    uint64_t id = 0;
    {
        std::lock_guard lock(sessions_mutex_);
        if (stopping_) {
            beast::error_code ignored;
            shared->close(ignored);
            return;
        }
        id = next_session_id_++;
        sessions_.emplace(id, Session{shared, {}});
    }

    try {
        launch_worker([this, shared, id] {
            serve_connection(*shared, id);
            end_session(id);
        });
    } catch (const std::exception& e) {
        Logger::warn(Logger::Component::LB,
            fmt::format("Dropping connection, no worker available: {}", e.what()));
        end_session(id);
    }
}

void ProxyServer::launch_worker(std::function<void()> work) {
    std::thread(std::move(work)).detach();
}

void ProxyServer::end_session(uint64_t id) {
    std::lock_guard lock(sessions_mutex_);
    auto it = sessions_.find(id);
    if (it != sessions_.end()) {
        beast::error_code ignored;
        it->second.socket->shutdown(tcp::socket::shutdown_send, ignored);
        it->second.socket->close(ignored);
        sessions_.erase(it);
    }
    sessions_cv_.notify_all();
}

void ProxyServer::set_session_abort(uint64_t id, std::function<void()> abort) {
    std::lock_guard lock(sessions_mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return;
    }
    it->second.abort = std::move(abort);
    // stop() already swept the sessions
    if (stopping_ && it->second.abort) {
        it->second.abort();
    }
}

void ProxyServer::serve_connection(tcp::socket& socket, uint64_t id) {
    beast::error_code ec;
    auto remote = socket.remote_endpoint(ec);
    const std::string remote_addr = ec ? std::string() : remote.address().to_string();

    beast::flat_buffer buffer;
    for (;;) {
        http::request_parser<http::string_body> parser;
        parser.header_limit(kHeaderLimit);
        parser.body_limit(kBodyLimit);

        http::read(socket, buffer, parser, ec);
        if (ec == http::error::end_of_stream) {
            break;
        }
        if (ec) {
            Logger::debug(Logger::Component::Proxy,
                fmt::format("Read from {} failed: {}", remote_addr, ec.message()));
            break;
        }

        auto& req = parser.get();
        const unsigned version = req.version();
        const bool keep_alive = req.keep_alive();
        const bool head_request = req.method() == http::verb::head;

        ProxyRequest request = to_proxy_request(req, remote_addr);
        BeastResponseSink sink(socket, buffer, version, keep_alive, head_request,
            [this, id](std::function<void()> abort) { set_session_abort(id, std::move(abort)); });

        try {
            dispatcher_.handle_request(sink, request);
        } catch (const std::exception& e) {
            Logger::error(Logger::Component::Proxy,
                fmt::format("Request {} {} failed: {}", request.method, request.target, e.what()));
            if (sink.hijacked()) {
                break;
            }
            write_bad_gateway(sink, e.what());
        }

        if (sink.hijacked()) {
            break;
        }

        sink.finish(ec);
        if (ec) {
            Logger::debug(Logger::Component::Proxy,
                fmt::format("Write to {} failed: {}", remote_addr, ec.message()));
            break;
        }
        if (!sink.keep_alive()) {
            break;
        }
    }
}

} // namespace slb
