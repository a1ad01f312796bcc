#include <gtest/gtest.h>
#include "middleware.hpp"
#include "proxy_server.hpp"
#include "test_support.hpp"
#include <boost/asio/connect.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <system_error>
#include <thread>

using namespace slb;
using namespace std::chrono_literals;
using slb::test::SilentBackend;
using slb::test::TestBackend;

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

// Plain Beast server that answers /health and echoes WebSocket messages.
class EchoBackend {
public:
    EchoBackend() : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
        port_ = acceptor_.local_endpoint().port();
        accept_thread_ = std::thread([this] { accept_loop(); });
    }

    ~EchoBackend() {
        stopping_ = true;
        // Wake the blocking accept
        beast::error_code ignored;
        tcp::socket poke(ioc_);
        poke.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port_), ignored);
        accept_thread_.join();
        for (auto& thread : connection_threads_) {
            thread.join();
        }
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

private:
    void accept_loop() {
        while (!stopping_) {
            tcp::socket socket(ioc_);
            beast::error_code ec;
            acceptor_.accept(socket, ec);
            if (ec || stopping_) {
                break;
            }
            connection_threads_.emplace_back([s = std::move(socket)]() mutable { serve(s); });
        }
    }

    static void serve(tcp::socket& socket) {
        beast::error_code ec;
        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        http::read(socket, buffer, req, ec);
        if (ec) {
            return;
        }

        if (websocket::is_upgrade(req)) {
            websocket::stream<tcp::socket> ws(std::move(socket));
            ws.accept(req, ec);
            while (!ec) {
                beast::flat_buffer message;
                ws.read(message, ec);
                if (ec) {
                    break;
                }
                ws.text(true);
                ws.write(net::buffer("echo:" + beast::buffers_to_string(message.data())), ec);
            }
            return;
        }

        http::response<http::string_body> res;
        res.version(req.version());
        res.result(req.target() == "/health" ? http::status::ok : http::status::not_found);
        res.body() = "OK";
        res.keep_alive(false);
        res.prepare_payload();
        http::write(socket, res, ec);
        socket.shutdown(tcp::socket::shutdown_send, ec);
    }

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    uint16_t port_ = 0;
    std::atomic<bool> stopping_{false};
    std::thread accept_thread_;
    std::vector<std::thread> connection_threads_;
};

// httplib backend that names itself and can be told to fail its health check.
struct NamedBackend {
    explicit NamedBackend(std::string name) : name(std::move(name)) {
        backend.server().Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            res.status = healthy ? 200 : 503;
        });
        backend.server().Get("/whoami", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(this->name, "text/plain");
        });
        backend.server().Post("/echo", [this](const httplib::Request& req, httplib::Response& res) {
            res.set_content(this->name + ":" + req.body, "text/plain");
        });
        backend.start();
    }

    std::string name;
    std::atomic<bool> healthy{true};
    TestBackend backend;
};

// Refuses to start a worker for the first connection, as when the process is
// out of threads.
class ThreadStarvedServer : public ProxyServer {
public:
    using ProxyServer::ProxyServer;

    int launch_attempts() const { return launch_attempts_.load(); }

protected:
    void launch_worker(std::function<void()> work) override {
        if (launch_attempts_.fetch_add(1) == 0) {
            throw std::system_error(
                std::make_error_code(std::errc::resource_unavailable_try_again));
        }
        ProxyServer::launch_worker(std::move(work));
    }

private:
    std::atomic<int> launch_attempts_{0};
};

} // namespace

class ProxyServerTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (server) {
            server->stop();
        }
        if (server_thread.joinable()) {
            server_thread.join();
        }
    }

    template <class Server = ProxyServer>
    void start(const std::vector<std::string>& urls) {
        auto probe = std::make_shared<HttpHealthProbe>(500ms);
        std::vector<std::unique_ptr<Upstream>> upstreams;
        for (const auto& url : urls) {
            auto address = UpstreamAddress::parse(url);
            ASSERT_TRUE(address.has_value()) << address.error();
            upstreams.push_back(with_default_middleware(
                std::make_unique<HttpUpstream>(*address, probe, 50ms), state));
        }
        dispatcher = std::make_unique<Dispatcher>(std::move(upstreams), state);
        server = std::make_unique<Server>(*dispatcher, "127.0.0.1", 0);
        port = server->bind();
        server_thread = std::thread([this] { server->listen(); });
    }

    httplib::Client client() {
        httplib::Client c("127.0.0.1", port);
        c.set_read_timeout(5, 0);
        return c;
    }

    ConfigState state;
    std::unique_ptr<Dispatcher> dispatcher;
    std::unique_ptr<ProxyServer> server;
    std::thread server_thread;
    uint16_t port = 0;
};

TEST_F(ProxyServerTest, RoundRobinsPlainRequests) {
    NamedBackend a("a");
    NamedBackend b("b");
    start({a.backend.url(), b.backend.url()});

    auto c = client();
    std::vector<std::string> served;
    for (int i = 0; i < 4; ++i) {
        auto res = c.Get("/whoami");
        ASSERT_TRUE(res) << httplib::to_string(res.error());
        EXPECT_EQ(res->status, 200);
        served.push_back(res->body);
    }

    EXPECT_EQ(served, (std::vector<std::string>{"a", "b", "a", "b"}));
    EXPECT_EQ(state.global_counter(), 4u);
}

TEST_F(ProxyServerTest, DocumentStaysOnOneBackend) {
    NamedBackend a("a");
    NamedBackend b("b");
    start({a.backend.url(), b.backend.url()});

    auto c = client();
    auto first = c.Get("/whoami?document_id=doc-42");
    ASSERT_TRUE(first);

    for (int i = 0; i < 5; ++i) {
        c.Get("/whoami");
        auto res = c.Get("/whoami?document_id=doc-42");
        ASSERT_TRUE(res);
        EXPECT_EQ(res->body, first->body);
    }
    EXPECT_EQ(dispatcher->sticky_sessions(), 1u);
}

TEST_F(ProxyServerTest, DocumentFailsOverWhenBackendDies) {
    NamedBackend a("a");
    NamedBackend b("b");
    start({a.backend.url(), b.backend.url()});

    auto c = client();
    auto first = c.Get("/whoami?document_id=doc-42");
    ASSERT_TRUE(first);
    ASSERT_EQ(first->body, "a");

    a.healthy = false;
    std::this_thread::sleep_for(100ms);

    for (int i = 0; i < 3; ++i) {
        auto res = c.Get("/whoami?document_id=doc-42");
        ASSERT_TRUE(res);
        EXPECT_EQ(res->body, "b");
    }

    // Recovery of the old backend does not move the document back
    a.healthy = true;
    std::this_thread::sleep_for(100ms);
    auto after = c.Get("/whoami?document_id=doc-42");
    ASSERT_TRUE(after);
    EXPECT_EQ(after->body, "b");
}

TEST_F(ProxyServerTest, ForwardsRequestBody) {
    NamedBackend a("a");
    start({a.backend.url()});

    auto c = client();
    auto res = c.Post("/echo", "payload", "text/plain");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->body, "a:payload");
    EXPECT_EQ(dispatcher->last_response_sample(), "a:payload");
}

TEST_F(ProxyServerTest, UnreachableBackendIsBadGateway) {
    start({"http://127.0.0.1:1"});

    auto c = client();
    auto res = c.Get("/anything");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 502);
    EXPECT_NE(res->body.find("Bad Gateway"), std::string::npos);
}

TEST_F(ProxyServerTest, TunnelsWebSocket) {
    EchoBackend echo;
    start({echo.url()});

    net::io_context ioc;
    websocket::stream<tcp::socket> ws(ioc);
    ws.next_layer().connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
    ws.handshake("127.0.0.1:" + std::to_string(port), "/chat?document_id=room-1");

    for (const std::string message : {"hello", "second"}) {
        ws.write(net::buffer(message));
        beast::flat_buffer reply;
        ws.read(reply);
        EXPECT_EQ(beast::buffers_to_string(reply.data()), "echo:" + message);
    }

    ws.close(websocket::close_code::normal);

    EXPECT_TRUE(dispatcher->session_token("room-1").has_value());
    EXPECT_EQ(dispatcher->ws_cursor(), 0u);
}

TEST_F(ProxyServerTest, StopWaitsForOpenConnections) {
    NamedBackend a("a");
    start({a.backend.url()});

    // Idle keep-alive connection that never sends a request
    net::io_context ioc;
    tcp::socket idle(ioc);
    idle.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
    for (int i = 0; i < 200 && server->active_connections() == 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(server->active_connections(), 1u);

    server->stop();
    server_thread.join();

    EXPECT_EQ(server->active_connections(), 0u);
}

TEST_F(ProxyServerTest, SurvivesWorkerStartFailure) {
    NamedBackend a("a");
    start<ThreadStarvedServer>({a.backend.url()});

    auto c = client();
    auto dropped = c.Get("/whoami");
    EXPECT_FALSE(dropped);

    for (int i = 0; i < 200 && server->active_connections() != 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(server->active_connections(), 0u);

    // The listener keeps accepting
    auto res = c.Get("/whoami");
    ASSERT_TRUE(res) << httplib::to_string(res.error());
    EXPECT_EQ(res->body, "a");
    EXPECT_EQ(static_cast<ThreadStarvedServer&>(*server).launch_attempts(), 2);

    server->stop();
    server_thread.join();
}

TEST_F(ProxyServerTest, StopAbortsPendingUpgradeHandshake) {
    SilentBackend silent;
    start({silent.url()});

    net::io_context ioc;
    tcp::socket client_socket(ioc);
    client_socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));

    http::request<http::empty_body> req{http::verb::get, "/chat", 11};
    req.set(http::field::host, "127.0.0.1");
    req.set(http::field::connection, "Upgrade");
    req.set(http::field::upgrade, "websocket");
    req.set(http::field::sec_websocket_key, "dGhlIHNhbXBsZSBub25jZQ==");
    req.set(http::field::sec_websocket_version, "13");
    http::write(client_socket, req);

    // One connection for the health check, one for the tunnel
    for (int i = 0; i < 600 && silent.accepted() < 2; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_GE(silent.accepted(), 2);
    std::this_thread::sleep_for(50ms);

    auto start_time = std::chrono::steady_clock::now();
    server->stop();
    server_thread.join();
    auto elapsed = std::chrono::steady_clock::now() - start_time;

    EXPECT_LT(elapsed, 3s);
    EXPECT_EQ(server->active_connections(), 0u);
}

TEST_F(ProxyServerTest, NoContentResponseHasNoLength) {
    TestBackend backend;
    backend.server().Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("OK", "text/plain");
    });
    backend.server().Delete("/documents/doc-1", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });
    backend.start();
    start({backend.url()});

    auto c = client();
    auto res = c.Delete("/documents/doc-1");
    ASSERT_TRUE(res) << httplib::to_string(res.error());
    EXPECT_EQ(res->status, 204);
    EXPECT_FALSE(res->has_header("Content-Length"));
    EXPECT_FALSE(res->has_header("Transfer-Encoding"));
    EXPECT_TRUE(res->body.empty());
}

TEST_F(ProxyServerTest, StreamsBodyBeforeBackendFinishes) {
    std::atomic<bool> client_saw_first{false};
    std::atomic<bool> released_by_client{false};

    TestBackend backend;
    backend.server().Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("OK", "text/plain");
    });
    backend.server().Get("/events", [&](const httplib::Request&, httplib::Response& res) {
        res.set_chunked_content_provider("text/plain",
            [&](size_t offset, httplib::DataSink& sink) {
                if (offset == 0) {
                    sink.write("first;", 6);
                    return true;
                }
                // Hold the rest back until the client has seen the first part
                for (int i = 0; i < 400 && !client_saw_first; ++i) {
                    std::this_thread::sleep_for(5ms);
                }
                released_by_client = client_saw_first.load();
                sink.write("second", 6);
                sink.done();
                return true;
            });
    });
    backend.start();
    start({backend.url()});

    std::string body;
    auto c = client();
    auto res = c.Get("/events", [&](const char* data, size_t length) {
        body.append(data, length);
        if (body.find("first;") != std::string::npos) {
            client_saw_first = true;
        }
        return true;
    });

    ASSERT_TRUE(res) << httplib::to_string(res.error());
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(body, "first;second");
    EXPECT_TRUE(released_by_client.load());
}

TEST_F(ProxyServerTest, StopWhileConnectionsClose) {
    NamedBackend a("a");
    start({a.backend.url()});

    std::atomic<bool> running{true};
    std::vector<std::thread> clients;
    for (int t = 0; t < 8; ++t) {
        clients.emplace_back([&] {
            httplib::Client c("127.0.0.1", port);
            c.set_connection_timeout(1, 0);
            c.set_read_timeout(1, 0);
            while (running) {
                c.Get("/whoami");
            }
        });
    }

    std::this_thread::sleep_for(200ms);
    server->stop();
    server_thread.join();
    running = false;
    for (auto& thread : clients) {
        thread.join();
    }

    EXPECT_EQ(server->active_connections(), 0u);
}
