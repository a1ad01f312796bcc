#pragma once

#include "dispatcher.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace slb {

// HTTP/1.1 front end. Connections are accepted asynchronously and each one is
// served by its own thread for its whole lifetime (keep-alive and tunnels).
class ProxyServer {
public:
    ProxyServer(Dispatcher& dispatcher, std::string bind_address, uint16_t port);
    virtual ~ProxyServer();

    ProxyServer(const ProxyServer&) = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;

    // Opens the listening socket and returns the bound port (useful with port 0).
    // Throws boost::system::system_error when the address cannot be bound.
    uint16_t bind();

    // Accepts connections until stop(). Binds first if bind() was not called.
    void listen();

    // Closes the listener, shuts down open connections and waits for their
    // threads to finish.
    void stop();

    size_t active_connections() const;

protected:
    // Starts the worker for one accepted connection. Throws std::system_error
    // when no thread can be created.
    virtual void launch_worker(std::function<void()> work);

private:
    using tcp = boost::asio::ip::tcp;

    struct Session {
        std::shared_ptr<tcp::socket> socket;
        std::function<void()> abort;  // cancels outbound I/O of an in-flight request
    };

    void do_accept();
    void start_session(tcp::socket socket);
    void end_session(uint64_t id);
    void serve_connection(tcp::socket& socket, uint64_t id);
    void set_session_abort(uint64_t id, std::function<void()> abort);

    Dispatcher& dispatcher_;
    std::string bind_address_;
    uint16_t port_;

    boost::asio::io_context ioc_;
    tcp::acceptor acceptor_;
    std::atomic<bool> stopping_{false};

    mutable std::mutex sessions_mutex_;
    std::condition_variable sessions_cv_;
    std::unordered_map<uint64_t, Session> sessions_;
    uint64_t next_session_id_ = 0;
};

} // namespace slb
