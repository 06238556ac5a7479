#pragma once

#include <asio.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace zkemu::sim {

using asio::ip::tcp;

/**
 * TCP Listener
 *
 * Accepts terminal clients and hands each socket, bound to its own
 * strand, to the connection handler.
 */
class TcpListener : public std::enable_shared_from_this<TcpListener> {
public:
    using ConnectionHandler = std::function<void(tcp::socket)>;

    TcpListener(asio::io_context& io_context, const std::string& host, uint16_t port);
    ~TcpListener();

    void setConnectionHandler(ConnectionHandler handler);

    // Start accepting connections
    void start();

    // Stop server
    void stop();

    /**
     * Port actually bound, useful when configured with port 0
     */
    uint16_t localPort() const;

private:
    void doAccept();

    asio::io_context& m_io_context;
    tcp::acceptor m_acceptor;
    std::string m_host;
    uint16_t m_port;
    std::atomic<bool> m_running;
    ConnectionHandler m_connectionHandler;
};

} // namespace zkemu::sim
