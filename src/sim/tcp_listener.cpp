#include "zkemu/sim/tcp_listener.hpp"
#include "zkemu/utils/logger.hpp"

namespace zkemu::sim {

TcpListener::TcpListener(asio::io_context& io_context, const std::string& host, uint16_t port)
    : m_io_context(io_context)
    , m_acceptor(io_context)
    , m_host(host)
    , m_port(port)
    , m_running(false)
{
}

TcpListener::~TcpListener() {
    stop();
}

void TcpListener::setConnectionHandler(ConnectionHandler handler) {
    m_connectionHandler = std::move(handler);
}

void TcpListener::start() {
    if (m_running) return;

    try {
        tcp::endpoint endpoint(asio::ip::make_address(m_host), m_port);

        m_acceptor.open(endpoint.protocol());
        m_acceptor.set_option(tcp::acceptor::reuse_address(true));
        m_acceptor.bind(endpoint);
        m_acceptor.listen();

        m_running = true;
        LOG_INFO("TCP listener on {}:{}", m_host, localPort());

        doAccept();
    }
    catch (const std::exception& e) {
        LOG_ERROR("Failed to start TCP listener: {}", e.what());
        throw;
    }
}

void TcpListener::stop() {
    if (!m_running) return;

    m_running = false;

    asio::error_code ec;
    m_acceptor.close(ec);

    LOG_INFO("TCP listener stopped");
}

uint16_t TcpListener::localPort() const {
    asio::error_code ec;
    auto endpoint = m_acceptor.local_endpoint(ec);
    return ec ? m_port : endpoint.port();
}

void TcpListener::doAccept() {
    if (!m_running) return;

    auto self = shared_from_this();

    m_acceptor.async_accept(
        asio::make_strand(m_io_context),
        [this, self](const asio::error_code& error, tcp::socket socket) {
            if (!m_running) return;

            if (error) {
                LOG_WARN("TCP accept failed: {}", error.message());
            }
            else if (m_connectionHandler) {
                m_connectionHandler(std::move(socket));
            }
            doAccept();
        }
    );
}

} // namespace zkemu::sim
