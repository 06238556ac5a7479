#include "zkemu/sim/device_connection.hpp"
#include "zkemu/utils/logger.hpp"

namespace zkemu::sim {

namespace {

std::string describeEndpoint(const tcp::socket& socket) {
    asio::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace

DeviceConnection::DeviceConnection(tcp::socket socket, Dispatcher& dispatcher, uint64_t connectionId)
    : m_socket(std::move(socket))
    , m_dispatcher(dispatcher)
    , m_connectionId(connectionId)
    , m_remote(describeEndpoint(m_socket))
    , m_running(false)
    , m_session(TransportKind::Tcp, m_remote)
    , m_writing(false)
{
}

DeviceConnection::~DeviceConnection() {
    if (m_running) {
        m_running = false;
        asio::error_code ec;
        m_socket.close(ec);
        m_dispatcher.release(m_session);
    }
}

void DeviceConnection::start() {
    if (m_running) return;

    m_running = true;
    LOG_INFO("[Conn:{}] Started from {}", m_connectionId, m_remote);

    doReadPrefix();
}

void DeviceConnection::stop() {
    if (!m_running) return;

    m_running = false;

    asio::error_code ec;
    m_socket.shutdown(tcp::socket::shutdown_both, ec);
    m_socket.close(ec);

    m_dispatcher.release(m_session);
    LOG_INFO("[Conn:{}] Closed", m_connectionId);

    if (m_disconnectHandler) {
        m_disconnectHandler(m_connectionId);
    }
}

void DeviceConnection::close() {
    auto self = shared_from_this();
    asio::post(m_socket.get_executor(), [self]() { self->stop(); });
}

void DeviceConnection::setDisconnectHandler(DisconnectHandler handler) {
    m_disconnectHandler = std::move(handler);
}

// =============================================================================
// Reading
// =============================================================================

void DeviceConnection::doReadPrefix() {
    if (!m_running) return;

    auto self = shared_from_this();

    asio::async_read(
        m_socket,
        asio::buffer(m_prefix),
        [this, self](const asio::error_code& error, size_t bytes_transferred) {
            handleReadPrefix(error, bytes_transferred);
        }
    );
}

void DeviceConnection::handleReadPrefix(const asio::error_code& error, size_t bytes_transferred) {
    if (!m_running) return;

    if (error) {
        if (error != asio::error::eof && error != asio::error::operation_aborted) {
            LOG_ERROR("[Conn:{}] Read prefix error: {}", m_connectionId, error.message());
        }
        stop();
        return;
    }

    uint32_t length = 0;
    if (bytes_transferred != m_prefix.size() ||
        !protocol::TcpFrameBuffer::parsePrefix(m_prefix.data(), length)) {
        LOG_WARN("[Conn:{}] Bad stream prefix, dropping connection", m_connectionId);
        stop();
        return;
    }

    doReadPacket(length);
}

void DeviceConnection::doReadPacket(uint32_t length) {
    if (!m_running) return;

    m_packet.resize(length);
    auto self = shared_from_this();

    asio::async_read(
        m_socket,
        asio::buffer(m_packet),
        [this, self](const asio::error_code& error, size_t bytes_transferred) {
            handleReadPacket(error, bytes_transferred);
        }
    );
}

void DeviceConnection::handleReadPacket(const asio::error_code& error, size_t /*bytes_transferred*/) {
    if (!m_running) return;

    if (error) {
        if (error != asio::error::eof && error != asio::error::operation_aborted) {
            LOG_ERROR("[Conn:{}] Read packet error: {}", m_connectionId, error.message());
        }
        stop();
        return;
    }

    DispatchResult result = m_dispatcher.handlePacket(m_session, m_packet);
    send(result);

    if (!result.closeSession) {
        doReadPrefix();
    }
}

// =============================================================================
// Writing
// =============================================================================

void DeviceConnection::send(const DispatchResult& result) {
    {
        std::lock_guard<std::mutex> lock(m_writeMutex);
        for (const auto& packet : result.packets) {
            m_writeQueue.push(protocol::TcpFrameBuffer::wrap(packet));
        }
        if (result.closeSession) {
            m_closeWhenDrained = true;
        }
    }

    // Start write if not already writing
    if (!m_writing) {
        doWrite();
    }
}

void DeviceConnection::doWrite() {
    if (!m_running) return;

    bool drainedClose = false;
    {
        std::lock_guard<std::mutex> lock(m_writeMutex);

        if (m_writeQueue.empty()) {
            m_writing = false;
            drainedClose = m_closeWhenDrained;
        }
        else {
            m_writing = true;
            auto self = shared_from_this();

            // Front stays queued until the write completes
            const auto& data = m_writeQueue.front();

            asio::async_write(
                m_socket,
                asio::buffer(data),
                [this, self](const asio::error_code& error, size_t bytes_transferred) {
                    handleWrite(error, bytes_transferred);
                }
            );
        }
    }

    if (drainedClose) {
        stop();
    }
}

void DeviceConnection::handleWrite(const asio::error_code& error, size_t /*bytes_transferred*/) {
    if (error) {
        if (error != asio::error::operation_aborted) {
            LOG_ERROR("[Conn:{}] Write error: {}", m_connectionId, error.message());
        }
        stop();
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_writeMutex);
        m_writeQueue.pop();
    }

    // Continue writing if more in queue
    doWrite();
}

} // namespace zkemu::sim
