#pragma once

#include "zkemu/protocol/packet.hpp"
#include "zkemu/sim/device_session.hpp"
#include "zkemu/sim/dispatcher.hpp"
#include <array>
#include <asio.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace zkemu::sim {

using asio::ip::tcp;

/**
 * Device Connection
 *
 * One TCP client of the simulated terminal. Reads the 8 byte stream
 * prefix, then the packet it announces, and hands it to the dispatcher.
 * The socket must be bound to a strand so handlers never overlap.
 */
class DeviceConnection : public std::enable_shared_from_this<DeviceConnection> {
public:
    using DisconnectHandler = std::function<void(uint64_t connectionId)>;

    DeviceConnection(tcp::socket socket, Dispatcher& dispatcher, uint64_t connectionId);
    ~DeviceConnection();

    // Start reading packets
    void start();

    // Stop and close connection; call from the connection's strand
    void stop();

    // Thread safe stop
    void close();

    void setDisconnectHandler(DisconnectHandler handler);

    uint64_t getId() const { return m_connectionId; }
    const std::string& getRemoteAddress() const { return m_remote; }

private:
    void doReadPrefix();
    void doReadPacket(uint32_t length);
    void doWrite();

    void handleReadPrefix(const asio::error_code& error, size_t bytes_transferred);
    void handleReadPacket(const asio::error_code& error, size_t bytes_transferred);
    void handleWrite(const asio::error_code& error, size_t bytes_transferred);

    void send(const DispatchResult& result);

    tcp::socket m_socket;
    Dispatcher& m_dispatcher;
    uint64_t m_connectionId;
    std::string m_remote;
    std::atomic<bool> m_running;

    DeviceSession m_session;

    // Read buffers
    std::array<uint8_t, protocol::TcpFrameBuffer::kPrefixSize> m_prefix{};
    Bytes m_packet;

    // Write queue
    std::queue<Bytes> m_writeQueue;
    std::mutex m_writeMutex;
    bool m_writing;
    bool m_closeWhenDrained = false;

    DisconnectHandler m_disconnectHandler;
};

} // namespace zkemu::sim
