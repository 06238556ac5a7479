#pragma once

#include "zkemu/sim/device_session.hpp"
#include "zkemu/sim/dispatcher.hpp"
#include <asio.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace zkemu::sim {

using asio::ip::udp;

/**
 * UDP Listener
 *
 * One datagram is one packet. Sessions are looked up by the session id
 * the client stamps on each frame; a CONNECT is matched to its sender so
 * a retransmitted CONNECT gets the same session back.
 */
class UdpListener : public std::enable_shared_from_this<UdpListener> {
public:
    static constexpr size_t kMaxDatagram = 65535;

    UdpListener(asio::io_context& io_context, Dispatcher& dispatcher,
                const std::string& host, uint16_t port);
    ~UdpListener();

    void start();
    void stop();

    uint16_t localPort() const;
    size_t sessionCount() const { return m_sessions.size(); }

private:
    void doReceive();
    void handleDatagram(size_t length);

    DeviceSession* connectSession(const Frame& frame);
    void sendReplies(const std::vector<Bytes>& packets, const udp::endpoint& target);
    void dropSession(uint16_t sessionId);

    Dispatcher& m_dispatcher;
    udp::socket m_socket;
    std::string m_host;
    uint16_t m_port;
    std::atomic<bool> m_running;

    udp::endpoint m_sender;
    std::vector<uint8_t> m_datagram;

    std::map<uint16_t, std::unique_ptr<DeviceSession>> m_sessions;
    std::map<udp::endpoint, uint16_t> m_endpoints;
};

} // namespace zkemu::sim
