#include "zkemu/sim/udp_listener.hpp"
#include "zkemu/protocol/packet.hpp"
#include "zkemu/utils/logger.hpp"

namespace zkemu::sim {

namespace {

std::string describeEndpoint(const udp::endpoint& endpoint) {
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace

UdpListener::UdpListener(asio::io_context& io_context, Dispatcher& dispatcher,
                         const std::string& host, uint16_t port)
    : m_dispatcher(dispatcher)
    , m_socket(asio::make_strand(io_context))
    , m_host(host)
    , m_port(port)
    , m_running(false)
    , m_datagram(kMaxDatagram)
{
}

UdpListener::~UdpListener() {
    stop();
}

void UdpListener::start() {
    if (m_running) return;

    try {
        udp::endpoint endpoint(asio::ip::make_address(m_host), m_port);

        m_socket.open(endpoint.protocol());
        m_socket.set_option(udp::socket::reuse_address(true));
        m_socket.bind(endpoint);

        m_running = true;
        LOG_INFO("UDP listener on {}:{}", m_host, localPort());

        doReceive();
    }
    catch (const std::exception& e) {
        LOG_ERROR("Failed to start UDP listener: {}", e.what());
        throw;
    }
}

void UdpListener::stop() {
    if (!m_running) return;

    m_running = false;

    asio::error_code ec;
    m_socket.close(ec);

    for (auto& entry : m_sessions) {
        m_dispatcher.release(*entry.second);
    }
    m_sessions.clear();
    m_endpoints.clear();

    LOG_INFO("UDP listener stopped");
}

uint16_t UdpListener::localPort() const {
    asio::error_code ec;
    auto endpoint = m_socket.local_endpoint(ec);
    return ec ? m_port : endpoint.port();
}

void UdpListener::doReceive() {
    if (!m_running) return;

    auto self = shared_from_this();

    m_socket.async_receive_from(
        asio::buffer(m_datagram),
        m_sender,
        [this, self](const asio::error_code& error, size_t bytes) {
            if (!m_running) return;

            if (error) {
                if (error != asio::error::operation_aborted) {
                    LOG_WARN("UDP receive error: {}", error.message());
                }
            }
            else {
                handleDatagram(bytes);
            }
            doReceive();
        }
    );
}

void UdpListener::handleDatagram(size_t length) {
    Bytes packet(m_datagram.begin(), m_datagram.begin() + length);
    udp::endpoint sender = m_sender;

    // Peek at the header to find the session; the dispatcher decodes again
    auto frame = protocol::PacketCodec::decode(packet);
    if (!frame) {
        LOG_WARN("[Udp] Dropping datagram from {}: {}", describeEndpoint(sender), frame.error().describe());
        return;
    }

    DispatchResult result;
    if (frame.value().is(CommandId::Connect)) {
        DeviceSession* session = connectSession(frame.value());
        if (!session) {
            DeviceSession fresh(TransportKind::Udp, describeEndpoint(sender));
            result = m_dispatcher.dispatch(fresh, frame.value());
            if (fresh.connected && !result.closeSession) {
                uint16_t id = fresh.id;
                m_sessions[id] = std::make_unique<DeviceSession>(std::move(fresh));
                m_endpoints[sender] = id;
            }
        }
        else {
            result = m_dispatcher.dispatch(*session, frame.value());
        }
    }
    else {
        auto it = m_sessions.find(frame.value().sessionId);
        if (it == m_sessions.end()) {
            // Not connected: the dispatcher answers ACK_UNAUTH
            DeviceSession stranger(TransportKind::Udp, describeEndpoint(sender));
            result = m_dispatcher.dispatch(stranger, frame.value());
        }
        else {
            result = m_dispatcher.dispatch(*it->second, frame.value());
            if (result.closeSession) {
                dropSession(it->first);
            }
        }
    }

    sendReplies(result.packets, sender);
}

DeviceSession* UdpListener::connectSession(const Frame& frame) {
    auto known = m_endpoints.find(m_sender);
    if (known == m_endpoints.end()) {
        return nullptr;
    }

    auto it = m_sessions.find(known->second);
    if (it != m_sessions.end()) {
        DeviceSession& session = *it->second;
        if (session.hasCachedReply && session.lastCommand == frame.command &&
            session.lastReplyId == frame.replyId) {
            return &session;
        }
    }

    // A new CONNECT from the same peer replaces its old session
    dropSession(known->second);
    return nullptr;
}

void UdpListener::sendReplies(const std::vector<Bytes>& packets, const udp::endpoint& target) {
    for (const auto& packet : packets) {
        auto data = std::make_shared<Bytes>(packet);
        m_socket.async_send_to(
            asio::buffer(*data),
            target,
            [data](const asio::error_code& error, size_t) {
                if (error && error != asio::error::operation_aborted) {
                    LOG_WARN("UDP send error: {}", error.message());
                }
            }
        );
    }
}

void UdpListener::dropSession(uint16_t sessionId) {
    auto it = m_sessions.find(sessionId);
    if (it == m_sessions.end()) {
        return;
    }

    m_dispatcher.release(*it->second);
    m_sessions.erase(it);

    for (auto endpoint = m_endpoints.begin(); endpoint != m_endpoints.end(); ) {
        if (endpoint->second == sessionId) {
            endpoint = m_endpoints.erase(endpoint);
        }
        else {
            ++endpoint;
        }
    }
}

} // namespace zkemu::sim
