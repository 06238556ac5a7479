#pragma once

#include "zkemu/core/result.hpp"
#include "zkemu/core/types.hpp"
#include "zkemu/net/transport.hpp"
#include "zkemu/protocol/types.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace zkemu::client {

using protocol::Bytes;
using protocol::Frame;

enum class SessionState {
    Disconnected,
    Connecting,
    Connected,
    Disconnecting
};

const char* sessionStateName(SessionState state);

struct SessionOptions {
    uint32_t password = 0;
    std::chrono::milliseconds timeout{5000};
    int udpRetries = 3;
    bool omitPing = false;
    std::chrono::seconds heartbeatInterval{30};

    static SessionOptions fromConfig(const ClientConfig& config);
};

/**
 * Session with one terminal
 *
 * Owns the transport, negotiates the session id, stamps reply ids and
 * matches replies against the last one sent. Not thread safe: callers
 * serialize requests.
 */
class Session {
public:
    Session(std::unique_ptr<net::Transport> transport, SessionOptions options = SessionOptions{});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * CONNECT, then AUTH when the device asks for it, then the handshake
     * ping unless omitted.
     */
    Status connect();

    /**
     * Send EXIT and release the transport.
     */
    Status disconnect();

    /**
     * Drop the session without EXIT, e.g. after RESTART or POWEROFF.
     */
    void abandon(const std::string& reason);

    /**
     * Send a command and wait for the reply carrying its reply id.
     * UDP requests are retransmitted; a timeout that survives the
     * retries, or any TCP timeout, closes the session.
     */
    Result<Frame> request(uint16_t command, const Bytes& payload = {});

    /**
     * Single attempt. On UDP a timeout is returned without closing the
     * session so the caller can decide what to re-request.
     */
    Result<Frame> exchange(uint16_t command, const Bytes& payload = {});

    /**
     * Next frame carrying the current reply id, for multi-frame replies.
     */
    Result<Frame> awaitFollowUp();

    /**
     * Probe the device if the session has been idle for the heartbeat
     * interval. A silent device forces Disconnected.
     */
    Status heartbeat();

    // Unconditional liveness probe
    Status ping();

    SessionState state() const { return m_state; }
    bool isConnected() const { return m_state == SessionState::Connected; }
    uint16_t sessionId() const { return m_sessionId; }
    uint16_t replyCounter() const { return m_replyId; }
    bool authenticated() const { return m_authenticated; }
    TransportKind transportKind() const { return m_transport->kind(); }
    std::string peerAddress() const { return m_transport->peer(); }
    const SessionOptions& options() const { return m_options; }

private:
    Result<Frame> roundTrip(uint16_t command, const Bytes& payload, int attempts);
    Result<Frame> receiveMatching(std::chrono::steady_clock::time_point deadline);
    Result<Frame> settle(Result<Frame> result, bool udpTimeoutIsFatal);
    Status authenticate();
    void teardown(const std::string& reason);
    void transition(SessionState next);

    std::unique_ptr<net::Transport> m_transport;
    SessionOptions m_options;
    SessionState m_state = SessionState::Disconnected;
    uint16_t m_sessionId = 0;
    uint16_t m_replyId = protocol::kReplyIdSeed;
    bool m_authenticated = false;
    std::chrono::steady_clock::time_point m_lastActivity;
};

} // namespace zkemu::client
