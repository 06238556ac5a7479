#include "zkemu/client/session.hpp"
#include "zkemu/protocol/commkey.hpp"
#include "zkemu/protocol/messages.hpp"
#include "zkemu/protocol/packet.hpp"
#include "zkemu/utils/logger.hpp"

#include <fmt/format.h>

namespace zkemu::client {

using protocol::CommandId;
using protocol::PacketCodec;
using protocol::code;

const char* sessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Disconnected:  return "Disconnected";
        case SessionState::Connecting:    return "Connecting";
        case SessionState::Connected:     return "Connected";
        case SessionState::Disconnecting: return "Disconnecting";
    }
    return "Unknown";
}

SessionOptions SessionOptions::fromConfig(const ClientConfig& config) {
    SessionOptions options;
    options.password = config.password;
    options.timeout = std::chrono::milliseconds(config.timeout_ms);
    options.udpRetries = config.udp_retries < 0 ? 0 : config.udp_retries;
    options.omitPing = config.omit_ping;
    options.heartbeatInterval = std::chrono::seconds(config.heartbeat_interval_s);
    return options;
}

Session::Session(std::unique_ptr<net::Transport> transport, SessionOptions options)
    : m_transport(std::move(transport))
    , m_options(options)
    , m_lastActivity(std::chrono::steady_clock::now())
{
}

Session::~Session() {
    if (m_state != SessionState::Disconnected) {
        auto status = disconnect();
        if (!status) {
            LOG_DEBUG("[Session] Close on destruction: {}", status.error().describe());
        }
    }
}

void Session::transition(SessionState next) {
    if (m_state == next) return;
    LOG_DEBUG("[Session] {} -> {} ({})", sessionStateName(m_state), sessionStateName(next),
              m_transport->peer());
    m_state = next;
}

void Session::teardown(const std::string& reason) {
    if (m_state == SessionState::Disconnected) return;

    m_transport->close();
    if (m_state == SessionState::Connected) {
        LOG_INFO("[Session] 0x{:04X} with {} closed: {}", m_sessionId, m_transport->peer(), reason);
    }
    m_sessionId = 0;
    m_authenticated = false;
    transition(SessionState::Disconnected);
}

// =============================================================================
// Lifecycle
// =============================================================================

Status Session::connect() {
    if (m_state == SessionState::Connected) {
        return Status::success();
    }
    if (m_state != SessionState::Disconnected) {
        return makeError(ErrorCode::NotConnected,
                         fmt::format("cannot connect while {}", sessionStateName(m_state)));
    }

    transition(SessionState::Connecting);
    m_sessionId = 0;
    m_authenticated = false;
    m_replyId = protocol::kReplyIdSeed;

    auto opened = m_transport->open(m_options.timeout);
    if (!opened) {
        transition(SessionState::Disconnected);
        return makeError(ErrorCode::ConnectionLost,
                         fmt::format("can't reach device {}: {}", m_transport->peer(), opened.error().message));
    }

    int attempts = m_transport->kind() == TransportKind::Udp ? m_options.udpRetries + 1 : 1;
    auto reply = roundTrip(code(CommandId::Connect), {}, attempts);
    if (!reply) {
        teardown("connect failed");
        ErrorCode failure = reply.code() == ErrorCode::Timeout ? ErrorCode::ConnectionLost : reply.code();
        return makeError(failure, fmt::format("no CONNECT reply from {}: {}",
                                              m_transport->peer(), reply.error().message));
    }

    const Frame& frame = reply.value();
    if (frame.sessionId == 0) {
        teardown("invalid session id");
        return makeError(ErrorCode::MalformedFrame, "device assigned session id 0");
    }
    m_sessionId = frame.sessionId;

    if (frame.is(CommandId::AckUnauth)) {
        auto status = authenticate();
        if (!status) {
            teardown("authentication failed");
            return status;
        }
    }
    else if (!frame.is(CommandId::AckOk)) {
        teardown("connect refused");
        return makeError(ErrorCode::DeviceError,
                         fmt::format("CONNECT answered with {}", protocol::commandName(frame.command)));
    }

    transition(SessionState::Connected);
    LOG_INFO("[Session] Connected to {} over {}, session 0x{:04X}",
             m_transport->peer(), transportName(m_transport->kind()), m_sessionId);

    if (!m_options.omitPing) {
        auto status = ping();
        if (!status) {
            teardown("handshake ping failed");
            return makeError(ErrorCode::ConnectionLost,
                             fmt::format("handshake ping failed: {}", status.error().message));
        }
    }

    return Status::success();
}

Status Session::authenticate() {
    if (m_options.password == 0) {
        return makeError(ErrorCode::Authentication, "device requires a password and none is configured");
    }

    protocol::AuthRequest auth;
    auth.key = protocol::makeCommKey(m_options.password, m_sessionId);

    int attempts = m_transport->kind() == TransportKind::Udp ? m_options.udpRetries + 1 : 1;
    auto reply = roundTrip(code(CommandId::Auth), auth.payload(), attempts);
    if (!reply) {
        return makeError(ErrorCode::Authentication,
                         fmt::format("no AUTH reply: {}", reply.error().message));
    }
    if (!reply.value().is(CommandId::AckOk)) {
        return makeError(ErrorCode::Authentication,
                         fmt::format("device refused the password ({})",
                                     protocol::commandName(reply.value().command)));
    }

    m_authenticated = true;
    LOG_DEBUG("[Session] Authenticated session 0x{:04X}", m_sessionId);
    return Status::success();
}

Status Session::disconnect() {
    if (m_state == SessionState::Disconnected) {
        return Status::success();
    }

    transition(SessionState::Disconnecting);

    // EXIT is not acknowledged by the caller
    Bytes packet = PacketCodec::encode(CommandId::Exit, m_sessionId, protocol::nextReplyId(m_replyId));
    m_replyId = protocol::nextReplyId(m_replyId);
    auto sent = m_transport->send(packet);

    m_transport->close();
    LOG_INFO("[Session] Disconnected from {}", m_transport->peer());
    m_sessionId = 0;
    m_authenticated = false;
    transition(SessionState::Disconnected);

    if (!sent) {
        return makeError(ErrorCode::ConnectionLost,
                         fmt::format("EXIT not delivered: {}", sent.error().message));
    }
    return Status::success();
}

void Session::abandon(const std::string& reason) {
    teardown(reason);
}

// =============================================================================
// Requests
// =============================================================================

Result<Frame> Session::request(uint16_t command, const Bytes& payload) {
    if (m_state != SessionState::Connected) {
        return makeError(ErrorCode::NotConnected, "not connected");
    }
    int attempts = m_transport->kind() == TransportKind::Udp ? m_options.udpRetries + 1 : 1;
    return settle(roundTrip(command, payload, attempts), true);
}

Result<Frame> Session::exchange(uint16_t command, const Bytes& payload) {
    if (m_state != SessionState::Connected) {
        return makeError(ErrorCode::NotConnected, "not connected");
    }
    return settle(roundTrip(command, payload, 1), false);
}

Result<Frame> Session::awaitFollowUp() {
    if (m_state != SessionState::Connected) {
        return makeError(ErrorCode::NotConnected, "not connected");
    }
    auto deadline = std::chrono::steady_clock::now() + m_options.timeout;
    return settle(receiveMatching(deadline), false);
}

Result<Frame> Session::settle(Result<Frame> result, bool udpTimeoutIsFatal) {
    if (result) {
        m_lastActivity = std::chrono::steady_clock::now();
        return result;
    }

    switch (result.code()) {
        case ErrorCode::Timeout:
            if (m_transport->kind() == TransportKind::Tcp) {
                teardown("reply timeout");
                return result;
            }
            if (udpTimeoutIsFatal) {
                teardown("device stopped answering");
                return makeError(ErrorCode::ConnectionLost,
                                 fmt::format("no reply after {} attempts", m_options.udpRetries + 1));
            }
            return result;

        case ErrorCode::ConnectionLost:
        case ErrorCode::Io:
        case ErrorCode::MalformedFrame:
            teardown(result.error().message);
            return makeError(ErrorCode::ConnectionLost, result.error().message);

        default:
            return result;
    }
}

Result<Frame> Session::roundTrip(uint16_t command, const Bytes& payload, int attempts) {
    m_replyId = protocol::nextReplyId(m_replyId);
    Bytes packet = PacketCodec::encode(command, m_sessionId, m_replyId, payload);

    for (int attempt = 1; attempt <= attempts; attempt++) {
        if (attempt > 1) {
            LOG_DEBUG("[Session] Retransmitting {} reply={} (attempt {}/{})",
                      protocol::commandName(command), m_replyId, attempt, attempts);
        }

        auto sent = m_transport->send(packet);
        if (!sent) {
            return sent.error();
        }

        auto deadline = std::chrono::steady_clock::now() + m_options.timeout;
        auto reply = receiveMatching(deadline);
        if (reply || reply.code() != ErrorCode::Timeout) {
            return reply;
        }
    }

    return makeError(ErrorCode::Timeout,
                     fmt::format("{} got no reply within {} ms", protocol::commandName(command),
                                 m_options.timeout.count()));
}

Result<Frame> Session::receiveMatching(std::chrono::steady_clock::time_point deadline) {
    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return makeError(ErrorCode::Timeout, "deadline passed");
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (remaining.count() == 0) {
            remaining = std::chrono::milliseconds(1);
        }

        auto bytes = m_transport->receive(remaining);
        if (!bytes) {
            return bytes.error();
        }

        auto frame = PacketCodec::decode(bytes.value());
        if (!frame) {
            LOG_WARN("[Session] Dropping frame from {}: {}", m_transport->peer(), frame.error().message);
            continue;
        }

        const Frame& reply = frame.value();
        if (reply.replyId != m_replyId) {
            LOG_DEBUG("[Session] Discarding stale {} (reply {} while waiting for {})",
                      protocol::commandName(reply.command), reply.replyId, m_replyId);
            continue;
        }
        if (m_sessionId != 0 && reply.sessionId != m_sessionId) {
            LOG_DEBUG("[Session] Discarding {} for session 0x{:04X}",
                      protocol::commandName(reply.command), reply.sessionId);
            continue;
        }

        return frame;
    }
}

// =============================================================================
// Liveness
// =============================================================================

Status Session::ping() {
    auto reply = request(code(CommandId::GetTime));
    if (!reply) {
        return reply.error();
    }
    return Status::success();
}

Status Session::heartbeat() {
    if (m_state != SessionState::Connected) {
        return makeError(ErrorCode::NotConnected, "not connected");
    }

    auto idle = std::chrono::steady_clock::now() - m_lastActivity;
    if (idle < m_options.heartbeatInterval) {
        return Status::success();
    }

    auto status = ping();
    if (!status) {
        teardown("heartbeat unanswered");
        return makeError(ErrorCode::ConnectionLost,
                         fmt::format("heartbeat unanswered: {}", status.error().message));
    }
    return Status::success();
}

} // namespace zkemu::client
