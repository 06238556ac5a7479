#include "zkemu/sim/dispatcher.hpp"
#include "zkemu/protocol/packet.hpp"
#include "zkemu/utils/buffer.hpp"
#include "zkemu/utils/crypto.hpp"
#include "zkemu/utils/logger.hpp"

#include <algorithm>

namespace zkemu::sim {

using protocol::code;

namespace {

Replies single(CommandId command, Bytes payload = {}) {
    Replies replies;
    replies.push_back(Reply{code(command), std::move(payload)});
    return replies;
}

} // namespace

// =============================================================================
// Component
// =============================================================================

Replies Component::ok(Bytes payload) {
    return single(CommandId::AckOk, std::move(payload));
}

Replies Component::error() {
    return single(CommandId::AckError);
}

Replies Component::unauthorized() {
    return single(CommandId::AckUnauth);
}

Replies Component::data(Bytes payload) {
    return single(CommandId::Data, std::move(payload));
}

Replies Component::dataOrStream(const Bytes& payload, size_t inlineLimit) {
    if (payload.size() <= inlineLimit) {
        return data(payload);
    }

    Replies replies;
    utils::BufferWriter size;
    size.writeU32(static_cast<uint32_t>(payload.size()));
    replies.push_back(Reply{code(CommandId::PrepareData), size.take()});

    for (size_t offset = 0; offset < payload.size(); offset += Dispatcher::kStreamFrameSize) {
        size_t length = std::min(Dispatcher::kStreamFrameSize, payload.size() - offset);
        replies.push_back(Reply{code(CommandId::Data),
                                Bytes(payload.begin() + offset, payload.begin() + offset + length)});
    }

    replies.push_back(Reply{code(CommandId::AckOk), {}});
    return replies;
}

Replies Component::dataFor(const RequestContext& context, const Bytes& payload) {
    if (context.session.transport == TransportKind::Udp) {
        if (payload.size() > Dispatcher::kMaxDatagramPayload) {
            LOG_WARN("[Sim] {} byte reply does not fit a datagram", payload.size());
            return error();
        }
        return data(payload);
    }
    return dataOrStream(payload, context.store.config().inline_data_limit);
}

// =============================================================================
// Dispatcher
// =============================================================================

Dispatcher::Dispatcher(DeviceStore& store)
    : m_store(store)
{
}

void Dispatcher::registerComponent(std::shared_ptr<Component> component) {
    size_t before = m_handlers.size();
    component->registerHandlers(*this);
    LOG_INFO("Registered component {} ({} commands)", component->getName(), m_handlers.size() - before);
    m_components.push_back(std::move(component));
}

DispatchResult Dispatcher::handlePacket(DeviceSession& session, const Bytes& packet) {
    auto frame = protocol::PacketCodec::decode(packet);
    if (!frame) {
        LOG_WARN("[Sim] Dropping packet from {}: {}", session.peer, frame.error().describe());
        return {};
    }
    return dispatch(session, frame.value());
}

DispatchResult Dispatcher::dispatch(DeviceSession& session, const Frame& frame) {
    LOG_DEBUG("[Sim] {} <- {}", session.peer, protocol::describeFrame(frame));

    if (session.transport == TransportKind::Udp && session.hasCachedReply &&
        frame.command == session.lastCommand && frame.replyId == session.lastReplyId) {
        LOG_DEBUG("[Sim] Retransmitted {} reply={}, answering from cache",
                  protocol::commandName(frame.command), frame.replyId);
        DispatchResult cached;
        cached.packets = session.cachedReply;
        cached.closeSession = session.closeAfterReply;
        return cached;
    }

    RequestContext context{session, m_store, frame};
    Replies replies = route(context);

    DispatchResult result = stamp(session, frame, replies);
    session.hasCachedReply = true;
    session.lastCommand = frame.command;
    session.lastReplyId = frame.replyId;
    session.cachedReply = result.packets;
    result.closeSession = session.closeAfterReply;
    return result;
}

Replies Dispatcher::route(RequestContext& context) {
    const Frame& frame = context.frame;
    DeviceSession& session = context.session;
    const char* name = protocol::commandName(frame.command);

    if (!frame.is(CommandId::Connect)) {
        if (!session.connected) {
            LOG_DEBUG("[Sim] {} from {} before CONNECT", name, session.peer);
            return single(CommandId::AckUnauth);
        }
        if (frame.sessionId != session.id) {
            LOG_WARN("[Sim] {} carries session 0x{:04X}, expected 0x{:04X}", name, frame.sessionId, session.id);
            return single(CommandId::AckUnauth);
        }
        if (m_store.password() != 0 && !session.authenticated &&
            !frame.is(CommandId::Auth) && !frame.is(CommandId::Exit)) {
            LOG_DEBUG("[Sim] {} refused, session 0x{:04X} not authenticated", name, session.id);
            return single(CommandId::AckUnauth);
        }
    }

    auto request = protocol::decodeRequest(frame);
    if (!request) {
        LOG_WARN("[Sim] {}", request.error().describe());
        return single(CommandId::AckError);
    }
    if (std::holds_alternative<protocol::UnknownRequest>(request.value())) {
        LOG_WARN("[Sim] Unknown command {} ({} payload bytes)", frame.command, frame.payload.size());
        return single(CommandId::AckError);
    }

    auto it = m_handlers.find(frame.command);
    if (it == m_handlers.end()) {
        LOG_WARN("[Sim] No handler for {}", name);
        return single(CommandId::AckError);
    }

    try {
        return it->second(context, request.value());
    }
    catch (const std::exception& e) {
        LOG_ERROR("[Sim] {} handler failed: {}", name, e.what());
        return single(CommandId::AckError);
    }
}

DispatchResult Dispatcher::stamp(DeviceSession& session, const Frame& frame, const Replies& replies) {
    uint16_t sessionId = session.connected ? session.id : frame.sessionId;

    DispatchResult result;
    result.packets.reserve(replies.size());
    for (const auto& reply : replies) {
        Bytes packet = protocol::PacketCodec::encode(reply.command, sessionId, frame.replyId, reply.payload);
        LOG_TRACE("[Sim] {} -> {} {}", session.peer, protocol::commandName(reply.command),
                  utils::Crypto::toHex(packet, true));
        result.packets.push_back(std::move(packet));
    }
    return result;
}

void Dispatcher::release(DeviceSession& session) {
    if (session.id != 0) {
        m_store.closeSession(session.id);
        LOG_INFO("[Sim] Session 0x{:04X} with {} closed", session.id, session.peer);
    }
    session.reset();
}

} // namespace zkemu::sim
