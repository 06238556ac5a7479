#include "zkemu/sim/components/session_component.hpp"
#include "zkemu/protocol/commkey.hpp"
#include "zkemu/utils/logger.hpp"

namespace zkemu::sim::components {

SessionComponent::SessionComponent()
    : Component("Session")
{
}

void SessionComponent::registerHandlers(Dispatcher& dispatcher) {
    dispatcher.on<protocol::ConnectRequest>(
        [this](RequestContext& context, const protocol::ConnectRequest&) { return handleConnect(context); });
    dispatcher.on<protocol::AuthRequest>(
        [this](RequestContext& context, const protocol::AuthRequest& request) { return handleAuth(context, request); });
    dispatcher.on<protocol::ExitRequest>(
        [this](RequestContext& context, const protocol::ExitRequest&) { return handleExit(context); });
}

Replies SessionComponent::handleConnect(RequestContext& context) {
    DeviceSession& session = context.session;

    // A second CONNECT on the same connection starts over
    if (session.connected) {
        LOG_DEBUG("[Session] {} reconnecting, dropping 0x{:04X}", session.peer, session.id);
        context.store.closeSession(session.id);
        session.reset();
    }

    session.id = context.store.openSession();
    session.connected = true;
    session.authenticated = context.store.password() == 0;

    LOG_INFO("[Session] {} connected over {}, session 0x{:04X}{}", session.peer,
             transportName(session.transport), session.id,
             session.authenticated ? "" : ", awaiting AUTH");

    return session.authenticated ? ok() : unauthorized();
}

Replies SessionComponent::handleAuth(RequestContext& context, const protocol::AuthRequest& request) {
    DeviceSession& session = context.session;
    uint32_t password = context.store.password();

    if (password != 0 && !protocol::verifyCommKey(request.key, password, session.id)) {
        LOG_WARN("[Session] Bad commkey from {} on session 0x{:04X}", session.peer, session.id);
        session.authenticated = false;
        return unauthorized();
    }

    session.authenticated = true;
    LOG_INFO("[Session] 0x{:04X} authenticated", session.id);
    return ok();
}

Replies SessionComponent::handleExit(RequestContext& context) {
    LOG_DEBUG("[Session] EXIT from {}", context.session.peer);
    context.session.closeAfterReply = true;
    return ok();
}

} // namespace zkemu::sim::components
