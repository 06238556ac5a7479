#pragma once

#include "zkemu/sim/dispatcher.hpp"

namespace zkemu::sim::components {

/**
 * Session Component
 *
 * Commands:
 *   CONNECT (1000) - Allocate a session id, ACK_UNAUTH when a password is set
 *   AUTH (1102)    - Check the commkey against the device password
 *   EXIT (1001)    - Acknowledge and close the session
 */
class SessionComponent : public Component {
public:
    SessionComponent();

    void registerHandlers(Dispatcher& dispatcher) override;

private:
    Replies handleConnect(RequestContext& context);
    Replies handleAuth(RequestContext& context, const protocol::AuthRequest& request);
    Replies handleExit(RequestContext& context);
};

} // namespace zkemu::sim::components
