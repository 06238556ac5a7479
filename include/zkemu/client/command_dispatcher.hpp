#pragma once

#include "zkemu/client/session.hpp"
#include "zkemu/protocol/messages.hpp"

namespace zkemu::client {

/**
 * Client side command dispatcher
 *
 * Issues one command at a time over a Session and turns the device's
 * reply code into success or a DeviceError. Success replies are ACK_OK,
 * ACK_DATA, DATA and PREPARE_DATA; the frame is returned so callers can
 * read its payload or continue a streamed reply.
 */
class CommandDispatcher {
public:
    explicit CommandDispatcher(Session& session) : m_session(session) {}

    Result<Frame> execute(uint16_t command, const Bytes& payload = {});
    Result<Frame> execute(const protocol::Request& request);

    // Single attempt, see Session::exchange
    Result<Frame> executeOnce(const protocol::Request& request);

    // Any reply code is returned as is
    Result<Frame> executeRaw(const protocol::Request& request);

    /**
     * Map a reply code to success or DeviceError
     */
    static Result<Frame> classify(uint16_t command, Frame reply);

    Session& session() { return m_session; }

private:
    Session& m_session;
};

} // namespace zkemu::client
