#include "zkemu/client/command_dispatcher.hpp"
#include "zkemu/utils/logger.hpp"

#include <fmt/format.h>

namespace zkemu::client {

using protocol::CommandId;

Result<Frame> CommandDispatcher::classify(uint16_t command, Frame reply) {
    const char* name = protocol::commandName(command);

    switch (static_cast<CommandId>(reply.command)) {
        case CommandId::AckOk:
        case CommandId::AckData:
        case CommandId::Data:
        case CommandId::PrepareData:
            return reply;

        case CommandId::AckUnauth:
            return makeError(ErrorCode::DeviceError, fmt::format("{}: not authorized", name));
        case CommandId::AckRetry:
        case CommandId::AckRepeat:
            return makeError(ErrorCode::DeviceError, fmt::format("{}: device busy", name));
        case CommandId::AckUnknown:
            return makeError(ErrorCode::DeviceError, fmt::format("{}: command not supported", name));
        case CommandId::AckError:
            return makeError(ErrorCode::DeviceError, fmt::format("{}: device reported an error", name));

        default:
            return makeError(ErrorCode::DeviceError,
                             fmt::format("{}: unexpected reply {}", name, protocol::commandName(reply.command)));
    }
}

Result<Frame> CommandDispatcher::execute(uint16_t command, const Bytes& payload) {
    LOG_DEBUG("[Dispatch] {} ({} bytes)", protocol::commandName(command), payload.size());

    auto reply = m_session.request(command, payload);
    if (!reply) {
        return reply;
    }
    return classify(command, reply.take());
}

Result<Frame> CommandDispatcher::execute(const protocol::Request& request) {
    return execute(protocol::requestCommand(request), protocol::requestPayload(request));
}

Result<Frame> CommandDispatcher::executeOnce(const protocol::Request& request) {
    uint16_t command = protocol::requestCommand(request);
    auto reply = m_session.exchange(command, protocol::requestPayload(request));
    if (!reply) {
        return reply;
    }
    return classify(command, reply.take());
}

Result<Frame> CommandDispatcher::executeRaw(const protocol::Request& request) {
    return m_session.request(protocol::requestCommand(request), protocol::requestPayload(request));
}

} // namespace zkemu::client
