#pragma once

#include "zkemu/protocol/messages.hpp"
#include "zkemu/protocol/packet.hpp"
#include "zkemu/protocol/types.hpp"
#include "zkemu/sim/device_session.hpp"
#include "zkemu/sim/device_store.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace zkemu::sim {

using protocol::CommandId;
using protocol::Frame;

/**
 * One reply frame before it is stamped with the session and reply ids
 */
struct Reply {
    uint16_t command;
    Bytes payload;
};

using Replies = std::vector<Reply>;

/**
 * Everything a handler may touch while answering one request
 */
struct RequestContext {
    DeviceSession& session;
    DeviceStore& store;
    const Frame& frame;
};

/**
 * Encoded packets to send back, in order
 */
struct DispatchResult {
    std::vector<Bytes> packets;
    bool closeSession = false;
};

class Dispatcher;

/**
 * Base class for handler groups
 *
 * Each component registers the commands of one category (session,
 * device information, control, data) with the dispatcher.
 */
class Component {
public:
    explicit Component(const std::string& name) : m_name(name) {}
    virtual ~Component() = default;

    const std::string& getName() const { return m_name; }

    virtual void registerHandlers(Dispatcher& dispatcher) = 0;

protected:
    std::string m_name;

    static Replies ok(Bytes payload = {});
    static Replies error();
    static Replies unauthorized();
    static Replies data(Bytes payload);

    /**
     * DATA when the payload is at most `inlineLimit` bytes, otherwise
     * PREPARE_DATA, DATA frames and ACK_OK.
     */
    static Replies dataOrStream(const Bytes& payload, size_t inlineLimit);

    /**
     * Reply to a data request. UDP gets one DATA datagram, so a lost
     * reply is recovered by retransmitting the request; TCP uses
     * dataOrStream with the configured inline limit.
     */
    static Replies dataFor(const RequestContext& context, const Bytes& payload);
};

/**
 * Server side command dispatcher
 *
 * Registration table from command code to handler. Frames are checked
 * for session and authentication before their handler runs; anything
 * unknown or undecodable is answered with ACK_ERROR.
 */
class Dispatcher {
public:
    using Handler = std::function<Replies(RequestContext&, const protocol::Request&)>;

    static constexpr size_t kStreamFrameSize = 1024;
    static constexpr size_t kMaxDatagramPayload = 65507 - protocol::PacketCodec::kHeaderSize;

    explicit Dispatcher(DeviceStore& store);

    void registerComponent(std::shared_ptr<Component> component);

    /**
     * Register a handler for the request type T
     */
    template<typename T, typename F>
    void on(F handler) {
        m_handlers[protocol::code(T::kCommand)] =
            [handler](RequestContext& context, const protocol::Request& request) {
                return handler(context, std::get<T>(request));
            };
    }

    bool hasHandler(uint16_t command) const { return m_handlers.count(command) != 0; }
    size_t handlerCount() const { return m_handlers.size(); }

    /**
     * Decode and answer one packet. Undecodable packets produce nothing.
     */
    DispatchResult handlePacket(DeviceSession& session, const Bytes& packet);

    /**
     * Answer a decoded frame
     */
    DispatchResult dispatch(DeviceSession& session, const Frame& frame);

    /**
     * Forget a session when its connection goes away
     */
    void release(DeviceSession& session);

    DeviceStore& store() { return m_store; }

private:
    Replies route(RequestContext& context);
    DispatchResult stamp(DeviceSession& session, const Frame& frame, const Replies& replies);

    DeviceStore& m_store;
    std::map<uint16_t, Handler> m_handlers;
    std::vector<std::shared_ptr<Component>> m_components;
};

} // namespace zkemu::sim
