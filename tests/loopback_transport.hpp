#pragma once

#include "zkemu/net/transport.hpp"
#include "zkemu/protocol/packet.hpp"
#include "zkemu/sim/components/control_component.hpp"
#include "zkemu/sim/components/data_component.hpp"
#include "zkemu/sim/components/info_component.hpp"
#include "zkemu/sim/components/session_component.hpp"
#include "zkemu/sim/device_store.hpp"
#include "zkemu/sim/dispatcher.hpp"
#include <deque>
#include <map>
#include <memory>
#include <set>
#include <utility>
#include <vector>

namespace zkemu::test {

/**
 * In-process transport wired straight into a simulator dispatcher
 *
 * Every send() is answered synchronously; receive() pops the queued
 * replies and reports a timeout when there are none. Replies can be
 * dropped or stray packets injected to exercise the session logic.
 */
class LoopbackTransport : public net::Transport {
public:
    LoopbackTransport(sim::Dispatcher& dispatcher, TransportKind kind)
        : m_dispatcher(dispatcher)
        , m_kind(kind)
        , m_session(kind, "loopback")
    {
    }

    ~LoopbackTransport() override {
        close();
    }

    Status open(std::chrono::milliseconds /*timeout*/) override {
        m_open = true;
        m_peerClosed = false;
        m_opens++;
        return Status::success();
    }

    void close() override {
        if (m_open) {
            m_open = false;
            m_dispatcher.release(m_session);
        }
        m_inbox.clear();
    }

    bool isOpen() const override { return m_open; }

    Status send(const protocol::Bytes& packet) override {
        if (!m_open || m_peerClosed) {
            return makeError(ErrorCode::ConnectionLost, "loopback closed");
        }

        auto frame = protocol::PacketCodec::decode(packet);
        bool dropAll = false;
        if (frame) {
            m_sent.push_back(frame.value());
            int occurrence = ++m_seen[frame.value().command];
            dropAll = m_dropTargets.erase(std::make_pair(frame.value().command, occurrence)) != 0;
        }

        if (m_silent) {
            return Status::success();
        }

        auto result = m_dispatcher.handlePacket(m_session, packet);
        for (auto& reply : result.packets) {
            if (dropAll) {
                m_dropped++;
                continue;
            }
            if (m_dropReplies > 0) {
                m_dropReplies--;
                m_dropped++;
                continue;
            }
            m_inbox.push_back(std::move(reply));
        }

        if (result.closeSession) {
            m_dispatcher.release(m_session);
            if (m_kind == TransportKind::Tcp) {
                m_peerClosed = true;
            }
        }
        return Status::success();
    }

    Result<protocol::Bytes> receive(std::chrono::milliseconds /*timeout*/) override {
        if (m_inbox.empty()) {
            if (m_peerClosed) {
                return makeError(ErrorCode::ConnectionLost, "peer closed the stream");
            }
            return makeError(ErrorCode::Timeout, "nothing queued");
        }
        protocol::Bytes packet = std::move(m_inbox.front());
        m_inbox.pop_front();
        return packet;
    }

    TransportKind kind() const override { return m_kind; }
    std::string peer() const override { return "loopback"; }

    // Fault injection
    void dropNextReplies(int count) { m_dropReplies = count; }
    // Swallow the replies to the n-th (1 based) request carrying `command`
    void dropRepliesTo(protocol::CommandId command, int occurrence) {
        m_dropTargets.insert({protocol::code(command), occurrence});
    }
    void inject(protocol::Bytes packet) { m_inbox.push_back(std::move(packet)); }
    void setSilent(bool silent) { m_silent = silent; }

    const std::vector<protocol::Frame>& sent() const { return m_sent; }
    int dropped() const { return m_dropped; }
    int opens() const { return m_opens; }
    sim::DeviceSession& deviceSession() { return m_session; }

private:
    sim::Dispatcher& m_dispatcher;
    TransportKind m_kind;
    sim::DeviceSession m_session;

    std::deque<protocol::Bytes> m_inbox;
    std::vector<protocol::Frame> m_sent;
    bool m_open = false;
    bool m_peerClosed = false;
    bool m_silent = false;
    int m_dropReplies = 0;
    std::map<uint16_t, int> m_seen;
    std::set<std::pair<uint16_t, int>> m_dropTargets;
    int m_dropped = 0;
    int m_opens = 0;
};

/**
 * Simulated device with every handler group registered
 */
struct DeviceFixture {
    explicit DeviceFixture(SimulatorConfig config = SimulatorConfig{})
        : store(config)
        , dispatcher(store)
    {
        store.seedDefaults();
        dispatcher.registerComponent(std::make_shared<sim::components::SessionComponent>());
        dispatcher.registerComponent(std::make_shared<sim::components::InfoComponent>());
        dispatcher.registerComponent(std::make_shared<sim::components::ControlComponent>());
        dispatcher.registerComponent(std::make_shared<sim::components::DataComponent>());
    }

    std::unique_ptr<LoopbackTransport> transport(TransportKind kind = TransportKind::Tcp) {
        return std::make_unique<LoopbackTransport>(dispatcher, kind);
    }

    sim::DeviceStore store;
    sim::Dispatcher dispatcher;
};

} // namespace zkemu::test
