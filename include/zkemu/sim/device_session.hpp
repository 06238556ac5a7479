#pragma once

#include "zkemu/core/types.hpp"
#include "zkemu/protocol/types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace zkemu::sim {

using protocol::Bytes;

/**
 * Per connection protocol state kept by the simulator
 *
 * A TCP connection owns exactly one; UDP sessions are keyed by id.
 * Only the thread currently dispatching for the session touches it.
 */
struct DeviceSession {
    DeviceSession(TransportKind kind, std::string peer)
        : transport(kind), peer(std::move(peer)) {}

    TransportKind transport;
    std::string peer;

    uint16_t id = 0;
    bool connected = false;
    bool authenticated = false;
    uint32_t registeredEvents = 0;
    bool verifying = false;

    // Last answered request, replayed when a UDP client retransmits it
    bool hasCachedReply = false;
    uint16_t lastCommand = 0;
    uint16_t lastReplyId = 0;
    std::vector<Bytes> cachedReply;

    // Data set staged by PREPARE_BUFFER for READ_BUFFER
    Bytes readBuffer;
    bool readBufferStaged = false;

    // Inbound PREPARE_DATA / DATA buffer
    Bytes upload;
    uint32_t uploadExpected = 0;
    bool uploadActive = false;

    // Set by EXIT, RESTART and POWEROFF once the reply is out
    bool closeAfterReply = false;

    void releaseBuffers() {
        readBuffer.clear();
        readBufferStaged = false;
        upload.clear();
        uploadExpected = 0;
        uploadActive = false;
    }

    void reset() {
        id = 0;
        connected = false;
        authenticated = false;
        registeredEvents = 0;
        verifying = false;
        hasCachedReply = false;
        cachedReply.clear();
        closeAfterReply = false;
        releaseBuffers();
    }
};

} // namespace zkemu::sim
