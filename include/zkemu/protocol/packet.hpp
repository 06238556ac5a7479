#pragma once

#include "zkemu/core/result.hpp"
#include "zkemu/protocol/types.hpp"
#include <cstddef>
#include <cstdint>

namespace zkemu::protocol {

/**
 * Checksum over a packet whose checksum field is zero
 */
using ChecksumFunction = uint16_t (*)(const uint8_t* data, size_t length);

/**
 * Terminal checksum: folded sum of little-endian words, complemented.
 * An odd trailing byte is added unshifted.
 */
uint16_t terminalChecksum(const uint8_t* data, size_t length);

/**
 * Packet codec
 *
 * Packet layout: command, checksum, session id, reply id (u16 LE each),
 * then the payload. Decoding never throws.
 */
class PacketCodec {
public:
    static constexpr size_t kHeaderSize = 8;

    static Bytes encode(uint16_t command, uint16_t sessionId, uint16_t replyId,
                        const Bytes& payload,
                        ChecksumFunction checksum = &terminalChecksum);

    static Bytes encode(CommandId command, uint16_t sessionId, uint16_t replyId,
                        const Bytes& payload = {},
                        ChecksumFunction checksum = &terminalChecksum) {
        return encode(code(command), sessionId, replyId, payload, checksum);
    }

    /**
     * Decode a complete packet
     * @return the frame, MalformedFrame for short input or Checksum on mismatch
     */
    static Result<Frame> decode(const uint8_t* data, size_t length,
                                ChecksumFunction checksum = &terminalChecksum);

    static Result<Frame> decode(const Bytes& data,
                                ChecksumFunction checksum = &terminalChecksum) {
        return decode(data.data(), data.size(), checksum);
    }
};

/**
 * TCP stream framing
 *
 * Each packet on a TCP stream is preceded by 0x5050, 0x7D82 and a u32
 * length. Bytes are buffered until a whole packet is available.
 */
class TcpFrameBuffer {
public:
    static constexpr uint16_t kMarker1 = 0x5050;
    static constexpr uint16_t kMarker2 = 0x7D82;
    static constexpr size_t kPrefixSize = 8;
    static constexpr uint32_t kMaxPacketSize = 1024 * 1024;

    enum class Status {
        Packet,     // one packet extracted
        NeedMore,   // prefix or body incomplete
        BadPrefix   // stream is not framed correctly, caller should drop it
    };

    static Bytes wrap(const Bytes& packet);

    /**
     * Validate a prefix and extract the packet length
     */
    static bool parsePrefix(const uint8_t* prefix, uint32_t& packetLength);

    void feed(const uint8_t* data, size_t length);
    Status next(Bytes& packet);

    size_t buffered() const { return m_buffer.size(); }
    void reset() { m_buffer.clear(); }

private:
    Bytes m_buffer;
};

} // namespace zkemu::protocol
