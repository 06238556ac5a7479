#include "test_framework.hpp"
#include "zkemu/protocol/messages.hpp"
#include "zkemu/protocol/packet.hpp"
#include "zkemu/utils/crypto.hpp"
#include <algorithm>

namespace packet_tests {

using zkemu::ErrorCode;
using zkemu::protocol::Bytes;
using zkemu::protocol::CommandId;
using zkemu::protocol::PacketCodec;
using zkemu::protocol::TcpFrameBuffer;
using zkemu::utils::Crypto;

Bytes fromString(const std::string& text, bool terminate) {
    Bytes out(text.begin(), text.end());
    if (terminate) out.push_back(0);
    return out;
}

uint16_t zeroChecksum(const uint8_t*, size_t) {
    return 0;
}

} // namespace packet_tests

// =============================================================================
// Checksum golden vectors
// =============================================================================

TEST(Packet_Golden_Connect) {
    using namespace packet_tests;
    auto packet = PacketCodec::encode(CommandId::Connect, 0, 0);
    ASSERT_STREQ(Crypto::toHex(packet), "e80316fc00000000");
    PASS();
}

TEST(Packet_Golden_Exit) {
    using namespace packet_tests;
    auto packet = PacketCodec::encode(CommandId::Exit, 0x1234, 7);
    ASSERT_STREQ(Crypto::toHex(packet), "e903dae934120700");
    PASS();
}

TEST(Packet_Golden_OddPayload) {
    using namespace packet_tests;
    // 14 byte payload ending in an odd total length once the header is added
    auto packet = PacketCodec::encode(CommandId::OptionsRrq, 0x2a, 3, fromString("~SerialNumber", true));
    ASSERT_STREQ(Crypto::toHex(packet), "0b00c3b62a0003007e53657269616c4e756d62657200");

    auto odd = PacketCodec::encode(CommandId::SetTime, 5, 65534, Bytes{0x01, 0x02, 0x03});
    ASSERT_STREQ(Crypto::toHex(odd), "ca002cfd0500feff010203");
    PASS();
}

TEST(Packet_Golden_PrepareData) {
    using namespace packet_tests;
    auto packet = PacketCodec::encode(CommandId::PrepareData, 0x1234, 1, Bytes{0x88, 0x13, 0x00, 0x00});
    ASSERT_STREQ(Crypto::toHex(packet), "dc0565d43412010088130000");
    PASS();
}

// =============================================================================
// Decoding
// =============================================================================

TEST(Packet_DecodeFields) {
    using namespace packet_tests;
    auto packet = PacketCodec::encode(CommandId::OptionsRrq, 0x2a, 3, fromString("~SerialNumber", true));
    auto frame = PacketCodec::decode(packet);
    ASSERT_OK(frame);
    ASSERT_TRUE(frame.value().is(CommandId::OptionsRrq));
    ASSERT_EQ(frame.value().sessionId, 0x2a);
    ASSERT_EQ(frame.value().replyId, 3);
    ASSERT_EQ(frame.value().checksum, 0xb6c3);
    ASSERT_EQ(frame.value().payload.size(), 14u);
    PASS();
}

TEST(Packet_ChecksumFieldCorruption) {
    using namespace packet_tests;
    auto packet = PacketCodec::encode(CommandId::GetTime, 0x1234, 9);
    packet[2] ^= 0x01;
    auto frame = PacketCodec::decode(packet);
    ASSERT_ERROR(frame, ErrorCode::Checksum);
    PASS();
}

TEST(Packet_EveryBitFlipDetected) {
    using namespace packet_tests;
    auto original = PacketCodec::encode(CommandId::UserWrq, 0x4d2, 42, Bytes{1, 2, 3, 4, 5, 6, 7, 8, 9});

    // A single flipped bit anywhere outside the checksum field must be caught
    for (size_t byte = 0; byte < original.size(); byte++) {
        if (byte == 2 || byte == 3) continue;
        for (int bit = 0; bit < 8; bit++) {
            Bytes damaged = original;
            damaged[byte] ^= static_cast<uint8_t>(1 << bit);
            auto frame = PacketCodec::decode(damaged);
            if (frame) {
                _msg = "bit " + std::to_string(bit) + " of byte " + std::to_string(byte) + " went unnoticed";
                return false;
            }
            ASSERT_EQ(frame.code(), ErrorCode::Checksum);
        }
    }
    PASS();
}

TEST(Packet_TruncatedHeader) {
    using namespace packet_tests;
    auto packet = PacketCodec::encode(CommandId::Connect, 0, 0);
    for (size_t length = 0; length < PacketCodec::kHeaderSize; length++) {
        auto frame = PacketCodec::decode(packet.data(), length);
        ASSERT_ERROR(frame, ErrorCode::MalformedFrame);
    }
    PASS();
}

TEST(Packet_TruncatedPayloadFailsChecksum) {
    using namespace packet_tests;
    auto packet = PacketCodec::encode(CommandId::Data, 1, 2, Bytes(32, 0x5a));
    packet.resize(packet.size() - 3);
    auto frame = PacketCodec::decode(packet);
    ASSERT_FALSE(frame.ok());
    PASS();
}

TEST(Packet_PluggableChecksum) {
    using namespace packet_tests;
    auto packet = PacketCodec::encode(CommandId::GetTime, 7, 8, {}, &zeroChecksum);
    ASSERT_EQ(packet[2], 0);
    ASSERT_EQ(packet[3], 0);

    ASSERT_OK(PacketCodec::decode(packet, &zeroChecksum));
    ASSERT_ERROR(PacketCodec::decode(packet), ErrorCode::Checksum);
    PASS();
}

// =============================================================================
// TCP framing
// =============================================================================

TEST(TcpFrame_WrapPrefix) {
    using namespace packet_tests;
    auto packet = PacketCodec::encode(CommandId::Connect, 0, 0);
    auto wrapped = TcpFrameBuffer::wrap(packet);
    ASSERT_STREQ(Crypto::toHex(wrapped), "5050827d08000000e80316fc00000000");
    PASS();
}

TEST(TcpFrame_SplitAcrossReads) {
    using namespace packet_tests;
    auto first = TcpFrameBuffer::wrap(PacketCodec::encode(CommandId::AckOk, 0x1234, 1));
    auto second = TcpFrameBuffer::wrap(PacketCodec::encode(CommandId::Data, 0x1234, 2, Bytes(10, 0xee)));

    Bytes stream = first;
    stream.insert(stream.end(), second.begin(), second.end());

    TcpFrameBuffer buffer;
    Bytes packet;
    std::vector<Bytes> packets;

    // Feed three bytes at a time
    for (size_t offset = 0; offset < stream.size(); offset += 3) {
        size_t length = std::min<size_t>(3, stream.size() - offset);
        buffer.feed(stream.data() + offset, length);
        while (buffer.next(packet) == TcpFrameBuffer::Status::Packet) {
            packets.push_back(packet);
        }
    }

    ASSERT_EQ(packets.size(), 2u);
    ASSERT_EQ(buffer.buffered(), 0u);

    auto frame = PacketCodec::decode(packets[1]);
    ASSERT_OK(frame);
    ASSERT_TRUE(frame.value().is(CommandId::Data));
    ASSERT_EQ(frame.value().payload.size(), 10u);
    PASS();
}

TEST(TcpFrame_BadMarker) {
    using namespace packet_tests;
    auto wrapped = TcpFrameBuffer::wrap(PacketCodec::encode(CommandId::Connect, 0, 0));
    wrapped[0] = 0x51;

    TcpFrameBuffer buffer;
    buffer.feed(wrapped.data(), wrapped.size());
    Bytes packet;
    ASSERT_TRUE(buffer.next(packet) == TcpFrameBuffer::Status::BadPrefix);
    PASS();
}

TEST(TcpFrame_OversizedLengthRejected) {
    using namespace packet_tests;
    Bytes prefix = {0x50, 0x50, 0x82, 0x7d, 0x00, 0x00, 0x20, 0x00};  // 2 MiB
    uint32_t length = 0;
    ASSERT_FALSE(TcpFrameBuffer::parsePrefix(prefix.data(), length));

    Bytes tiny = {0x50, 0x50, 0x82, 0x7d, 0x04, 0x00, 0x00, 0x00};
    ASSERT_FALSE(TcpFrameBuffer::parsePrefix(tiny.data(), length));
    PASS();
}

// =============================================================================
// Requests
// =============================================================================

TEST(Request_DecodeKnownAndUnknown) {
    using namespace packet_tests;
    zkemu::protocol::Frame frame;
    frame.command = zkemu::protocol::code(CommandId::ReadBuffer);
    frame.payload = Bytes{0x00, 0x10, 0x00, 0x00, 0xc0, 0xff, 0x00, 0x00};

    auto request = zkemu::protocol::decodeRequest(frame);
    ASSERT_OK(request);
    const auto* read = std::get_if<zkemu::protocol::ReadBufferRequest>(&request.value());
    ASSERT_TRUE(read != nullptr);
    ASSERT_EQ(read->offset, 0x1000u);
    ASSERT_EQ(read->size, 0xFFC0u);

    frame.command = 9999;
    auto unknown = zkemu::protocol::decodeRequest(frame);
    ASSERT_OK(unknown);
    ASSERT_TRUE(std::holds_alternative<zkemu::protocol::UnknownRequest>(unknown.value()));

    frame.command = zkemu::protocol::code(CommandId::ReadBuffer);
    frame.payload = Bytes{0x01};
    ASSERT_ERROR(zkemu::protocol::decodeRequest(frame), ErrorCode::MalformedFrame);
    PASS();
}

TEST(Request_ReplyIdWraps) {
    using namespace packet_tests;
    using zkemu::protocol::nextReplyId;
    ASSERT_EQ(nextReplyId(zkemu::protocol::kReplyIdSeed), 0);
    ASSERT_EQ(nextReplyId(0), 1);
    ASSERT_EQ(nextReplyId(65533), 65534);
    PASS();
}
