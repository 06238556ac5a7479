#include "zkemu/protocol/packet.hpp"
#include "zkemu/utils/buffer.hpp"

#include <cstring>
#include <fmt/format.h>

namespace zkemu::protocol {

namespace {

constexpr int32_t kFold = 0xFFFF;

} // namespace

// =============================================================================
// Checksum
// =============================================================================

uint16_t terminalChecksum(const uint8_t* data, size_t length) {
    int32_t sum = 0;
    size_t i = 0;

    while (length - i > 1) {
        sum += data[i] | (data[i + 1] << 8);
        if (sum > kFold) {
            sum -= kFold;
        }
        i += 2;
    }

    if (i < length) {
        sum += data[length - 1];
    }

    while (sum > kFold) {
        sum -= kFold;
    }

    int32_t result = ~sum;
    while (result < 0) {
        result += kFold;
    }
    return static_cast<uint16_t>(result);
}

// =============================================================================
// Packet Codec
// =============================================================================

Bytes PacketCodec::encode(uint16_t command, uint16_t sessionId, uint16_t replyId,
                          const Bytes& payload, ChecksumFunction checksum) {
    utils::BufferWriter writer(kHeaderSize + payload.size());
    writer.writeU16(command);
    writer.writeU16(0);
    writer.writeU16(sessionId);
    writer.writeU16(replyId);
    writer.writeBytes(payload);

    Bytes packet = writer.take();
    uint16_t sum = checksum(packet.data(), packet.size());
    packet[2] = static_cast<uint8_t>(sum & 0xFF);
    packet[3] = static_cast<uint8_t>(sum >> 8);
    return packet;
}

Result<Frame> PacketCodec::decode(const uint8_t* data, size_t length, ChecksumFunction checksum) {
    if (data == nullptr || length < kHeaderSize) {
        return makeError(ErrorCode::MalformedFrame,
                         fmt::format("packet of {} bytes is shorter than the header", length));
    }

    utils::BufferReader reader(data, length);
    Frame frame;
    frame.command = reader.readU16();
    frame.checksum = reader.readU16();
    frame.sessionId = reader.readU16();
    frame.replyId = reader.readU16();
    frame.payload.assign(data + kHeaderSize, data + length);

    Bytes zeroed(data, data + length);
    zeroed[2] = 0;
    zeroed[3] = 0;
    uint16_t expected = checksum(zeroed.data(), zeroed.size());
    if (expected != frame.checksum) {
        return makeError(ErrorCode::Checksum,
                         fmt::format("checksum 0x{:04X} != 0x{:04X} for command {}",
                                     frame.checksum, expected, frame.command));
    }

    return frame;
}

// =============================================================================
// TCP Framing
// =============================================================================

Bytes TcpFrameBuffer::wrap(const Bytes& packet) {
    utils::BufferWriter writer(kPrefixSize + packet.size());
    writer.writeU16(kMarker1);
    writer.writeU16(kMarker2);
    writer.writeU32(static_cast<uint32_t>(packet.size()));
    writer.writeBytes(packet);
    return writer.take();
}

bool TcpFrameBuffer::parsePrefix(const uint8_t* prefix, uint32_t& packetLength) {
    utils::BufferReader reader(prefix, kPrefixSize);
    if (reader.readU16() != kMarker1 || reader.readU16() != kMarker2) {
        return false;
    }
    packetLength = reader.readU32();
    return packetLength >= PacketCodec::kHeaderSize && packetLength <= kMaxPacketSize;
}

void TcpFrameBuffer::feed(const uint8_t* data, size_t length) {
    m_buffer.insert(m_buffer.end(), data, data + length);
}

TcpFrameBuffer::Status TcpFrameBuffer::next(Bytes& packet) {
    if (m_buffer.size() < kPrefixSize) {
        return Status::NeedMore;
    }

    uint32_t packetLength = 0;
    if (!parsePrefix(m_buffer.data(), packetLength)) {
        return Status::BadPrefix;
    }

    if (m_buffer.size() < kPrefixSize + packetLength) {
        return Status::NeedMore;
    }

    auto begin = m_buffer.begin() + kPrefixSize;
    auto end = begin + packetLength;
    packet.assign(begin, end);
    m_buffer.erase(m_buffer.begin(), end);
    return Status::Packet;
}

// =============================================================================
// Names
// =============================================================================

const char* commandName(uint16_t command) {
    switch (static_cast<CommandId>(command)) {
        case CommandId::Connect:        return "CONNECT";
        case CommandId::Exit:           return "EXIT";
        case CommandId::Auth:           return "AUTH";
        case CommandId::EnableDevice:   return "ENABLEDEVICE";
        case CommandId::DisableDevice:  return "DISABLEDEVICE";
        case CommandId::Restart:        return "RESTART";
        case CommandId::PowerOff:       return "POWEROFF";
        case CommandId::RefreshData:    return "REFRESHDATA";
        case CommandId::TestVoice:      return "TESTVOICE";
        case CommandId::Unlock:         return "UNLOCK";
        case CommandId::DoorStateRrq:   return "DOORSTATE_RRQ";
        case CommandId::WriteLcd:       return "WRITE_LCD";
        case CommandId::ClearLcd:       return "CLEAR_LCD";
        case CommandId::RegEvent:       return "REG_EVENT";
        case CommandId::StartVerify:    return "STARTVERIFY";
        case CommandId::CancelCapture:  return "CANCELCAPTURE";
        case CommandId::GetVersion:     return "GET_VERSION";
        case CommandId::GetTime:        return "GET_TIME";
        case CommandId::SetTime:        return "SET_TIME";
        case CommandId::OptionsRrq:     return "OPTIONS_RRQ";
        case CommandId::OptionsWrq:     return "OPTIONS_WRQ";
        case CommandId::GetFreeSizes:   return "GET_FREE_SIZES";
        case CommandId::GetPinWidth:    return "GET_PINWIDTH";
        case CommandId::DbRrq:          return "DB_RRQ";
        case CommandId::UserWrq:        return "USER_WRQ";
        case CommandId::UserTempRrq:    return "USERTEMP_RRQ";
        case CommandId::AttLogRrq:      return "ATTLOG_RRQ";
        case CommandId::ClearData:      return "CLEAR_DATA";
        case CommandId::ClearAttLog:    return "CLEAR_ATTLOG";
        case CommandId::DeleteUser:     return "DELETE_USER";
        case CommandId::DeleteUserTemp: return "DELETE_USERTEMP";
        case CommandId::GetUserTemp:    return "GET_USERTEMP";
        case CommandId::SaveUserTemps:  return "SAVE_USERTEMPS";
        case CommandId::PrepareData:    return "PREPARE_DATA";
        case CommandId::Data:           return "DATA";
        case CommandId::FreeData:       return "FREE_DATA";
        case CommandId::PrepareBuffer:  return "PREPARE_BUFFER";
        case CommandId::ReadBuffer:     return "READ_BUFFER";
        case CommandId::AckOk:          return "ACK_OK";
        case CommandId::AckError:       return "ACK_ERROR";
        case CommandId::AckData:        return "ACK_DATA";
        case CommandId::AckRetry:       return "ACK_RETRY";
        case CommandId::AckRepeat:      return "ACK_REPEAT";
        case CommandId::AckUnauth:      return "ACK_UNAUTH";
        case CommandId::AckUnknown:     return "ACK_UNKNOWN";
    }
    return "UNKNOWN";
}

std::string describeFrame(const Frame& frame) {
    return fmt::format("{}({}) session=0x{:04X} reply={} len={}",
                       commandName(frame.command), frame.command,
                       frame.sessionId, frame.replyId, frame.payload.size());
}

} // namespace zkemu::protocol
