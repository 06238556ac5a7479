#include "zkemu/protocol/messages.hpp"
#include "zkemu/utils/buffer.hpp"

#include <fmt/format.h>
#include <stdexcept>

namespace zkemu::protocol {

using utils::BufferReader;
using utils::BufferWriter;

// =============================================================================
// Payload encoding
// =============================================================================

Bytes AuthRequest::payload() const {
    return Bytes(key.begin(), key.end());
}

Bytes TestVoiceRequest::payload() const {
    BufferWriter writer;
    writer.writeU32(index);
    return writer.take();
}

Bytes UnlockRequest::payload() const {
    BufferWriter writer;
    writer.writeU32(tenthsOfSecond);
    return writer.take();
}

Bytes WriteLcdRequest::payload() const {
    BufferWriter writer;
    writer.writeI16(line);
    writer.writeU8(0);
    writer.writeBytes(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    return writer.take();
}

Bytes RegEventRequest::payload() const {
    BufferWriter writer;
    writer.writeU32(flags);
    return writer.take();
}

Bytes SetTimeRequest::payload() const {
    BufferWriter writer;
    writer.writeU32(packedTime);
    return writer.take();
}

Bytes OptionsReadRequest::payload() const {
    BufferWriter writer;
    writer.writeCString(name);
    return writer.take();
}

Bytes OptionsWriteRequest::payload() const {
    BufferWriter writer;
    writer.writeCString(name + "=" + value);
    return writer.take();
}

Bytes DbReadRequest::payload() const {
    return {static_cast<uint8_t>(table)};
}

Bytes UserWriteRequest::payload() const {
    return encodeUser(user, recordSize);
}

Bytes DeleteUserRequest::payload() const {
    BufferWriter writer;
    writer.writeU16(uid);
    return writer.take();
}

Bytes DeleteUserTempRequest::payload() const {
    BufferWriter writer;
    writer.writeU16(uid);
    writer.writeU8(fingerIndex);
    return writer.take();
}

Bytes GetUserTempRequest::payload() const {
    BufferWriter writer;
    writer.writeU16(uid);
    writer.writeU8(fingerIndex);
    return writer.take();
}

Bytes SaveUserTempsRequest::payload() const {
    BufferWriter writer;
    writer.writeU32(headerSize);
    writer.writeU16(reserved);
    writer.writeU16(tableEntrySize);
    return writer.take();
}

Bytes PrepareDataRequest::payload() const {
    BufferWriter writer;
    writer.writeU32(size);
    return writer.take();
}

Bytes PrepareBufferRequest::payload() const {
    BufferWriter writer;
    writer.writeU8(1);
    writer.writeU16(command);
    writer.writeU32(table);
    writer.writeU32(ext);
    return writer.take();
}

Bytes ReadBufferRequest::payload() const {
    BufferWriter writer;
    writer.writeU32(offset);
    writer.writeU32(size);
    return writer.take();
}

uint16_t requestCommand(const Request& request) {
    return std::visit([](const auto& r) { return commandOf(r); }, request);
}

Bytes requestPayload(const Request& request) {
    return std::visit([](const auto& r) { return r.payload(); }, request);
}

// =============================================================================
// Request decoding
// =============================================================================

namespace {

std::string trimNulls(const Bytes& data, size_t offset = 0) {
    if (offset >= data.size()) {
        return {};
    }
    std::string text(data.begin() + offset, data.end());
    size_t end = text.find('\0');
    if (end != std::string::npos) {
        text.resize(end);
    }
    return text;
}

Request decodeKnown(const Frame& frame) {
    const Bytes& payload = frame.payload;
    BufferReader reader(payload);

    switch (static_cast<CommandId>(frame.command)) {
        case CommandId::Connect:        return ConnectRequest{};
        case CommandId::Exit:           return ExitRequest{};
        case CommandId::Auth: {
            AuthRequest request;
            for (auto& byte : request.key) {
                byte = reader.readU8();
            }
            return request;
        }

        case CommandId::EnableDevice:   return EnableDeviceRequest{};
        case CommandId::DisableDevice:  return DisableDeviceRequest{};
        case CommandId::Restart:        return RestartRequest{};
        case CommandId::PowerOff:       return PowerOffRequest{};
        case CommandId::RefreshData:    return RefreshDataRequest{};
        case CommandId::TestVoice: {
            TestVoiceRequest request;
            if (reader.hasMore()) request.index = reader.readU32();
            return request;
        }
        case CommandId::Unlock: {
            UnlockRequest request;
            if (reader.hasMore()) request.tenthsOfSecond = reader.readU32();
            return request;
        }
        case CommandId::DoorStateRrq:   return DoorStateRequest{};
        case CommandId::WriteLcd: {
            WriteLcdRequest request;
            request.line = reader.readI16();
            reader.skip(1);
            request.text = trimNulls(payload, reader.position());
            return request;
        }
        case CommandId::ClearLcd:       return ClearLcdRequest{};
        case CommandId::RegEvent: {
            RegEventRequest request;
            if (reader.hasMore()) request.flags = reader.readU32();
            return request;
        }
        case CommandId::StartVerify:    return StartVerifyRequest{};
        case CommandId::CancelCapture:  return CancelCaptureRequest{};

        case CommandId::GetVersion:     return GetVersionRequest{};
        case CommandId::GetTime:        return GetTimeRequest{};
        case CommandId::SetTime:        return SetTimeRequest{reader.readU32()};
        case CommandId::OptionsRrq:     return OptionsReadRequest{trimNulls(payload)};
        case CommandId::OptionsWrq: {
            std::string pair = trimNulls(payload);
            size_t eq = pair.find('=');
            if (eq == std::string::npos || eq == 0) {
                throw std::invalid_argument("option write without key=value");
            }
            return OptionsWriteRequest{pair.substr(0, eq), pair.substr(eq + 1)};
        }
        case CommandId::GetFreeSizes:   return GetFreeSizesRequest{};
        case CommandId::GetPinWidth:    return GetPinWidthRequest{};

        case CommandId::DbRrq: {
            DbReadRequest request;
            if (reader.hasMore()) request.table = static_cast<TableId>(reader.readU8());
            return request;
        }
        case CommandId::UserWrq: {
            UserWriteRequest request;
            if (payload.size() != kUserRecordSize && payload.size() != kCompactUserRecordSize) {
                throw std::invalid_argument(fmt::format("user record of {} bytes", payload.size()));
            }
            request.recordSize = payload.size();
            auto user = decodeUser(payload.data(), payload.size(), request.recordSize);
            if (!user) {
                throw std::invalid_argument(user.error().message);
            }
            request.user = user.take();
            return request;
        }
        case CommandId::UserTempRrq:    return UserTempReadRequest{};
        case CommandId::AttLogRrq:      return AttLogReadRequest{};
        case CommandId::ClearData:      return ClearDataRequest{};
        case CommandId::ClearAttLog:    return ClearAttLogRequest{};
        case CommandId::DeleteUser:     return DeleteUserRequest{reader.readU16()};
        case CommandId::DeleteUserTemp: {
            DeleteUserTempRequest request;
            request.uid = reader.readU16();
            request.fingerIndex = reader.readU8();
            return request;
        }
        case CommandId::GetUserTemp: {
            GetUserTempRequest request;
            request.uid = reader.readU16();
            request.fingerIndex = reader.readU8();
            return request;
        }
        case CommandId::SaveUserTemps: {
            SaveUserTempsRequest request;
            if (reader.hasMore()) {
                request.headerSize = reader.readU32();
                request.reserved = reader.readU16();
                request.tableEntrySize = reader.readU16();
            }
            return request;
        }

        case CommandId::PrepareData:    return PrepareDataRequest{reader.readU32()};
        case CommandId::Data:           return DataRequest{payload};
        case CommandId::FreeData:       return FreeDataRequest{};
        case CommandId::PrepareBuffer: {
            PrepareBufferRequest request;
            reader.skip(1);
            request.command = reader.readU16();
            request.table = reader.readU32();
            request.ext = reader.readU32();
            return request;
        }
        case CommandId::ReadBuffer: {
            ReadBufferRequest request;
            request.offset = reader.readU32();
            request.size = reader.readU32();
            return request;
        }

        // Reply codes are never valid requests
        case CommandId::AckOk:
        case CommandId::AckError:
        case CommandId::AckData:
        case CommandId::AckRetry:
        case CommandId::AckRepeat:
        case CommandId::AckUnauth:
        case CommandId::AckUnknown:
            break;
    }

    return UnknownRequest{frame.command, payload};
}

} // namespace

Result<Request> decodeRequest(const Frame& frame) {
    try {
        return decodeKnown(frame);
    }
    catch (const std::out_of_range&) {
        return makeError(ErrorCode::MalformedFrame,
                         fmt::format("{} payload of {} bytes is truncated",
                                     commandName(frame.command), frame.payload.size()));
    }
    catch (const std::invalid_argument& e) {
        return makeError(ErrorCode::MalformedFrame,
                         fmt::format("{}: {}", commandName(frame.command), e.what()));
    }
}

} // namespace zkemu::protocol
