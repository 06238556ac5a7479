#pragma once

#include "zkemu/core/result.hpp"
#include "zkemu/protocol/commkey.hpp"
#include "zkemu/protocol/records.hpp"
#include "zkemu/protocol/types.hpp"
#include <string>
#include <variant>

namespace zkemu::protocol {

/**
 * Requests that carry no payload
 */
struct NoPayload {
    Bytes payload() const { return {}; }
};

// Session
struct ConnectRequest : NoPayload { static constexpr CommandId kCommand = CommandId::Connect; };
struct ExitRequest : NoPayload { static constexpr CommandId kCommand = CommandId::Exit; };
struct AuthRequest {
    static constexpr CommandId kCommand = CommandId::Auth;
    CommKey key{};
    Bytes payload() const;
};

// Device control
struct EnableDeviceRequest : NoPayload { static constexpr CommandId kCommand = CommandId::EnableDevice; };
struct DisableDeviceRequest : NoPayload { static constexpr CommandId kCommand = CommandId::DisableDevice; };
struct RestartRequest : NoPayload { static constexpr CommandId kCommand = CommandId::Restart; };
struct PowerOffRequest : NoPayload { static constexpr CommandId kCommand = CommandId::PowerOff; };
struct RefreshDataRequest : NoPayload { static constexpr CommandId kCommand = CommandId::RefreshData; };
struct TestVoiceRequest {
    static constexpr CommandId kCommand = CommandId::TestVoice;
    uint32_t index = 0;
    Bytes payload() const;
};
struct UnlockRequest {
    static constexpr CommandId kCommand = CommandId::Unlock;
    uint32_t tenthsOfSecond = 30;
    Bytes payload() const;
};
struct DoorStateRequest : NoPayload { static constexpr CommandId kCommand = CommandId::DoorStateRrq; };
struct WriteLcdRequest {
    static constexpr CommandId kCommand = CommandId::WriteLcd;
    int16_t line = 0;
    std::string text;
    Bytes payload() const;
};
struct ClearLcdRequest : NoPayload { static constexpr CommandId kCommand = CommandId::ClearLcd; };
struct RegEventRequest {
    static constexpr CommandId kCommand = CommandId::RegEvent;
    uint32_t flags = 0;
    Bytes payload() const;
};
struct StartVerifyRequest : NoPayload { static constexpr CommandId kCommand = CommandId::StartVerify; };
struct CancelCaptureRequest : NoPayload { static constexpr CommandId kCommand = CommandId::CancelCapture; };

// Device information
struct GetVersionRequest : NoPayload { static constexpr CommandId kCommand = CommandId::GetVersion; };
struct GetTimeRequest : NoPayload { static constexpr CommandId kCommand = CommandId::GetTime; };
struct SetTimeRequest {
    static constexpr CommandId kCommand = CommandId::SetTime;
    uint32_t packedTime = 0;
    Bytes payload() const;
};
struct OptionsReadRequest {
    static constexpr CommandId kCommand = CommandId::OptionsRrq;
    std::string name;
    Bytes payload() const;
};
struct OptionsWriteRequest {
    static constexpr CommandId kCommand = CommandId::OptionsWrq;
    std::string name;
    std::string value;
    Bytes payload() const;
};
struct GetFreeSizesRequest : NoPayload { static constexpr CommandId kCommand = CommandId::GetFreeSizes; };
struct GetPinWidthRequest {
    static constexpr CommandId kCommand = CommandId::GetPinWidth;
    Bytes payload() const { return {' ', 'P'}; }
};

// Data tables
struct DbReadRequest {
    static constexpr CommandId kCommand = CommandId::DbRrq;
    TableId table = TableId::FingerTmp;
    Bytes payload() const;
};
struct UserWriteRequest {
    static constexpr CommandId kCommand = CommandId::UserWrq;
    UserRecord user;
    size_t recordSize = kUserRecordSize;
    Bytes payload() const;
};
struct UserTempReadRequest : NoPayload { static constexpr CommandId kCommand = CommandId::UserTempRrq; };
struct AttLogReadRequest : NoPayload { static constexpr CommandId kCommand = CommandId::AttLogRrq; };
struct ClearDataRequest : NoPayload { static constexpr CommandId kCommand = CommandId::ClearData; };
struct ClearAttLogRequest : NoPayload { static constexpr CommandId kCommand = CommandId::ClearAttLog; };
struct DeleteUserRequest {
    static constexpr CommandId kCommand = CommandId::DeleteUser;
    uint16_t uid = 0;
    Bytes payload() const;
};
struct DeleteUserTempRequest {
    static constexpr CommandId kCommand = CommandId::DeleteUserTemp;
    uint16_t uid = 0;
    uint8_t fingerIndex = 0;
    Bytes payload() const;
};
struct GetUserTempRequest {
    static constexpr CommandId kCommand = CommandId::GetUserTemp;
    uint16_t uid = 0;
    uint8_t fingerIndex = 0;
    Bytes payload() const;
};
struct SaveUserTempsRequest {
    static constexpr CommandId kCommand = CommandId::SaveUserTemps;
    uint32_t headerSize = 12;
    uint16_t reserved = 0;
    uint16_t tableEntrySize = 8;
    Bytes payload() const;
};

// Buffered transfer
struct PrepareDataRequest {
    static constexpr CommandId kCommand = CommandId::PrepareData;
    uint32_t size = 0;
    Bytes payload() const;
};
struct DataRequest {
    static constexpr CommandId kCommand = CommandId::Data;
    Bytes chunk;
    Bytes payload() const { return chunk; }
};
struct FreeDataRequest : NoPayload { static constexpr CommandId kCommand = CommandId::FreeData; };
struct PrepareBufferRequest {
    static constexpr CommandId kCommand = CommandId::PrepareBuffer;
    uint16_t command = 0;
    uint32_t table = 0;
    uint32_t ext = 0;
    Bytes payload() const;
};
struct ReadBufferRequest {
    static constexpr CommandId kCommand = CommandId::ReadBuffer;
    uint32_t offset = 0;
    uint32_t size = 0;
    Bytes payload() const;
};

// Anything the terminal does not implement
struct UnknownRequest {
    uint16_t command = 0;
    Bytes raw;
    Bytes payload() const { return raw; }
};

using Request = std::variant<
    ConnectRequest, ExitRequest, AuthRequest,
    EnableDeviceRequest, DisableDeviceRequest, RestartRequest, PowerOffRequest,
    RefreshDataRequest, TestVoiceRequest, UnlockRequest, DoorStateRequest,
    WriteLcdRequest, ClearLcdRequest, RegEventRequest, StartVerifyRequest,
    CancelCaptureRequest,
    GetVersionRequest, GetTimeRequest, SetTimeRequest, OptionsReadRequest,
    OptionsWriteRequest, GetFreeSizesRequest, GetPinWidthRequest,
    DbReadRequest, UserWriteRequest, UserTempReadRequest, AttLogReadRequest,
    ClearDataRequest, ClearAttLogRequest, DeleteUserRequest, DeleteUserTempRequest,
    GetUserTempRequest, SaveUserTempsRequest,
    PrepareDataRequest, DataRequest, FreeDataRequest, PrepareBufferRequest,
    ReadBufferRequest,
    UnknownRequest>;

template<typename T>
constexpr uint16_t commandOf(const T&) {
    return code(T::kCommand);
}

inline uint16_t commandOf(const UnknownRequest& request) {
    return request.command;
}

uint16_t requestCommand(const Request& request);
Bytes requestPayload(const Request& request);

/**
 * Interpret a frame as one of the known requests.
 * Unknown codes decode to UnknownRequest, a payload that does not fit
 * its command is a MalformedFrame error.
 */
Result<Request> decodeRequest(const Frame& frame);

} // namespace zkemu::protocol
