#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace zkemu::protocol {

using Bytes = std::vector<uint8_t>;

/**
 * Terminal command and reply codes
 */
enum class CommandId : uint16_t {
    // Session
    Connect         = 1000,
    Exit            = 1001,
    Auth            = 1102,

    // Device control
    EnableDevice    = 1002,
    DisableDevice   = 1003,
    Restart         = 1004,
    PowerOff        = 1005,
    RefreshData     = 1013,
    TestVoice       = 1017,
    Unlock          = 31,
    DoorStateRrq    = 75,
    WriteLcd        = 66,
    ClearLcd        = 67,
    RegEvent        = 500,
    StartVerify     = 60,
    CancelCapture   = 62,

    // Device information
    GetVersion      = 1100,
    GetTime         = 201,
    SetTime         = 202,
    OptionsRrq      = 11,
    OptionsWrq      = 12,
    GetFreeSizes    = 50,
    GetPinWidth     = 69,

    // Data tables
    DbRrq           = 7,
    UserWrq         = 8,
    UserTempRrq     = 9,
    AttLogRrq       = 13,
    ClearData       = 14,
    ClearAttLog     = 15,
    DeleteUser      = 18,
    DeleteUserTemp  = 19,
    GetUserTemp     = 88,
    SaveUserTemps   = 110,

    // Buffered transfer
    PrepareData     = 1500,
    Data            = 1501,
    FreeData        = 1502,
    PrepareBuffer   = 1503,
    ReadBuffer      = 1504,

    // Replies
    AckOk           = 2000,
    AckError        = 2001,
    AckData         = 2002,
    AckRetry        = 2003,
    AckRepeat       = 2004,
    AckUnauth       = 2005,
    AckUnknown      = 0xFFFF
};

constexpr uint16_t code(CommandId id) {
    return static_cast<uint16_t>(id);
}

const char* commandName(uint16_t command);

/**
 * Table selectors used with PREPARE_BUFFER and DB_RRQ
 */
enum class TableId : uint8_t {
    AttLog    = 1,
    FingerTmp = 2,
    User      = 5
};

// Client side reply counter seed: the first increment yields 0 for CONNECT
constexpr uint16_t kReplyIdSeed = 0xFFFF - 1;
constexpr uint32_t kReplyIdModulus = 0xFFFF;

constexpr uint16_t nextReplyId(uint16_t current) {
    return static_cast<uint16_t>((static_cast<uint32_t>(current) + 1) % kReplyIdModulus);
}

/**
 * One protocol message
 */
struct Frame {
    uint16_t command = 0;
    uint16_t checksum = 0;
    uint16_t sessionId = 0;
    uint16_t replyId = 0;
    Bytes payload;

    bool is(CommandId id) const { return command == code(id); }

    bool operator==(const Frame& other) const {
        return command == other.command && sessionId == other.sessionId &&
               replyId == other.replyId && payload == other.payload;
    }
    bool operator!=(const Frame& other) const { return !(*this == other); }
};

std::string describeFrame(const Frame& frame);

} // namespace zkemu::protocol
