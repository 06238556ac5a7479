#pragma once

#include "zkemu/core/result.hpp"
#include "zkemu/protocol/types.hpp"
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

namespace zkemu::protocol {

// =============================================================================
// Packed date-time
// =============================================================================

struct DateTime {
    int year = 2000;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;

    static DateTime fromTm(const std::tm& tm);
    static DateTime now();

    bool isValid() const;
    std::string toString() const;   // YYYY-MM-DD HH:MM:SS

    bool operator==(const DateTime& other) const;
    bool operator!=(const DateTime& other) const { return !(*this == other); }
};

/**
 * Terminal clock encoding: a 31-day month, 12-month year count of
 * seconds since 2000-01-01. Years wrap at 100.
 */
uint32_t encodeTime(const DateTime& time);
DateTime decodeTime(uint32_t packed);

// =============================================================================
// Users
// =============================================================================

enum class Privilege : uint8_t {
    User  = 0,
    Admin = 14
};

constexpr size_t kUserRecordSize = 72;
constexpr size_t kCompactUserRecordSize = 28;

struct UserRecord {
    uint16_t uid = 0;
    Privilege privilege = Privilege::User;
    std::string password;
    std::string name;
    uint32_t card = 0;
    std::string groupId;
    std::string userId;

    bool operator==(const UserRecord& other) const;
};

/**
 * Check that every field fits the slot layout
 */
Status validateUser(const UserRecord& user, size_t recordSize = kUserRecordSize);

Bytes encodeUser(const UserRecord& user, size_t recordSize = kUserRecordSize);
Result<UserRecord> decodeUser(const uint8_t* data, size_t length, size_t recordSize = kUserRecordSize);
Result<std::vector<UserRecord>> decodeUsers(const Bytes& data, size_t recordSize = kUserRecordSize);

// =============================================================================
// Attendance
// =============================================================================

enum class VerifyMode : uint8_t {
    Password    = 0,
    Fingerprint = 1,
    Card        = 2,
    Face        = 15
};

enum class PunchType : uint8_t {
    CheckIn     = 0,
    CheckOut    = 1,
    BreakOut    = 2,
    BreakIn     = 3,
    OvertimeIn  = 4,
    OvertimeOut = 5
};

constexpr size_t kAttendanceRecordSize = 40;
constexpr size_t kShortAttendanceRecordSize = 16;
constexpr size_t kTinyAttendanceRecordSize = 8;

struct AttendanceRecord {
    uint16_t uid = 0;
    std::string userId;
    DateTime timestamp;
    VerifyMode status = VerifyMode::Fingerprint;
    PunchType punch = PunchType::CheckIn;

    bool operator==(const AttendanceRecord& other) const;
};

Bytes encodeAttendance(const AttendanceRecord& record, size_t recordSize = kAttendanceRecordSize);
Result<std::vector<AttendanceRecord>> decodeAttendance(const Bytes& data,
                                                       size_t recordSize = kAttendanceRecordSize);

// =============================================================================
// Fingerprint templates
// =============================================================================

constexpr size_t kTemplateHeaderSize = 6;
constexpr uint8_t kMaxFingerIndex = 9;

// Slot size is a u16 that includes the header
constexpr size_t kMaxTemplateSize = 0xFFFF - kTemplateHeaderSize;

struct TemplateRecord {
    uint16_t uid = 0;
    uint8_t fingerIndex = 0;
    bool valid = true;
    Bytes data;

    bool operator==(const TemplateRecord& other) const;
};

/**
 * Encode one template slot. Data longer than kMaxTemplateSize does not
 * fit the slot size field and is a MalformedRecord error.
 */
Result<Bytes> encodeTemplate(const TemplateRecord& record);

/**
 * Decode one template slot; the slot length comes from its own header
 */
Result<TemplateRecord> decodeTemplate(const Bytes& data);
Result<std::vector<TemplateRecord>> decodeTemplates(const Bytes& data);

// =============================================================================
// Data sets and bulk uploads
// =============================================================================

/**
 * Bulk table replies start with the u32 byte count of the records.
 */
Bytes wrapDataSet(const Bytes& records);
Result<Bytes> unwrapDataSet(const Bytes& data);

struct UserTemplates {
    UserRecord user;
    std::vector<TemplateRecord> templates;
};

/**
 * SAVE_USERTEMPS staging buffer: sizes header, user block, finger table
 * and template block.
 */
Bytes encodeTemplateUpload(const std::vector<UserTemplates>& entries);
Result<std::vector<UserTemplates>> decodeTemplateUpload(const Bytes& data);

} // namespace zkemu::protocol
