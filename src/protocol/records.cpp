#include "zkemu/protocol/records.hpp"
#include "zkemu/utils/buffer.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <map>
#include <stdexcept>

namespace zkemu::protocol {

using utils::BufferReader;
using utils::BufferWriter;

namespace {

bool isNumeric(const std::string& value) {
    return !value.empty() && value.size() <= 10 &&
           std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

uint32_t numericOrZero(const std::string& value) {
    if (!isNumeric(value)) {
        return 0;
    }
    unsigned long long parsed = std::stoull(value);
    return parsed > 0xFFFFFFFFULL ? 0 : static_cast<uint32_t>(parsed);
}

Error slotError(const char* what, size_t have, size_t need) {
    return makeError(ErrorCode::MalformedRecord,
                     fmt::format("{} slot of {} bytes, layout needs {}", what, have, need));
}

} // namespace

// =============================================================================
// Packed date-time
// =============================================================================

DateTime DateTime::fromTm(const std::tm& tm) {
    DateTime time;
    time.year = tm.tm_year + 1900;
    time.month = tm.tm_mon + 1;
    time.day = tm.tm_mday;
    time.hour = tm.tm_hour;
    time.minute = tm.tm_min;
    time.second = tm.tm_sec;
    return time;
}

DateTime DateTime::now() {
    std::time_t raw = std::time(nullptr);
    std::tm local{};
    localtime_r(&raw, &local);
    return fromTm(local);
}

bool DateTime::isValid() const {
    return year >= 2000 && year <= 2099 &&
           month >= 1 && month <= 12 &&
           day >= 1 && day <= 31 &&
           hour >= 0 && hour < 24 &&
           minute >= 0 && minute < 60 &&
           second >= 0 && second < 60;
}

std::string DateTime::toString() const {
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}",
                       year, month, day, hour, minute, second);
}

bool DateTime::operator==(const DateTime& other) const {
    return year == other.year && month == other.month && day == other.day &&
           hour == other.hour && minute == other.minute && second == other.second;
}

uint32_t encodeTime(const DateTime& time) {
    uint32_t days = static_cast<uint32_t>(
        ((time.year % 100) * 12 * 31) + ((time.month - 1) * 31) + time.day - 1);
    return days * 86400u +
           static_cast<uint32_t>((time.hour * 60 + time.minute) * 60 + time.second);
}

DateTime decodeTime(uint32_t packed) {
    DateTime time;
    time.second = static_cast<int>(packed % 60);
    packed /= 60;
    time.minute = static_cast<int>(packed % 60);
    packed /= 60;
    time.hour = static_cast<int>(packed % 24);
    packed /= 24;
    time.day = static_cast<int>(packed % 31) + 1;
    packed /= 31;
    time.month = static_cast<int>(packed % 12) + 1;
    packed /= 12;
    time.year = static_cast<int>(packed) + 2000;
    return time;
}

// =============================================================================
// Users
// =============================================================================

bool UserRecord::operator==(const UserRecord& other) const {
    return uid == other.uid && privilege == other.privilege && password == other.password &&
           name == other.name && card == other.card && groupId == other.groupId &&
           userId == other.userId;
}

Status validateUser(const UserRecord& user, size_t recordSize) {
    if (recordSize == kUserRecordSize) {
        if (user.password.size() > 8) return makeError(ErrorCode::MalformedRecord, "password longer than 8 bytes");
        if (user.name.size() > 24) return makeError(ErrorCode::MalformedRecord, "name longer than 24 bytes");
        if (user.groupId.size() > 7) return makeError(ErrorCode::MalformedRecord, "group id longer than 7 bytes");
        if (user.userId.size() > 24) return makeError(ErrorCode::MalformedRecord, "user id longer than 24 bytes");
        return Status::success();
    }

    if (recordSize == kCompactUserRecordSize) {
        if (user.password.size() > 5) return makeError(ErrorCode::MalformedRecord, "password longer than 5 bytes");
        if (user.name.size() > 8) return makeError(ErrorCode::MalformedRecord, "name longer than 8 bytes");
        if (!user.groupId.empty() && (!isNumeric(user.groupId) || std::stoull(user.groupId) > 0xFF)) {
            return makeError(ErrorCode::MalformedRecord, "group id must be a number below 256");
        }
        if (!user.userId.empty() && (!isNumeric(user.userId) || std::stoull(user.userId) > 0xFFFFFFFFULL)) {
            return makeError(ErrorCode::MalformedRecord, "user id must be a 32-bit number");
        }
        return Status::success();
    }

    return makeError(ErrorCode::MalformedRecord, fmt::format("unsupported user layout {}", recordSize));
}

Bytes encodeUser(const UserRecord& user, size_t recordSize) {
    BufferWriter writer(recordSize);
    writer.writeU16(user.uid);
    writer.writeU8(static_cast<uint8_t>(user.privilege));

    if (recordSize == kCompactUserRecordSize) {
        writer.writeFixedString(user.password, 5);
        writer.writeFixedString(user.name, 8);
        writer.writeU32(user.card);
        writer.pad(1);
        writer.writeU8(static_cast<uint8_t>(numericOrZero(user.groupId)));
        writer.writeU16(0);  // timezone
        writer.writeU32(numericOrZero(user.userId));
        return writer.take();
    }

    writer.writeFixedString(user.password, 8);
    writer.writeFixedString(user.name, 24);
    writer.writeU32(user.card);
    writer.pad(1);
    writer.writeFixedString(user.groupId, 7);
    writer.pad(1);
    writer.writeFixedString(user.userId, 24);
    return writer.take();
}

Result<UserRecord> decodeUser(const uint8_t* data, size_t length, size_t recordSize) {
    if (recordSize != kUserRecordSize && recordSize != kCompactUserRecordSize) {
        return makeError(ErrorCode::MalformedRecord, fmt::format("unsupported user layout {}", recordSize));
    }
    if (length < recordSize) {
        return slotError("user", length, recordSize);
    }

    BufferReader reader(data, recordSize);
    UserRecord user;
    user.uid = reader.readU16();
    user.privilege = static_cast<Privilege>(reader.readU8());

    if (recordSize == kCompactUserRecordSize) {
        user.password = reader.readFixedString(5);
        user.name = reader.readFixedString(8);
        user.card = reader.readU32();
        reader.skip(1);
        uint8_t group = reader.readU8();
        reader.skip(2);  // timezone
        user.userId = std::to_string(reader.readU32());
        if (group != 0) {
            user.groupId = std::to_string(group);
        }
        return user;
    }

    user.password = reader.readFixedString(8);
    user.name = reader.readFixedString(24);
    user.card = reader.readU32();
    reader.skip(1);
    user.groupId = reader.readFixedString(7);
    reader.skip(1);
    user.userId = reader.readFixedString(24);
    return user;
}

Result<std::vector<UserRecord>> decodeUsers(const Bytes& data, size_t recordSize) {
    if (recordSize == 0) {
        return makeError(ErrorCode::MalformedRecord, "zero record width");
    }

    std::vector<UserRecord> users;
    users.reserve(data.size() / recordSize);

    size_t offset = 0;
    while (offset < data.size()) {
        auto user = decodeUser(data.data() + offset, data.size() - offset, recordSize);
        if (!user) {
            return user.error();
        }
        users.push_back(user.take());
        offset += recordSize;
    }
    return users;
}

// =============================================================================
// Attendance
// =============================================================================

bool AttendanceRecord::operator==(const AttendanceRecord& other) const {
    return uid == other.uid && userId == other.userId && timestamp == other.timestamp &&
           status == other.status && punch == other.punch;
}

Bytes encodeAttendance(const AttendanceRecord& record, size_t recordSize) {
    BufferWriter writer(recordSize);

    switch (recordSize) {
        case kTinyAttendanceRecordSize:
            writer.writeU16(record.uid);
            writer.writeU8(static_cast<uint8_t>(record.status));
            writer.writeU32(encodeTime(record.timestamp));
            writer.writeU8(static_cast<uint8_t>(record.punch));
            break;

        case kShortAttendanceRecordSize:
            writer.writeU32(numericOrZero(record.userId));
            writer.writeU32(encodeTime(record.timestamp));
            writer.writeU8(static_cast<uint8_t>(record.status));
            writer.writeU8(static_cast<uint8_t>(record.punch));
            writer.pad(2);
            writer.writeU32(0);  // work code
            break;

        default:
            writer.writeU16(record.uid);
            writer.writeFixedString(record.userId, 24);
            writer.writeU8(static_cast<uint8_t>(record.status));
            writer.writeU32(encodeTime(record.timestamp));
            writer.writeU8(static_cast<uint8_t>(record.punch));
            writer.pad(8);
            break;
    }
    return writer.take();
}

Result<std::vector<AttendanceRecord>> decodeAttendance(const Bytes& data, size_t recordSize) {
    if (recordSize != kAttendanceRecordSize &&
        recordSize != kShortAttendanceRecordSize &&
        recordSize != kTinyAttendanceRecordSize) {
        return makeError(ErrorCode::MalformedRecord,
                         fmt::format("unsupported attendance layout {}", recordSize));
    }

    std::vector<AttendanceRecord> records;
    records.reserve(data.size() / recordSize);

    size_t offset = 0;
    while (offset < data.size()) {
        size_t available = data.size() - offset;
        if (available < recordSize) {
            return slotError("attendance", available, recordSize);
        }

        BufferReader reader(data.data() + offset, recordSize);
        AttendanceRecord record;

        if (recordSize == kTinyAttendanceRecordSize) {
            record.uid = reader.readU16();
            record.status = static_cast<VerifyMode>(reader.readU8());
            record.timestamp = decodeTime(reader.readU32());
            record.punch = static_cast<PunchType>(reader.readU8());
            record.userId = std::to_string(record.uid);
        }
        else if (recordSize == kShortAttendanceRecordSize) {
            record.userId = std::to_string(reader.readU32());
            record.timestamp = decodeTime(reader.readU32());
            record.status = static_cast<VerifyMode>(reader.readU8());
            record.punch = static_cast<PunchType>(reader.readU8());
        }
        else {
            record.uid = reader.readU16();
            record.userId = reader.readFixedString(24);
            record.status = static_cast<VerifyMode>(reader.readU8());
            record.timestamp = decodeTime(reader.readU32());
            record.punch = static_cast<PunchType>(reader.readU8());
        }

        records.push_back(std::move(record));
        offset += recordSize;
    }
    return records;
}

// =============================================================================
// Fingerprint templates
// =============================================================================

bool TemplateRecord::operator==(const TemplateRecord& other) const {
    return uid == other.uid && fingerIndex == other.fingerIndex &&
           valid == other.valid && data == other.data;
}

Result<Bytes> encodeTemplate(const TemplateRecord& record) {
    if (record.data.size() > kMaxTemplateSize) {
        return makeError(ErrorCode::MalformedRecord,
                         fmt::format("template of {} bytes exceeds the {} byte slot limit",
                                     record.data.size(), kMaxTemplateSize));
    }

    BufferWriter writer(kTemplateHeaderSize + record.data.size());
    writer.writeU16(static_cast<uint16_t>(record.data.size() + kTemplateHeaderSize));
    writer.writeU16(record.uid);
    writer.writeU8(record.fingerIndex);
    writer.writeU8(record.valid ? 1 : 0);
    writer.writeBytes(record.data);
    return writer.take();
}

namespace {

Result<TemplateRecord> decodeTemplateAt(const Bytes& data, size_t offset, size_t& slotSize) {
    size_t available = data.size() - offset;
    if (available < kTemplateHeaderSize) {
        return slotError("template header", available, kTemplateHeaderSize);
    }

    BufferReader reader(data.data() + offset, available);
    uint16_t size = reader.readU16();
    if (size < kTemplateHeaderSize) {
        return makeError(ErrorCode::MalformedRecord,
                         fmt::format("template declares {} bytes, less than its header", size));
    }
    if (size > available) {
        return slotError("template", available, size);
    }

    TemplateRecord record;
    record.uid = reader.readU16();
    record.fingerIndex = reader.readU8();
    record.valid = reader.readU8() != 0;
    record.data = reader.readBytes(size - kTemplateHeaderSize);

    if (record.fingerIndex > kMaxFingerIndex) {
        return makeError(ErrorCode::MalformedRecord,
                         fmt::format("finger index {} out of range", record.fingerIndex));
    }

    slotSize = size;
    return record;
}

} // namespace

Result<TemplateRecord> decodeTemplate(const Bytes& data) {
    size_t slotSize = 0;
    return decodeTemplateAt(data, 0, slotSize);
}

Result<std::vector<TemplateRecord>> decodeTemplates(const Bytes& data) {
    std::vector<TemplateRecord> templates;

    size_t offset = 0;
    while (offset < data.size()) {
        size_t slotSize = 0;
        auto record = decodeTemplateAt(data, offset, slotSize);
        if (!record) {
            return record.error();
        }
        templates.push_back(record.take());
        offset += slotSize;
    }
    return templates;
}

// =============================================================================
// Data sets and bulk uploads
// =============================================================================

Bytes wrapDataSet(const Bytes& records) {
    BufferWriter writer(records.size() + 4);
    writer.writeU32(static_cast<uint32_t>(records.size()));
    writer.writeBytes(records);
    return writer.take();
}

Result<Bytes> unwrapDataSet(const Bytes& data) {
    if (data.size() < 4) {
        return slotError("data set header", data.size(), 4);
    }

    BufferReader reader(data);
    uint32_t declared = reader.readU32();
    if (declared > reader.remaining()) {
        return makeError(ErrorCode::MalformedRecord,
                         fmt::format("data set declares {} bytes, only {} present",
                                     declared, reader.remaining()));
    }
    return reader.readBytes(declared);
}

namespace {

constexpr size_t kUploadHeaderSize = 12;
constexpr size_t kUploadTableEntrySize = 8;
constexpr uint8_t kUploadEntryType = 2;
constexpr uint8_t kUploadFingerBase = 0x10;

struct TableEntry {
    uint16_t uid;
    uint8_t finger;
    uint32_t offset;
};

} // namespace

Bytes encodeTemplateUpload(const std::vector<UserTemplates>& entries) {
    BufferWriter users;
    BufferWriter table;
    BufferWriter templates;

    for (const auto& entry : entries) {
        users.writeBytes(encodeUser(entry.user, kUserRecordSize));
        for (const auto& tmpl : entry.templates) {
            table.writeU8(kUploadEntryType);
            table.writeU16(entry.user.uid);
            table.writeU8(static_cast<uint8_t>(kUploadFingerBase + tmpl.fingerIndex));
            table.writeU32(static_cast<uint32_t>(templates.size()));
            templates.writeBytes(tmpl.data);
        }
    }

    BufferWriter writer(kUploadHeaderSize + users.size() + table.size() + templates.size());
    writer.writeU32(static_cast<uint32_t>(users.size()));
    writer.writeU32(static_cast<uint32_t>(table.size()));
    writer.writeU32(static_cast<uint32_t>(templates.size()));
    writer.writeBytes(users.data());
    writer.writeBytes(table.data());
    writer.writeBytes(templates.data());
    return writer.take();
}

Result<std::vector<UserTemplates>> decodeTemplateUpload(const Bytes& data) {
    if (data.size() < kUploadHeaderSize) {
        return slotError("upload header", data.size(), kUploadHeaderSize);
    }

    BufferReader reader(data);
    uint32_t userBlock = reader.readU32();
    uint32_t tableBlock = reader.readU32();
    uint32_t templateBlock = reader.readU32();

    uint64_t declared = static_cast<uint64_t>(userBlock) + tableBlock + templateBlock;
    if (declared > reader.remaining()) {
        return makeError(ErrorCode::MalformedRecord,
                         fmt::format("upload declares {} bytes, only {} present",
                                     declared, reader.remaining()));
    }
    if (userBlock % kUserRecordSize != 0 || tableBlock % kUploadTableEntrySize != 0) {
        return makeError(ErrorCode::MalformedRecord, "upload blocks are not whole records");
    }

    auto users = decodeUsers(reader.readBytes(userBlock), kUserRecordSize);
    if (!users) {
        return users.error();
    }

    std::vector<TableEntry> entries;
    for (uint32_t i = 0; i < tableBlock / kUploadTableEntrySize; i++) {
        if (reader.readU8() != kUploadEntryType) {
            return makeError(ErrorCode::MalformedRecord, "unexpected finger table entry type");
        }
        TableEntry entry;
        entry.uid = reader.readU16();
        uint8_t finger = reader.readU8();
        entry.offset = reader.readU32();
        if (finger < kUploadFingerBase || finger - kUploadFingerBase > kMaxFingerIndex) {
            return makeError(ErrorCode::MalformedRecord,
                             fmt::format("finger table index 0x{:02X} out of range", finger));
        }
        entry.finger = static_cast<uint8_t>(finger - kUploadFingerBase);
        if (entry.offset > templateBlock) {
            return makeError(ErrorCode::MalformedRecord, "finger table offset past template block");
        }
        entries.push_back(entry);
    }

    Bytes templateBytes = reader.readBytes(templateBlock);

    // Template length runs to the next offset in the block
    std::vector<uint32_t> offsets;
    for (const auto& entry : entries) {
        offsets.push_back(entry.offset);
    }
    offsets.push_back(templateBlock);
    std::sort(offsets.begin(), offsets.end());

    std::vector<UserTemplates> result;
    std::map<uint16_t, size_t> byUid;
    for (auto& user : users.value()) {
        byUid[user.uid] = result.size();
        result.push_back(UserTemplates{user, {}});
    }

    for (const auto& entry : entries) {
        auto it = byUid.find(entry.uid);
        if (it == byUid.end()) {
            return makeError(ErrorCode::MalformedRecord,
                             fmt::format("template for uid {} without a user record", entry.uid));
        }
        auto next = std::upper_bound(offsets.begin(), offsets.end(), entry.offset);
        uint32_t end = next == offsets.end() ? templateBlock : *next;
        if (end - entry.offset > kMaxTemplateSize) {
            return makeError(ErrorCode::MalformedRecord,
                             fmt::format("template for uid {} finger {} is {} bytes, limit {}",
                                         entry.uid, entry.finger, end - entry.offset, kMaxTemplateSize));
        }

        TemplateRecord tmpl;
        tmpl.uid = entry.uid;
        tmpl.fingerIndex = entry.finger;
        tmpl.valid = true;
        tmpl.data.assign(templateBytes.begin() + entry.offset, templateBytes.begin() + end);
        result[it->second].templates.push_back(std::move(tmpl));
    }

    return result;
}

} // namespace zkemu::protocol
