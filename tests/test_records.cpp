#include "test_framework.hpp"
#include "zkemu/protocol/commkey.hpp"
#include "zkemu/protocol/records.hpp"
#include "zkemu/utils/buffer.hpp"
#include "zkemu/utils/crypto.hpp"

namespace record_tests {

using zkemu::ErrorCode;
using zkemu::protocol::AttendanceRecord;
using zkemu::protocol::Bytes;
using zkemu::protocol::DateTime;
using zkemu::protocol::Privilege;
using zkemu::protocol::PunchType;
using zkemu::protocol::TemplateRecord;
using zkemu::protocol::UserRecord;
using zkemu::protocol::UserTemplates;
using zkemu::protocol::VerifyMode;

UserRecord sampleUser(uint16_t uid, const std::string& name) {
    UserRecord user;
    user.uid = uid;
    user.name = name;
    user.userId = std::to_string(uid);
    return user;
}

TemplateRecord sampleTemplate(uint16_t uid, uint8_t finger, size_t size, uint8_t fill) {
    TemplateRecord record;
    record.uid = uid;
    record.fingerIndex = finger;
    record.data.assign(size, fill);
    return record;
}

} // namespace record_tests

// =============================================================================
// Packed time
// =============================================================================

TEST(Time_Golden) {
    using namespace record_tests;
    ASSERT_EQ(zkemu::protocol::encodeTime(DateTime{2024, 3, 15, 8, 30, 5}), 777976205u);
    ASSERT_EQ(zkemu::protocol::encodeTime(DateTime{2000, 1, 1, 0, 0, 0}), 0u);

    auto decoded = zkemu::protocol::decodeTime(777976205u);
    ASSERT_TRUE(decoded == (DateTime{2024, 3, 15, 8, 30, 5}));
    ASSERT_STREQ(decoded.toString(), "2024-03-15 08:30:05");

    auto epoch = zkemu::protocol::decodeTime(0);
    ASSERT_STREQ(epoch.toString(), "2000-01-01 00:00:00");
    PASS();
}

TEST(Time_EndOfMonthAndYear) {
    using namespace record_tests;
    DateTime lastSecond{2023, 12, 31, 23, 59, 59};
    auto packed = zkemu::protocol::encodeTime(lastSecond);
    ASSERT_TRUE(zkemu::protocol::decodeTime(packed) == lastSecond);
    ASSERT_TRUE(zkemu::protocol::decodeTime(packed + 1) == (DateTime{2024, 1, 1, 0, 0, 0}));
    PASS();
}

TEST(Time_Validity) {
    using namespace record_tests;
    ASSERT_TRUE((DateTime{2024, 2, 29, 12, 0, 0}).isValid());
    ASSERT_FALSE((DateTime{1999, 12, 31, 0, 0, 0}).isValid());
    ASSERT_FALSE((DateTime{2024, 13, 1, 0, 0, 0}).isValid());
    ASSERT_FALSE((DateTime{2024, 1, 1, 24, 0, 0}).isValid());
    PASS();
}

// =============================================================================
// Users
// =============================================================================

TEST(User_EncodeLayout72) {
    using namespace record_tests;
    UserRecord user;
    user.uid = 0x0102;
    user.privilege = Privilege::Admin;
    user.password = "12345";
    user.name = "User001";
    user.card = 123456;
    user.groupId = "1";
    user.userId = "A-17";

    auto slot = zkemu::protocol::encodeUser(user);
    ASSERT_EQ(slot.size(), 72u);
    ASSERT_EQ(slot[0], 0x02);
    ASSERT_EQ(slot[1], 0x01);
    ASSERT_EQ(slot[2], 14);
    ASSERT_EQ(slot[3], '1');
    ASSERT_EQ(slot[11], 'U');

    zkemu::utils::BufferReader reader(slot.data() + 35, 4);
    ASSERT_EQ(reader.readU32(), 123456u);
    ASSERT_EQ(slot[40], '1');
    ASSERT_EQ(slot[48], 'A');
    ASSERT_EQ(slot[51], '7');
    ASSERT_EQ(slot[52], 0);

    auto decoded = zkemu::protocol::decodeUsers(slot);
    ASSERT_OK(decoded);
    ASSERT_EQ(decoded.value().size(), 1u);
    ASSERT_TRUE(decoded.value()[0] == user);
    PASS();
}

TEST(User_DecodeThreeRecords) {
    using namespace record_tests;
    Bytes table;
    for (uint16_t uid = 1; uid <= 3; uid++) {
        auto slot = zkemu::protocol::encodeUser(sampleUser(uid, "User" + std::to_string(uid)));
        table.insert(table.end(), slot.begin(), slot.end());
    }

    auto users = zkemu::protocol::decodeUsers(table);
    ASSERT_OK(users);
    ASSERT_EQ(users.value().size(), 3u);
    for (uint16_t i = 0; i < 3; i++) {
        ASSERT_EQ(users.value()[i].uid, i + 1);
        ASSERT_STREQ(users.value()[i].name, "User" + std::to_string(i + 1));
    }
    PASS();
}

TEST(User_ShortSlotIsMalformed) {
    using namespace record_tests;
    auto slot = zkemu::protocol::encodeUser(sampleUser(7, "Short"));
    slot.resize(60);
    ASSERT_ERROR(zkemu::protocol::decodeUsers(slot), ErrorCode::MalformedRecord);

    // One whole record followed by a partial one
    auto table = zkemu::protocol::encodeUser(sampleUser(8, "Whole"));
    table.insert(table.end(), 10, 0);
    ASSERT_ERROR(zkemu::protocol::decodeUsers(table), ErrorCode::MalformedRecord);
    PASS();
}

TEST(User_CompactLayout28) {
    using namespace record_tests;
    UserRecord user;
    user.uid = 12;
    user.password = "987";
    user.name = "Kiosk";
    user.card = 55;
    user.groupId = "3";
    user.userId = "4021";

    ASSERT_OK(zkemu::protocol::validateUser(user, zkemu::protocol::kCompactUserRecordSize));
    auto slot = zkemu::protocol::encodeUser(user, zkemu::protocol::kCompactUserRecordSize);
    ASSERT_EQ(slot.size(), 28u);

    auto decoded = zkemu::protocol::decodeUsers(slot, zkemu::protocol::kCompactUserRecordSize);
    ASSERT_OK(decoded);
    ASSERT_TRUE(decoded.value()[0] == user);

    user.userId = "not-a-number";
    ASSERT_ERROR(zkemu::protocol::validateUser(user, zkemu::protocol::kCompactUserRecordSize),
                 ErrorCode::MalformedRecord);
    PASS();
}

TEST(User_FieldLimits) {
    using namespace record_tests;
    UserRecord user = sampleUser(1, std::string(25, 'x'));
    ASSERT_ERROR(zkemu::protocol::validateUser(user), ErrorCode::MalformedRecord);

    user.name = std::string(24, 'x');
    ASSERT_OK(zkemu::protocol::validateUser(user));

    user.password = "123456789";
    ASSERT_ERROR(zkemu::protocol::validateUser(user), ErrorCode::MalformedRecord);
    PASS();
}

// =============================================================================
// Attendance
// =============================================================================

TEST(Attendance_AllLayouts) {
    using namespace record_tests;
    AttendanceRecord record;
    record.uid = 2;
    record.userId = "2";
    record.timestamp = DateTime{2024, 3, 15, 8, 30, 5};
    record.status = VerifyMode::Card;
    record.punch = PunchType::CheckOut;

    for (size_t width : {zkemu::protocol::kAttendanceRecordSize,
                         zkemu::protocol::kShortAttendanceRecordSize,
                         zkemu::protocol::kTinyAttendanceRecordSize}) {
        auto slot = zkemu::protocol::encodeAttendance(record, width);
        ASSERT_EQ(slot.size(), width);

        auto decoded = zkemu::protocol::decodeAttendance(slot, width);
        ASSERT_OK(decoded);
        ASSERT_EQ(decoded.value().size(), 1u);
        ASSERT_STREQ(decoded.value()[0].userId, "2");
        ASSERT_TRUE(decoded.value()[0].timestamp == record.timestamp);
        ASSERT_TRUE(decoded.value()[0].status == VerifyMode::Card);
        ASSERT_TRUE(decoded.value()[0].punch == PunchType::CheckOut);
    }
    PASS();
}

TEST(Attendance_Layout40Offsets) {
    using namespace record_tests;
    AttendanceRecord record;
    record.uid = 3;
    record.userId = "3";
    record.timestamp = DateTime{2024, 3, 15, 8, 30, 5};

    auto slot = zkemu::protocol::encodeAttendance(record);
    ASSERT_EQ(slot[0], 3);
    ASSERT_EQ(slot[2], '3');
    zkemu::utils::BufferReader reader(slot.data() + 27, 4);
    ASSERT_EQ(reader.readU32(), 777976205u);
    PASS();
}

TEST(Attendance_TruncatedTable) {
    using namespace record_tests;
    AttendanceRecord record;
    auto slot = zkemu::protocol::encodeAttendance(record);
    slot.pop_back();
    ASSERT_ERROR(zkemu::protocol::decodeAttendance(slot), ErrorCode::MalformedRecord);
    ASSERT_ERROR(zkemu::protocol::decodeAttendance(slot, 12), ErrorCode::MalformedRecord);
    PASS();
}

// =============================================================================
// Templates
// =============================================================================

TEST(Template_SlotsOfDifferentSizes) {
    using namespace record_tests;
    Bytes table;
    auto first = zkemu::protocol::encodeTemplate(sampleTemplate(1, 0, 10, 0xaa));
    auto second = zkemu::protocol::encodeTemplate(sampleTemplate(1, 6, 513, 0xbb));
    ASSERT_OK(first);
    ASSERT_OK(second);
    table.insert(table.end(), first.value().begin(), first.value().end());
    table.insert(table.end(), second.value().begin(), second.value().end());

    ASSERT_EQ(first.value()[0], 16);   // size counts the 6 byte header
    ASSERT_EQ(first.value()[1], 0);

    auto templates = zkemu::protocol::decodeTemplates(table);
    ASSERT_OK(templates);
    ASSERT_EQ(templates.value().size(), 2u);
    ASSERT_EQ(templates.value()[1].fingerIndex, 6);
    ASSERT_EQ(templates.value()[1].data.size(), 513u);
    ASSERT_TRUE(templates.value()[1].valid);
    PASS();
}

TEST(Template_DeclaredSizeBeyondData) {
    using namespace record_tests;
    auto encoded = zkemu::protocol::encodeTemplate(sampleTemplate(4, 2, 40, 0x11));
    ASSERT_OK(encoded);
    Bytes slot = encoded.take();
    slot.resize(30);
    ASSERT_ERROR(zkemu::protocol::decodeTemplates(slot), ErrorCode::MalformedRecord);

    Bytes header = {0x03, 0x00, 0x01, 0x00, 0x00, 0x01};
    ASSERT_ERROR(zkemu::protocol::decodeTemplate(header), ErrorCode::MalformedRecord);
    PASS();
}

TEST(Template_SizeFieldLimit) {
    using namespace record_tests;
    const size_t limit = zkemu::protocol::kMaxTemplateSize;

    // Largest template still fits the u16 slot size
    auto largest = zkemu::protocol::encodeTemplate(sampleTemplate(2, 1, limit, 0x5a));
    ASSERT_OK(largest);
    ASSERT_EQ(largest.value()[0], 0xFF);
    ASSERT_EQ(largest.value()[1], 0xFF);

    auto small = zkemu::protocol::encodeTemplate(sampleTemplate(2, 2, 10, 0x11));
    ASSERT_OK(small);
    Bytes table = largest.take();
    table.insert(table.end(), small.value().begin(), small.value().end());
    auto decoded = zkemu::protocol::decodeTemplates(table);
    ASSERT_OK(decoded);
    ASSERT_EQ(decoded.value().size(), 2u);
    ASSERT_EQ(decoded.value()[0].data.size(), limit);
    ASSERT_EQ(decoded.value()[1].data.size(), 10u);

    ASSERT_ERROR(zkemu::protocol::encodeTemplate(sampleTemplate(2, 1, limit + 1, 0x5a)),
                 ErrorCode::MalformedRecord);
    ASSERT_ERROR(zkemu::protocol::encodeTemplate(sampleTemplate(2, 1, 65530, 0x5a)),
                 ErrorCode::MalformedRecord);
    PASS();
}

TEST(TemplateUpload_OversizeTemplateRejected) {
    using namespace record_tests;
    UserTemplates carol{sampleUser(7, "Carol"),
                        {sampleTemplate(7, 0, zkemu::protocol::kMaxTemplateSize + 1, 0x33)}};
    auto buffer = zkemu::protocol::encodeTemplateUpload({carol});
    ASSERT_ERROR(zkemu::protocol::decodeTemplateUpload(buffer), ErrorCode::MalformedRecord);
    PASS();
}

TEST(DataSet_SizeHeader) {
    using namespace record_tests;
    auto wrapped = zkemu::protocol::wrapDataSet(Bytes{1, 2, 3});
    ASSERT_STREQ(zkemu::utils::Crypto::toHex(wrapped), "03000000010203");

    auto unwrapped = zkemu::protocol::unwrapDataSet(wrapped);
    ASSERT_OK(unwrapped);
    ASSERT_EQ(unwrapped.value().size(), 3u);

    wrapped.pop_back();
    ASSERT_ERROR(zkemu::protocol::unwrapDataSet(wrapped), ErrorCode::MalformedRecord);
    ASSERT_ERROR(zkemu::protocol::unwrapDataSet(Bytes{1, 0}), ErrorCode::MalformedRecord);
    PASS();
}

TEST(TemplateUpload_Layout) {
    using namespace record_tests;
    UserTemplates alice{sampleUser(5, "Alice"), {sampleTemplate(5, 0, 20, 0x01), sampleTemplate(5, 3, 30, 0x02)}};
    UserTemplates bob{sampleUser(6, "Bob"), {}};

    auto buffer = zkemu::protocol::encodeTemplateUpload({alice, bob});
    zkemu::utils::BufferReader reader(buffer);
    ASSERT_EQ(reader.readU32(), 144u);   // two 72 byte users
    ASSERT_EQ(reader.readU32(), 16u);    // two table entries
    ASSERT_EQ(reader.readU32(), 50u);
    ASSERT_EQ(buffer.size(), 12u + 144u + 16u + 50u);

    // Second table entry: type 2, uid 5, finger 0x13, offset 20
    size_t entry = 12 + 144 + 8;
    ASSERT_EQ(buffer[entry], 2);
    ASSERT_EQ(buffer[entry + 1], 5);
    ASSERT_EQ(buffer[entry + 3], 0x13);
    ASSERT_EQ(buffer[entry + 4], 20);

    auto decoded = zkemu::protocol::decodeTemplateUpload(buffer);
    ASSERT_OK(decoded);
    ASSERT_EQ(decoded.value().size(), 2u);
    ASSERT_EQ(decoded.value()[0].templates.size(), 2u);
    ASSERT_EQ(decoded.value()[0].templates[1].fingerIndex, 3);
    ASSERT_EQ(decoded.value()[0].templates[1].data.size(), 30u);
    ASSERT_TRUE(decoded.value()[1].templates.empty());
    PASS();
}

TEST(TemplateUpload_Inconsistent) {
    using namespace record_tests;
    UserTemplates alice{sampleUser(5, "Alice"), {sampleTemplate(5, 0, 20, 0x01)}};
    auto buffer = zkemu::protocol::encodeTemplateUpload({alice});

    Bytes truncated(buffer.begin(), buffer.end() - 1);
    ASSERT_ERROR(zkemu::protocol::decodeTemplateUpload(truncated), ErrorCode::MalformedRecord);

    // Table entry pointing at a uid with no user record
    Bytes orphan = buffer;
    orphan[12 + 72 + 1] = 9;
    ASSERT_ERROR(zkemu::protocol::decodeTemplateUpload(orphan), ErrorCode::MalformedRecord);
    PASS();
}

// =============================================================================
// Communication key
// =============================================================================

TEST(CommKey_Golden) {
    using namespace record_tests;
    auto key = zkemu::protocol::makeCommKey(12345, 0x1234);
    ASSERT_STREQ(zkemu::utils::Crypto::toHex(key.data(), key.size()), "6de1326b");

    auto zero = zkemu::protocol::makeCommKey(0, 1);
    ASSERT_STREQ(zkemu::utils::Crypto::toHex(zero.data(), zero.size()), "617d3279");

    auto one = zkemu::protocol::makeCommKey(1, 100);
    ASSERT_STREQ(zkemu::utils::Crypto::toHex(one.data(), one.size()), "61fd3279");
    PASS();
}

TEST(CommKey_Verify) {
    using namespace record_tests;
    auto key = zkemu::protocol::makeCommKey(12345, 0x1234, 77);
    ASSERT_EQ(key[2], 77);
    ASSERT_TRUE(zkemu::protocol::verifyCommKey(key, 12345, 0x1234));
    ASSERT_FALSE(zkemu::protocol::verifyCommKey(key, 12346, 0x1234));
    ASSERT_FALSE(zkemu::protocol::verifyCommKey(key, 12345, 0x1334));
    PASS();
}
