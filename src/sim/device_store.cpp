#include "zkemu/sim/device_store.hpp"
#include "zkemu/utils/buffer.hpp"
#include "zkemu/utils/crypto.hpp"
#include "zkemu/utils/logger.hpp"

#include <algorithm>
#include <ctime>
#include <stdexcept>

namespace zkemu::sim {

using protocol::AttendanceRecord;
using protocol::DateTime;
using protocol::TemplateRecord;
using protocol::UserRecord;

DeviceStore::DeviceStore(SimulatorConfig config)
    : m_config(std::move(config))
{
    m_options = {
        {"~SerialNumber", m_config.serial_number},
        {"~Platform", m_config.platform},
        {"~DeviceName", m_config.device_name},
        {"MAC", m_config.mac_address},
        {"IPAddress", m_config.ip_address},
        {"NetMask", m_config.netmask},
        {"GATEIPAddress", m_config.gateway},
        {"ZKFaceVersion", "0"},
        {"~ZKFPVersion", "10"},
        {"~ExtendFmt", "0"},
        {"~UserExtFmt", "0"},
        {"FaceFunOn", "0"},
        {"CompatOldFirmware", "0"},
    };
}

void DeviceStore::seedDefaults() {
    UserRecord admin;
    admin.uid = 1;
    admin.privilege = protocol::Privilege::Admin;
    admin.name = "Admin";
    admin.userId = "1";

    UserRecord first;
    first.uid = 2;
    first.password = "12345";
    first.name = "User001";
    first.card = 123456;
    first.userId = "2";

    UserRecord second;
    second.uid = 3;
    second.name = "User002";
    second.card = 234567;
    second.userId = "3";

    putUser(admin);
    putUser(first);
    putUser(second);

    if (!m_config.seed_demo_data) {
        return;
    }

    auto punch = [this](const UserRecord& user, DateTime when, protocol::VerifyMode status,
                        protocol::PunchType type) {
        AttendanceRecord record;
        record.uid = user.uid;
        record.userId = user.userId;
        record.timestamp = when;
        record.status = status;
        record.punch = type;
        appendAttendance(record);
    };

    punch(first, DateTime{2024, 3, 15, 8, 30, 5}, protocol::VerifyMode::Fingerprint, protocol::PunchType::CheckIn);
    punch(second, DateTime{2024, 3, 15, 8, 41, 12}, protocol::VerifyMode::Card, protocol::PunchType::CheckIn);
    punch(first, DateTime{2024, 3, 15, 17, 2, 48}, protocol::VerifyMode::Fingerprint, protocol::PunchType::CheckOut);
    punch(second, DateTime{2024, 3, 15, 17, 15, 0}, protocol::VerifyMode::Password, protocol::PunchType::CheckOut);

    LOG_DEBUG("[Store] Seeded {} users and {} punches", m_users.size(), m_attendance.size());
}

// =============================================================================
// Sessions
// =============================================================================

uint16_t DeviceStore::openSession() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_sessions.size() >= 0xFFFF) {
        throw std::runtime_error("session table full");
    }

    uint16_t id = utils::Crypto::randomNonZeroU16();
    while (m_sessions.count(id) != 0) {
        id = utils::Crypto::randomNonZeroU16();
    }
    m_sessions.insert(id);
    return id;
}

void DeviceStore::closeSession(uint16_t sessionId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sessions.erase(sessionId);
}

size_t DeviceStore::liveSessions() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.size();
}

// =============================================================================
// Options and clock
// =============================================================================

std::optional<std::string> DeviceStore::option(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_options.find(name);
    if (it == m_options.end()) {
        return std::nullopt;
    }
    return it->second;
}

void DeviceStore::setOption(const std::string& name, const std::string& value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_options[name] = value;
}

DateTime DeviceStore::time() const {
    std::chrono::seconds offset;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        offset = m_clockOffset;
    }

    std::time_t raw = std::time(nullptr) + static_cast<std::time_t>(offset.count());
    std::tm local{};
    localtime_r(&raw, &local);
    return DateTime::fromTm(local);
}

void DeviceStore::setTime(const DateTime& time) {
    std::tm wanted{};
    wanted.tm_year = time.year - 1900;
    wanted.tm_mon = time.month - 1;
    wanted.tm_mday = time.day;
    wanted.tm_hour = time.hour;
    wanted.tm_min = time.minute;
    wanted.tm_sec = time.second;
    wanted.tm_isdst = -1;

    std::time_t target = std::mktime(&wanted);
    std::time_t now = std::time(nullptr);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_clockOffset = std::chrono::seconds(static_cast<long long>(target - now));
}

// =============================================================================
// Users and templates
// =============================================================================

std::vector<UserRecord> DeviceStore::users() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<UserRecord> users;
    users.reserve(m_users.size());
    for (const auto& [uid, user] : m_users) {
        users.push_back(user);
    }
    return users;
}

std::optional<UserRecord> DeviceStore::findUser(uint16_t uid) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_users.find(uid);
    if (it == m_users.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool DeviceStore::putUser(const UserRecord& user) {
    std::lock_guard<std::mutex> lock(m_mutex);
    bool exists = m_users.count(user.uid) != 0;
    if (!exists && static_cast<int32_t>(m_users.size()) >= m_config.user_capacity) {
        return false;
    }
    m_users[user.uid] = user;
    return true;
}

bool DeviceStore::removeUser(uint16_t uid) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_users.erase(uid) == 0) {
        return false;
    }
    m_templates.erase(std::remove_if(m_templates.begin(), m_templates.end(),
                                     [uid](const TemplateRecord& t) { return t.uid == uid; }),
                      m_templates.end());
    return true;
}

std::vector<TemplateRecord> DeviceStore::templates() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_templates;
}

std::optional<TemplateRecord> DeviceStore::findTemplate(uint16_t uid, uint8_t fingerIndex) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& record : m_templates) {
        if (record.uid == uid && record.fingerIndex == fingerIndex) {
            return record;
        }
    }
    return std::nullopt;
}

bool DeviceStore::putTemplate(const TemplateRecord& record) {
    if (record.data.size() > protocol::kMaxTemplateSize) {
        LOG_WARN("[Store] Template uid={} finger={} of {} bytes refused",
                 record.uid, record.fingerIndex, record.data.size());
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& existing : m_templates) {
        if (existing.uid == record.uid && existing.fingerIndex == record.fingerIndex) {
            existing = record;
            return true;
        }
    }
    if (static_cast<int32_t>(m_templates.size()) >= m_config.finger_capacity) {
        return false;
    }
    m_templates.push_back(record);
    return true;
}

bool DeviceStore::removeTemplate(uint16_t uid, uint8_t fingerIndex) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto before = m_templates.size();
    m_templates.erase(std::remove_if(m_templates.begin(), m_templates.end(),
                                     [&](const TemplateRecord& t) {
                                         return t.uid == uid && t.fingerIndex == fingerIndex;
                                     }),
                      m_templates.end());
    return m_templates.size() != before;
}

// =============================================================================
// Attendance
// =============================================================================

std::vector<AttendanceRecord> DeviceStore::attendance() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_attendance;
}

bool DeviceStore::appendAttendance(const AttendanceRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (static_cast<int32_t>(m_attendance.size()) >= m_config.record_capacity) {
        return false;
    }
    m_attendance.push_back(record);
    return true;
}

void DeviceStore::clearAttendance() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_attendance.clear();
}

void DeviceStore::clearAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_users.clear();
    m_templates.clear();
    m_attendance.clear();
}

// =============================================================================
// Data sets
// =============================================================================

Bytes DeviceStore::userTable() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    utils::BufferWriter records(m_users.size() * protocol::kUserRecordSize);
    for (const auto& [uid, user] : m_users) {
        records.writeBytes(protocol::encodeUser(user));
    }
    return protocol::wrapDataSet(records.data());
}

Bytes DeviceStore::templateTable() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    utils::BufferWriter records;
    for (const auto& record : m_templates) {
        // putTemplate keeps every stored template within the slot limit
        auto slot = protocol::encodeTemplate(record);
        if (!slot) {
            throw std::logic_error(slot.error().describe());
        }
        records.writeBytes(slot.value());
    }
    return protocol::wrapDataSet(records.data());
}

Bytes DeviceStore::attendanceTable() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    utils::BufferWriter records(m_attendance.size() * protocol::kAttendanceRecordSize);
    for (const auto& record : m_attendance) {
        records.writeBytes(protocol::encodeAttendance(record));
    }
    return protocol::wrapDataSet(records.data());
}

Bytes DeviceStore::freeSizes() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto users = static_cast<int32_t>(m_users.size());
    auto fingers = static_cast<int32_t>(m_templates.size());
    auto records = static_cast<int32_t>(m_attendance.size());

    int32_t fields[20] = {};
    fields[4] = users;
    fields[6] = fingers;
    fields[8] = records;
    fields[14] = m_config.finger_capacity;
    fields[15] = m_config.user_capacity;
    fields[16] = m_config.record_capacity;
    fields[17] = m_config.finger_capacity - fingers;
    fields[18] = m_config.user_capacity - users;
    fields[19] = m_config.record_capacity - records;

    utils::BufferWriter writer(92);
    for (int32_t field : fields) {
        writer.writeI32(field);
    }

    // faces, reserved, face capacity
    writer.writeI32(0);
    writer.writeI32(0);
    writer.writeI32(0);
    return writer.take();
}

// =============================================================================
// Device state
// =============================================================================

void DeviceStore::setEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_enabled = enabled;
}

bool DeviceStore::enabled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_enabled;
}

void DeviceStore::unlockDoor(uint32_t tenthsOfSecond) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_unlockedUntil = std::chrono::steady_clock::now() + std::chrono::milliseconds(tenthsOfSecond * 100ULL);
}

bool DeviceStore::doorLocked() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::chrono::steady_clock::now() >= m_unlockedUntil;
}

void DeviceStore::writeLcd(int16_t line, const std::string& text) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lcd[line] = text;
}

void DeviceStore::clearLcd() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lcd.clear();
}

std::map<int16_t, std::string> DeviceStore::lcd() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lcd;
}

} // namespace zkemu::sim
