#pragma once

#include "zkemu/core/types.hpp"
#include "zkemu/protocol/records.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace zkemu::sim {

using protocol::Bytes;

/**
 * Simulated terminal memory
 *
 * Users, templates, the attendance log, options and the clock, shared by
 * every session. A single mutex serializes all access.
 */
class DeviceStore {
public:
    static constexpr uint8_t kPinWidth = 5;

    explicit DeviceStore(SimulatorConfig config);

    const SimulatorConfig& config() const { return m_config; }
    uint32_t password() const { return m_config.password; }

    /**
     * Three factory users and, when enabled, a few punches
     */
    void seedDefaults();

    // Session ids: random, non-zero, unique among live sessions
    uint16_t openSession();
    void closeSession(uint16_t sessionId);
    size_t liveSessions() const;

    // Options as read by OPTIONS_RRQ
    std::optional<std::string> option(const std::string& name) const;
    void setOption(const std::string& name, const std::string& value);

    // Clock
    protocol::DateTime time() const;
    void setTime(const protocol::DateTime& time);

    // Users
    std::vector<protocol::UserRecord> users() const;
    std::optional<protocol::UserRecord> findUser(uint16_t uid) const;
    bool putUser(const protocol::UserRecord& user);   // false when full
    bool removeUser(uint16_t uid);

    // Templates
    std::vector<protocol::TemplateRecord> templates() const;
    std::optional<protocol::TemplateRecord> findTemplate(uint16_t uid, uint8_t fingerIndex) const;
    bool putTemplate(const protocol::TemplateRecord& record);
    bool removeTemplate(uint16_t uid, uint8_t fingerIndex);

    // Attendance
    std::vector<protocol::AttendanceRecord> attendance() const;
    bool appendAttendance(const protocol::AttendanceRecord& record);
    void clearAttendance();

    // CLEAR_DATA: users, templates and attendance
    void clearAll();

    // Data sets with their u32 size header
    Bytes userTable() const;
    Bytes templateTable() const;
    Bytes attendanceTable() const;

    /**
     * GET_FREE_SIZES payload: 20 counters and 3 face counters
     */
    Bytes freeSizes() const;

    // Device state
    void setEnabled(bool enabled);
    bool enabled() const;
    void unlockDoor(uint32_t tenthsOfSecond);
    bool doorLocked() const;
    void writeLcd(int16_t line, const std::string& text);
    void clearLcd();
    std::map<int16_t, std::string> lcd() const;

private:
    SimulatorConfig m_config;
    mutable std::mutex m_mutex;

    std::set<uint16_t> m_sessions;
    std::map<std::string, std::string> m_options;
    std::chrono::seconds m_clockOffset{0};

    std::map<uint16_t, protocol::UserRecord> m_users;
    std::vector<protocol::TemplateRecord> m_templates;
    std::vector<protocol::AttendanceRecord> m_attendance;

    bool m_enabled = true;
    std::chrono::steady_clock::time_point m_unlockedUntil{};
    std::map<int16_t, std::string> m_lcd;
};

} // namespace zkemu::sim
