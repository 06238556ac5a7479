#pragma once

#include "zkemu/client/command_dispatcher.hpp"
#include "zkemu/client/session.hpp"
#include "zkemu/client/transfer.hpp"
#include "zkemu/core/result.hpp"
#include "zkemu/core/types.hpp"
#include "zkemu/protocol/records.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace zkemu::client {

/**
 * Storage counters reported by GET_FREE_SIZES
 */
struct DeviceSizes {
    int32_t users = 0;
    int32_t fingers = 0;
    int32_t records = 0;
    int32_t cards = 0;
    int32_t fingerCapacity = 0;
    int32_t userCapacity = 0;
    int32_t recordCapacity = 0;
    int32_t fingersAvailable = 0;
    int32_t usersAvailable = 0;
    int32_t recordsAvailable = 0;

    // Only present on face capable firmware
    bool hasFaceInfo = false;
    int32_t faces = 0;
    int32_t faceCapacity = 0;
};

struct NetworkParams {
    std::string ipAddress;
    std::string netmask;
    std::string gateway;
};

/**
 * Terminal client
 *
 * One explicitly owned session per object; several clients can talk to
 * different devices from the same process. Operations are serialized
 * internally since the protocol allows a single outstanding request.
 */
class DeviceClient {
public:
    explicit DeviceClient(const ClientConfig& config);
    DeviceClient(std::unique_ptr<net::Transport> transport, SessionOptions options);
    ~DeviceClient();

    DeviceClient(const DeviceClient&) = delete;
    DeviceClient& operator=(const DeviceClient&) = delete;

    // Session
    Status connect();
    Status disconnect();
    Status heartbeat();
    bool isConnected() const;

    // Device information
    Result<std::string> getFirmwareVersion();
    Result<std::string> readOption(const std::string& name);
    Status writeOption(const std::string& name, const std::string& value);
    Result<std::string> getSerialNumber();
    Result<std::string> getPlatform();
    Result<std::string> getDeviceName();
    Result<std::string> getMacAddress();
    Result<NetworkParams> getNetworkParams();
    Result<protocol::DateTime> getTime();
    Status setTime(const protocol::DateTime& time);
    Result<DeviceSizes> readSizes();
    Result<uint8_t> getPinWidth();

    // Users
    Result<std::vector<protocol::UserRecord>> listUsers();

    /**
     * Create or update a user. A zero uid takes the next free one and an
     * empty user id defaults to the uid. The device refreshes afterwards.
     */
    Result<protocol::UserRecord> addUser(protocol::UserRecord user);
    Status deleteUser(uint16_t uid);
    Status deleteUserById(const std::string& userId);

    // Attendance
    Result<std::vector<protocol::AttendanceRecord>> listAttendance();
    Status clearAttendance();

    // Fingerprint templates
    Result<std::vector<protocol::TemplateRecord>> listTemplates();
    Result<protocol::TemplateRecord> getUserTemplate(uint16_t uid, uint8_t fingerIndex);
    Status deleteUserTemplate(uint16_t uid, uint8_t fingerIndex);

    /**
     * Upload users with their templates in one buffered transfer,
     * then SAVE_USERTEMPS and REFRESHDATA.
     */
    Status saveUserTemplates(const std::vector<protocol::UserTemplates>& entries);

    // Device control
    Status clearData();
    Status refreshData();
    Status enableDevice();
    Status disableDevice();

    // The device drops the session once it has acknowledged these
    Status restart();
    Status powerOff();

    Status unlockDoor(uint32_t seconds = 3);
    Result<bool> getDoorState();   // true when the lock reports closed
    Status writeLcd(int16_t line, const std::string& text);
    Status clearLcd();
    Status testVoice(uint32_t index = 0);
    Status registerEvents(uint32_t flags);
    Status startVerify();
    Status cancelCapture();

    Session& session() { return *m_session; }
    TransferEngine& transfers() { return m_transfer; }

private:
    Status simple(const protocol::Request& request);
    Result<Frame> run(const protocol::Request& request);
    Result<DeviceSizes> readSizesLocked();
    Result<std::vector<protocol::UserRecord>> listUsersLocked();

    mutable std::mutex m_mutex;
    std::unique_ptr<Session> m_session;
    CommandDispatcher m_commands;
    TransferEngine m_transfer;
    size_t m_userRecordSize = protocol::kUserRecordSize;
};

} // namespace zkemu::client
