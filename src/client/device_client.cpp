#include "zkemu/client/device_client.hpp"
#include "zkemu/net/transport.hpp"
#include "zkemu/utils/buffer.hpp"
#include "zkemu/utils/logger.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <initializer_list>
#include <limits>

namespace zkemu::client {

using protocol::CommandId;
using protocol::TableId;
using protocol::code;

namespace {

// Text reply up to the first NUL
std::string cString(const Bytes& payload) {
    std::string text(payload.begin(), payload.end());
    size_t end = text.find('\0');
    if (end != std::string::npos) {
        text.resize(end);
    }
    return text;
}

// Layout of a table given its byte count and the device's record count
size_t detectRecordSize(size_t bytes, int32_t count, std::initializer_list<size_t> layouts, size_t fallback) {
    if (count > 0 && bytes % static_cast<size_t>(count) == 0) {
        size_t width = bytes / static_cast<size_t>(count);
        if (std::find(layouts.begin(), layouts.end(), width) != layouts.end()) {
            return width;
        }
    }
    for (size_t width : layouts) {
        if (bytes % width == 0) {
            return width;
        }
    }
    return fallback;
}

} // namespace

DeviceClient::DeviceClient(const ClientConfig& config)
    : DeviceClient(net::makeTransport(config), SessionOptions::fromConfig(config))
{
}

DeviceClient::DeviceClient(std::unique_ptr<net::Transport> transport, SessionOptions options)
    : m_session(std::make_unique<Session>(std::move(transport), options))
    , m_commands(*m_session)
    , m_transfer(m_commands)
{
}

DeviceClient::~DeviceClient() = default;

// =============================================================================
// Session
// =============================================================================

Status DeviceClient::connect() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_session->connect();
}

Status DeviceClient::disconnect() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_session->disconnect();
}

Status DeviceClient::heartbeat() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_session->heartbeat();
}

bool DeviceClient::isConnected() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_session->isConnected();
}

Result<Frame> DeviceClient::run(const protocol::Request& request) {
    return m_commands.execute(request);
}

Status DeviceClient::simple(const protocol::Request& request) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto reply = run(request);
    if (!reply) {
        return reply.error();
    }
    return Status::success();
}

// =============================================================================
// Device information
// =============================================================================

Result<std::string> DeviceClient::getFirmwareVersion() {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto reply = run(protocol::GetVersionRequest{});
    if (!reply) {
        return reply.error();
    }
    return cString(reply.value().payload);
}

Result<std::string> DeviceClient::readOption(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto reply = run(protocol::OptionsReadRequest{name});
    if (!reply) {
        return reply.error();
    }

    // "Name=value\0", empty when the device does not know the option
    std::string text = cString(reply.value().payload);
    size_t eq = text.find('=');
    if (eq == std::string::npos) {
        return std::string();
    }
    return text.substr(eq + 1);
}

Status DeviceClient::writeOption(const std::string& name, const std::string& value) {
    return simple(protocol::OptionsWriteRequest{name, value});
}

Result<std::string> DeviceClient::getSerialNumber() {
    return readOption("~SerialNumber");
}

Result<std::string> DeviceClient::getPlatform() {
    return readOption("~Platform");
}

Result<std::string> DeviceClient::getDeviceName() {
    return readOption("~DeviceName");
}

Result<std::string> DeviceClient::getMacAddress() {
    return readOption("MAC");
}

Result<NetworkParams> DeviceClient::getNetworkParams() {
    NetworkParams params;

    auto ip = readOption("IPAddress");
    if (!ip) return ip.error();
    params.ipAddress = ip.take();

    auto mask = readOption("NetMask");
    if (!mask) return mask.error();
    params.netmask = mask.take();

    auto gateway = readOption("GATEIPAddress");
    if (!gateway) return gateway.error();
    params.gateway = gateway.take();

    return params;
}

Result<protocol::DateTime> DeviceClient::getTime() {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto reply = run(protocol::GetTimeRequest{});
    if (!reply) {
        return reply.error();
    }
    if (reply.value().payload.size() < 4) {
        return makeError(ErrorCode::MalformedFrame,
                         fmt::format("GET_TIME reply of {} bytes", reply.value().payload.size()));
    }
    return protocol::decodeTime(utils::BufferReader(reply.value().payload).readU32());
}

Status DeviceClient::setTime(const protocol::DateTime& time) {
    if (!time.isValid()) {
        return makeError(ErrorCode::MalformedRecord, fmt::format("invalid time {}", time.toString()));
    }
    return simple(protocol::SetTimeRequest{protocol::encodeTime(time)});
}

Result<DeviceSizes> DeviceClient::readSizes() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return readSizesLocked();
}

Result<DeviceSizes> DeviceClient::readSizesLocked() {
    auto reply = run(protocol::GetFreeSizesRequest{});
    if (!reply) {
        return reply.error();
    }

    const Bytes& payload = reply.value().payload;
    if (payload.size() < 80) {
        return makeError(ErrorCode::MalformedFrame,
                         fmt::format("GET_FREE_SIZES reply of {} bytes, expected 80", payload.size()));
    }

    utils::BufferReader reader(payload);
    int32_t fields[20];
    for (auto& field : fields) {
        field = reader.readI32();
    }

    DeviceSizes sizes;
    sizes.users = fields[4];
    sizes.fingers = fields[6];
    sizes.records = fields[8];
    sizes.cards = fields[12];
    sizes.fingerCapacity = fields[14];
    sizes.userCapacity = fields[15];
    sizes.recordCapacity = fields[16];
    sizes.fingersAvailable = fields[17];
    sizes.usersAvailable = fields[18];
    sizes.recordsAvailable = fields[19];

    if (reader.remaining() >= 12) {
        sizes.hasFaceInfo = true;
        sizes.faces = reader.readI32();
        reader.skip(4);
        sizes.faceCapacity = reader.readI32();
    }
    return sizes;
}

Result<uint8_t> DeviceClient::getPinWidth() {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto reply = run(protocol::GetPinWidthRequest{});
    if (!reply) {
        return reply.error();
    }
    if (reply.value().payload.empty()) {
        return makeError(ErrorCode::MalformedFrame, "GET_PINWIDTH reply is empty");
    }
    return reply.value().payload[0];
}

// =============================================================================
// Users
// =============================================================================

Result<std::vector<protocol::UserRecord>> DeviceClient::listUsers() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return listUsersLocked();
}

Result<std::vector<protocol::UserRecord>> DeviceClient::listUsersLocked() {
    auto sizes = readSizesLocked();
    if (!sizes) {
        return sizes.error();
    }

    auto data = m_transfer.readBuffer(code(CommandId::UserTempRrq), static_cast<uint32_t>(TableId::User));
    if (!data) {
        return data.error();
    }
    auto records = protocol::unwrapDataSet(data.value());
    if (!records) {
        return records.error();
    }

    m_userRecordSize = detectRecordSize(records.value().size(), sizes.value().users,
                                        {protocol::kUserRecordSize, protocol::kCompactUserRecordSize},
                                        protocol::kUserRecordSize);
    LOG_DEBUG("[Client] {} user bytes, {} byte records", records.value().size(), m_userRecordSize);

    return protocol::decodeUsers(records.value(), m_userRecordSize);
}

Result<protocol::UserRecord> DeviceClient::addUser(protocol::UserRecord user) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (user.uid == 0) {
        auto users = listUsersLocked();
        if (!users) {
            return users.error();
        }
        uint16_t highest = 0;
        for (const auto& existing : users.value()) {
            highest = std::max(highest, existing.uid);
        }
        if (highest == 0xFFFF) {
            return makeError(ErrorCode::DeviceError, "no free uid left");
        }
        user.uid = static_cast<uint16_t>(highest + 1);
    }
    if (user.userId.empty()) {
        user.userId = std::to_string(user.uid);
    }
    if (user.privilege != protocol::Privilege::User && user.privilege != protocol::Privilege::Admin) {
        return makeError(ErrorCode::MalformedRecord,
                         fmt::format("privilege {} is neither user nor admin",
                                     static_cast<int>(user.privilege)));
    }

    auto valid = protocol::validateUser(user, m_userRecordSize);
    if (!valid) {
        return valid.error();
    }

    auto written = run(protocol::UserWriteRequest{user, m_userRecordSize});
    if (!written) {
        return written.error();
    }
    auto refreshed = run(protocol::RefreshDataRequest{});
    if (!refreshed) {
        return refreshed.error();
    }

    LOG_INFO("[Client] Stored user uid={} id='{}' name='{}'", user.uid, user.userId, user.name);
    return user;
}

Status DeviceClient::deleteUser(uint16_t uid) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto deleted = run(protocol::DeleteUserRequest{uid});
    if (!deleted) {
        return deleted.error();
    }
    auto refreshed = run(protocol::RefreshDataRequest{});
    if (!refreshed) {
        return refreshed.error();
    }
    return Status::success();
}

Status DeviceClient::deleteUserById(const std::string& userId) {
    uint16_t uid = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto users = listUsersLocked();
        if (!users) {
            return users.error();
        }
        auto it = std::find_if(users.value().begin(), users.value().end(),
                               [&](const protocol::UserRecord& user) { return user.userId == userId; });
        if (it == users.value().end()) {
            return makeError(ErrorCode::DeviceError, fmt::format("no user with id '{}'", userId));
        }
        uid = it->uid;
    }
    return deleteUser(uid);
}

// =============================================================================
// Attendance
// =============================================================================

Result<std::vector<protocol::AttendanceRecord>> DeviceClient::listAttendance() {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto sizes = readSizesLocked();
    if (!sizes) {
        return sizes.error();
    }
    if (sizes.value().records == 0) {
        return std::vector<protocol::AttendanceRecord>{};
    }

    auto data = m_transfer.readBuffer(code(CommandId::AttLogRrq), static_cast<uint32_t>(TableId::AttLog));
    if (!data) {
        return data.error();
    }
    auto records = protocol::unwrapDataSet(data.value());
    if (!records) {
        return records.error();
    }

    size_t width = detectRecordSize(records.value().size(), sizes.value().records,
                                    {protocol::kAttendanceRecordSize, protocol::kShortAttendanceRecordSize,
                                     protocol::kTinyAttendanceRecordSize},
                                    protocol::kAttendanceRecordSize);
    LOG_DEBUG("[Client] {} attendance bytes, {} byte records", records.value().size(), width);

    return protocol::decodeAttendance(records.value(), width);
}

Status DeviceClient::clearAttendance() {
    return simple(protocol::ClearAttLogRequest{});
}

// =============================================================================
// Fingerprint templates
// =============================================================================

Result<std::vector<protocol::TemplateRecord>> DeviceClient::listTemplates() {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto data = m_transfer.readBuffer(code(CommandId::DbRrq), static_cast<uint32_t>(TableId::FingerTmp));
    if (!data) {
        return data.error();
    }
    auto records = protocol::unwrapDataSet(data.value());
    if (!records) {
        return records.error();
    }
    return protocol::decodeTemplates(records.value());
}

Result<protocol::TemplateRecord> DeviceClient::getUserTemplate(uint16_t uid, uint8_t fingerIndex) {
    if (fingerIndex > protocol::kMaxFingerIndex) {
        return makeError(ErrorCode::MalformedRecord, fmt::format("finger index {} out of range", fingerIndex));
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto reply = run(protocol::GetUserTempRequest{uid, fingerIndex});
    if (!reply) {
        return reply.error();
    }

    auto data = m_transfer.collectReply(reply.value());
    if (!data) {
        return data.error();
    }

    // Raw template followed by six zero bytes
    Bytes raw = data.take();
    if (raw.size() >= 6 && std::all_of(raw.end() - 6, raw.end(), [](uint8_t b) { return b == 0; })) {
        raw.resize(raw.size() - 6);
    }
    if (raw.empty()) {
        return makeError(ErrorCode::DeviceError,
                         fmt::format("no template for uid {} finger {}", uid, fingerIndex));
    }

    protocol::TemplateRecord record;
    record.uid = uid;
    record.fingerIndex = fingerIndex;
    record.valid = true;
    record.data = std::move(raw);
    return record;
}

Status DeviceClient::deleteUserTemplate(uint16_t uid, uint8_t fingerIndex) {
    if (fingerIndex > protocol::kMaxFingerIndex) {
        return makeError(ErrorCode::MalformedRecord, fmt::format("finger index {} out of range", fingerIndex));
    }
    return simple(protocol::DeleteUserTempRequest{uid, fingerIndex});
}

Status DeviceClient::saveUserTemplates(const std::vector<protocol::UserTemplates>& entries) {
    for (const auto& entry : entries) {
        auto valid = protocol::validateUser(entry.user);
        if (!valid) {
            return valid;
        }
        for (const auto& fingerprint : entry.templates) {
            if (fingerprint.fingerIndex > protocol::kMaxFingerIndex) {
                return makeError(ErrorCode::MalformedRecord,
                                 fmt::format("finger index {} out of range", fingerprint.fingerIndex));
            }
            if (fingerprint.data.size() > protocol::kMaxTemplateSize) {
                return makeError(ErrorCode::MalformedRecord,
                                 fmt::format("template for uid {} finger {} is {} bytes, limit {}",
                                             entry.user.uid, fingerprint.fingerIndex,
                                             fingerprint.data.size(), protocol::kMaxTemplateSize));
            }
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    auto staged = m_transfer.writeBuffer(protocol::encodeTemplateUpload(entries));
    if (!staged) {
        return staged;
    }
    auto saved = run(protocol::SaveUserTempsRequest{});
    if (!saved) {
        return saved.error();
    }
    auto refreshed = run(protocol::RefreshDataRequest{});
    if (!refreshed) {
        return refreshed.error();
    }

    LOG_INFO("[Client] Uploaded {} users with templates", entries.size());
    return Status::success();
}

// =============================================================================
// Device control
// =============================================================================

Status DeviceClient::clearData() {
    return simple(protocol::ClearDataRequest{});
}

Status DeviceClient::refreshData() {
    return simple(protocol::RefreshDataRequest{});
}

Status DeviceClient::enableDevice() {
    return simple(protocol::EnableDeviceRequest{});
}

Status DeviceClient::disableDevice() {
    return simple(protocol::DisableDeviceRequest{});
}

Status DeviceClient::restart() {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto reply = run(protocol::RestartRequest{});
    if (!reply) {
        return reply.error();
    }
    m_session->abandon("device restarting");
    return Status::success();
}

Status DeviceClient::powerOff() {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto reply = run(protocol::PowerOffRequest{});
    if (!reply) {
        return reply.error();
    }
    m_session->abandon("device powering off");
    return Status::success();
}

Status DeviceClient::unlockDoor(uint32_t seconds) {
    // UNLOCK carries tenths of a second in a u32
    if (seconds > std::numeric_limits<uint32_t>::max() / 10) {
        return makeError(ErrorCode::MalformedRecord,
                         fmt::format("unlock time of {} seconds out of range", seconds));
    }
    return simple(protocol::UnlockRequest{seconds * 10});
}

Result<bool> DeviceClient::getDoorState() {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto reply = m_commands.executeRaw(protocol::DoorStateRequest{});
    if (!reply) {
        return reply.error();
    }
    return reply.value().is(CommandId::AckOk);
}

Status DeviceClient::writeLcd(int16_t line, const std::string& text) {
    return simple(protocol::WriteLcdRequest{line, text});
}

Status DeviceClient::clearLcd() {
    return simple(protocol::ClearLcdRequest{});
}

Status DeviceClient::testVoice(uint32_t index) {
    return simple(protocol::TestVoiceRequest{index});
}

Status DeviceClient::registerEvents(uint32_t flags) {
    return simple(protocol::RegEventRequest{flags});
}

Status DeviceClient::startVerify() {
    return simple(protocol::StartVerifyRequest{});
}

Status DeviceClient::cancelCapture() {
    return simple(protocol::CancelCaptureRequest{});
}

} // namespace zkemu::client
