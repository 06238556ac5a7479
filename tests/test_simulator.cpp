#include "test_framework.hpp"
#include "loopback_transport.hpp"
#include "zkemu/client/device_client.hpp"
#include "zkemu/protocol/packet.hpp"
#include "zkemu/utils/buffer.hpp"

namespace simulator_tests {

using zkemu::ErrorCode;
using zkemu::SimulatorConfig;
using zkemu::TransportKind;
using zkemu::client::DeviceClient;
using zkemu::client::SessionOptions;
using zkemu::protocol::Bytes;
using zkemu::protocol::CommandId;
using zkemu::protocol::PacketCodec;
using zkemu::protocol::TemplateRecord;
using zkemu::protocol::UserRecord;
using zkemu::protocol::UserTemplates;
using zkemu::test::DeviceFixture;
using zkemu::test::LoopbackTransport;

/**
 * Client talking to a fixture through the loopback
 */
struct Bench {
    explicit Bench(DeviceFixture& fixture, TransportKind kind = TransportKind::Tcp) {
        SessionOptions options;
        options.timeout = std::chrono::milliseconds(50);
        auto transport = fixture.transport(kind);
        link = transport.get();
        client = std::make_unique<DeviceClient>(std::move(transport), options);
    }

    size_t sentCount(CommandId command) const {
        size_t count = 0;
        for (const auto& frame : link->sent()) {
            if (frame.is(command)) count++;
        }
        return count;
    }

    LoopbackTransport* link = nullptr;
    std::unique_ptr<DeviceClient> client;
};

SimulatorConfig stagingConfig() {
    SimulatorConfig config;
    config.inline_data_limit = 16;
    return config;
}

// Decode the single reply the dispatcher sends back
zkemu::protocol::Frame soleReply(const zkemu::sim::DispatchResult& result) {
    zkemu::protocol::Frame frame;
    if (result.packets.size() == 1) {
        auto decoded = PacketCodec::decode(result.packets[0]);
        if (decoded) frame = decoded.take();
    }
    return frame;
}

TemplateRecord fingerprint(uint16_t uid, uint8_t finger, size_t size) {
    TemplateRecord record;
    record.uid = uid;
    record.fingerIndex = finger;
    for (size_t i = 0; i < size; i++) {
        record.data.push_back(static_cast<uint8_t>(i % 251 + 1));
    }
    return record;
}

} // namespace simulator_tests

// =============================================================================
// Dispatch rules
// =============================================================================

TEST(Sim_CommandBeforeConnectUnauthorized) {
    using namespace simulator_tests;
    DeviceFixture fixture;
    zkemu::sim::DeviceSession session(TransportKind::Tcp, "test");

    auto result = fixture.dispatcher.handlePacket(session, PacketCodec::encode(CommandId::GetTime, 0, 1));
    auto reply = soleReply(result);
    ASSERT_TRUE(reply.is(CommandId::AckUnauth));
    ASSERT_EQ(reply.replyId, 1);
    ASSERT_FALSE(result.closeSession);
    PASS();
}

TEST(Sim_UnknownCommandAnswersError) {
    using namespace simulator_tests;
    DeviceFixture fixture;
    zkemu::sim::DeviceSession session(TransportKind::Tcp, "test");

    auto connected = soleReply(fixture.dispatcher.handlePacket(session, PacketCodec::encode(CommandId::Connect, 0, 0)));
    ASSERT_TRUE(connected.is(CommandId::AckOk));
    ASSERT_NE(connected.sessionId, 0);

    auto unknown = soleReply(fixture.dispatcher.handlePacket(
        session, PacketCodec::encode(static_cast<uint16_t>(9999), connected.sessionId, 1)));
    ASSERT_TRUE(unknown.is(CommandId::AckError));
    ASSERT_EQ(unknown.sessionId, connected.sessionId);

    // Wrong session id on a live connection
    auto foreign = soleReply(fixture.dispatcher.handlePacket(
        session, PacketCodec::encode(CommandId::GetTime, static_cast<uint16_t>(connected.sessionId ^ 0x0101), 2)));
    ASSERT_TRUE(foreign.is(CommandId::AckUnauth));
    PASS();
}

TEST(Sim_CorruptPacketIgnored) {
    using namespace simulator_tests;
    DeviceFixture fixture;
    zkemu::sim::DeviceSession session(TransportKind::Udp, "test");

    auto packet = PacketCodec::encode(CommandId::Connect, 0, 0);
    packet[4] ^= 0x40;
    auto result = fixture.dispatcher.handlePacket(session, packet);
    ASSERT_TRUE(result.packets.empty());
    ASSERT_FALSE(session.connected);
    PASS();
}

TEST(Sim_ReadBufferWithoutStagedData) {
    using namespace simulator_tests;
    DeviceFixture fixture;
    zkemu::sim::DeviceSession session(TransportKind::Tcp, "test");
    auto connected = soleReply(fixture.dispatcher.handlePacket(session, PacketCodec::encode(CommandId::Connect, 0, 0)));

    zkemu::protocol::ReadBufferRequest read{0, 64};
    auto reply = soleReply(fixture.dispatcher.handlePacket(
        session, PacketCodec::encode(CommandId::ReadBuffer, connected.sessionId, 1, read.payload())));
    ASSERT_TRUE(reply.is(CommandId::AckError));
    PASS();
}

// =============================================================================
// Device information
// =============================================================================

TEST(Sim_OptionsAndVersion) {
    using namespace simulator_tests;
    DeviceFixture fixture;
    Bench bench(fixture);
    ASSERT_OK(bench.client->connect());

    auto serial = bench.client->getSerialNumber();
    ASSERT_OK(serial);
    ASSERT_STREQ(serial.value(), fixture.store.config().serial_number);

    auto firmware = bench.client->getFirmwareVersion();
    ASSERT_OK(firmware);
    ASSERT_STREQ(firmware.value(), "Ver 6.60 Nov 13 2019");

    auto network = bench.client->getNetworkParams();
    ASSERT_OK(network);
    ASSERT_STREQ(network.value().ipAddress, "192.168.1.201");
    ASSERT_STREQ(network.value().gateway, "192.168.1.1");

    auto missing = bench.client->readOption("NoSuchOption");
    ASSERT_OK(missing);
    ASSERT_TRUE(missing.value().empty());

    ASSERT_OK(bench.client->writeOption("~DeviceName", "Lobby"));
    auto name = bench.client->getDeviceName();
    ASSERT_OK(name);
    ASSERT_STREQ(name.value(), "Lobby");

    auto pinWidth = bench.client->getPinWidth();
    ASSERT_OK(pinWidth);
    ASSERT_EQ(pinWidth.value(), 5);
    PASS();
}

TEST(Sim_FreeSizes) {
    using namespace simulator_tests;
    DeviceFixture fixture;
    Bench bench(fixture);
    ASSERT_OK(bench.client->connect());

    auto sizes = bench.client->readSizes();
    ASSERT_OK(sizes);
    ASSERT_EQ(sizes.value().users, 3);
    ASSERT_EQ(sizes.value().records, 4);
    ASSERT_EQ(sizes.value().fingers, 0);
    ASSERT_EQ(sizes.value().userCapacity, 3000);
    ASSERT_EQ(sizes.value().usersAvailable, 2997);
    ASSERT_EQ(sizes.value().recordsAvailable, 99996);
    ASSERT_TRUE(sizes.value().hasFaceInfo);
    PASS();
}

TEST(Sim_SetAndGetTime) {
    using namespace simulator_tests;
    DeviceFixture fixture;
    Bench bench(fixture, TransportKind::Udp);
    ASSERT_OK(bench.client->connect());

    zkemu::protocol::DateTime target{2024, 3, 15, 8, 30, 5};
    ASSERT_OK(bench.client->setTime(target));

    auto now = bench.client->getTime();
    ASSERT_OK(now);
    uint32_t drift = zkemu::protocol::encodeTime(now.value()) - zkemu::protocol::encodeTime(target);
    ASSERT_TRUE(drift <= 2);

    ASSERT_ERROR(bench.client->setTime(zkemu::protocol::DateTime{2024, 13, 1, 0, 0, 0}),
                 ErrorCode::MalformedRecord);
    PASS();
}

// =============================================================================
// Users and attendance
// =============================================================================

TEST(Sim_ListSeededUsers) {
    using namespace simulator_tests;
    DeviceFixture fixture;
    Bench bench(fixture);
    ASSERT_OK(bench.client->connect());

    auto users = bench.client->listUsers();
    ASSERT_OK(users);
    ASSERT_EQ(users.value().size(), 3u);
    ASSERT_STREQ(users.value()[0].name, "Admin");
    ASSERT_TRUE(users.value()[0].privilege == zkemu::protocol::Privilege::Admin);
    ASSERT_STREQ(users.value()[1].password, "12345");
    ASSERT_EQ(users.value()[1].card, 123456u);
    ASSERT_EQ(users.value()[2].card, 234567u);

    // Small enough to come back inline
    ASSERT_EQ(bench.sentCount(CommandId::ReadBuffer), 0u);
    PASS();
}

TEST(Sim_StagedReadOverTcp) {
    using namespace simulator_tests;
    DeviceFixture fixture(stagingConfig());
    Bench bench(fixture);
    ASSERT_OK(bench.client->connect());
    bench.client->transfers().setChunkSize(64);

    // 4 + 3 * 72 bytes in chunks of 64
    auto users = bench.client->listUsers();
    ASSERT_OK(users);
    ASSERT_EQ(users.value().size(), 3u);
    ASSERT_STREQ(users.value()[2].name, "User002");
    ASSERT_EQ(bench.sentCount(CommandId::ReadBuffer), 4u);
    ASSERT_FALSE(bench.link->deviceSession().readBufferStaged);
    PASS();
}

TEST(Sim_StagedReadOverUdpRecoversLostChunk) {
    using namespace simulator_tests;
    DeviceFixture fixture(stagingConfig());
    Bench bench(fixture, TransportKind::Udp);
    ASSERT_OK(bench.client->connect());
    bench.client->transfers().setChunkSize(64);
    bench.link->dropRepliesTo(CommandId::ReadBuffer, 2);

    auto users = bench.client->listUsers();
    ASSERT_OK(users);
    ASSERT_EQ(users.value().size(), 3u);

    // Chunks 0..3 in order, then chunk 1 again
    std::vector<uint32_t> offsets;
    for (const auto& frame : bench.link->sent()) {
        if (frame.is(CommandId::ReadBuffer)) {
            offsets.push_back(zkemu::utils::BufferReader(frame.payload).readU32());
        }
    }
    std::vector<uint32_t> expected = {0, 64, 128, 192, 64};
    ASSERT_TRUE(offsets == expected);
    PASS();
}

TEST(Sim_ListAttendance) {
    using namespace simulator_tests;
    DeviceFixture fixture(stagingConfig());
    Bench bench(fixture);
    ASSERT_OK(bench.client->connect());

    auto records = bench.client->listAttendance();
    ASSERT_OK(records);
    ASSERT_EQ(records.value().size(), 4u);
    ASSERT_STREQ(records.value()[0].userId, "2");
    ASSERT_STREQ(records.value()[2].timestamp.toString(), "2024-03-15 17:02:48");
    ASSERT_TRUE(records.value()[3].punch == zkemu::protocol::PunchType::CheckOut);

    ASSERT_OK(bench.client->clearAttendance());
    auto cleared = bench.client->listAttendance();
    ASSERT_OK(cleared);
    ASSERT_TRUE(cleared.value().empty());
    PASS();
}

TEST(Sim_AddAndDeleteUser) {
    using namespace simulator_tests;
    DeviceFixture fixture;
    Bench bench(fixture);
    ASSERT_OK(bench.client->connect());

    UserRecord user;
    user.name = "Visitor";
    user.password = "4321";
    user.card = 777;
    auto added = bench.client->addUser(user);
    ASSERT_OK(added);
    ASSERT_EQ(added.value().uid, 4);
    ASSERT_STREQ(added.value().userId, "4");

    auto stored = fixture.store.findUser(4);
    ASSERT_TRUE(stored.has_value());
    ASSERT_STREQ(stored->name, "Visitor");
    ASSERT_EQ(stored->card, 777u);

    ASSERT_OK(bench.client->deleteUserById("4"));
    ASSERT_FALSE(fixture.store.findUser(4).has_value());
    ASSERT_ERROR(bench.client->deleteUserById("4"), ErrorCode::DeviceError);

    user.name = std::string(30, 'n');
    ASSERT_ERROR(bench.client->addUser(user), ErrorCode::MalformedRecord);
    PASS();
}

// =============================================================================
// Fingerprint templates
// =============================================================================

TEST(Sim_TemplateUploadAndFetch) {
    using namespace simulator_tests;
    DeviceFixture fixture;
    Bench bench(fixture);
    ASSERT_OK(bench.client->connect());

    UserRecord owner;
    owner.uid = 10;
    owner.name = "Finger";
    owner.userId = "10";
    UserTemplates entry{owner, {fingerprint(10, 0, 600), fingerprint(10, 3, 1500)}};

    ASSERT_OK(bench.client->saveUserTemplates({entry}));
    ASSERT_TRUE(bench.sentCount(CommandId::Data) >= 3u);
    ASSERT_TRUE(fixture.store.findUser(10).has_value());

    auto templates = bench.client->listTemplates();
    ASSERT_OK(templates);
    ASSERT_EQ(templates.value().size(), 2u);

    // 1500 + 6 bytes is streamed rather than sent inline
    auto fetched = bench.client->getUserTemplate(10, 3);
    ASSERT_OK(fetched);
    ASSERT_TRUE(fetched.value().data == entry.templates[1].data);

    ASSERT_OK(bench.client->deleteUserTemplate(10, 3));
    ASSERT_ERROR(bench.client->deleteUserTemplate(10, 3), ErrorCode::DeviceError);
    ASSERT_ERROR(bench.client->getUserTemplate(10, 3), ErrorCode::DeviceError);
    ASSERT_ERROR(bench.client->getUserTemplate(10, 12), ErrorCode::MalformedRecord);
    PASS();
}

TEST(Sim_TemplateFetchOverUdpIsOneDatagram) {
    using namespace simulator_tests;
    DeviceFixture fixture;
    ASSERT_TRUE(fixture.store.putTemplate(fingerprint(2, 4, 1500)));

    zkemu::sim::DeviceSession udp(TransportKind::Udp, "udp");
    auto connected = soleReply(fixture.dispatcher.handlePacket(udp, PacketCodec::encode(CommandId::Connect, 0, 0)));
    zkemu::protocol::GetUserTempRequest request{2, 4};
    auto reply = fixture.dispatcher.handlePacket(
        udp, PacketCodec::encode(CommandId::GetUserTemp, connected.sessionId, 1, request.payload()));
    ASSERT_EQ(reply.packets.size(), 1u);
    ASSERT_TRUE(soleReply(reply).is(CommandId::Data));
    ASSERT_EQ(soleReply(reply).payload.size(), 1506u);

    // TCP still streams anything above the inline limit
    zkemu::sim::DeviceSession tcp(TransportKind::Tcp, "tcp");
    connected = soleReply(fixture.dispatcher.handlePacket(tcp, PacketCodec::encode(CommandId::Connect, 0, 0)));
    auto streamed = fixture.dispatcher.handlePacket(
        tcp, PacketCodec::encode(CommandId::GetUserTemp, connected.sessionId, 1, request.payload()));
    ASSERT_EQ(streamed.packets.size(), 4u);
    PASS();
}

TEST(Sim_TemplateFetchOverUdpSurvivesLostReply) {
    using namespace simulator_tests;
    DeviceFixture fixture;
    Bench bench(fixture, TransportKind::Udp);
    ASSERT_OK(bench.client->connect());

    TemplateRecord stored = fingerprint(3, 1, 1500);
    ASSERT_TRUE(fixture.store.putTemplate(stored));
    bench.link->dropRepliesTo(CommandId::GetUserTemp, 1);

    auto fetched = bench.client->getUserTemplate(3, 1);
    ASSERT_OK(fetched);
    ASSERT_TRUE(fetched.value().data == stored.data);

    // The request is retransmitted under the same reply id
    std::vector<uint16_t> replyIds;
    for (const auto& frame : bench.link->sent()) {
        if (frame.is(CommandId::GetUserTemp)) replyIds.push_back(frame.replyId);
    }
    ASSERT_EQ(replyIds.size(), 2u);
    ASSERT_EQ(replyIds[0], replyIds[1]);
    ASSERT_TRUE(bench.client->isConnected());
    PASS();
}

TEST(Sim_OversizeTemplateRefused) {
    using namespace simulator_tests;
    DeviceFixture fixture;
    Bench bench(fixture);
    ASSERT_OK(bench.client->connect());

    UserRecord owner;
    owner.uid = 7;
    owner.name = "Large";
    owner.userId = "7";
    UserTemplates entry{owner, {fingerprint(7, 0, zkemu::protocol::kMaxTemplateSize + 1)}};

    // Client refuses before anything is sent
    ASSERT_ERROR(bench.client->saveUserTemplates({entry}), ErrorCode::MalformedRecord);
    ASSERT_EQ(bench.sentCount(CommandId::PrepareData), 0u);

    // Device refuses the same upload staged by hand
    ASSERT_OK(bench.client->transfers().writeBuffer(zkemu::protocol::encodeTemplateUpload({entry})));
    zkemu::client::CommandDispatcher commands(bench.client->session());
    ASSERT_ERROR(commands.execute(zkemu::protocol::SaveUserTempsRequest{}), ErrorCode::DeviceError);
    ASSERT_FALSE(fixture.store.findUser(7).has_value());
    ASSERT_FALSE(fixture.store.findTemplate(7, 0).has_value());

    ASSERT_FALSE(fixture.store.putTemplate(entry.templates[0]));
    auto templates = bench.client->listTemplates();
    ASSERT_OK(templates);
    PASS();
}

TEST(Sim_DataWithoutPrepareRejected) {
    using namespace simulator_tests;
    DeviceFixture fixture;
    Bench bench(fixture);
    ASSERT_OK(bench.client->connect());

    zkemu::protocol::DataRequest chunk{Bytes(10, 1)};
    zkemu::client::CommandDispatcher commands(bench.client->session());
    ASSERT_ERROR(commands.execute(chunk), ErrorCode::DeviceError);
    ASSERT_ERROR(commands.execute(zkemu::protocol::SaveUserTempsRequest{}), ErrorCode::DeviceError);
    PASS();
}

// =============================================================================
// Device control
// =============================================================================

TEST(Sim_DoorAndLcd) {
    using namespace simulator_tests;
    DeviceFixture fixture;
    Bench bench(fixture);
    ASSERT_OK(bench.client->connect());

    auto locked = bench.client->getDoorState();
    ASSERT_OK(locked);
    ASSERT_TRUE(locked.value());

    // Tenths of a second must fit the u32 field
    ASSERT_ERROR(bench.client->unlockDoor(429496730u), ErrorCode::MalformedRecord);
    ASSERT_EQ(bench.sentCount(CommandId::Unlock), 0u);

    ASSERT_OK(bench.client->unlockDoor(5));
    ASSERT_EQ(zkemu::utils::BufferReader(bench.link->sent().back().payload).readU32(), 50u);
    auto open = bench.client->getDoorState();
    ASSERT_OK(open);
    ASSERT_FALSE(open.value());

    ASSERT_OK(bench.client->writeLcd(1, "Welcome"));
    ASSERT_STREQ(fixture.store.lcd()[1], "Welcome");
    ASSERT_OK(bench.client->clearLcd());
    ASSERT_TRUE(fixture.store.lcd().empty());

    ASSERT_OK(bench.client->disableDevice());
    ASSERT_FALSE(fixture.store.enabled());
    ASSERT_OK(bench.client->enableDevice());
    ASSERT_TRUE(fixture.store.enabled());
    ASSERT_OK(bench.client->testVoice(0));
    PASS();
}

TEST(Sim_RestartDropsSession) {
    using namespace simulator_tests;
    DeviceFixture fixture;
    Bench bench(fixture);
    ASSERT_OK(bench.client->connect());
    ASSERT_EQ(fixture.store.liveSessions(), 1u);

    ASSERT_OK(bench.client->restart());
    ASSERT_FALSE(bench.client->isConnected());
    ASSERT_EQ(fixture.store.liveSessions(), 0u);
    ASSERT_ERROR(bench.client->getTime(), ErrorCode::NotConnected);

    // A new session can be opened once the device is back
    ASSERT_OK(bench.client->connect());
    ASSERT_OK(bench.client->getTime());
    PASS();
}

TEST(Sim_ClearDataEmptiesTables) {
    using namespace simulator_tests;
    DeviceFixture fixture;
    Bench bench(fixture);
    ASSERT_OK(bench.client->connect());

    ASSERT_OK(bench.client->clearData());
    auto users = bench.client->listUsers();
    ASSERT_OK(users);
    ASSERT_TRUE(users.value().empty());
    auto sizes = bench.client->readSizes();
    ASSERT_OK(sizes);
    ASSERT_EQ(sizes.value().records, 0);
    PASS();
}
