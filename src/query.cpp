#include "zkemu/client/device_client.hpp"
#include "zkemu/utils/config.hpp"
#include "zkemu/utils/logger.hpp"

#include <fmt/format.h>
#include <iostream>
#include <string>
#include <vector>

using zkemu::client::DeviceClient;

namespace {

void printUsage(const char* program) {
    std::cout << "Attendance terminal query tool\n";
    std::cout << "Usage: " << program << " [options] <command> [arguments]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <file>     Load configuration from file\n";
    std::cout << "  -a, --address <host>    Device address (default 127.0.0.1)\n";
    std::cout << "  -p, --port <port>       Device port (default 4370)\n";
    std::cout << "  -u, --udp               Use UDP instead of TCP\n";
    std::cout << "  -P, --password <n>      Communication password\n";
    std::cout << "  -t, --timeout <ms>      Reply timeout\n";
    std::cout << "      --no-ping           Skip the liveness probe after CONNECT\n";
    std::cout << "  -v, --verbose           Log protocol traffic\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "\n";
    std::cout << "Commands:\n";
    std::cout << "  info                    Firmware, identity, clock and capacities\n";
    std::cout << "  users                   List users\n";
    std::cout << "  attendance              List attendance records\n";
    std::cout << "  templates               List fingerprint templates\n";
    std::cout << "  add-user <name> [user_id] [password] [card]\n";
    std::cout << "  delete-user <user_id>\n";
    std::cout << "  set-time [now]          Set the device clock to the local time\n";
    std::cout << "  clear-attendance\n";
    std::cout << "  unlock [seconds]\n";
    std::cout << "  door                    Report the lock state\n";
    std::cout << "  lcd <line> <text>\n";
    std::cout << "  voice [index]\n";
    std::cout << "  restart | poweroff\n";
}

int report(const zkemu::Status& status, const char* what) {
    if (!status) {
        std::cerr << what << " failed: " << status.error().describe() << "\n";
        return 1;
    }
    std::cout << what << ": ok\n";
    return 0;
}

int showInfo(DeviceClient& client) {
    auto firmware = client.getFirmwareVersion();
    if (!firmware) {
        std::cerr << "Cannot read firmware version: " << firmware.error().describe() << "\n";
        return 1;
    }
    std::cout << fmt::format("{:<16}{}\n", "Firmware", firmware.value());

    auto serial = client.getSerialNumber();
    auto platform = client.getPlatform();
    auto name = client.getDeviceName();
    auto mac = client.getMacAddress();
    if (serial) std::cout << fmt::format("{:<16}{}\n", "Serial", serial.value());
    if (platform) std::cout << fmt::format("{:<16}{}\n", "Platform", platform.value());
    if (name) std::cout << fmt::format("{:<16}{}\n", "Device name", name.value());
    if (mac) std::cout << fmt::format("{:<16}{}\n", "MAC", mac.value());

    auto network = client.getNetworkParams();
    if (network) {
        std::cout << fmt::format("{:<16}{} / {} via {}\n", "Network",
                                 network.value().ipAddress, network.value().netmask, network.value().gateway);
    }

    auto time = client.getTime();
    if (time) std::cout << fmt::format("{:<16}{}\n", "Clock", time.value().toString());

    auto pinWidth = client.getPinWidth();
    if (pinWidth) std::cout << fmt::format("{:<16}{}\n", "PIN width", pinWidth.value());

    auto sizes = client.readSizes();
    if (!sizes) {
        std::cerr << "Cannot read capacities: " << sizes.error().describe() << "\n";
        return 1;
    }
    const auto& s = sizes.value();
    std::cout << fmt::format("{:<16}{} / {}\n", "Users", s.users, s.userCapacity);
    std::cout << fmt::format("{:<16}{} / {}\n", "Fingers", s.fingers, s.fingerCapacity);
    std::cout << fmt::format("{:<16}{} / {}\n", "Records", s.records, s.recordCapacity);
    if (s.hasFaceInfo) {
        std::cout << fmt::format("{:<16}{} / {}\n", "Faces", s.faces, s.faceCapacity);
    }
    return 0;
}

int listUsers(DeviceClient& client) {
    auto users = client.listUsers();
    if (!users) {
        std::cerr << "Cannot list users: " << users.error().describe() << "\n";
        return 1;
    }

    std::cout << fmt::format("{:>5}  {:<10} {:<24} {:<6} {:>10}  {}\n",
                             "uid", "user_id", "name", "priv", "card", "group");
    for (const auto& user : users.value()) {
        std::cout << fmt::format("{:>5}  {:<10} {:<24} {:<6} {:>10}  {}\n",
                                 user.uid, user.userId, user.name,
                                 user.privilege == zkemu::protocol::Privilege::Admin ? "admin" : "user",
                                 user.card, user.groupId);
    }
    std::cout << users.value().size() << " users\n";
    return 0;
}

int listAttendance(DeviceClient& client) {
    auto records = client.listAttendance();
    if (!records) {
        std::cerr << "Cannot list attendance: " << records.error().describe() << "\n";
        return 1;
    }

    for (const auto& record : records.value()) {
        std::cout << fmt::format("{}  uid={:<5} user_id={:<10} status={} punch={}\n",
                                 record.timestamp.toString(), record.uid, record.userId,
                                 static_cast<int>(record.status), static_cast<int>(record.punch));
    }
    std::cout << records.value().size() << " records\n";
    return 0;
}

int listTemplates(DeviceClient& client) {
    auto templates = client.listTemplates();
    if (!templates) {
        std::cerr << "Cannot list templates: " << templates.error().describe() << "\n";
        return 1;
    }

    for (const auto& record : templates.value()) {
        std::cout << fmt::format("uid={:<5} finger={} valid={} size={}\n",
                                 record.uid, record.fingerIndex, record.valid ? 1 : 0, record.data.size());
    }
    std::cout << templates.value().size() << " templates\n";
    return 0;
}

int addUser(DeviceClient& client, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "add-user needs a name\n";
        return 1;
    }

    zkemu::protocol::UserRecord user;
    user.name = args[0];
    if (args.size() > 1) user.userId = args[1];
    if (args.size() > 2) user.password = args[2];
    if (args.size() > 3) {
        try {
            user.card = static_cast<uint32_t>(std::stoul(args[3]));
        }
        catch (const std::exception&) {
            std::cerr << "Invalid card number: " << args[3] << "\n";
            return 1;
        }
    }

    auto stored = client.addUser(user);
    if (!stored) {
        std::cerr << "add-user failed: " << stored.error().describe() << "\n";
        return 1;
    }
    std::cout << fmt::format("Stored uid={} user_id={}\n", stored.value().uid, stored.value().userId);
    return 0;
}

int runCommand(DeviceClient& client, const std::string& command, const std::vector<std::string>& args) {
    try {
        if (command == "info") return showInfo(client);
        if (command == "users") return listUsers(client);
        if (command == "attendance") return listAttendance(client);
        if (command == "templates") return listTemplates(client);
        if (command == "add-user") return addUser(client, args);
        if (command == "delete-user") {
            if (args.empty()) {
                std::cerr << "delete-user needs a user id\n";
                return 1;
            }
            return report(client.deleteUserById(args[0]), "delete-user");
        }
        if (command == "set-time") return report(client.setTime(zkemu::protocol::DateTime::now()), "set-time");
        if (command == "clear-attendance") return report(client.clearAttendance(), "clear-attendance");
        if (command == "unlock") {
            uint32_t seconds = args.empty() ? 3 : static_cast<uint32_t>(std::stoul(args[0]));
            return report(client.unlockDoor(seconds), "unlock");
        }
        if (command == "door") {
            auto locked = client.getDoorState();
            if (!locked) {
                std::cerr << "door failed: " << locked.error().describe() << "\n";
                return 1;
            }
            std::cout << "Door is " << (locked.value() ? "locked" : "open") << "\n";
            return 0;
        }
        if (command == "lcd") {
            if (args.size() < 2) {
                std::cerr << "lcd needs a line and a text\n";
                return 1;
            }
            return report(client.writeLcd(static_cast<int16_t>(std::stoi(args[0])), args[1]), "lcd");
        }
        if (command == "voice") {
            uint32_t index = args.empty() ? 0 : static_cast<uint32_t>(std::stoul(args[0]));
            return report(client.testVoice(index), "voice");
        }
        if (command == "restart") return report(client.restart(), "restart");
        if (command == "poweroff") return report(client.powerOff(), "poweroff");
    }
    catch (const std::exception& e) {
        std::cerr << "Invalid argument for " << command << ": " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << command << "\n";
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    auto& config = zkemu::utils::Config::instance();

    std::string command;
    std::vector<std::string> commandArgs;
    std::vector<std::pair<std::string, std::string>> overrides;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto needValue = [&](const char* key) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return false;
            }
            overrides.emplace_back(key, argv[++i]);
            return true;
        };

        if (!command.empty()) {
            commandArgs.push_back(arg);
        }
        else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --config requires a filename\n";
                return 1;
            }
            std::string file = argv[++i];
            if (!config.loadFromFile(file)) {
                std::cerr << "Error: cannot read " << file << "\n";
                return 1;
            }
        }
        else if (arg == "-a" || arg == "--address") {
            if (!needValue("device_address")) return 1;
        }
        else if (arg == "-p" || arg == "--port") {
            if (!needValue("device_port")) return 1;
        }
        else if (arg == "-P" || arg == "--password") {
            if (!needValue("device_password")) return 1;
        }
        else if (arg == "-t" || arg == "--timeout") {
            if (!needValue("timeout_ms")) return 1;
        }
        else if (arg == "-u" || arg == "--udp") {
            overrides.emplace_back("transport", "udp");
        }
        else if (arg == "--no-ping") {
            overrides.emplace_back("omit_ping", "true");
        }
        else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        }
        else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
        else {
            command = arg;
        }
    }

    if (command.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    // Command line wins over the file
    for (const auto& entry : overrides) {
        if (!config.set(entry.first, entry.second)) {
            std::cerr << "Error: invalid value '" << entry.second << "' for " << entry.first << "\n";
            return 1;
        }
    }

    const auto& settings = config.getClientConfig();

    zkemu::utils::LogOptions logOptions;
    logOptions.level = verbose ? "trace" : settings.log_level;
    logOptions.file = settings.log_file;
    zkemu::utils::Logger::init(logOptions);

    DeviceClient client(settings);
    auto connected = client.connect();
    if (!connected) {
        std::cerr << "Cannot connect to " << settings.device_address << ":" << settings.device_port
                  << ": " << connected.error().describe() << "\n";
        zkemu::utils::Logger::shutdown();
        return 2;
    }

    int result = runCommand(client, command, commandArgs);

    if (client.isConnected()) {
        auto closed = client.disconnect();
        if (!closed) {
            LOG_WARN("Disconnect failed: {}", closed.error().describe());
        }
    }

    zkemu::utils::Logger::shutdown();
    return result;
}
