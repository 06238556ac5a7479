#include "zkemu/utils/config.hpp"
#include "zkemu/utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace zkemu::utils {

namespace {

bool parseBool(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    throw std::invalid_argument("not a boolean: " + value);
}

uint16_t parsePort(const std::string& value) {
    unsigned long port = std::stoul(value);
    if (port > 0xFFFF) {
        throw std::out_of_range("port out of range: " + value);
    }
    return static_cast<uint16_t>(port);
}

TransportKind parseTransport(const std::string& value) {
    if (value == "tcp" || value == "TCP") return TransportKind::Tcp;
    if (value == "udp" || value == "UDP") return TransportKind::Udp;
    throw std::invalid_argument("unknown transport: " + value);
}

} // namespace

Config& Config::instance() {
    static Config config;
    return config;
}

void Config::reset() {
    m_simulator = SimulatorConfig{};
    m_client = ClientConfig{};
}

bool Config::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line)) {
        lineNumber++;

        // Trim whitespace
        auto trim = [](std::string& s) {
            s.erase(0, s.find_first_not_of(" \t\r"));
            s.erase(s.find_last_not_of(" \t\r") + 1);
        };
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[') {
            continue;
        }

        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) {
            LOG_WARN("{}:{}: expected key = value", path, lineNumber);
            continue;
        }

        std::string key = line.substr(0, eqPos);
        std::string value = line.substr(eqPos + 1);
        trim(key);
        trim(value);

        if (!set(key, value)) {
            LOG_WARN("{}:{}: ignoring '{}'", path, lineNumber, key);
        }
    }

    return true;
}

bool Config::set(const std::string& key, const std::string& value) {
    try {
        // Simulator
        if (key == "bind_address") m_simulator.bind_address = value;
        else if (key == "port") m_simulator.port = parsePort(value);
        else if (key == "enable_tcp") m_simulator.enable_tcp = parseBool(value);
        else if (key == "enable_udp") m_simulator.enable_udp = parseBool(value);
        else if (key == "password") m_simulator.password = static_cast<uint32_t>(std::stoul(value));
        else if (key == "firmware_version") m_simulator.firmware_version = value;
        else if (key == "serial_number") m_simulator.serial_number = value;
        else if (key == "platform") m_simulator.platform = value;
        else if (key == "device_name") m_simulator.device_name = value;
        else if (key == "mac_address") m_simulator.mac_address = value;
        else if (key == "ip_address") m_simulator.ip_address = value;
        else if (key == "netmask") m_simulator.netmask = value;
        else if (key == "gateway") m_simulator.gateway = value;
        else if (key == "user_capacity") m_simulator.user_capacity = std::stoi(value);
        else if (key == "finger_capacity") m_simulator.finger_capacity = std::stoi(value);
        else if (key == "record_capacity") m_simulator.record_capacity = std::stoi(value);
        else if (key == "inline_data_limit") m_simulator.inline_data_limit = static_cast<uint32_t>(std::stoul(value));
        else if (key == "seed_demo_data") m_simulator.seed_demo_data = parseBool(value);
        else if (key == "worker_threads") m_simulator.worker_threads = static_cast<unsigned int>(std::stoul(value));
        // Client
        else if (key == "device_address") m_client.device_address = value;
        else if (key == "device_port") m_client.device_port = parsePort(value);
        else if (key == "transport") m_client.transport = parseTransport(value);
        else if (key == "device_password") m_client.password = static_cast<uint32_t>(std::stoul(value));
        else if (key == "timeout_ms") m_client.timeout_ms = static_cast<uint32_t>(std::stoul(value));
        else if (key == "omit_ping") m_client.omit_ping = parseBool(value);
        else if (key == "udp_retries") m_client.udp_retries = std::stoi(value);
        else if (key == "heartbeat_interval_s") m_client.heartbeat_interval_s = static_cast<uint32_t>(std::stoul(value));
        // Shared
        else if (key == "log_level") {
            m_simulator.log_level = value;
            m_client.log_level = value;
        }
        else if (key == "log_file") {
            m_simulator.log_file = value;
            m_client.log_file = value;
        }
        else {
            return false;
        }
    }
    catch (const std::exception& e) {
        LOG_WARN("Bad value for {}: {} ({})", key, value, e.what());
        return false;
    }
    return true;
}

bool Config::saveToFile(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }

    file << "# zkemu configuration\n\n";

    file << "# Simulated terminal\n";
    file << "bind_address = " << m_simulator.bind_address << "\n";
    file << "port = " << m_simulator.port << "\n";
    file << "enable_tcp = " << (m_simulator.enable_tcp ? "true" : "false") << "\n";
    file << "enable_udp = " << (m_simulator.enable_udp ? "true" : "false") << "\n";
    file << "password = " << m_simulator.password << "\n";
    file << "firmware_version = " << m_simulator.firmware_version << "\n";
    file << "serial_number = " << m_simulator.serial_number << "\n";
    file << "platform = " << m_simulator.platform << "\n";
    file << "device_name = " << m_simulator.device_name << "\n";
    file << "mac_address = " << m_simulator.mac_address << "\n";
    file << "ip_address = " << m_simulator.ip_address << "\n";
    file << "netmask = " << m_simulator.netmask << "\n";
    file << "gateway = " << m_simulator.gateway << "\n";
    file << "user_capacity = " << m_simulator.user_capacity << "\n";
    file << "finger_capacity = " << m_simulator.finger_capacity << "\n";
    file << "record_capacity = " << m_simulator.record_capacity << "\n";
    file << "inline_data_limit = " << m_simulator.inline_data_limit << "\n";
    file << "seed_demo_data = " << (m_simulator.seed_demo_data ? "true" : "false") << "\n";
    file << "worker_threads = " << m_simulator.worker_threads << "\n\n";

    file << "# Client\n";
    file << "device_address = " << m_client.device_address << "\n";
    file << "device_port = " << m_client.device_port << "\n";
    file << "transport = " << transportName(m_client.transport) << "\n";
    file << "device_password = " << m_client.password << "\n";
    file << "timeout_ms = " << m_client.timeout_ms << "\n";
    file << "omit_ping = " << (m_client.omit_ping ? "true" : "false") << "\n";
    file << "udp_retries = " << m_client.udp_retries << "\n";
    file << "heartbeat_interval_s = " << m_client.heartbeat_interval_s << "\n\n";

    file << "# Logging\n";
    file << "log_level = " << m_simulator.log_level << "\n";
    file << "log_file = " << m_simulator.log_file << "\n";

    return true;
}

} // namespace zkemu::utils
