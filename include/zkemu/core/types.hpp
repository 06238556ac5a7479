#pragma once

#include <cstdint>
#include <string>

namespace zkemu {

enum class TransportKind {
    Tcp,
    Udp
};

inline const char* transportName(TransportKind kind) {
    return kind == TransportKind::Tcp ? "tcp" : "udp";
}

/**
 * Simulator configuration
 */
struct SimulatorConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 4370;
    bool enable_tcp = true;
    bool enable_udp = true;
    uint32_t password = 0;  // 0 disables CMD_AUTH

    std::string firmware_version = "Ver 6.60 Nov 13 2019";
    std::string serial_number = "DGD9190019050335743";
    std::string platform = "ZEM560";
    std::string device_name = "ZKTeco Device";
    std::string mac_address = "00:17:61:C8:EC:17";
    std::string ip_address = "192.168.1.201";
    std::string netmask = "255.255.255.0";
    std::string gateway = "192.168.1.1";

    int32_t user_capacity = 3000;
    int32_t finger_capacity = 10000;
    int32_t record_capacity = 100000;

    // Data sets up to this size are answered inline, larger ones are staged
    uint32_t inline_data_limit = 1024;

    bool seed_demo_data = true;
    unsigned int worker_threads = 2;

    std::string log_level = "info";
    std::string log_file = "zkemu-sim.log";
};

/**
 * Client connection settings
 */
struct ClientConfig {
    std::string device_address = "127.0.0.1";
    uint16_t device_port = 4370;
    TransportKind transport = TransportKind::Tcp;
    uint32_t password = 0;
    uint32_t timeout_ms = 5000;
    bool omit_ping = false;
    int udp_retries = 3;
    uint32_t heartbeat_interval_s = 30;

    std::string log_level = "info";
    std::string log_file;
};

} // namespace zkemu
