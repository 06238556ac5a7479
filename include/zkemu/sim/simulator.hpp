#pragma once

#include "zkemu/core/types.hpp"
#include "zkemu/sim/device_connection.hpp"
#include "zkemu/sim/device_store.hpp"
#include "zkemu/sim/dispatcher.hpp"
#include "zkemu/sim/tcp_listener.hpp"
#include "zkemu/sim/udp_listener.hpp"
#include <asio.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace zkemu::sim {

/**
 * Terminal Simulator
 *
 * Owns the device store, the command dispatcher and the TCP and UDP
 * listeners, all served from one io_context.
 */
class Simulator {
public:
    Simulator();
    ~Simulator();

    // Initialize with configuration
    bool init(const SimulatorConfig& config);

    // Bind the listeners
    void start();

    // Stop listeners, connections and workers
    void stop();

    // Start worker threads and return; stop() joins them
    void runInBackground();

    bool isRunning() const { return m_running; }

    uint16_t tcpPort() const;
    uint16_t udpPort() const;
    size_t connectionCount() const;

    DeviceStore& store() { return *m_store; }
    Dispatcher& dispatcher() { return *m_dispatcher; }

private:
    void setupComponents();
    void handleTcpConnection(tcp::socket socket);

    SimulatorConfig m_config;
    std::unique_ptr<DeviceStore> m_store;
    std::unique_ptr<Dispatcher> m_dispatcher;

    asio::io_context m_io_context;

    std::shared_ptr<TcpListener> m_tcpListener;
    std::shared_ptr<UdpListener> m_udpListener;

    // Worker threads
    std::vector<std::thread> m_threads;
    std::atomic<bool> m_running;

    // Connection tracking
    std::map<uint64_t, std::shared_ptr<DeviceConnection>> m_connections;
    mutable std::mutex m_connectionsMutex;
    uint64_t m_nextConnectionId = 1;
};

} // namespace zkemu::sim
