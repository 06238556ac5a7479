#include "zkemu/sim/simulator.hpp"
#include "zkemu/sim/components/control_component.hpp"
#include "zkemu/sim/components/data_component.hpp"
#include "zkemu/sim/components/info_component.hpp"
#include "zkemu/sim/components/session_component.hpp"
#include "zkemu/utils/logger.hpp"

#include <algorithm>

namespace zkemu::sim {

Simulator::Simulator()
    : m_running(false)
{
}

Simulator::~Simulator() {
    stop();
}

bool Simulator::init(const SimulatorConfig& config) {
    m_config = config;

    LOG_INFO("Initializing terminal simulator");
    LOG_INFO("  Address:  {}:{}", config.bind_address, config.port);
    LOG_INFO("  TCP:      {}", config.enable_tcp ? "on" : "off");
    LOG_INFO("  UDP:      {}", config.enable_udp ? "on" : "off");
    LOG_INFO("  Password: {}", config.password != 0 ? "set" : "none");
    LOG_INFO("  Firmware: {}", config.firmware_version);

    if (!config.enable_tcp && !config.enable_udp) {
        LOG_ERROR("Both TCP and UDP are disabled");
        return false;
    }

    m_store = std::make_unique<DeviceStore>(config);
    m_store->seedDefaults();

    m_dispatcher = std::make_unique<Dispatcher>(*m_store);
    setupComponents();

    if (config.enable_tcp) {
        m_tcpListener = std::make_shared<TcpListener>(m_io_context, config.bind_address, config.port);
        m_tcpListener->setConnectionHandler(
            [this](tcp::socket socket) { handleTcpConnection(std::move(socket)); });
    }

    if (config.enable_udp) {
        m_udpListener = std::make_shared<UdpListener>(m_io_context, *m_dispatcher, config.bind_address, config.port);
    }

    LOG_INFO("Simulator initialized with {} users, {} punches",
             m_store->users().size(), m_store->attendance().size());
    return true;
}

void Simulator::setupComponents() {
    m_dispatcher->registerComponent(std::make_shared<components::SessionComponent>());
    m_dispatcher->registerComponent(std::make_shared<components::InfoComponent>());
    m_dispatcher->registerComponent(std::make_shared<components::ControlComponent>());
    m_dispatcher->registerComponent(std::make_shared<components::DataComponent>());

    LOG_INFO("Components registered ({} commands)", m_dispatcher->handlerCount());
}

void Simulator::start() {
    if (m_running) return;

    if (m_tcpListener) m_tcpListener->start();
    if (m_udpListener) m_udpListener->start();

    m_running = true;
    LOG_INFO("Simulator started");
}

void Simulator::stop() {
    if (!m_running) return;

    LOG_INFO("Stopping simulator...");

    m_running = false;

    if (m_tcpListener) m_tcpListener->stop();

    {
        std::lock_guard<std::mutex> lock(m_connectionsMutex);
        for (auto& entry : m_connections) {
            entry.second->close();
        }
    }

    m_io_context.stop();

    // Wait for worker threads
    for (auto& thread : m_threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    m_threads.clear();

    // No handler runs past this point
    if (m_udpListener) m_udpListener->stop();

    // Posted closes may have been dropped by the io_context stop.
    // stop() runs the disconnect handler, which takes the lock itself.
    std::vector<std::shared_ptr<DeviceConnection>> remaining;
    {
        std::lock_guard<std::mutex> lock(m_connectionsMutex);
        for (auto& entry : m_connections) {
            remaining.push_back(entry.second);
        }
    }
    for (auto& connection : remaining) {
        connection->stop();
    }
    {
        std::lock_guard<std::mutex> lock(m_connectionsMutex);
        m_connections.clear();
    }

    LOG_INFO("Simulator stopped");
}

void Simulator::runInBackground() {
    unsigned int numThreads = std::max(1u, m_config.worker_threads);

    LOG_INFO("Starting {} worker threads", numThreads);

    for (unsigned int i = 0; i < numThreads; i++) {
        m_threads.emplace_back([this]() {
            m_io_context.run();
        });
    }
}

uint16_t Simulator::tcpPort() const {
    return m_tcpListener ? m_tcpListener->localPort() : 0;
}

uint16_t Simulator::udpPort() const {
    return m_udpListener ? m_udpListener->localPort() : 0;
}

size_t Simulator::connectionCount() const {
    std::lock_guard<std::mutex> lock(m_connectionsMutex);
    return m_connections.size();
}

void Simulator::handleTcpConnection(tcp::socket socket) {
    std::shared_ptr<DeviceConnection> connection;
    {
        std::lock_guard<std::mutex> lock(m_connectionsMutex);
        uint64_t connId = m_nextConnectionId++;
        connection = std::make_shared<DeviceConnection>(std::move(socket), *m_dispatcher, connId);
        m_connections[connId] = connection;
    }

    connection->setDisconnectHandler([this](uint64_t connectionId) {
        std::lock_guard<std::mutex> lock(m_connectionsMutex);
        m_connections.erase(connectionId);
        LOG_DEBUG("Client {} disconnected, {} remaining", connectionId, m_connections.size());
    });

    connection->start();
}

} // namespace zkemu::sim
