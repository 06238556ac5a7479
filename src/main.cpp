#include "zkemu/sim/simulator.hpp"
#include "zkemu/utils/config.hpp"
#include "zkemu/utils/logger.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

static std::atomic<bool> g_running{true};

void signalHandler(int /*signal*/) {
    g_running = false;
}

void printUsage(const char* program) {
    std::cout << "ZKTeco-compatible attendance terminal simulator\n";
    std::cout << "Usage: " << program << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <file>   Load configuration from file\n";
    std::cout << "  -p, --port <port>     Listen on this TCP/UDP port (default 4370)\n";
    std::cout << "  -h, --help            Show this help message\n";
    std::cout << "\n";
    std::cout << "The simulator answers the binary terminal protocol on TCP and UDP.\n";
    std::cout << "See config/simulator.ini for the available settings.\n";
}

int main(int argc, char* argv[]) {
    // Parse arguments
    std::string configFile;
    std::string portOverride;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                configFile = argv[++i];
            }
            else {
                std::cerr << "Error: --config requires a filename\n";
                return 1;
            }
        }
        else if (arg == "-p" || arg == "--port") {
            if (i + 1 < argc) {
                portOverride = argv[++i];
            }
            else {
                std::cerr << "Error: --port requires a number\n";
                return 1;
            }
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    // Load configuration before logging so the level and file apply
    auto& config = zkemu::utils::Config::instance();
    bool configLoaded = configFile.empty() || config.loadFromFile(configFile);

    if (!portOverride.empty() && !config.set("port", portOverride)) {
        std::cerr << "Error: invalid port " << portOverride << "\n";
        return 1;
    }

    const auto& settings = config.getSimulatorConfig();

    zkemu::utils::LogOptions logOptions;
    logOptions.level = settings.log_level;
    logOptions.file = settings.log_file;
    zkemu::utils::Logger::init(logOptions);

    LOG_INFO("===========================================");
    LOG_INFO("  zkemu terminal simulator");
    LOG_INFO("  Version 0.1.0");
    LOG_INFO("===========================================");

    if (!configFile.empty()) {
        if (configLoaded) {
            LOG_INFO("Loaded configuration from {}", configFile);
        }
        else {
            LOG_WARN("Failed to load config file: {}", configFile);
        }
    }

    // Set up signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    // Create and initialize simulator
    zkemu::sim::Simulator simulator;

    if (!simulator.init(settings)) {
        LOG_ERROR("Failed to initialize simulator");
        zkemu::utils::Logger::shutdown();
        return 1;
    }

    try {
        simulator.start();
    }
    catch (const std::exception& e) {
        LOG_CRITICAL("Cannot listen on port {}: {}", settings.port, e.what());
        zkemu::utils::Logger::shutdown();
        return 1;
    }

    LOG_INFO("Simulator is running. Press Ctrl+C to stop.");

    simulator.runInBackground();
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_INFO("Received shutdown signal");
    simulator.stop();

    LOG_INFO("Simulator shutdown complete");

    zkemu::utils::Logger::shutdown();

    return 0;
}
