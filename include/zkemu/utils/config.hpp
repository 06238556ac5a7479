#pragma once

#include "zkemu/core/types.hpp"
#include <string>

namespace zkemu::utils {

/**
 * Configuration manager
 *
 * Loads simulator and client settings from a "key = value" file.
 * Unknown keys are ignored, malformed values are logged and skipped.
 */
class Config {
public:
    static Config& instance();

    // Load config from file
    bool loadFromFile(const std::string& path);

    // Save config to file
    bool saveToFile(const std::string& path) const;

    // Apply a single setting, returns false for unknown keys or bad values
    bool set(const std::string& key, const std::string& value);

    const SimulatorConfig& getSimulatorConfig() const { return m_simulator; }
    SimulatorConfig& getSimulatorConfig() { return m_simulator; }

    const ClientConfig& getClientConfig() const { return m_client; }
    ClientConfig& getClientConfig() { return m_client; }

    void reset();

private:
    Config() = default;

    SimulatorConfig m_simulator;
    ClientConfig m_client;
};

} // namespace zkemu::utils
