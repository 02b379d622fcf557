#pragma once

#include <cstddef>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace relaunch::infra {

/**
 * @brief Launcher configuration settings.
 *
 * Covers the instance key, forwarding timeouts, channel placement and limits,
 * the worker pool size and logging.
 */
struct RelayConfig {
    // Instance
    std::string applicationName;    ///< Exclusivity/channel key; empty derives it from the executable.

    // Client
    int clientTimeoutMs{5000};      ///< Budget for one forwarding attempt in milliseconds.

    // Channel
    std::string runtimeDir;         ///< Socket and lock directory; empty selects the default.
    bool allowOtherUsers{true};     ///< Let other local users connect to the primary.
    int sessionTimeoutMs{5000};     ///< Idle limit for a connected client in milliseconds.
    size_t maxMessageBytes{1024 * 1024}; ///< Largest accepted message payload.

    // Runtime
    int workerThreads{2};           ///< Worker threads in the shared AsioContext.

    // Logging
    std::string logLevel{"info"};   ///< spdlog level name ("trace" ... "off").
    std::string logFile;            ///< Rotating log file; empty disables file logging.
};

/**
 * @brief Manages launcher configuration persistence.
 *
 * Loads and saves RelayConfig as JSON in <configDir>/config.json. Missing
 * keys keep their defaults; a missing file is created with the defaults.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory (created if missing).
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk.
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    RelayConfig& config() { return config_; }
    const RelayConfig& config() const { return config_; }

    std::filesystem::path configPath() const { return configPath_; }
    std::string configDir() const { return configDir_.string(); }

    /**
     * @brief Returns the default configuration directory.
     *
     * $RELAUNCH_CONFIG_DIR if set, otherwise $XDG_CONFIG_HOME/relaunch,
     * otherwise ~/.config/relaunch.
     */
    static std::filesystem::path defaultConfigDir();

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    RelayConfig config_;
};

} // namespace relaunch::infra
