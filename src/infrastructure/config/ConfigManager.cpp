#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace relaunch::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        spdlog::debug("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    j["instance"]["name"] = config_.applicationName;

    j["client"]["timeout_ms"] = config_.clientTimeoutMs;

    j["channel"]["runtime_dir"] = config_.runtimeDir;
    j["channel"]["allow_other_users"] = config_.allowOtherUsers;
    j["channel"]["session_timeout_ms"] = config_.sessionTimeoutMs;
    j["channel"]["max_message_bytes"] = config_.maxMessageBytes;

    j["runtime"]["worker_threads"] = config_.workerThreads;

    j["logging"]["level"] = config_.logLevel;
    j["logging"]["file"] = config_.logFile;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    if (j.contains("instance")) {
        const auto& i = j["instance"];
        config_.applicationName = i.value("name", "");
    }

    if (j.contains("client")) {
        const auto& c = j["client"];
        config_.clientTimeoutMs = c.value("timeout_ms", 5000);
    }

    if (j.contains("channel")) {
        const auto& ch = j["channel"];
        config_.runtimeDir = ch.value("runtime_dir", "");
        config_.allowOtherUsers = ch.value("allow_other_users", true);
        config_.sessionTimeoutMs = ch.value("session_timeout_ms", 5000);
        config_.maxMessageBytes = ch.value("max_message_bytes", size_t{1024 * 1024});
    }

    if (j.contains("runtime")) {
        const auto& r = j["runtime"];
        config_.workerThreads = r.value("worker_threads", 2);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config_.logLevel = l.value("level", "info");
        config_.logFile = l.value("file", "");
    }
}

std::filesystem::path ConfigManager::defaultConfigDir() {
    if (const char* dir = std::getenv("RELAUNCH_CONFIG_DIR"); dir && *dir) {
        return dir;
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "relaunch";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "relaunch";
    }
    return std::filesystem::temp_directory_path() / "relaunch";
}

} // namespace relaunch::infra
