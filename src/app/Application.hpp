#pragma once

#include "app/InstanceCoordinator.hpp"
#include "core/types/ArgumentBatch.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/common.h>

#include <memory>
#include <optional>
#include <string>

namespace relaunch::app {

/**
 * @brief Maps a configured level name ("trace" ... "off") to a spdlog level.
 * @return The level, or std::nullopt if the name is not a level.
 */
std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name);

/**
 * @brief Composition root of the relaunch executable.
 *
 * Loads the configuration, installs logging and wires the Linux
 * collaborators into an InstanceCoordinator.
 */
class Application {
public:
    Application(int argc, char** argv);
    ~Application();

    /**
     * @brief Forwards to a running instance or serves as the primary until signalled.
     * @return Process exit code.
     */
    int run();

    infra::ConfigManager& config() { return *config_; }
    infra::AsioContext& asioContext() { return *asioContext_; }
    InstanceCoordinator& coordinator() { return *coordinator_; }

private:
    void initializeLogging();
    void initializeComponents();

    core::ArgumentBatch arguments_;
    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<infra::AsioContext> asioContext_;
    std::unique_ptr<InstanceCoordinator> coordinator_;
};

} // namespace relaunch::app
