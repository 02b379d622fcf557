#include "app/Application.hpp"

#include "infrastructure/instance/LockFileOracle.hpp"
#include "infrastructure/ipc/ChannelEndpoint.hpp"
#include "infrastructure/ipc/LocalChannelFactory.hpp"
#include "infrastructure/process/ProcProcessRegistry.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <future>
#include <stop_token>

namespace relaunch::app {

namespace {

std::string joinArguments(const core::ArgumentBatch& batch) {
    std::string joined;
    for (const auto& argument : batch) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += argument;
    }
    return joined;
}

} // namespace

std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str() reports unknown names as "off"
    if (level == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return level;
}

Application::Application(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        arguments_.emplace_back(argv[i]);
    }

    config_ = std::make_unique<infra::ConfigManager>(infra::ConfigManager::defaultConfigDir());
    config_->load();

    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    coordinator_.reset();

    if (asioContext_) {
        asioContext_->stop();
    }

    spdlog::debug("Application shut down");
}

void Application::initializeLogging() {
    const auto& cfg = config_->config();

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    std::vector<spdlog::sink_ptr> sinks{consoleSink};

    if (!cfg.logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(cfg.logFile,
                                                                               5 * 1024 * 1024, 3);
        fileSink->set_level(spdlog::level::debug);
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>("relaunch", sinks.begin(), sinks.end());
    auto level = parseLogLevel(cfg.logLevel);
    logger->set_level(level.value_or(spdlog::level::info));
    spdlog::set_default_logger(logger);

    if (!level) {
        spdlog::warn("Unknown log level '{}' in {}, using info", cfg.logLevel,
                     config_->configPath().string());
    }

    if (!cfg.logFile.empty()) {
        spdlog::debug("Log file: {}", cfg.logFile);
    }
}

void Application::initializeComponents() {
    const auto& cfg = config_->config();

    asioContext_ = std::make_unique<infra::AsioContext>(
        static_cast<size_t>(cfg.workerThreads > 0 ? cfg.workerThreads : 1));
    asioContext_->start();

    auto runtimeDir = infra::resolveRuntimeDir(cfg.runtimeDir);

    infra::LocalSocketServer::Options serverOptions;
    serverOptions.sessionTimeout = std::chrono::milliseconds(cfg.sessionTimeoutMs);
    serverOptions.maxMessageBytes = cfg.maxMessageBytes;

    InstanceCoordinator::Collaborators collaborators;
    collaborators.oracle = std::make_shared<infra::LockFileOracle>(runtimeDir);
    collaborators.channels =
        std::make_shared<infra::LocalChannelFactory>(*asioContext_, runtimeDir, serverOptions);
    collaborators.processes = std::make_shared<infra::ProcProcessRegistry>();

    std::optional<std::string> name;
    if (!cfg.applicationName.empty()) {
        name = cfg.applicationName;
    }

    coordinator_ = std::make_unique<InstanceCoordinator>(*asioContext_, collaborators, name);
    coordinator_->setClientTimeout(std::chrono::milliseconds(cfg.clientTimeoutMs));
    coordinator_->setAllowOtherUsers(cfg.allowOtherUsers);

    spdlog::debug("Application components initialized (runtime dir {})", runtimeDir.string());
}

int Application::run() {
    coordinator_->onArgumentsReceived([](const core::ArgumentBatch& batch) {
        spdlog::info("Arguments received: [{}]", joinArguments(batch));
    });
    coordinator_->onExceptionOccurred([](std::exception_ptr exception) {
        try {
            std::rethrow_exception(exception);
        } catch (const std::exception& e) {
            spdlog::error("Channel error: {}", e.what());
        }
    });

    if (coordinator_->trySend(arguments_).get()) {
        return 0;
    }

    auto shutdownRequested = std::make_shared<std::promise<int>>();
    auto shutdown = shutdownRequested->get_future();

    asio::signal_set signals(asioContext_->getContext(), SIGINT, SIGTERM);
    signals.async_wait([shutdownRequested](const asio::error_code& ec, int signalNumber) {
        shutdownRequested->set_value(ec ? 0 : signalNumber);
    });

    std::stop_source stopSource;
    coordinator_->start(arguments_, stopSource.get_token()).get();
    spdlog::info("Serving as primary instance of '{}'", coordinator_->applicationName());

    if (auto signalNumber = shutdown.get(); signalNumber != 0) {
        spdlog::info("Received signal {}, shutting down", signalNumber);
    }

    stopSource.request_stop();
    coordinator_->dispose();
    return 0;
}

} // namespace relaunch::app
