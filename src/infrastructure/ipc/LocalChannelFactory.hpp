#pragma once

#include "core/services/IForwardingChannel.hpp"
#include "infrastructure/ipc/LocalSocketServer.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <filesystem>

namespace relaunch::infra {

/**
 * @brief Creates Unix domain socket channel endpoints under one runtime directory.
 */
class LocalChannelFactory : public core::IChannelFactory {
public:
    /**
     * @brief Constructs a factory.
     * @param context AsioContext that runs server I/O.
     * @param runtimeDir Directory for socket files (see resolveRuntimeDir()).
     * @param serverOptions Session limits applied to created servers.
     */
    LocalChannelFactory(AsioContext& context, std::filesystem::path runtimeDir,
                        LocalSocketServer::Options serverOptions = {});

    std::unique_ptr<core::IChannelClient> createClient(const std::string& applicationName) override;
    std::shared_ptr<core::IChannelServer> createServer(const std::string& applicationName) override;

    const std::filesystem::path& runtimeDir() const { return runtimeDir_; }

private:
    AsioContext& context_;
    std::filesystem::path runtimeDir_;
    LocalSocketServer::Options serverOptions_;
};

} // namespace relaunch::infra
