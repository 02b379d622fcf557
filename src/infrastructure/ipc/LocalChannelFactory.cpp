#include "infrastructure/ipc/LocalChannelFactory.hpp"

#include "infrastructure/ipc/ChannelEndpoint.hpp"
#include "infrastructure/ipc/LocalSocketClient.hpp"

namespace relaunch::infra {

LocalChannelFactory::LocalChannelFactory(AsioContext& context, std::filesystem::path runtimeDir,
                                         LocalSocketServer::Options serverOptions)
    : context_(context), runtimeDir_(std::move(runtimeDir)), serverOptions_(serverOptions) {}

std::unique_ptr<core::IChannelClient>
LocalChannelFactory::createClient(const std::string& applicationName) {
    return std::make_unique<LocalSocketClient>(socketPathFor(runtimeDir_, applicationName));
}

std::shared_ptr<core::IChannelServer>
LocalChannelFactory::createServer(const std::string& applicationName) {
    auto socketPath = socketPathFor(runtimeDir_, applicationName);
    std::filesystem::create_directories(runtimeDir_);
    return std::make_shared<LocalSocketServer>(context_, std::move(socketPath), serverOptions_);
}

} // namespace relaunch::infra
