#include "infrastructure/ipc/ChannelEndpoint.hpp"

#include "core/types/ChannelErrors.hpp"

#include <cstdlib>
#include <sys/un.h>

namespace relaunch::infra {

std::filesystem::path resolveRuntimeDir(const std::filesystem::path& configured) {
    if (!configured.empty()) {
        return configured;
    }

    if (const char* runtimeDir = std::getenv("XDG_RUNTIME_DIR"); runtimeDir && *runtimeDir) {
        return runtimeDir;
    }
    return "/tmp";
}

std::filesystem::path socketPathFor(const std::filesystem::path& runtimeDir,
                                    const std::string& applicationName) {
    auto path = runtimeDir / (applicationName + ".sock");

    // sun_path must hold the path plus its terminating NUL
    if (path.native().size() >= sizeof(sockaddr_un::sun_path)) {
        throw core::ChannelError("Socket path too long: " + path.string(),
                                 std::make_error_code(std::errc::filename_too_long));
    }
    return path;
}

std::filesystem::path lockPathFor(const std::filesystem::path& runtimeDir,
                                  const std::string& applicationName) {
    return runtimeDir / (applicationName + ".lock");
}

} // namespace relaunch::infra
