#include "infrastructure/instance/LockFileOracle.hpp"

#include "infrastructure/ipc/ChannelEndpoint.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace relaunch::infra {

LockFileOracle::LockFileOracle(std::filesystem::path runtimeDir)
    : runtimeDir_(std::move(runtimeDir)) {}

LockFileOracle::~LockFileOracle() {
    std::lock_guard lock(mutex_);
    for (auto& [name, fd] : heldLocks_) {
        flock(fd, LOCK_UN);
        close(fd);
    }
    heldLocks_.clear();
}

bool LockFileOracle::isFirstInstance(const std::string& applicationName) {
    std::lock_guard lock(mutex_);

    if (heldLocks_.contains(applicationName)) {
        return true;
    }

    std::error_code ec;
    std::filesystem::create_directories(runtimeDir_, ec);

    auto lockPath = lockPathFor(runtimeDir_, applicationName);
    int fd = open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0666);
    if (fd == -1) {
        spdlog::error("Failed to open lock file {}: {}", lockPath.string(), std::strerror(errno));
        return false;
    }

    if (flock(fd, LOCK_EX | LOCK_NB) == -1) {
        int error = errno;
        close(fd);
        if (error == EWOULDBLOCK) {
            spdlog::debug("Lock {} is held by another instance", lockPath.string());
        } else {
            spdlog::error("Failed to lock {}: {}", lockPath.string(), std::strerror(error));
        }
        return false;
    }

    heldLocks_[applicationName] = fd;
    spdlog::debug("Acquired instance lock {}", lockPath.string());
    return true;
}

void LockFileOracle::release(const std::string& applicationName) {
    std::lock_guard lock(mutex_);

    auto it = heldLocks_.find(applicationName);
    if (it == heldLocks_.end()) {
        return;
    }

    flock(it->second, LOCK_UN);
    close(it->second);
    heldLocks_.erase(it);
}

} // namespace relaunch::infra
