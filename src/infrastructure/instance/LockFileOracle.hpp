#pragma once

#include "core/services/IExclusivityOracle.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace relaunch::infra {

/**
 * @brief Exclusivity oracle backed by an advisory lock file per application.
 *
 * The first caller takes an exclusive flock() on <runtimeDir>/<name>.lock and
 * keeps the descriptor open until destruction. The kernel drops the lock when
 * the holder exits, so a killed holder never leaves a stale claim behind.
 * Asking again for a name this oracle already holds returns true.
 */
class LockFileOracle : public core::IExclusivityOracle {
public:
    explicit LockFileOracle(std::filesystem::path runtimeDir);

    /**
     * @brief Destructor. Releases every lock held by this oracle.
     */
    ~LockFileOracle() override;

    LockFileOracle(const LockFileOracle&) = delete;
    LockFileOracle& operator=(const LockFileOracle&) = delete;

    bool isFirstInstance(const std::string& applicationName) override;

    /**
     * @brief Releases the lock for a name, if held.
     */
    void release(const std::string& applicationName);

private:
    std::filesystem::path runtimeDir_;
    std::map<std::string, int> heldLocks_;
    std::mutex mutex_;
};

} // namespace relaunch::infra
