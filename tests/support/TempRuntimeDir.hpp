#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include <unistd.h>

namespace relaunch::testing {

/**
 * @brief Short-lived runtime directory for sockets and lock files.
 *
 * Kept directly under /tmp so socket paths stay well below the sun_path limit.
 */
class TempRuntimeDir {
public:
    TempRuntimeDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::path("/tmp") /
                ("relaunch_t" + std::to_string(getpid()) + "_" + std::to_string(++counter));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempRuntimeDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempRuntimeDir(const TempRuntimeDir&) = delete;
    TempRuntimeDir& operator=(const TempRuntimeDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace relaunch::testing
