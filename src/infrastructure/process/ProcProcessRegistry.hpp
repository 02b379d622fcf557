#pragma once

#include "core/services/IProcessRegistry.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace relaunch::infra {

/**
 * @brief Handle to a process, pinned by an open /proc/<pid> directory descriptor.
 *
 * Where the kernel supports it, signals are sent through the descriptor
 * (pidfd_send_signal), so a recycled pid can never be hit by mistake.
 */
class ProcProcessHandle : public core::IProcessHandle {
public:
    ProcProcessHandle(pid_t pid, int procDirFd);

    /**
     * @brief Destructor. Closes the /proc descriptor.
     */
    ~ProcProcessHandle() override;

    ProcProcessHandle(const ProcProcessHandle&) = delete;
    ProcProcessHandle& operator=(const ProcProcessHandle&) = delete;

    pid_t id() const override { return pid_; }

    /**
     * @brief Sends SIGKILL to the process.
     * @throws std::system_error if the signal cannot be delivered.
     */
    void terminate() override;

private:
    pid_t pid_;
    int procDirFd_;
};

/**
 * @brief Process registry reading the Linux /proc filesystem.
 *
 * A process matches a name when the file name of /proc/<pid>/exe equals it.
 * When exe is unreadable (processes of other users), /proc/<pid>/comm is
 * compared against the name truncated to the kernel's 15-character limit.
 */
class ProcProcessRegistry : public core::IProcessRegistry {
public:
    explicit ProcProcessRegistry(std::filesystem::path procRoot = "/proc");

    std::vector<std::unique_ptr<core::IProcessHandle>> findByName(const std::string& name) override;
    pid_t currentProcessId() const override;
    std::string currentExecutableName() const override;

private:
    std::optional<std::string> executableName(const std::filesystem::path& procDir) const;
    std::optional<std::string> commandName(const std::filesystem::path& procDir) const;

    std::filesystem::path procRoot_;
};

} // namespace relaunch::infra
