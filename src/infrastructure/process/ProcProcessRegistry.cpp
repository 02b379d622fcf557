#include "infrastructure/process/ProcProcessRegistry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <fstream>
#include <string_view>
#include <sys/syscall.h>
#include <system_error>
#include <unistd.h>

namespace relaunch::infra {

namespace {

constexpr size_t kCommLength = 15;
constexpr std::string_view kDeletedSuffix = " (deleted)";

bool isPidDirectory(const std::string& name) {
    return !name.empty() && std::all_of(name.begin(), name.end(),
                                        [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

ProcProcessHandle::ProcProcessHandle(pid_t pid, int procDirFd) : pid_(pid), procDirFd_(procDirFd) {}

ProcProcessHandle::~ProcProcessHandle() {
    if (procDirFd_ != -1) {
        close(procDirFd_);
    }
}

void ProcProcessHandle::terminate() {
    int rc = -1;
#ifdef SYS_pidfd_send_signal
    rc = static_cast<int>(syscall(SYS_pidfd_send_signal, procDirFd_, SIGKILL, nullptr, 0));
    if (rc == -1 && errno == ENOSYS) {
        rc = kill(pid_, SIGKILL);
    }
#else
    rc = kill(pid_, SIGKILL);
#endif

    if (rc == -1) {
        if (errno == ESRCH) {
            spdlog::debug("Process {} already exited", pid_);
            return;
        }
        throw std::system_error(errno, std::generic_category(),
                                "Failed to terminate process " + std::to_string(pid_));
    }

    spdlog::info("Terminated process {}", pid_);
}

ProcProcessRegistry::ProcProcessRegistry(std::filesystem::path procRoot)
    : procRoot_(std::move(procRoot)) {}

std::vector<std::unique_ptr<core::IProcessHandle>>
ProcProcessRegistry::findByName(const std::string& name) {
    std::vector<std::unique_ptr<core::IProcessHandle>> matches;

    std::error_code ec;
    std::filesystem::directory_iterator it(procRoot_, ec);
    if (ec) {
        throw std::system_error(ec, "Failed to enumerate " + procRoot_.string());
    }

    const auto truncated = name.substr(0, kCommLength);
    for (const auto& entry : it) {
        auto pidText = entry.path().filename().string();
        if (!isPidDirectory(pidText)) {
            continue;
        }

        bool matched = false;
        if (auto exe = executableName(entry.path())) {
            matched = *exe == name;
        } else if (auto comm = commandName(entry.path())) {
            matched = *comm == truncated;
        }

        if (!matched) {
            continue;
        }

        // Pin the process before handing it out; it may have exited meanwhile
        int fd = open(entry.path().c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
        if (fd == -1) {
            continue;
        }

        matches.push_back(
            std::make_unique<ProcProcessHandle>(static_cast<pid_t>(std::stol(pidText)), fd));
    }

    spdlog::debug("Found {} process(es) named {}", matches.size(), name);
    return matches;
}

pid_t ProcProcessRegistry::currentProcessId() const {
    return getpid();
}

std::string ProcProcessRegistry::currentExecutableName() const {
    return executableName(procRoot_ / "self").value_or("");
}

std::optional<std::string>
ProcProcessRegistry::executableName(const std::filesystem::path& procDir) const {
    std::error_code ec;
    auto target = std::filesystem::read_symlink(procDir / "exe", ec);
    if (ec) {
        return std::nullopt;
    }

    auto fileName = target.filename().string();
    if (fileName.size() > kDeletedSuffix.size() && fileName.ends_with(kDeletedSuffix)) {
        fileName.erase(fileName.size() - kDeletedSuffix.size());
    }
    return fileName;
}

std::optional<std::string>
ProcProcessRegistry::commandName(const std::filesystem::path& procDir) const {
    std::ifstream file(procDir / "comm");
    std::string comm;
    if (!file || !std::getline(file, comm)) {
        return std::nullopt;
    }
    return comm;
}

} // namespace relaunch::infra
