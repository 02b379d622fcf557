#include <catch2/catch_test_macros.hpp>

#include "infrastructure/process/ProcProcessRegistry.hpp"
#include "support/TempRuntimeDir.hpp"

#include <algorithm>
#include <csignal>
#include <fstream>
#include <sys/wait.h>
#include <unistd.h>

using namespace relaunch::infra;
using relaunch::testing::TempRuntimeDir;

namespace {

void addProcess(const std::filesystem::path& root, const std::string& pid,
                const std::string& exeTarget, const std::string& comm) {
    auto dir = root / pid;
    std::filesystem::create_directories(dir);
    if (!exeTarget.empty()) {
        std::filesystem::create_symlink(exeTarget, dir / "exe");
    }
    if (!comm.empty()) {
        std::ofstream(dir / "comm") << comm << "\n";
    }
}

std::vector<pid_t> idsOf(const std::vector<std::unique_ptr<relaunch::core::IProcessHandle>>& handles) {
    std::vector<pid_t> ids;
    for (const auto& handle : handles) {
        ids.push_back(handle->id());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace

TEST_CASE("ProcProcessRegistry name matching", "[ProcProcessRegistry]") {
    TempRuntimeDir root;
    addProcess(root.path(), "100", "/usr/bin/fakeapp", "fakeapp");
    addProcess(root.path(), "200", "", "fakeapp");
    addProcess(root.path(), "300", "/usr/bin/other", "fakeapp");
    addProcess(root.path(), "400", "/opt/fakeapp (deleted)", "");
    addProcess(root.path(), "500", "/usr/bin/fakeapp-helper", "");
    addProcess(root.path(), "600", "", "averyveryverylo");
    addProcess(root.path(), "self", "/usr/bin/fakeapp", "");
    std::filesystem::create_directories(root.path() / "sys");

    ProcProcessRegistry registry(root.path());

    SECTION("Executable name is preferred over comm") {
        REQUIRE(idsOf(registry.findByName("fakeapp")) == std::vector<pid_t>{100, 200, 400});
    }

    SECTION("comm matches the truncated name") {
        REQUIRE(idsOf(registry.findByName("averyveryverylongapplication")) ==
                std::vector<pid_t>{600});
    }

    SECTION("Unknown names match nothing") {
        REQUIRE(registry.findByName("absent").empty());
    }

    SECTION("Current executable comes from the self entry") {
        REQUIRE(registry.currentExecutableName() == "fakeapp");
        REQUIRE(registry.currentProcessId() == getpid());
    }
}

TEST_CASE("ProcProcessRegistry enumeration failure", "[ProcProcessRegistry]") {
    ProcProcessRegistry registry("/nonexistent/relaunch/proc");
    REQUIRE_THROWS_AS(registry.findByName("fakeapp"), std::system_error);
}

TEST_CASE("ProcProcessRegistry on the live system", "[ProcProcessRegistry]") {
    ProcProcessRegistry registry;
    auto self = registry.currentExecutableName();
    REQUIRE_FALSE(self.empty());

    SECTION("Finds this process") {
        auto ids = idsOf(registry.findByName(self));
        REQUIRE(std::find(ids.begin(), ids.end(), getpid()) != ids.end());
    }

    SECTION("Terminates a matching child process") {
        pid_t child = fork();
        REQUIRE(child != -1);
        if (child == 0) {
            for (;;) {
                pause();
            }
        }

        auto handles = registry.findByName(self);
        auto it = std::find_if(handles.begin(), handles.end(),
                               [child](const auto& handle) { return handle->id() == child; });
        REQUIRE(it != handles.end());

        (*it)->terminate();

        int status = 0;
        REQUIRE(waitpid(child, &status, 0) == child);
        REQUIRE(WIFSIGNALED(status));
        REQUIRE(WTERMSIG(status) == SIGKILL);

        SECTION("Terminating an exited process is not an error") {
            REQUIRE_NOTHROW((*it)->terminate());
        }
    }
}
