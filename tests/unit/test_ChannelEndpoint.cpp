#include <catch2/catch_test_macros.hpp>

#include "core/types/ChannelErrors.hpp"
#include "infrastructure/ipc/ChannelEndpoint.hpp"

#include <cstdlib>
#include <string>

using namespace relaunch;
using namespace relaunch::infra;

TEST_CASE("Channel endpoint paths", "[ChannelEndpoint]") {
    SECTION("Socket and lock files are named after the application") {
        REQUIRE(socketPathFor("/run/user/1000", "editor") == "/run/user/1000/editor.sock");
        REQUIRE(lockPathFor("/run/user/1000", "editor") == "/run/user/1000/editor.lock");
    }

    SECTION("Overlong socket paths are rejected") {
        std::string longName(200, 'n');
        REQUIRE_THROWS_AS(socketPathFor("/tmp", longName), core::ChannelError);
    }

    SECTION("Configured runtime directory wins") {
        REQUIRE(resolveRuntimeDir("/srv/relaunch") == "/srv/relaunch");
    }

    SECTION("XDG runtime directory is the fallback") {
        const char* previous = std::getenv("XDG_RUNTIME_DIR");
        std::string saved = previous ? previous : "";

        ::setenv("XDG_RUNTIME_DIR", "/run/user/4242", 1);
        REQUIRE(resolveRuntimeDir() == "/run/user/4242");

        ::unsetenv("XDG_RUNTIME_DIR");
        REQUIRE(resolveRuntimeDir() == "/tmp");

        if (previous) {
            ::setenv("XDG_RUNTIME_DIR", saved.c_str(), 1);
        }
    }
}
