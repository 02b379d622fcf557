#include <catch2/catch_test_macros.hpp>

#include "app/PrimaryLifecycle.hpp"
#include "core/types/ChannelErrors.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

using namespace relaunch;
using namespace relaunch::app;

namespace {

class RecordingServer : public core::IChannelServer {
public:
    void setMessageCallback(MessageCallback callback) override {
        calls.push_back("setMessageCallback");
        messageCallback = std::move(callback);
    }
    void setExceptionCallback(core::ChannelExceptionCallback callback) override {
        calls.push_back("setExceptionCallback");
        exceptionCallback = std::move(callback);
    }
    void allowUsersReadWrite() override { calls.push_back("allowUsersReadWrite"); }
    void start() override {
        calls.push_back("start");
        starting = true;
        std::this_thread::sleep_for(startDelay);
        if (failStart) {
            throw core::ChannelError("bind failed",
                                     std::make_error_code(std::errc::address_in_use));
        }
        running = true;
    }
    void stop() override {
        calls.push_back("stop");
        running = false;
    }
    bool isRunning() const override { return running; }

    std::vector<std::string> calls;
    MessageCallback messageCallback;
    core::ChannelExceptionCallback exceptionCallback;
    std::atomic<bool> running{false};
    std::atomic<bool> starting{false};
    std::chrono::milliseconds startDelay{0};
    bool failStart{false};
};

void waitUntil(const std::atomic<bool>& flag) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!flag && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

class SingleServerFactory : public core::IChannelFactory {
public:
    std::unique_ptr<core::IChannelClient> createClient(const std::string&) override {
        throw std::logic_error("client not expected");
    }
    std::shared_ptr<core::IChannelServer> createServer(const std::string& name) override {
        ++serversCreated;
        lastName = name;
        return server;
    }

    std::shared_ptr<RecordingServer> server = std::make_shared<RecordingServer>();
    int serversCreated{0};
    std::string lastName;
};

} // namespace

TEST_CASE("PrimaryLifecycle activation", "[PrimaryLifecycle]") {
    infra::AsioContext context(2);
    context.start();
    NotificationHub hub(context);
    SingleServerFactory factory;

    std::mutex mutex;
    std::vector<core::ArgumentBatch> received;
    std::vector<std::exception_ptr> errors;
    hub.onArgumentsReceived([&](const core::ArgumentBatch& batch) {
        std::lock_guard<std::mutex> lock(mutex);
        received.push_back(batch);
    });
    hub.onExceptionOccurred([&](std::exception_ptr e) {
        std::lock_guard<std::mutex> lock(mutex);
        errors.push_back(e);
    });

    PrimaryLifecycle primary("editor", factory, hub, context);

    SECTION("Server is wired before it starts") {
        primary.start({}).get();

        REQUIRE(factory.lastName == "editor");
        REQUIRE(factory.server->calls == std::vector<std::string>{
                                             "setExceptionCallback", "setMessageCallback",
                                             "allowUsersReadWrite", "start"});
        REQUIRE(primary.isListening());
    }

    SECTION("Permissions stay restricted when other users are not allowed") {
        primary.setAllowOtherUsers(false);
        primary.start({}).get();

        REQUIRE(std::find(factory.server->calls.begin(), factory.server->calls.end(),
                          "allowUsersReadWrite") == factory.server->calls.end());
    }

    SECTION("Initial arguments precede forwarded ones") {
        primary.start({"--initial"}, {}).get();
        factory.server->messageCallback(core::ArgumentBatch{"--forwarded"});
        hub.flush().get();

        REQUIRE(received == std::vector<core::ArgumentBatch>{{"--initial"}, {"--forwarded"}});
    }

    SECTION("A null payload becomes an empty batch") {
        primary.start({}).get();
        factory.server->messageCallback(std::nullopt);
        hub.flush().get();

        REQUIRE(received == std::vector<core::ArgumentBatch>{core::ArgumentBatch{}});
    }

    SECTION("Server failures are republished") {
        primary.start({}).get();
        factory.server->exceptionCallback(
            std::make_exception_ptr(core::ChannelError("read failed")));
        hub.flush().get();

        REQUIRE(errors.size() == 1);
    }

    SECTION("A cancelled token prevents activation") {
        std::stop_source source;
        source.request_stop();

        auto started = primary.start(source.get_token());
        REQUIRE_THROWS_AS(started.get(), core::OperationCancelled);
        REQUIRE(factory.serversCreated == 0);
        REQUIRE_FALSE(primary.isListening());
    }

    SECTION("Triggering the token stops the server") {
        std::stop_source source;
        primary.start(source.get_token()).get();
        REQUIRE(primary.isListening());

        source.request_stop();

        REQUIRE_FALSE(primary.isListening());
        REQUIRE(factory.server->calls.back() == "stop");
    }

    SECTION("Start failures reach both the future and the hub") {
        factory.server->failStart = true;

        auto started = primary.start({});
        REQUIRE_THROWS_AS(started.get(), core::ChannelError);
        hub.flush().get();

        REQUIRE(errors.size() == 1);
        REQUIRE_FALSE(primary.isListening());
    }

    SECTION("Start may only be called once") {
        primary.start({}).get();
        REQUIRE_THROWS_AS(primary.start({}), std::logic_error);
        REQUIRE_THROWS_AS(primary.start({"x"}, {}), std::logic_error);
        REQUIRE(factory.serversCreated == 1);
    }

    SECTION("Stop is idempotent") {
        primary.start({}).get();
        primary.stop();
        primary.stop();

        REQUIRE(std::count(factory.server->calls.begin(), factory.server->calls.end(), "stop") ==
                1);
    }
}

TEST_CASE("PrimaryLifecycle shutdown during activation", "[PrimaryLifecycle]") {
    infra::AsioContext context(2);
    context.start();
    NotificationHub hub(context);
    SingleServerFactory factory;
    factory.server->startDelay = std::chrono::milliseconds(200);

    SECTION("Shutdown while the server starts leaves it stopped") {
        PrimaryLifecycle primary("editor", factory, hub, context);
        auto started = primary.start({});
        waitUntil(factory.server->starting);

        primary.shutdown();

        REQUIRE_FALSE(factory.server->running);
        REQUIRE(factory.server->calls.back() == "stop");
        REQUIRE_FALSE(primary.isListening());
        REQUIRE_THROWS_AS(started.get(), core::OperationCancelled);
    }

    SECTION("Shutdown right after start never leaves a listener") {
        PrimaryLifecycle primary("editor", factory, hub, context);
        auto started = primary.start({});
        primary.shutdown();

        REQUIRE_FALSE(factory.server->running);
        REQUIRE_FALSE(primary.isListening());
        REQUIRE_THROWS_AS(started.get(), core::OperationCancelled);
    }

    SECTION("Stop while the server starts also stops it") {
        PrimaryLifecycle primary("editor", factory, hub, context);
        auto started = primary.start({});
        waitUntil(factory.server->starting);

        primary.stop();

        REQUIRE_THROWS_AS(started.get(), core::OperationCancelled);
        REQUIRE_FALSE(factory.server->running);
        REQUIRE_FALSE(primary.isListening());
    }

    SECTION("Destruction waits for the activation in progress") {
        auto primary = std::make_unique<PrimaryLifecycle>("editor", factory, hub, context);
        auto started = primary->start({});
        waitUntil(factory.server->starting);

        primary.reset();

        REQUIRE_FALSE(factory.server->running);
        REQUIRE_THROWS_AS(started.get(), core::OperationCancelled);
    }
}

TEST_CASE("PrimaryLifecycle queued activation", "[PrimaryLifecycle]") {
    infra::AsioContext context(1);
    NotificationHub hub(context);
    SingleServerFactory factory;

    SECTION("An activation queued before shutdown never runs") {
        PrimaryLifecycle primary("editor", factory, hub, context);
        auto started = primary.start({});
        primary.shutdown();
        context.start();

        REQUIRE_THROWS_AS(started.get(), core::OperationCancelled);
        REQUIRE(factory.serversCreated == 0);
    }

    SECTION("An activation queued before destruction never runs") {
        auto primary = std::make_unique<PrimaryLifecycle>("editor", factory, hub, context);
        auto started = primary->start({});
        primary.reset();
        context.start();

        REQUIRE_THROWS_AS(started.get(), core::OperationCancelled);
        REQUIRE(factory.serversCreated == 0);
    }
}
