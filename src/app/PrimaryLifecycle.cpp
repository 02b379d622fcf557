#include "app/PrimaryLifecycle.hpp"

#include "core/types/ChannelErrors.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace relaunch::app {

PrimaryLifecycle::PrimaryLifecycle(std::string applicationName, core::IChannelFactory& channels,
                                   NotificationHub& hub, infra::AsioContext& context)
    : applicationName_(std::move(applicationName)), channels_(channels), hub_(hub),
      context_(context) {}

PrimaryLifecycle::~PrimaryLifecycle() {
    shutdown();

    // Deregister last; this waits for a stop callback running on another thread
    std::unique_ptr<std::stop_callback<std::function<void()>>> callback;
    {
        std::lock_guard lock(mutex_);
        callback = std::move(stopCallback_);
    }
    callback.reset();
}

std::future<void> PrimaryLifecycle::start(std::stop_token token) {
    if (started_.exchange(true)) {
        throw std::logic_error("Primary server for '" + applicationName_ + "' already started");
    }

    return context_.submit(
        [this, token, name = applicationName_, work = activations_.token()]() {
            infra::WorkTracker::Scope scope(work);
            if (!scope) {
                throw core::OperationCancelled("Primary server for '" + name +
                                               "' released before activation");
            }
            activate(token);
        });
}

std::future<void> PrimaryLifecycle::start(core::ArgumentBatch initialArguments,
                                          std::stop_token token) {
    if (started_.load()) {
        throw std::logic_error("Primary server for '" + applicationName_ + "' already started");
    }

    hub_.publishArguments(std::move(initialArguments));
    return start(std::move(token));
}

void PrimaryLifecycle::activate(std::stop_token token) {
    if (token.stop_requested()) {
        throw core::OperationCancelled("Primary start for '" + applicationName_ + "' cancelled");
    }

    {
        std::lock_guard lock(mutex_);
        if (stopped_) {
            throw core::OperationCancelled("Primary server for '" + applicationName_ +
                                           "' stopped before activation");
        }
    }

    std::shared_ptr<core::IChannelServer> server;
    try {
        server = channels_.createServer(applicationName_);
        server->setExceptionCallback([this](std::exception_ptr e) { hub_.publishException(e); });
        server->setMessageCallback([this](std::optional<core::ArgumentBatch> message) {
            hub_.publishArguments(message ? std::move(*message) : core::ArgumentBatch{});
        });

        if (allowOtherUsers_.load()) {
            server->allowUsersReadWrite();
        }

        server->start();
    } catch (const std::exception& e) {
        spdlog::error("Failed to start primary server for '{}': {}", applicationName_, e.what());
        hub_.publishException(std::current_exception());
        throw;
    }

    bool stoppedWhileStarting = false;
    {
        std::lock_guard lock(mutex_);
        if (stopped_) {
            stoppedWhileStarting = true;
        } else {
            server_ = server;
        }
    }

    if (stoppedWhileStarting) {
        server->stop();
        spdlog::info("Primary server for '{}' stopped while starting", applicationName_);
        throw core::OperationCancelled("Primary server for '" + applicationName_ +
                                       "' stopped while starting");
    }

    // Invokes stop() immediately if the token was triggered while starting
    auto callback = std::make_unique<std::stop_callback<std::function<void()>>>(
        token, std::function<void()>([this]() { stop(); }));

    {
        std::lock_guard lock(mutex_);
        stopCallback_ = std::move(callback);
    }

    spdlog::info("Primary instance of '{}' is accepting forwarded arguments", applicationName_);
}

void PrimaryLifecycle::stop() {
    std::shared_ptr<core::IChannelServer> server;
    {
        std::lock_guard lock(mutex_);
        stopped_ = true;
        server = std::move(server_);
        server_.reset();
    }

    if (server) {
        server->setMessageCallback({});
        server->setExceptionCallback({});
        server->stop();
        spdlog::info("Primary server for '{}' released", applicationName_);
    }
}

void PrimaryLifecycle::shutdown() {
    stop();
    activations_.close();
}

bool PrimaryLifecycle::isListening() const {
    std::lock_guard lock(mutex_);
    return server_ && server_->isRunning();
}

} // namespace relaunch::app
