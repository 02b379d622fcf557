#pragma once

#include "app/NotificationHub.hpp"
#include "core/services/IForwardingChannel.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/WorkTracker.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>

namespace relaunch::app {

/**
 * @brief Server side of the forwarding channel once this process is primary.
 *
 * Activation runs on the worker pool: the server is created, wired to the
 * NotificationHub, given relaxed permissions if requested and started. Every
 * batch the server receives is republished as ArgumentsReceived; a null
 * payload becomes an empty batch. The server lives until stop() or until the
 * stop token passed to start() is triggered.
 */
class PrimaryLifecycle {
public:
    PrimaryLifecycle(std::string applicationName, core::IChannelFactory& channels,
                     NotificationHub& hub, infra::AsioContext& context);

    /**
     * @brief Destructor. Stops the server if it is running.
     */
    ~PrimaryLifecycle();

    PrimaryLifecycle(const PrimaryLifecycle&) = delete;
    PrimaryLifecycle& operator=(const PrimaryLifecycle&) = delete;

    /**
     * @brief Selects whether other local users may connect (default true).
     */
    void setAllowOtherUsers(bool allow) { allowOtherUsers_ = allow; }

    /**
     * @brief Activates the server on the worker pool.
     * @param token Stops the server when triggered.
     * @return Future that is ready once the server accepts connections. It holds
     *         core::OperationCancelled if the token was already triggered, or the
     *         error that prevented the server from starting.
     * @throws std::logic_error if called more than once.
     */
    std::future<void> start(std::stop_token token);

    /**
     * @brief Publishes the primary's own arguments, then activates the server.
     *
     * The arguments are queued on the hub before activation begins, so they are
     * delivered ahead of any batch the server receives.
     */
    std::future<void> start(core::ArgumentBatch initialArguments, std::stop_token token);

    /**
     * @brief Stops and releases the server. Safe to call repeatedly.
     *
     * An activation still in progress stops the server it brings up instead
     * of keeping it.
     */
    void stop();

    /**
     * @brief Stops the server and waits for a running activation to finish.
     *
     * A queued activation that has not begun yet will not run. Must not be
     * called from the activation itself.
     */
    void shutdown();

    bool isStarted() const { return started_.load(); }

    /**
     * @brief Checks whether a server is currently accepting connections.
     */
    bool isListening() const;

private:
    void activate(std::stop_token token);

    std::string applicationName_;
    core::IChannelFactory& channels_;
    NotificationHub& hub_;
    infra::AsioContext& context_;
    std::atomic<bool> allowOtherUsers_{true};
    std::atomic<bool> started_{false};
    bool stopped_{false};

    std::shared_ptr<core::IChannelServer> server_;
    std::unique_ptr<std::stop_callback<std::function<void()>>> stopCallback_;
    mutable std::mutex mutex_;
    infra::WorkTracker activations_;
};

} // namespace relaunch::app
