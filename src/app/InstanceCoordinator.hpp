#pragma once

#include "app/NotificationHub.hpp"
#include "app/PrimaryLifecycle.hpp"
#include "core/services/IExclusivityOracle.hpp"
#include "core/services/IForwardingChannel.hpp"
#include "core/services/IProcessRegistry.hpp"
#include "core/types/ArgumentBatch.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/WorkTracker.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

namespace relaunch::app {

/**
 * @brief Decides on every launch whether this process forwards or serves.
 *
 * A secondary launch forwards its arguments to the running primary through
 * the channel. If that fails, the primary is presumed stale: every other
 * process with the same name is killed and the caller is told to become the
 * new primary by calling start().
 *
 * @note Mutual exclusion is best-effort. The oracle and the channel are
 *       independent resources, so two launches that both fail to reach a
 *       primary may both run recovery and kill each other's predecessors.
 *       No consensus step is added on top of that.
 */
class InstanceCoordinator {
public:
    static constexpr std::chrono::milliseconds kDefaultClientTimeout{5000};

    /**
     * @brief External capabilities the coordinator relies on.
     */
    struct Collaborators {
        std::shared_ptr<core::IExclusivityOracle> oracle;
        std::shared_ptr<core::IChannelFactory> channels;
        std::shared_ptr<core::IProcessRegistry> processes;
    };

    /**
     * @brief Constructs a coordinator.
     * @param context Worker pool for forwarding, recovery, activation and notifications.
     * @param collaborators Oracle, channel factory and process registry (all required).
     * @param applicationName Exclusivity and channel key; defaults to the executable name.
     * @throws std::invalid_argument if a collaborator is missing or no name can be determined.
     */
    InstanceCoordinator(infra::AsioContext& context, Collaborators collaborators,
                        std::optional<std::string> applicationName = std::nullopt);

    /**
     * @brief Destructor. Disposes the coordinator and waits for running trySend() work.
     *
     * Attempts still queued on the pool are abandoned; their futures hold
     * core::OperationCancelled.
     */
    ~InstanceCoordinator();

    InstanceCoordinator(const InstanceCoordinator&) = delete;
    InstanceCoordinator& operator=(const InstanceCoordinator&) = delete;

    const std::string& applicationName() const { return applicationName_; }

    /**
     * @brief Budget for one forwarding attempt (connect and send).
     *
     * Read once at the beginning of each trySend() call.
     */
    std::chrono::milliseconds clientTimeout() const { return clientTimeout_.load(); }
    void setClientTimeout(std::chrono::milliseconds timeout) { clientTimeout_ = timeout; }

    /**
     * @brief Selects whether start() lets other local users connect (default true).
     */
    void setAllowOtherUsers(bool allow) { primary_.setAllowOtherUsers(allow); }

    core::CoordinatorState state() const { return state_.load(); }

    NotificationHub& notifications() { return hub_; }

    NotificationHub::SubscriptionId onExceptionOccurred(NotificationHub::ExceptionHandler handler) {
        return hub_.onExceptionOccurred(std::move(handler));
    }

    NotificationHub::SubscriptionId onArgumentsReceived(NotificationHub::ArgumentsHandler handler) {
        return hub_.onArgumentsReceived(std::move(handler));
    }

    /**
     * @brief Forwards arguments to a running instance, recovering if it is unreachable.
     *
     * The future yields true when another instance exists and either nothing
     * needed forwarding (empty batch) or the batch was delivered. It yields
     * false when this process should become the primary: either no other
     * instance holds the name, or forwarding failed and stale instances were
     * terminated. Forwarding failures never surface through the future.
     *
     * @param arguments Batch to forward; std::nullopt is rejected.
     * @throws std::invalid_argument if arguments is std::nullopt.
     * @throws std::logic_error after start() or dispose().
     */
    std::future<bool> trySend(std::optional<core::ArgumentBatch> arguments);

    /**
     * @brief Begins serving as primary.
     * @param token Stops the server when triggered.
     * @return Future ready once the server accepts connections.
     * @throws std::logic_error if already started or disposed.
     */
    std::future<void> start(std::stop_token token = {});

    /**
     * @brief Publishes the primary's own arguments, then begins serving.
     */
    std::future<void> start(core::ArgumentBatch initialArguments, std::stop_token token = {});

    /**
     * @brief Releases the primary server (if any) and drains pending notifications.
     *
     * Idempotent. In-flight trySend() attempts keep their own connection.
     */
    void dispose();

private:
    bool sendOrRecover(const core::ArgumentBatch& arguments, std::chrono::milliseconds timeout);
    bool forward(const core::ArgumentBatch& arguments, std::chrono::milliseconds timeout);
    void terminateStaleInstances() noexcept;
    void beginPrimary();
    void transitionTo(core::CoordinatorState next);

    infra::AsioContext& context_;
    Collaborators collaborators_;
    std::string applicationName_;
    std::atomic<std::chrono::milliseconds> clientTimeout_{kDefaultClientTimeout};
    std::atomic<core::CoordinatorState> state_{core::CoordinatorState::Uninitialized};

    NotificationHub hub_;
    PrimaryLifecycle primary_;
    std::mutex disposeMutex_;
    infra::WorkTracker sends_;
};

} // namespace relaunch::app
