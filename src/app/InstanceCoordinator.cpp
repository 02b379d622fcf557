#include "app/InstanceCoordinator.hpp"

#include "core/types/ChannelErrors.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace relaunch::app {

namespace {

std::string resolveApplicationName(const std::optional<std::string>& explicitName,
                                   const core::IProcessRegistry& processes) {
    if (explicitName) {
        if (explicitName->empty()) {
            throw std::invalid_argument("Application name must not be empty");
        }
        return *explicitName;
    }

    auto name = processes.currentExecutableName();
    if (name.empty()) {
        throw std::invalid_argument(
            "Application name not given and the executable name cannot be determined");
    }
    return name;
}

const InstanceCoordinator::Collaborators& requireCollaborators(
    const InstanceCoordinator::Collaborators& collaborators) {
    if (!collaborators.oracle || !collaborators.channels || !collaborators.processes) {
        throw std::invalid_argument("InstanceCoordinator requires an oracle, a channel factory "
                                    "and a process registry");
    }
    return collaborators;
}

} // namespace

InstanceCoordinator::InstanceCoordinator(infra::AsioContext& context, Collaborators collaborators,
                                         std::optional<std::string> applicationName)
    : context_(context), collaborators_(requireCollaborators(collaborators)),
      applicationName_(resolveApplicationName(applicationName, *collaborators_.processes)),
      hub_(context), primary_(applicationName_, *collaborators_.channels, hub_, context) {
    spdlog::debug("InstanceCoordinator created for '{}'", applicationName_);
}

InstanceCoordinator::~InstanceCoordinator() {
    dispose();
    sends_.close();
}

std::future<bool> InstanceCoordinator::trySend(std::optional<core::ArgumentBatch> arguments) {
    if (!arguments) {
        throw std::invalid_argument("trySend requires an argument batch");
    }

    auto current = state_.load();
    if (current == core::CoordinatorState::ActingAsPrimary ||
        current == core::CoordinatorState::Disposed) {
        throw std::logic_error(std::string("trySend is not allowed while ") +
                               core::coordinatorStateToString(current));
    }

    auto timeout = clientTimeout_.load();
    return context_.submit([this, batch = std::move(*arguments), timeout,
                            name = applicationName_, work = sends_.token()]() {
        infra::WorkTracker::Scope scope(work);
        if (!scope) {
            throw core::OperationCancelled("Coordinator for '" + name +
                                           "' was destroyed before sending");
        }
        return sendOrRecover(batch, timeout);
    });
}

bool InstanceCoordinator::sendOrRecover(const core::ArgumentBatch& arguments,
                                        std::chrono::milliseconds timeout) {
    if (collaborators_.oracle->isFirstInstance(applicationName_)) {
        spdlog::info("No running instance of '{}' found", applicationName_);
        transitionTo(core::CoordinatorState::Uninitialized);
        return false;
    }

    transitionTo(core::CoordinatorState::ActingAsClient);

    if (arguments.empty()) {
        spdlog::info("Instance of '{}' already running, nothing to forward", applicationName_);
        return true;
    }

    if (forward(arguments, timeout)) {
        return true;
    }

    transitionTo(core::CoordinatorState::RecoveringStaleLock);
    terminateStaleInstances();
    transitionTo(core::CoordinatorState::Uninitialized);
    return false;
}

void InstanceCoordinator::transitionTo(core::CoordinatorState next) {
    // A client-side transition never overrides the primary role or disposal
    auto current = state_.load();
    while (current != core::CoordinatorState::ActingAsPrimary &&
           current != core::CoordinatorState::Disposed &&
           !state_.compare_exchange_weak(current, next)) {
    }
}

bool InstanceCoordinator::forward(const core::ArgumentBatch& arguments,
                                  std::chrono::milliseconds timeout) {
    try {
        auto client = collaborators_.channels->createClient(applicationName_);
        client->setExceptionCallback([this](std::exception_ptr e) { hub_.publishException(e); });
        client->write(arguments, timeout);

        spdlog::info("Forwarded {} argument(s) to running instance of '{}'", arguments.size(),
                     applicationName_);
        return true;
    } catch (const core::ChannelTimeout& e) {
        spdlog::debug("Forwarding to '{}' timed out: {}", applicationName_, e.what());
    } catch (const std::exception& e) {
        spdlog::warn("Forwarding to '{}' failed: {}", applicationName_, e.what());
        hub_.publishException(std::current_exception());
    } catch (...) {
        spdlog::warn("Forwarding to '{}' failed with a non-standard exception", applicationName_);
        hub_.publishException(std::current_exception());
    }
    return false;
}

void InstanceCoordinator::terminateStaleInstances() noexcept {
    spdlog::warn("Running instance of '{}' is unreachable, terminating stale processes",
                 applicationName_);

    try {
        auto handles = collaborators_.processes->findByName(applicationName_);
        const auto self = collaborators_.processes->currentProcessId();

        size_t terminated = 0;
        for (const auto& handle : handles) {
            if (handle->id() == self) {
                continue;
            }

            try {
                handle->terminate();
                ++terminated;
            } catch (const std::exception& e) {
                spdlog::warn("Failed to terminate process {}: {}", handle->id(), e.what());
            } catch (...) {
                spdlog::warn("Failed to terminate process {}: non-standard exception",
                             handle->id());
            }
        }

        spdlog::info("Terminated {} stale process(es) of '{}'", terminated, applicationName_);
    } catch (const std::exception& e) {
        spdlog::warn("Stale instance recovery for '{}' failed: {}", applicationName_, e.what());
    } catch (...) {
        spdlog::warn("Stale instance recovery for '{}' failed with a non-standard exception",
                     applicationName_);
    }
}

std::future<void> InstanceCoordinator::start(std::stop_token token) {
    beginPrimary();
    return primary_.start(std::move(token));
}

std::future<void> InstanceCoordinator::start(core::ArgumentBatch initialArguments,
                                             std::stop_token token) {
    beginPrimary();
    return primary_.start(std::move(initialArguments), std::move(token));
}

void InstanceCoordinator::beginPrimary() {
    auto expected = state_.load();
    do {
        if (expected == core::CoordinatorState::ActingAsPrimary ||
            expected == core::CoordinatorState::Disposed) {
            throw std::logic_error(std::string("start is not allowed while ") +
                                   core::coordinatorStateToString(expected));
        }
    } while (!state_.compare_exchange_weak(expected, core::CoordinatorState::ActingAsPrimary));

    // Re-claim the marker; after recovery the killed holder's claim is gone
    if (!collaborators_.oracle->isFirstInstance(applicationName_)) {
        spdlog::warn("Exclusivity marker for '{}' is still held elsewhere, serving anyway",
                     applicationName_);
    }
}

void InstanceCoordinator::dispose() {
    std::lock_guard lock(disposeMutex_);

    if (state_.exchange(core::CoordinatorState::Disposed) == core::CoordinatorState::Disposed) {
        return;
    }

    primary_.shutdown();

    // Let queued notifications reach subscribers before the hub goes away
    if (context_.isRunning() && !context_.runningInThisThread()) {
        hub_.flush().wait();
    }

    spdlog::debug("InstanceCoordinator for '{}' disposed", applicationName_);
}

} // namespace relaunch::app
