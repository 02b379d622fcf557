#include "app/NotificationHub.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace relaunch::app {

namespace {

std::string describe(const std::exception_ptr& exception) {
    try {
        std::rethrow_exception(exception);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // namespace

NotificationHub::NotificationHub(infra::AsioContext& context) : strand_(context.makeStrand()) {}

NotificationHub::~NotificationHub() {
    deliveries_.close();
}

NotificationHub::SubscriptionId NotificationHub::onExceptionOccurred(ExceptionHandler handler) {
    std::lock_guard lock(mutex_);
    auto id = nextId_++;
    exceptionHandlers_.emplace(id, std::move(handler));
    return id;
}

NotificationHub::SubscriptionId NotificationHub::onArgumentsReceived(ArgumentsHandler handler) {
    std::lock_guard lock(mutex_);
    auto id = nextId_++;
    argumentsHandlers_.emplace(id, std::move(handler));
    return id;
}

void NotificationHub::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(mutex_);
    exceptionHandlers_.erase(id);
    argumentsHandlers_.erase(id);
}

void NotificationHub::publishException(std::exception_ptr exception) noexcept {
    if (!exception) {
        return;
    }

    try {
        spdlog::debug("Publishing exception: {}", describe(exception));
        asio::post(strand_, [this, exception, work = deliveries_.token()]() {
            infra::WorkTracker::Scope scope(work);
            if (scope) {
                deliverException(exception);
            }
        });
    } catch (const std::exception& e) {
        spdlog::error("Failed to queue exception notification: {}", e.what());
    }
}

void NotificationHub::publishArguments(core::ArgumentBatch batch) noexcept {
    try {
        spdlog::debug("Publishing {} received argument(s)", batch.size());
        asio::post(strand_,
                   [this, batch = std::move(batch), work = deliveries_.token()]() {
                       infra::WorkTracker::Scope scope(work);
                       if (scope) {
                           deliverArguments(batch);
                       }
                   });
    } catch (const std::exception& e) {
        spdlog::error("Failed to queue arguments notification: {}", e.what());
    }
}

std::future<void> NotificationHub::flush() {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    asio::post(strand_, [promise]() { promise->set_value(); });
    return future;
}

size_t NotificationHub::subscriberCount() const {
    std::lock_guard lock(mutex_);
    return exceptionHandlers_.size() + argumentsHandlers_.size();
}

void NotificationHub::deliverException(const std::exception_ptr& exception) {
    std::vector<ExceptionHandler> handlers;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, handler] : exceptionHandlers_) {
            handlers.push_back(handler);
        }
    }

    for (const auto& handler : handlers) {
        try {
            handler(exception);
        } catch (const std::exception& e) {
            spdlog::warn("ExceptionOccurred subscriber failed: {}", e.what());
        } catch (...) {
            spdlog::warn("ExceptionOccurred subscriber failed with a non-standard exception");
        }
    }
}

void NotificationHub::deliverArguments(const core::ArgumentBatch& batch) {
    std::vector<ArgumentsHandler> handlers;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, handler] : argumentsHandlers_) {
            handlers.push_back(handler);
        }
    }

    for (const auto& handler : handlers) {
        try {
            handler(batch);
        } catch (const std::exception& e) {
            spdlog::warn("ArgumentsReceived subscriber failed: {}", e.what());
        } catch (...) {
            spdlog::warn("ArgumentsReceived subscriber failed with a non-standard exception");
        }
    }
}

} // namespace relaunch::app
