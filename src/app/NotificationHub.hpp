#pragma once

#include "core/types/ArgumentBatch.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/WorkTracker.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <mutex>

namespace relaunch::app {

/**
 * @brief Fan-out of the two notifications the application subscribes to.
 *
 * Publishing never blocks on subscriber code: each publication is posted onto
 * a serial strand and delivered there, in publish order, to every subscriber
 * registered at delivery time. A subscriber that throws is logged and skipped;
 * the remaining subscribers still run and the publisher never sees the error.
 */
class NotificationHub {
public:
    using SubscriptionId = uint64_t;
    using ExceptionHandler = std::function<void(std::exception_ptr)>;
    using ArgumentsHandler = std::function<void(const core::ArgumentBatch&)>;

    /**
     * @brief Constructs a hub delivering on the given context.
     * @param context AsioContext whose workers run the subscribers.
     */
    explicit NotificationHub(infra::AsioContext& context);

    /**
     * @brief Destructor. Publications not yet delivered are dropped.
     *
     * Waits for a delivery in progress, so it must not run inside a subscriber.
     */
    ~NotificationHub();

    NotificationHub(const NotificationHub&) = delete;
    NotificationHub& operator=(const NotificationHub&) = delete;

    /**
     * @brief Subscribes to asynchronous failures.
     * @param handler Called with each reported exception.
     * @return Identifier for unsubscribe().
     */
    SubscriptionId onExceptionOccurred(ExceptionHandler handler);

    /**
     * @brief Subscribes to received argument batches.
     * @param handler Called with each batch, in arrival order.
     * @return Identifier for unsubscribe().
     */
    SubscriptionId onArgumentsReceived(ArgumentsHandler handler);

    /**
     * @brief Removes a subscription of either kind. Unknown ids are ignored.
     */
    void unsubscribe(SubscriptionId id);

    void publishException(std::exception_ptr exception) noexcept;
    void publishArguments(core::ArgumentBatch batch) noexcept;

    /**
     * @brief Returns a future that is ready once every earlier publication was delivered.
     */
    std::future<void> flush();

    size_t subscriberCount() const;

private:
    void deliverException(const std::exception_ptr& exception);
    void deliverArguments(const core::ArgumentBatch& batch);

    infra::AsioContext::Strand strand_;

    std::map<SubscriptionId, ExceptionHandler> exceptionHandlers_;
    std::map<SubscriptionId, ArgumentsHandler> argumentsHandlers_;
    SubscriptionId nextId_{1};
    mutable std::mutex mutex_;
    infra::WorkTracker deliveries_;
};

} // namespace relaunch::app
