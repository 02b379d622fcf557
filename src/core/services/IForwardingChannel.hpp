/**
 * @file IForwardingChannel.hpp
 * @brief Interfaces for the named duplex channel between instances.
 *
 * The channel is keyed by application name. A client forwards one argument
 * batch per message; the server reports every decoded batch and every
 * asynchronous failure through callbacks.
 */

#pragma once

#include "core/types/ArgumentBatch.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace relaunch::core {

/**
 * @brief Callback type for failures that occur outside of a direct call.
 */
using ChannelExceptionCallback = std::function<void(std::exception_ptr)>;

/**
 * @brief Client end of the forwarding channel.
 *
 * The connection is owned by the object: destroying the client releases it
 * on every path.
 */
class IChannelClient {
public:
    virtual ~IChannelClient() = default;

    /**
     * @brief Registers the handler for asynchronous client failures.
     * @param callback Handler invoked with the captured exception.
     */
    virtual void setExceptionCallback(ChannelExceptionCallback callback) = 0;

    /**
     * @brief Connects if needed and delivers one batch to the server.
     * @param batch Arguments to forward.
     * @param timeout Budget for connect, send and acknowledgement together.
     * @throws ChannelTimeout if the budget elapses.
     * @throws ChannelError on any other connection or transfer failure.
     */
    virtual void write(const ArgumentBatch& batch, std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief Server end of the forwarding channel.
 */
class IChannelServer {
public:
    /**
     * @brief Callback type for received messages.
     *
     * A null payload on the wire is reported as std::nullopt.
     */
    using MessageCallback = std::function<void(std::optional<ArgumentBatch>)>;

    virtual ~IChannelServer() = default;

    /**
     * @brief Registers the handler for received messages.
     */
    virtual void setMessageCallback(MessageCallback callback) = 0;

    /**
     * @brief Registers the handler for asynchronous server failures.
     */
    virtual void setExceptionCallback(ChannelExceptionCallback callback) = 0;

    /**
     * @brief Lets processes of other local users connect.
     *
     * Must be called before start(). A no-op where the platform has no such
     * concept.
     */
    virtual void allowUsersReadWrite() = 0;

    /**
     * @brief Binds the endpoint and begins accepting connections.
     * @throws ChannelError if the endpoint cannot be bound.
     */
    virtual void start() = 0;

    /**
     * @brief Stops accepting, closes the active session and releases the endpoint.
     *
     * Safe to call more than once.
     */
    virtual void stop() = 0;

    /**
     * @brief Checks whether the server is accepting connections.
     */
    virtual bool isRunning() const = 0;
};

/**
 * @brief Creates channel endpoints bound to an application name.
 */
class IChannelFactory {
public:
    virtual ~IChannelFactory() = default;

    virtual std::unique_ptr<IChannelClient> createClient(const std::string& applicationName) = 0;
    virtual std::shared_ptr<IChannelServer> createServer(const std::string& applicationName) = 0;
};

} // namespace relaunch::core
