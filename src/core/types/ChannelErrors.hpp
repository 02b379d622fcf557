/**
 * @file ChannelErrors.hpp
 * @brief Exception types raised by forwarding channel operations.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace relaunch::core {

/**
 * @brief Failure while connecting, sending, receiving or decoding on a channel.
 */
class ChannelError : public std::runtime_error {
public:
    explicit ChannelError(const std::string& message, std::error_code code = {})
        : std::runtime_error(code ? message + ": " + code.message() : message), code_(code) {}

    /**
     * @brief Returns the underlying system error, if any.
     */
    const std::error_code& code() const noexcept { return code_; }

private:
    std::error_code code_;
};

/**
 * @brief A channel operation did not complete before its deadline.
 */
class ChannelTimeout : public ChannelError {
public:
    explicit ChannelTimeout(const std::string& message)
        : ChannelError(message, std::make_error_code(std::errc::timed_out)) {}
};

/**
 * @brief An operation was abandoned because its stop token was triggered.
 */
class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& message) : std::runtime_error(message) {}
};

} // namespace relaunch::core
