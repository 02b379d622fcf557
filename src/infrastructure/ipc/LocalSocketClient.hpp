#pragma once

#include "core/services/IForwardingChannel.hpp"

#include <asio.hpp>
#include <filesystem>
#include <mutex>

namespace relaunch::infra {

/**
 * @brief Forwarding channel client over a Unix domain stream socket.
 *
 * Each write() connects (on first use), sends one frame and waits for the
 * server's acknowledgement. The whole exchange runs on a private io_context
 * bounded by the caller's timeout, so a primary that accepts connections but
 * never answers is reported as a timeout rather than blocking forever.
 *
 * Destroying the client shuts the connection down.
 */
class LocalSocketClient : public core::IChannelClient {
public:
    /**
     * @brief Constructs a client for the given socket path.
     * @param socketPath Path of the primary's socket.
     */
    explicit LocalSocketClient(std::filesystem::path socketPath);

    /**
     * @brief Destructor. Shuts down and closes the connection.
     */
    ~LocalSocketClient() override;

    LocalSocketClient(const LocalSocketClient&) = delete;
    LocalSocketClient& operator=(const LocalSocketClient&) = delete;

    void setExceptionCallback(core::ChannelExceptionCallback callback) override;

    /**
     * @brief Sends one batch and waits for its acknowledgement.
     * @param batch Arguments to forward.
     * @param timeout Budget for connect, send and acknowledgement.
     * @throws core::ChannelTimeout if the budget elapses.
     * @throws core::ChannelError on connection refusal, I/O failure or a bad reply.
     */
    void write(const core::ArgumentBatch& batch, std::chrono::milliseconds timeout) override;

private:
    void reportException(std::exception_ptr exception);

    std::filesystem::path socketPath_;
    asio::io_context ioContext_;
    asio::local::stream_protocol::socket socket_;
    bool connected_{false};

    core::ChannelExceptionCallback exceptionCallback_;
    std::mutex mutex_;
};

} // namespace relaunch::infra
