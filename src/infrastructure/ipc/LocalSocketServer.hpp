#pragma once

#include "core/services/IForwardingChannel.hpp"
#include "infrastructure/ipc/MessageFraming.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <array>
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>

namespace relaunch::infra {

/**
 * @brief Forwarding channel server over a Unix domain stream socket.
 *
 * Accepts one client session at a time. Every frame of a session is decoded,
 * handed to the message callback and acknowledged before the next one is
 * read, so batches are reported in arrival order. All handlers run on a
 * single strand of the shared AsioContext.
 *
 * Must be owned by a std::shared_ptr; pending handlers keep the server alive.
 *
 * @note This class is non-copyable.
 */
class LocalSocketServer : public core::IChannelServer,
                          public std::enable_shared_from_this<LocalSocketServer> {
public:
    /**
     * @brief Tunables for client sessions.
     */
    struct Options {
        std::chrono::milliseconds sessionTimeout{5000};            ///< Idle limit per session.
        size_t maxMessageBytes{framing::kDefaultMaxPayloadBytes};  ///< Largest accepted payload.
    };

    /**
     * @brief Constructs a server for the given socket path.
     * @param context AsioContext whose workers run the server.
     * @param socketPath Path to bind.
     * @param options Session limits.
     */
    LocalSocketServer(AsioContext& context, std::filesystem::path socketPath, Options options);

    /**
     * @brief Destructor. Closes the endpoint and removes the socket file if still bound.
     */
    ~LocalSocketServer() override;

    LocalSocketServer(const LocalSocketServer&) = delete;
    LocalSocketServer& operator=(const LocalSocketServer&) = delete;

    void setMessageCallback(MessageCallback callback) override;
    void setExceptionCallback(core::ChannelExceptionCallback callback) override;

    /**
     * @brief Makes the socket readable and writable by every local user (mode 0666).
     */
    void allowUsersReadWrite() override;

    /**
     * @brief Removes a stale socket file, binds, listens and begins accepting.
     * @throws core::ChannelError if the socket cannot be bound.
     */
    void start() override;

    void stop() override;

    bool isRunning() const override { return running_.load(); }

    const std::filesystem::path& socketPath() const { return socketPath_; }

private:
    struct Session {
        explicit Session(const AsioContext::Strand& strand) : socket(strand), timer(strand) {}

        asio::local::stream_protocol::socket socket;
        asio::steady_timer timer;
        std::array<uint8_t, framing::kHeaderSize> header{};
        std::string payload;
    };

    void startAccept();
    void readFrame(std::shared_ptr<Session> session);
    void sendAck(std::shared_ptr<Session> session);
    void endSession(std::shared_ptr<Session> session, const asio::error_code& ec);
    void armIdleTimer(std::shared_ptr<Session> session);
    void closeEndpoint();

    void deliver(std::optional<core::ArgumentBatch> batch);
    void reportException(std::exception_ptr exception);

    AsioContext::Strand strand_;
    std::filesystem::path socketPath_;
    Options options_;
    bool allowOtherUsers_{false};
    std::atomic<bool> running_{false};

    std::unique_ptr<asio::local::stream_protocol::acceptor> acceptor_;
    asio::steady_timer acceptRetryTimer_;
    std::shared_ptr<Session> activeSession_;

    MessageCallback messageCallback_;
    core::ChannelExceptionCallback exceptionCallback_;
    mutable std::mutex callbackMutex_;
};

} // namespace relaunch::infra
