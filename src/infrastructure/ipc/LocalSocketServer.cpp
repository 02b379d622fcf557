#include "infrastructure/ipc/LocalSocketServer.hpp"

#include "core/types/ChannelErrors.hpp"

#include <spdlog/spdlog.h>

namespace relaunch::infra {

namespace {

const std::array<uint8_t, 1> kAck{framing::kAckByte};

constexpr auto kAcceptRetryDelay = std::chrono::milliseconds(100);

bool isOrdinaryDisconnect(const asio::error_code& ec) {
    return !ec || ec == asio::error::eof || ec == asio::error::operation_aborted;
}

} // namespace

LocalSocketServer::LocalSocketServer(AsioContext& context, std::filesystem::path socketPath,
                                     Options options)
    : strand_(context.makeStrand()), socketPath_(std::move(socketPath)),
      options_(options), acceptRetryTimer_(strand_) {}

LocalSocketServer::~LocalSocketServer() {
    asio::error_code ec;
    if (acceptor_) {
        acceptor_->close(ec);
    }

    if (running_.exchange(false)) {
        std::error_code fsEc;
        std::filesystem::remove(socketPath_, fsEc);
    }
}

void LocalSocketServer::setMessageCallback(MessageCallback callback) {
    std::lock_guard lock(callbackMutex_);
    messageCallback_ = std::move(callback);
}

void LocalSocketServer::setExceptionCallback(core::ChannelExceptionCallback callback) {
    std::lock_guard lock(callbackMutex_);
    exceptionCallback_ = std::move(callback);
}

void LocalSocketServer::allowUsersReadWrite() {
    allowOtherUsers_ = true;
}

void LocalSocketServer::start() {
    if (running_.load()) {
        return;
    }

    std::error_code fsEc;
    if (std::filesystem::remove(socketPath_, fsEc)) {
        spdlog::debug("Removed stale socket {}", socketPath_.string());
    }

    try {
        auto acceptor = std::make_unique<asio::local::stream_protocol::acceptor>(strand_);
        asio::local::stream_protocol::endpoint endpoint(socketPath_.string());
        acceptor->open(endpoint.protocol());
        acceptor->bind(endpoint);

        if (allowOtherUsers_) {
            using std::filesystem::perms;
            std::filesystem::permissions(socketPath_,
                                         perms::owner_read | perms::owner_write |
                                             perms::group_read | perms::group_write |
                                             perms::others_read | perms::others_write,
                                         std::filesystem::perm_options::replace, fsEc);
            if (fsEc) {
                spdlog::warn("Failed to relax permissions on {}: {}", socketPath_.string(),
                             fsEc.message());
            }
        }

        acceptor->listen(asio::socket_base::max_listen_connections);
        acceptor_ = std::move(acceptor);
    } catch (const std::system_error& e) {
        throw core::ChannelError("Failed to listen on " + socketPath_.string(), e.code());
    }

    running_ = true;
    asio::dispatch(strand_, [self = shared_from_this()]() { self->startAccept(); });
    spdlog::info("Channel server listening on {}", socketPath_.string());
}

void LocalSocketServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    asio::post(strand_, [self = shared_from_this()]() { self->closeEndpoint(); });

    std::error_code fsEc;
    std::filesystem::remove(socketPath_, fsEc);
    spdlog::info("Channel server on {} stopped", socketPath_.string());
}

void LocalSocketServer::startAccept() {
    if (!running_.load() || !acceptor_) {
        return;
    }

    auto session = std::make_shared<Session>(strand_);
    auto self = shared_from_this();

    acceptor_->async_accept(session->socket, [this, self, session](const asio::error_code& ec) {
        if (!running_.load()) {
            return;
        }

        if (ec) {
            reportException(std::make_exception_ptr(
                core::ChannelError("Failed to accept channel connection", ec)));
            acceptRetryTimer_.expires_after(kAcceptRetryDelay);
            acceptRetryTimer_.async_wait([this, self](const asio::error_code& timerEc) {
                if (!timerEc) {
                    startAccept();
                }
            });
            return;
        }

        spdlog::debug("Channel client connected on {}", socketPath_.string());
        activeSession_ = session;
        readFrame(session);
    });
}

void LocalSocketServer::readFrame(std::shared_ptr<Session> session) {
    armIdleTimer(session);
    auto self = shared_from_this();

    asio::async_read(
        session->socket, asio::buffer(session->header),
        [this, self, session](const asio::error_code& ec, std::size_t /*bytes*/) {
            if (ec) {
                endSession(session, ec);
                return;
            }

            auto length = framing::decodeHeader(session->header);
            if (length > options_.maxMessageBytes) {
                reportException(std::make_exception_ptr(core::ChannelError(
                    "Message of " + std::to_string(length) + " bytes exceeds the limit of " +
                    std::to_string(options_.maxMessageBytes))));
                endSession(session, {});
                return;
            }

            session->payload.assign(length, '\0');
            asio::async_read(
                session->socket, asio::buffer(session->payload),
                [this, self, session](const asio::error_code& ec2, std::size_t /*bytes*/) {
                    if (ec2) {
                        endSession(session, ec2);
                        return;
                    }

                    std::optional<core::ArgumentBatch> batch;
                    try {
                        batch = framing::decodePayload(session->payload);
                    } catch (const core::ChannelError&) {
                        reportException(std::current_exception());
                        endSession(session, {});
                        return;
                    }

                    deliver(std::move(batch));
                    sendAck(session);
                });
        });
}

void LocalSocketServer::sendAck(std::shared_ptr<Session> session) {
    auto self = shared_from_this();

    asio::async_write(session->socket, asio::buffer(kAck),
                      [this, self, session](const asio::error_code& ec, std::size_t /*bytes*/) {
                          if (ec) {
                              endSession(session, ec);
                              return;
                          }
                          readFrame(session);
                      });
}

void LocalSocketServer::endSession(std::shared_ptr<Session> session, const asio::error_code& ec) {
    if (!isOrdinaryDisconnect(ec)) {
        reportException(
            std::make_exception_ptr(core::ChannelError("Channel session failed", ec)));
    }

    asio::error_code ignored;
    session->timer.cancel();
    session->socket.close(ignored);

    if (activeSession_ == session) {
        activeSession_.reset();
        spdlog::debug("Channel client disconnected from {}", socketPath_.string());
        startAccept();
    }
}

void LocalSocketServer::armIdleTimer(std::shared_ptr<Session> session) {
    session->timer.expires_after(options_.sessionTimeout);
    session->timer.async_wait([this, self = shared_from_this(), session](const asio::error_code& ec) {
        if (ec) {
            return;
        }
        spdlog::debug("Closing idle channel session on {}", socketPath_.string());
        asio::error_code ignored;
        session->socket.close(ignored);
    });
}

void LocalSocketServer::closeEndpoint() {
    asio::error_code ignored;
    acceptRetryTimer_.cancel();

    if (acceptor_) {
        acceptor_->close(ignored);
        acceptor_.reset();
    }

    if (activeSession_) {
        activeSession_->timer.cancel();
        activeSession_->socket.close(ignored);
        activeSession_.reset();
    }
}

void LocalSocketServer::deliver(std::optional<core::ArgumentBatch> batch) {
    MessageCallback callback;
    {
        std::lock_guard lock(callbackMutex_);
        callback = messageCallback_;
    }

    if (!callback) {
        return;
    }

    try {
        callback(std::move(batch));
    } catch (const std::exception& e) {
        spdlog::warn("Channel message handler failed: {}", e.what());
        reportException(std::current_exception());
    }
}

void LocalSocketServer::reportException(std::exception_ptr exception) {
    core::ChannelExceptionCallback callback;
    {
        std::lock_guard lock(callbackMutex_);
        callback = exceptionCallback_;
    }

    if (!callback) {
        return;
    }

    try {
        callback(exception);
    } catch (const std::exception& e) {
        spdlog::warn("Channel exception handler failed: {}", e.what());
    }
}

} // namespace relaunch::infra
