#include "infrastructure/ipc/LocalSocketClient.hpp"

#include "core/types/ChannelErrors.hpp"
#include "infrastructure/ipc/MessageFraming.hpp"

#include <spdlog/spdlog.h>

#include <array>

namespace relaunch::infra {

LocalSocketClient::LocalSocketClient(std::filesystem::path socketPath)
    : socketPath_(std::move(socketPath)), socket_(ioContext_) {}

LocalSocketClient::~LocalSocketClient() {
    if (!socket_.is_open()) {
        return;
    }

    asio::error_code ec;
    if (connected_) {
        socket_.shutdown(asio::local::stream_protocol::socket::shutdown_both, ec);
        if (ec && ec != asio::error::not_connected) {
            reportException(std::make_exception_ptr(
                core::ChannelError("Failed to shut down channel connection", ec)));
        }
    }
    socket_.close(ec);
}

void LocalSocketClient::setExceptionCallback(core::ChannelExceptionCallback callback) {
    std::lock_guard lock(mutex_);
    exceptionCallback_ = std::move(callback);
}

void LocalSocketClient::write(const core::ArgumentBatch& batch, std::chrono::milliseconds timeout) {
    auto frame = framing::encodeFrame(batch);
    std::array<uint8_t, 1> ack{};
    asio::error_code result = asio::error::would_block;
    std::string stage = "connect";

    auto sendFrame = [&]() {
        stage = "send";
        asio::async_write(socket_, asio::buffer(frame),
                          [&](const asio::error_code& ec, std::size_t /*bytes*/) {
                              if (ec) {
                                  result = ec;
                                  return;
                              }
                              stage = "acknowledge";
                              asio::async_read(socket_, asio::buffer(ack),
                                               [&](const asio::error_code& ec2, std::size_t) {
                                                   result = ec2;
                                               });
                          });
    };

    if (connected_) {
        sendFrame();
    } else {
        socket_.async_connect(asio::local::stream_protocol::endpoint(socketPath_.string()),
                              [&](const asio::error_code& ec) {
                                  if (ec) {
                                      result = ec;
                                      return;
                                  }
                                  connected_ = true;
                                  sendFrame();
                              });
    }

    ioContext_.restart();
    ioContext_.run_for(timeout);

    if (!ioContext_.stopped()) {
        // Abort the outstanding operation and let its handler observe the cancellation
        asio::error_code ignored;
        socket_.close(ignored);
        connected_ = false;
        ioContext_.run();
        throw core::ChannelTimeout("Timed out during " + stage + " to " + socketPath_.string() +
                                   " after " + std::to_string(timeout.count()) + "ms");
    }

    if (result) {
        throw core::ChannelError("Channel " + stage + " to " + socketPath_.string() + " failed",
                                 result);
    }

    if (ack[0] != framing::kAckByte) {
        throw core::ChannelError("Unexpected acknowledgement from " + socketPath_.string());
    }

    spdlog::debug("Forwarded {} argument(s) to {}", batch.size(), socketPath_.string());
}

void LocalSocketClient::reportException(std::exception_ptr exception) {
    core::ChannelExceptionCallback callback;
    {
        std::lock_guard lock(mutex_);
        callback = exceptionCallback_;
    }

    if (!callback) {
        return;
    }

    try {
        callback(exception);
    } catch (const std::exception& e) {
        spdlog::warn("Channel client exception handler failed: {}", e.what());
    }
}

} // namespace relaunch::infra
