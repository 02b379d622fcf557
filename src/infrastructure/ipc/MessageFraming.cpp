#include "infrastructure/ipc/MessageFraming.hpp"

#include "core/types/ChannelErrors.hpp"

#include <nlohmann/json.hpp>

namespace relaunch::infra::framing {

using json = nlohmann::json;

std::vector<uint8_t> encodeFrame(const std::optional<core::ArgumentBatch>& batch) {
    json payload = batch ? json(*batch) : json(nullptr);
    // Arguments are not guaranteed to be valid UTF-8; invalid sequences become U+FFFD.
    auto text = payload.dump(-1, ' ', false, json::error_handler_t::replace);

    auto length = static_cast<uint32_t>(text.size());
    std::vector<uint8_t> frame;
    frame.reserve(kHeaderSize + text.size());
    frame.push_back(static_cast<uint8_t>(length >> 24));
    frame.push_back(static_cast<uint8_t>((length >> 16) & 0xFF));
    frame.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
    frame.push_back(static_cast<uint8_t>(length & 0xFF));
    frame.insert(frame.end(), text.begin(), text.end());
    return frame;
}

uint32_t decodeHeader(const std::array<uint8_t, kHeaderSize>& header) {
    return (static_cast<uint32_t>(header[0]) << 24) | (static_cast<uint32_t>(header[1]) << 16) |
           (static_cast<uint32_t>(header[2]) << 8) | static_cast<uint32_t>(header[3]);
}

std::optional<core::ArgumentBatch> decodePayload(const std::string& payload) {
    json j;
    try {
        j = json::parse(payload);
    } catch (const json::parse_error& e) {
        throw core::ChannelError(std::string("Malformed message payload: ") + e.what());
    }

    if (j.is_null()) {
        return std::nullopt;
    }

    if (!j.is_array()) {
        throw core::ChannelError("Message payload is not an argument array");
    }

    core::ArgumentBatch batch;
    batch.reserve(j.size());
    for (const auto& item : j) {
        if (!item.is_string()) {
            throw core::ChannelError("Message payload contains a non-string argument");
        }
        batch.push_back(item.get<std::string>());
    }
    return batch;
}

} // namespace relaunch::infra::framing
