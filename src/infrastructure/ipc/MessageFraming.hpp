#pragma once

#include "core/types/ArgumentBatch.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace relaunch::infra {

/**
 * @brief Wire framing for the local forwarding channel.
 *
 * A frame is a 4-byte big-endian payload length followed by a UTF-8 JSON
 * payload: an array of strings, or null. After each delivered frame the
 * server answers with the single byte kAckByte.
 */
namespace framing {

constexpr size_t kHeaderSize = 4;
constexpr uint8_t kAckByte = 0x06;
constexpr size_t kDefaultMaxPayloadBytes = 1024 * 1024;

/**
 * @brief Serializes a batch into a complete frame (header and payload).
 * @param batch Arguments to encode; std::nullopt encodes a null payload.
 * @return Frame bytes ready to be written to the socket.
 */
std::vector<uint8_t> encodeFrame(const std::optional<core::ArgumentBatch>& batch);

/**
 * @brief Reads the payload length from a frame header.
 */
uint32_t decodeHeader(const std::array<uint8_t, kHeaderSize>& header);

/**
 * @brief Parses a frame payload.
 * @param payload Raw JSON text.
 * @return The batch, or std::nullopt for a null payload.
 * @throws core::ChannelError if the payload is not null or an array of strings.
 */
std::optional<core::ArgumentBatch> decodePayload(const std::string& payload);

} // namespace framing

} // namespace relaunch::infra
