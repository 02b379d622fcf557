#include <catch2/catch_test_macros.hpp>

#include "core/types/ChannelErrors.hpp"
#include "infrastructure/ipc/MessageFraming.hpp"

#include <algorithm>
#include <array>
#include <string>

using namespace relaunch;
using namespace relaunch::infra;

namespace {

std::array<uint8_t, framing::kHeaderSize> headerOf(const std::vector<uint8_t>& frame) {
    std::array<uint8_t, framing::kHeaderSize> header{};
    std::copy_n(frame.begin(), framing::kHeaderSize, header.begin());
    return header;
}

std::string payloadOf(const std::vector<uint8_t>& frame) {
    return std::string(frame.begin() + framing::kHeaderSize, frame.end());
}

} // namespace

TEST_CASE("Frame encoding", "[MessageFraming]") {
    SECTION("Header carries the big-endian payload length") {
        auto frame = framing::encodeFrame(core::ArgumentBatch{"a", "b"});

        REQUIRE(payloadOf(frame) == R"(["a","b"])");
        REQUIRE(frame[0] == 0);
        REQUIRE(frame[1] == 0);
        REQUIRE(frame[2] == 0);
        REQUIRE(frame[3] == 9);
        REQUIRE(framing::decodeHeader(headerOf(frame)) == 9);
    }

    SECTION("Missing batch is encoded as null") {
        auto frame = framing::encodeFrame(std::nullopt);
        REQUIRE(payloadOf(frame) == "null");
        REQUIRE_FALSE(framing::decodePayload(payloadOf(frame)).has_value());
    }

    SECTION("Empty batch stays distinct from null") {
        auto frame = framing::encodeFrame(core::ArgumentBatch{});
        REQUIRE(payloadOf(frame) == "[]");

        auto decoded = framing::decodePayload(payloadOf(frame));
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->empty());
    }

    SECTION("Arguments keep order, duplicates and special characters") {
        core::ArgumentBatch batch{"--file", "my file.txt", "", "\"quoted\"", "ünïcødé", "--file"};
        REQUIRE(framing::decodePayload(payloadOf(framing::encodeFrame(batch))) == batch);
    }

    SECTION("Invalid UTF-8 does not prevent encoding") {
        core::ArgumentBatch batch{std::string("bad\xff")};
        auto decoded = framing::decodePayload(payloadOf(framing::encodeFrame(batch)));
        REQUIRE(decoded->size() == 1);
        REQUIRE(decoded->front() == "bad\xEF\xBF\xBD");
    }

    SECTION("Large lengths use every header byte") {
        std::array<uint8_t, framing::kHeaderSize> header{0x01, 0x02, 0x03, 0x04};
        REQUIRE(framing::decodeHeader(header) == 0x01020304u);
    }
}

TEST_CASE("Payload validation", "[MessageFraming]") {
    REQUIRE_THROWS_AS(framing::decodePayload("[\"unterminated"), core::ChannelError);
    REQUIRE_THROWS_AS(framing::decodePayload(R"({"args":[]})"), core::ChannelError);
    REQUIRE_THROWS_AS(framing::decodePayload(R"(["ok", 3])"), core::ChannelError);
    REQUIRE_THROWS_AS(framing::decodePayload(""), core::ChannelError);
}
