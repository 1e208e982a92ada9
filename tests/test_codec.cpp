/*
 * Tests for codec.hpp: message encoding, total decoding and stream framing.
 */

#include <catch2/catch.hpp>
#include "codec.hpp"

#include <cstring>
#include <string>
#include <variant>
#include <vector>

using namespace deck_relay;

namespace {

StateModel sample_state() {
    ButtonSet b;
    b.set(Button::A, true);
    b.set(Button::DpadLeft, true);
    b.set(Button::R3, true);
    return StateModel(0.5f, -0.3f, -1.0f, 0.999f, 0.0f, 0.42f, b, 1000);
}

Message round_trip(const Message& m) {
    Message decoded;
    REQUIRE(decodeMessage(encodeMessage(m), decoded) == DecodeError::None);
    return decoded;
}

}  // namespace

TEST_CASE("codec - every message type survives encode/decode", "[codec]") {
    REQUIRE(round_trip(ControllerList{{"Steam Deck", "Xbox Wireless Controller"}}) ==
            Message(ControllerList{{"Steam Deck", "Xbox Wireless Controller"}}));
    REQUIRE(round_trip(ControllerList{}) == Message(ControllerList{}));
    REQUIRE(round_trip(ControllerState{sample_state()}) == Message(ControllerState{sample_state()}));
    REQUIRE(round_trip(Ping{123456789012345ULL}) == Message(Ping{123456789012345ULL}));
    REQUIRE(round_trip(Pong{42}) == Message(Pong{42}));
}

TEST_CASE("codec - frame layout", "[codec]") {
    std::vector<uint8_t> frame = encodeMessage(Ping{0x0102030405060708ULL});

    // length prefix + magic + version + tag + u64
    REQUIRE(frame.size() == FRAME_HEADER_SIZE + PAYLOAD_HEADER_SIZE + 8);
    REQUIRE(frame[0] == 14);
    REQUIRE(frame[1] == 0);
    REQUIRE(frame[4] == 'D');
    REQUIRE(frame[5] == 'R');
    REQUIRE(frame[6] == 'L');
    REQUIRE(frame[7] == '1');
    REQUIRE(frame[8] == PROTOCOL_VERSION);
    REQUIRE(frame[9] == static_cast<uint8_t>(MessageTag::Ping));
    REQUIRE(frame[10] == 0x08);  // little-endian
    REQUIRE(frame[17] == 0x01);
}

TEST_CASE("codec - controller state is not clamped on the wire", "[codec]") {
    // Out-of-range floats are written as-is; the decoder clamps via StateModel
    std::vector<uint8_t> frame = encodeMessage(ControllerState{sample_state()});
    float too_big = 3.5f;
    std::memcpy(&frame[FRAME_HEADER_SIZE + PAYLOAD_HEADER_SIZE], &too_big, sizeof(too_big));

    Message decoded;
    REQUIRE(decodeMessage(frame, decoded) == DecodeError::None);
    REQUIRE(std::get<ControllerState>(decoded).state.leftStickX() == 1.0f);
}

TEST_CASE("codec - every truncation of a frame is malformed", "[codec][malformed]") {
    std::vector<uint8_t> frame = encodeMessage(ControllerState{sample_state()});
    for (size_t n = 0; n < frame.size(); ++n) {
        std::vector<uint8_t> cut(frame.begin(), frame.begin() + static_cast<std::ptrdiff_t>(n));
        Message out;
        REQUIRE(decodeMessage(cut, out) == DecodeError::Malformed);
    }
}

TEST_CASE("codec - rejects bad headers and trailing bytes", "[codec][malformed]") {
    Message out;

    SECTION("wrong magic") {
        std::vector<uint8_t> frame = encodeMessage(Ping{1});
        frame[4] ^= 0xFF;
        REQUIRE(decodeMessage(frame, out) == DecodeError::Malformed);
    }
    SECTION("wrong version") {
        std::vector<uint8_t> frame = encodeMessage(Ping{1});
        frame[8] = PROTOCOL_VERSION + 1;
        REQUIRE(decodeMessage(frame, out) == DecodeError::Malformed);
    }
    SECTION("unknown tag") {
        std::vector<uint8_t> frame = encodeMessage(Ping{1});
        frame[9] = 99;
        REQUIRE(decodeMessage(frame, out) == DecodeError::Malformed);
    }
    SECTION("trailing bytes inside the payload") {
        std::vector<uint8_t> payload = encodePayload(Pong{9});
        payload.push_back(0);
        REQUIRE(decodePayload(payload.data(), payload.size(), out) == DecodeError::Malformed);
    }
    SECTION("undefined button bits") {
        std::vector<uint8_t> frame = encodeMessage(ControllerState{sample_state()});
        size_t mask_at = FRAME_HEADER_SIZE + PAYLOAD_HEADER_SIZE + 6 * 4;
        frame[mask_at + 1] |= 0x08;  // 0x0800 is not a button
        REQUIRE(decodeMessage(frame, out) == DecodeError::Malformed);
    }
    SECTION("name length past the end") {
        std::vector<uint8_t> payload = encodePayload(ControllerList{{"pad"}});
        payload[PAYLOAD_HEADER_SIZE + 2] = 200;
        REQUIRE(decodePayload(payload.data(), payload.size(), out) == DecodeError::Malformed);
    }
    SECTION("garbage") {
        const uint8_t junk[] = {0xde, 0xad, 0xbe, 0xef, 0x00, 0x11, 0x22};
        REQUIRE(decodePayload(junk, sizeof(junk), out) == DecodeError::Malformed);
        REQUIRE(decodePayload(nullptr, 0, out) == DecodeError::Malformed);
    }
}

TEST_CASE("codec - frame decoder reassembles byte-by-byte input", "[codec][stream]") {
    std::vector<uint8_t> stream = encodeMessage(ControllerList{{"Steam Deck"}});
    std::vector<uint8_t> second = encodeMessage(ControllerState{sample_state()});
    stream.insert(stream.end(), second.begin(), second.end());

    FrameDecoder decoder;
    std::vector<Message> got;
    for (uint8_t byte : stream) {
        decoder.feed(&byte, 1);
        Message m;
        while (decoder.next(m) == FrameDecoder::Status::Ok) {
            got.push_back(m);
        }
    }

    REQUIRE(got.size() == 2);
    REQUIRE(std::holds_alternative<ControllerList>(got[0]));
    REQUIRE(std::get<ControllerState>(got[1]).state == sample_state());
    REQUIRE(decoder.buffered() == 0);
}

TEST_CASE("codec - truncated message is dropped and the stream resumes", "[codec][stream]") {
    // A frame whose payload was cut short by the sender: the length prefix
    // describes what actually follows, the payload inside is incomplete.
    std::vector<uint8_t> full = encodePayload(ControllerState{sample_state()});
    std::vector<uint8_t> cut(full.begin(), full.begin() + 11);
    std::vector<uint8_t> stream = {static_cast<uint8_t>(cut.size()), 0, 0, 0};
    stream.insert(stream.end(), cut.begin(), cut.end());

    std::vector<uint8_t> good = encodeMessage(Ping{77});
    stream.insert(stream.end(), good.begin(), good.end());

    FrameDecoder decoder;
    decoder.feed(stream.data(), stream.size());

    Message m;
    REQUIRE(decoder.next(m) == FrameDecoder::Status::Malformed);
    REQUIRE(decoder.next(m) == FrameDecoder::Status::Ok);
    REQUIRE(m == Message(Ping{77}));
    REQUIRE(decoder.next(m) == FrameDecoder::Status::NeedMore);
}

TEST_CASE("codec - oversized length prefix is reported", "[codec][stream]") {
    const uint8_t header[] = {0x00, 0x00, 0x10, 0x00};  // 1 MiB
    FrameDecoder decoder;
    decoder.feed(header, sizeof(header));

    Message m;
    REQUIRE(decoder.next(m) == FrameDecoder::Status::Oversized);
}

TEST_CASE("codec - long controller names are clipped", "[codec][controller_list]") {
    ControllerList list;
    list.names.push_back(std::string(70000, 'a'));
    list.names.push_back("Steam Deck");

    std::vector<uint8_t> frame = encodeMessage(list);
    REQUIRE(frame.size() <= FRAME_HEADER_SIZE + MAX_FRAME_SIZE);

    Message m;
    REQUIRE(decodeMessage(frame, m) == DecodeError::None);
    const auto& names = std::get<ControllerList>(m).names;
    REQUIRE(names.size() == 2);
    REQUIRE(names[0] == std::string(MAX_CONTROLLER_NAME, 'a'));
    REQUIRE(names[1] == "Steam Deck");
}

TEST_CASE("codec - clipping keeps multi-byte characters whole", "[codec][controller_list]") {
    // 254 ASCII bytes then a 2-byte character straddling the limit
    ControllerList list;
    list.names.push_back(std::string(254, 'x') + "\xC3\xA9");

    Message m = round_trip(list);
    REQUIRE(std::get<ControllerList>(m).names[0] == std::string(254, 'x'));
}

TEST_CASE("codec - oversized controller list still fits one frame", "[codec][controller_list]") {
    ControllerList list;
    for (int i = 0; i < 1200; ++i) {
        list.names.push_back(std::string(60, static_cast<char>('a' + i % 26)));
    }

    std::vector<uint8_t> frame = encodeMessage(list);
    REQUIRE(frame.size() <= FRAME_HEADER_SIZE + MAX_FRAME_SIZE);

    FrameDecoder decoder;
    decoder.feed(frame.data(), frame.size());
    Message m;
    REQUIRE(decoder.next(m) == FrameDecoder::Status::Ok);

    // 62 bytes per entry after the 8-byte payload prefix
    const auto& names = std::get<ControllerList>(m).names;
    REQUIRE(names.size() == (MAX_FRAME_SIZE - PAYLOAD_HEADER_SIZE - 2) / 62);
    REQUIRE(names.front() == list.names.front());
    REQUIRE(names.back() == list.names[names.size() - 1]);
}

TEST_CASE("codec - message names and tags", "[codec]") {
    REQUIRE(messageTag(ControllerList{}) == MessageTag::ControllerList);
    REQUIRE(messageTag(Pong{}) == MessageTag::Pong);
    REQUIRE(std::string(messageName(Ping{})) == "Ping");
    REQUIRE(std::string(messageName(ControllerState{})) == "ControllerState");
}
