/*
 * Deck relay protocol - messages exchanged between source and sink.
 * Every message travels as one length-prefixed frame over a single TCP
 * connection; see codec.hpp for the byte layout.
 */
#ifndef DECK_RELAY_RELAY_PROTOCOL_HPP
#define DECK_RELAY_RELAY_PROTOCOL_HPP

#include "state_model.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace deck_relay {

// Magic bytes for payload validation
constexpr uint32_t PACKET_MAGIC = 0x314C5244;  // "DRL1" in little-endian
constexpr uint8_t PROTOCOL_VERSION = 1;

// Default TCP port (the WebSocket variant on 8080 is not compatible)
constexpr unsigned short DEFAULT_PORT = 12345;

// Frames larger than this mean the stream lost sync
constexpr size_t MAX_FRAME_SIZE = 64 * 1024;

constexpr size_t FRAME_HEADER_SIZE = 4;   // u32 payload length
constexpr size_t PAYLOAD_HEADER_SIZE = 6; // magic + version + tag

// Longer controller names are clipped when a ControllerList is encoded
constexpr size_t MAX_CONTROLLER_NAME = 255;

enum class MessageTag : uint8_t {
    ControllerList = 1,
    ControllerState = 2,
    Ping = 3,
    Pong = 4,
};

struct ControllerList {
    std::vector<std::string> names;

    bool operator==(const ControllerList& o) const { return names == o.names; }
};

struct ControllerState {
    StateModel state;

    bool operator==(const ControllerState& o) const { return state == o.state; }
};

struct Ping {
    uint64_t sent_at = 0;

    bool operator==(const Ping& o) const { return sent_at == o.sent_at; }
};

struct Pong {
    uint64_t echoed_at = 0;

    bool operator==(const Pong& o) const { return echoed_at == o.echoed_at; }
};

using Message = std::variant<ControllerList, ControllerState, Ping, Pong>;

MessageTag messageTag(const Message& message);
const char* messageName(const Message& message);

}  // namespace deck_relay

#endif
