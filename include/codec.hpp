/*
 * Message Codec
 *
 * Binary encoding of relay messages (all integers little-endian):
 *
 *   frame   = u32 payload_length | payload
 *   payload = u32 magic | u8 version | u8 tag | body
 *
 *   ControllerList  : u16 count | count x (u16 length | utf-8 bytes)
 *   ControllerState : f32 lsx lsy rsx rsy lt rt | u16 buttons | u64 timestamp
 *   Ping            : u64 sent_at
 *   Pong            : u64 echoed_at
 *
 * Encoding a ControllerList clips each name to MAX_CONTROLLER_NAME bytes and
 * drops trailing names that would push the frame past MAX_FRAME_SIZE.
 *
 * Decoding never trusts its input: any short, oversized or unknown payload
 * yields DecodeError::Malformed.
 */

#ifndef DECK_RELAY_CODEC_HPP
#define DECK_RELAY_CODEC_HPP

#include "relay_protocol.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace deck_relay {

enum class DecodeError {
    None,
    Malformed,
};

// Encodes a complete frame, length prefix included
std::vector<uint8_t> encodeMessage(const Message& message);

// Encodes only the payload (no length prefix)
std::vector<uint8_t> encodePayload(const Message& message);

// Decodes a complete frame (length prefix + payload)
DecodeError decodeMessage(const std::vector<uint8_t>& frame, Message& out);
DecodeError decodeMessage(const uint8_t* data, size_t size, Message& out);

// Decodes a payload without length prefix
DecodeError decodePayload(const uint8_t* data, size_t size, Message& out);

// Reassembles frames from a byte stream read in arbitrary chunks.
class FrameDecoder {
public:
    enum class Status {
        NeedMore,   // no complete frame buffered
        Ok,         // message decoded
        Malformed,  // one frame dropped, stream still in sync
        Oversized,  // length prefix exceeds MAX_FRAME_SIZE, stream unusable
    };

    void feed(const uint8_t* data, size_t size);
    Status next(Message& out);
    void reset();

    size_t buffered() const { return buffer_.size() - offset_; }

private:
    std::vector<uint8_t> buffer_;
    size_t offset_ = 0;

    void compact();
};

}  // namespace deck_relay

#endif  // DECK_RELAY_CODEC_HPP
