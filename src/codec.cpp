/*
 * Message Codec Implementation
 */

#include "codec.hpp"

#include <algorithm>
#include <cstring>
#include <string>
#include <type_traits>

namespace deck_relay {

namespace {

template <class>
constexpr bool always_false = false;

class Writer {
public:
    explicit Writer(std::vector<uint8_t>& out) : out_(out) {}

    void u8(uint8_t v) { out_.push_back(v); }

    void u16(uint16_t v) {
        out_.push_back(static_cast<uint8_t>(v & 0xFF));
        out_.push_back(static_cast<uint8_t>(v >> 8));
    }

    void u32(uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            out_.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
        }
    }

    void u64(uint64_t v) {
        for (int i = 0; i < 8; ++i) {
            out_.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
        }
    }

    void f32(float v) {
        uint32_t bits;
        static_assert(sizeof(bits) == sizeof(v), "float must be 32 bits");
        std::memcpy(&bits, &v, sizeof(bits));
        u32(bits);
    }

    void bytes(const std::string& s) {
        out_.insert(out_.end(), s.begin(), s.end());
    }

private:
    std::vector<uint8_t>& out_;
};

// Bounds-checked reader; every accessor fails instead of reading past the end
class Reader {
public:
    Reader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    bool u8(uint8_t& v) {
        if (!need(1)) return false;
        v = data_[pos_++];
        return true;
    }

    bool u16(uint16_t& v) {
        if (!need(2)) return false;
        v = static_cast<uint16_t>(data_[pos_] | (data_[pos_ + 1] << 8));
        pos_ += 2;
        return true;
    }

    bool u32(uint32_t& v) {
        if (!need(4)) return false;
        v = 0;
        for (int i = 0; i < 4; ++i) {
            v |= static_cast<uint32_t>(data_[pos_ + i]) << (8 * i);
        }
        pos_ += 4;
        return true;
    }

    bool u64(uint64_t& v) {
        if (!need(8)) return false;
        v = 0;
        for (int i = 0; i < 8; ++i) {
            v |= static_cast<uint64_t>(data_[pos_ + i]) << (8 * i);
        }
        pos_ += 8;
        return true;
    }

    bool f32(float& v) {
        uint32_t bits;
        if (!u32(bits)) return false;
        std::memcpy(&v, &bits, sizeof(v));
        return true;
    }

    bool bytes(size_t n, std::string& s) {
        if (!need(n)) return false;
        s.assign(reinterpret_cast<const char*>(data_ + pos_), n);
        pos_ += n;
        return true;
    }

    bool atEnd() const { return pos_ == size_; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;

    bool need(size_t n) const { return size_ - pos_ >= n; }
};

// Name prefix of at most MAX_CONTROLLER_NAME bytes, cut on a UTF-8 boundary
size_t clipped_length(const std::string& name) {
    size_t len = std::min(name.size(), MAX_CONTROLLER_NAME);
    while (len > 0 && len < name.size() &&
           (static_cast<unsigned char>(name[len]) & 0xC0) == 0x80) {
        --len;
    }
    return len;
}

// Names that still fit in one frame after clipping
size_t fitting_count(const ControllerList& list) {
    size_t payload = PAYLOAD_HEADER_SIZE + 2;
    size_t count = 0;
    for (const auto& name : list.names) {
        size_t entry = 2 + clipped_length(name);
        if (count == 0xFFFF || payload + entry > MAX_FRAME_SIZE) {
            break;
        }
        payload += entry;
        ++count;
    }
    return count;
}

void encodeBody(const Message& message, Writer& w) {
    std::visit([&w](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ControllerList>) {
            const size_t count = fitting_count(m);
            w.u16(static_cast<uint16_t>(count));
            for (size_t i = 0; i < count; ++i) {
                const size_t len = clipped_length(m.names[i]);
                w.u16(static_cast<uint16_t>(len));
                w.bytes(m.names[i].substr(0, len));
            }
        } else if constexpr (std::is_same_v<T, ControllerState>) {
            const StateModel& s = m.state;
            w.f32(s.leftStickX());
            w.f32(s.leftStickY());
            w.f32(s.rightStickX());
            w.f32(s.rightStickY());
            w.f32(s.leftTrigger());
            w.f32(s.rightTrigger());
            w.u16(s.buttons().mask());
            w.u64(s.timestamp());
        } else if constexpr (std::is_same_v<T, Ping>) {
            w.u64(m.sent_at);
        } else if constexpr (std::is_same_v<T, Pong>) {
            w.u64(m.echoed_at);
        } else {
            static_assert(always_false<T>, "unhandled message type");
        }
    }, message);
}

bool decodeControllerList(Reader& r, Message& out) {
    uint16_t count;
    if (!r.u16(count)) return false;
    ControllerList list;
    list.names.reserve(count);
    for (uint16_t i = 0; i < count; ++i) {
        uint16_t len;
        std::string name;
        if (!r.u16(len) || !r.bytes(len, name)) return false;
        list.names.push_back(std::move(name));
    }
    out = std::move(list);
    return true;
}

bool decodeControllerState(Reader& r, Message& out) {
    float lsx, lsy, rsx, rsy, lt, rt;
    uint16_t buttons;
    uint64_t timestamp;
    if (!r.f32(lsx) || !r.f32(lsy) || !r.f32(rsx) || !r.f32(rsy) ||
        !r.f32(lt) || !r.f32(rt) || !r.u16(buttons) || !r.u64(timestamp)) {
        return false;
    }
    if ((buttons & ~kButtonMask) != 0) {
        return false;
    }
    out = ControllerState{StateModel(lsx, lsy, rsx, rsy, lt, rt, ButtonSet(buttons), timestamp)};
    return true;
}

}  // namespace

MessageTag messageTag(const Message& message) {
    return std::visit([](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ControllerList>) {
            return MessageTag::ControllerList;
        } else if constexpr (std::is_same_v<T, ControllerState>) {
            return MessageTag::ControllerState;
        } else if constexpr (std::is_same_v<T, Ping>) {
            return MessageTag::Ping;
        } else if constexpr (std::is_same_v<T, Pong>) {
            return MessageTag::Pong;
        } else {
            static_assert(always_false<T>, "unhandled message type");
        }
    }, message);
}

const char* messageName(const Message& message) {
    switch (messageTag(message)) {
        case MessageTag::ControllerList: return "ControllerList";
        case MessageTag::ControllerState: return "ControllerState";
        case MessageTag::Ping: return "Ping";
        case MessageTag::Pong: return "Pong";
    }
    return "Unknown";
}

std::vector<uint8_t> encodePayload(const Message& message) {
    std::vector<uint8_t> out;
    Writer w(out);
    w.u32(PACKET_MAGIC);
    w.u8(PROTOCOL_VERSION);
    w.u8(static_cast<uint8_t>(messageTag(message)));
    encodeBody(message, w);
    return out;
}

std::vector<uint8_t> encodeMessage(const Message& message) {
    std::vector<uint8_t> payload = encodePayload(message);
    std::vector<uint8_t> frame;
    frame.reserve(FRAME_HEADER_SIZE + payload.size());
    Writer w(frame);
    w.u32(static_cast<uint32_t>(payload.size()));
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

DecodeError decodePayload(const uint8_t* data, size_t size, Message& out) {
    if (data == nullptr && size != 0) {
        return DecodeError::Malformed;
    }
    Reader r(data, size);
    uint32_t magic;
    uint8_t version;
    uint8_t tag;
    if (!r.u32(magic) || magic != PACKET_MAGIC) return DecodeError::Malformed;
    if (!r.u8(version) || version != PROTOCOL_VERSION) return DecodeError::Malformed;
    if (!r.u8(tag)) return DecodeError::Malformed;

    Message decoded;
    bool ok = false;
    switch (static_cast<MessageTag>(tag)) {
        case MessageTag::ControllerList:
            ok = decodeControllerList(r, decoded);
            break;
        case MessageTag::ControllerState:
            ok = decodeControllerState(r, decoded);
            break;
        case MessageTag::Ping: {
            uint64_t sent_at;
            ok = r.u64(sent_at);
            if (ok) decoded = Ping{sent_at};
            break;
        }
        case MessageTag::Pong: {
            uint64_t echoed_at;
            ok = r.u64(echoed_at);
            if (ok) decoded = Pong{echoed_at};
            break;
        }
        default:
            ok = false;
            break;
    }

    // Trailing bytes mean the peer speaks something else
    if (!ok || !r.atEnd()) {
        return DecodeError::Malformed;
    }
    out = std::move(decoded);
    return DecodeError::None;
}

DecodeError decodeMessage(const uint8_t* data, size_t size, Message& out) {
    if (data == nullptr || size < FRAME_HEADER_SIZE) {
        return DecodeError::Malformed;
    }
    Reader r(data, size);
    uint32_t length;
    r.u32(length);
    if (length > MAX_FRAME_SIZE || size - FRAME_HEADER_SIZE != length) {
        return DecodeError::Malformed;
    }
    return decodePayload(data + FRAME_HEADER_SIZE, length, out);
}

DecodeError decodeMessage(const std::vector<uint8_t>& frame, Message& out) {
    return decodeMessage(frame.data(), frame.size(), out);
}

void FrameDecoder::feed(const uint8_t* data, size_t size) {
    if (size == 0) return;
    compact();
    buffer_.insert(buffer_.end(), data, data + size);
}

FrameDecoder::Status FrameDecoder::next(Message& out) {
    size_t available = buffer_.size() - offset_;
    if (available < FRAME_HEADER_SIZE) {
        return Status::NeedMore;
    }
    Reader header(buffer_.data() + offset_, FRAME_HEADER_SIZE);
    uint32_t length;
    header.u32(length);
    if (length > MAX_FRAME_SIZE) {
        return Status::Oversized;
    }
    if (available - FRAME_HEADER_SIZE < length) {
        return Status::NeedMore;
    }

    const uint8_t* payload = buffer_.data() + offset_ + FRAME_HEADER_SIZE;
    offset_ += FRAME_HEADER_SIZE + length;
    if (decodePayload(payload, length, out) != DecodeError::None) {
        return Status::Malformed;
    }
    return Status::Ok;
}

void FrameDecoder::reset() {
    buffer_.clear();
    offset_ = 0;
}

void FrameDecoder::compact() {
    if (offset_ == 0) return;
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
    offset_ = 0;
}

}  // namespace deck_relay
