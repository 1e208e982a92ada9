/*
 * Transport Implementation
 */

#include "transport.hpp"

#include <chrono>
#include <iostream>

namespace deck_relay {

namespace {

const size_t READ_CHUNK = 4096;

TransportError from_io(IoStatus status) {
    switch (status) {
        case IoStatus::Ok: return TransportError::None;
        case IoStatus::Timeout: return TransportError::Timeout;
        case IoStatus::Closed:
        case IoStatus::Error: return TransportError::IoFailure;
    }
    return TransportError::IoFailure;
}

}  // namespace

const char* transportErrorName(TransportError error) {
    switch (error) {
        case TransportError::None: return "none";
        case TransportError::NotConnected: return "not connected";
        case TransportError::IoFailure: return "I/O failure";
        case TransportError::Timeout: return "timeout";
    }
    return "unknown";
}

Transport::Transport(int send_timeout_ms)
    : send_timeout_ms_(send_timeout_ms) {
}

Transport::~Transport() {
    disconnect();
}

bool Transport::listen(uint16_t port, const std::string& address) {
    if (!listener_.bind(port, address)) {
        return false;
    }
    std::cout << "transport: listening on " << address << ":" << listener_.port() << std::endl;
    return true;
}

IoStatus Transport::acceptPending(int timeout_ms, TcpSocket& out) {
    return listener_.accept(out, timeout_ms);
}

uint64_t Transport::adopt(TcpSocket socket, FrameDecoder decoder) {
    socket.setNoDelay();
    socket.setSendTimeout(send_timeout_ms_);

    auto conn = std::make_shared<Connection>();
    conn->peer = socket.peerAddress();
    conn->socket = std::move(socket);
    conn->decoder = std::move(decoder);

    std::shared_ptr<Connection> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        conn->generation = ++next_generation_;
        previous = std::move(current_);
        current_ = conn;
    }

    if (previous) {
        std::cout << "transport: " << conn->peer << " replaces " << previous->peer << std::endl;
        // Other threads may still hold it; the fd closes with the last reference
        previous->socket.shutdownBoth();
    }
    return conn->generation;
}

void Transport::disconnect() {
    std::shared_ptr<Connection> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::move(current_);
    }
    if (previous) {
        previous->socket.shutdownBoth();
    }
}

bool Transport::disconnectIf(uint64_t generation) {
    std::shared_ptr<Connection> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!current_ || current_->generation != generation) {
            return false;
        }
        previous = std::move(current_);
    }
    previous->socket.shutdownBoth();
    return true;
}

std::shared_ptr<Transport::Connection> Transport::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

bool Transport::isConnected() const {
    return current() != nullptr;
}

uint64_t Transport::generation() const {
    auto conn = current();
    return conn ? conn->generation : 0;
}

std::string Transport::peerAddress() const {
    auto conn = current();
    return conn ? conn->peer : std::string();
}

TransportError Transport::send(const Message& message) {
    uint64_t generation;
    return send(message, generation);
}

TransportError Transport::send(const Message& message, uint64_t& generation) {
    auto conn = current();
    if (!conn) {
        generation = 0;
        return TransportError::NotConnected;
    }
    generation = conn->generation;

    std::vector<uint8_t> frame = encodeMessage(message);
    IoStatus status = conn->socket.sendAll(frame.data(), frame.size());
    if (status != IoStatus::Ok) {
        std::cerr << "transport: send " << messageName(message) << " to " << conn->peer
                  << " failed (" << (status == IoStatus::Timeout ? "timeout" : "connection lost") << ")"
                  << std::endl;
    }
    return from_io(status);
}

TransportError Transport::receive(Message& out, int timeout_ms) {
    uint64_t generation;
    return receive(out, timeout_ms, generation);
}

TransportError Transport::receive(Message& out, int timeout_ms, uint64_t& generation) {
    auto conn = current();
    if (!conn) {
        generation = 0;
        return TransportError::NotConnected;
    }
    generation = conn->generation;

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);
    uint8_t buffer[READ_CHUNK];

    for (;;) {
        switch (conn->decoder.next(out)) {
            case FrameDecoder::Status::Ok:
                return TransportError::None;
            case FrameDecoder::Status::Malformed:
                ++malformed_;
                std::cerr << "transport: dropped malformed frame from " << conn->peer << std::endl;
                continue;
            case FrameDecoder::Status::Oversized:
                std::cerr << "transport: oversized frame from " << conn->peer << ", stream out of sync" << std::endl;
                return TransportError::IoFailure;
            case FrameDecoder::Status::NeedMore:
                break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
        if (remaining < 0) {
            remaining = 0;
        }

        size_t received = 0;
        IoStatus status = conn->socket.receiveSome(buffer, sizeof(buffer), received, static_cast<int>(remaining));
        if (status == IoStatus::Ok) {
            conn->decoder.feed(buffer, received);
            continue;
        }
        if (status == IoStatus::Timeout) {
            return TransportError::Timeout;
        }
        return TransportError::IoFailure;
    }
}

}  // namespace deck_relay
