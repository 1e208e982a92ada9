/*
 * Peer Discovery Implementation
 */

#include "discovery.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <variant>

namespace deck_relay {

namespace {

// Longest single wait while a cancel flag is being watched
const int WAIT_SLICE_MS = 50;

}  // namespace

IoStatus sendControllerList(TcpSocket& socket, const ControllerList& list) {
    std::vector<uint8_t> frame = encodeMessage(Message(list));
    return socket.sendAll(frame.data(), frame.size());
}

IoStatus awaitControllerList(TcpSocket& socket, FrameDecoder& decoder, int timeout_ms,
                             ControllerList& out, const std::atomic<bool>* cancel) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);
    uint8_t buffer[1024];

    for (;;) {
        Message message;
        FrameDecoder::Status status = decoder.next(message);
        if (status == FrameDecoder::Status::Ok) {
            if (auto* list = std::get_if<ControllerList>(&message)) {
                out = *list;
                return IoStatus::Ok;
            }
            // The source always speaks first with its controller list
            continue;
        }
        if (status == FrameDecoder::Status::Malformed) {
            continue;
        }
        if (status == FrameDecoder::Status::Oversized) {
            return IoStatus::Error;
        }

        if (cancel && *cancel) {
            return IoStatus::Closed;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
        if (remaining <= 0) {
            return IoStatus::Timeout;
        }

        size_t received = 0;
        int wait = static_cast<int>(std::min<long long>(remaining, WAIT_SLICE_MS));
        IoStatus io = socket.receiveSome(buffer, sizeof(buffer), received, wait);
        if (io == IoStatus::Ok) {
            decoder.feed(buffer, received);
        } else if (io != IoStatus::Timeout) {
            return io;
        }
    }
}

Discovery::Discovery(uint16_t port, int connect_timeout_ms, int handshake_timeout_ms)
    : port_(port), connect_timeout_ms_(connect_timeout_ms),
      handshake_timeout_ms_(handshake_timeout_ms) {
}

bool Discovery::probe(uint32_t address, DiscoveryResult& result) {
    if (cancelled_) {
        return false;
    }
    ++attempts_;

    TcpSocket socket;
    if (TcpSocket::connectTo(address, port_, connect_timeout_ms_, socket) != IoStatus::Ok) {
        return false;
    }

    FrameDecoder decoder;
    ControllerList list;
    IoStatus status = awaitControllerList(socket, decoder, handshake_timeout_ms_, list, &cancelled_);
    if (status != IoStatus::Ok) {
        std::cerr << "discovery: " << formatIpv4(address) << ":" << port_
                  << " accepted the connection but did not complete the handshake" << std::endl;
        return false;
    }

    result.address = address;
    result.socket = std::move(socket);
    result.decoder = std::move(decoder);
    result.controllers = std::move(list);
    return true;
}

bool Discovery::scan(const AddressRange& range, DiscoveryResult& result) {
    attempts_ = 0;
    std::cout << "discovery: scanning " << range.toString() << " port " << port_ << std::endl;

    for (size_t i = 0; i < range.size(); ++i) {
        if (cancelled_) {
            std::cout << "discovery: cancelled after " << attempts_ << " attempts" << std::endl;
            return false;
        }
        if (probe(range.at(i), result)) {
            std::cout << "discovery: found source at " << formatIpv4(result.address)
                      << " after " << attempts_ << " attempts" << std::endl;
            return true;
        }
    }

    std::cout << "discovery: no source found in " << range.toString() << std::endl;
    return false;
}

}  // namespace deck_relay
