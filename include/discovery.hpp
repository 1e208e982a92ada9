/*
 * Peer Discovery
 *
 * The sink looks for a source by dialing every address of a range on the
 * relay port, one at a time with a short connect timeout. A candidate is
 * accepted once it completes the handshake: the source speaks first and
 * sends its ControllerList. The first accepted address ends the scan.
 *
 * A scan is a cancellable task; cancel() may be called from any thread and
 * takes effect at the next attempt or handshake wait slice.
 */

#ifndef DECK_RELAY_DISCOVERY_HPP
#define DECK_RELAY_DISCOVERY_HPP

#include "address_range.hpp"
#include "codec.hpp"
#include "relay_protocol.hpp"
#include "tcp_socket.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace deck_relay {

// Listener side of the handshake
IoStatus sendControllerList(TcpSocket& socket, const ControllerList& list);

// Dialer side: reads frames until a ControllerList arrives or timeout_ms
// elapses. Bytes read past it stay buffered in `decoder`.
IoStatus awaitControllerList(TcpSocket& socket, FrameDecoder& decoder, int timeout_ms,
                             ControllerList& out, const std::atomic<bool>* cancel = nullptr);

struct DiscoveryResult {
    uint32_t address = 0;
    TcpSocket socket;
    FrameDecoder decoder;
    ControllerList controllers;
};

class Discovery {
public:
    Discovery(uint16_t port, int connect_timeout_ms, int handshake_timeout_ms);

    // Dials one address and runs the handshake
    bool probe(uint32_t address, DiscoveryResult& result);

    // Tries each address of `range` in order; stops at the first success
    bool scan(const AddressRange& range, DiscoveryResult& result);

    void cancel() { cancelled_ = true; }
    void reset() { cancelled_ = false; }
    bool isCancelled() const { return cancelled_; }

    // Connection attempts made by the current or last scan
    size_t attempts() const { return attempts_; }

private:
    uint16_t port_;
    int connect_timeout_ms_;
    int handshake_timeout_ms_;
    std::atomic<bool> cancelled_{false};
    std::atomic<size_t> attempts_{0};
};

}  // namespace deck_relay

#endif  // DECK_RELAY_DISCOVERY_HPP
