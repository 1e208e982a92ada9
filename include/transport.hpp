/*
 * Transport
 *
 * Owns exactly one logical connection to the peer. A connection is
 * installed with adopt() (after a dial or an accept) and replaces any
 * previous one; each gets a new generation number so late failures from
 * a replaced connection can be told apart.
 *
 * send() may be called from any thread. receive() must only be called from
 * one thread at a time, it owns the stream reassembly buffer.
 * No lock is held while a socket call is in progress.
 */

#ifndef DECK_RELAY_TRANSPORT_HPP
#define DECK_RELAY_TRANSPORT_HPP

#include "codec.hpp"
#include "relay_protocol.hpp"
#include "tcp_socket.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace deck_relay {

enum class TransportError {
    None,
    NotConnected,
    IoFailure,
    Timeout,
};

const char* transportErrorName(TransportError error);

class Transport {
public:
    explicit Transport(int send_timeout_ms = 500);
    ~Transport();

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    // Listening side
    bool listen(uint16_t port, const std::string& address = "0.0.0.0");
    uint16_t listenPort() const { return listener_.port(); }
    IoStatus acceptPending(int timeout_ms, TcpSocket& out);
    void stopListening() { listener_.close(); }

    // Installs a connected socket, pre-empting the current connection.
    // `decoder` carries bytes already read during the handshake.
    uint64_t adopt(TcpSocket socket, FrameDecoder decoder = FrameDecoder());

    void disconnect();

    // Drops the connection only if it is still the given generation
    bool disconnectIf(uint64_t generation);

    bool isConnected() const;
    uint64_t generation() const;
    std::string peerAddress() const;

    // Fails immediately with NotConnected when there is no connection
    TransportError send(const Message& message);
    TransportError send(const Message& message, uint64_t& generation);

    // Blocks up to timeout_ms for the next message. Malformed frames are
    // dropped and counted; Timeout means nothing arrived in the window.
    TransportError receive(Message& out, int timeout_ms);
    TransportError receive(Message& out, int timeout_ms, uint64_t& generation);

    uint64_t malformedCount() const { return malformed_; }

private:
    struct Connection {
        TcpSocket socket;
        FrameDecoder decoder;
        uint64_t generation = 0;
        std::string peer;
    };

    int send_timeout_ms_;
    TcpListener listener_;

    mutable std::mutex mutex_;
    std::shared_ptr<Connection> current_;
    uint64_t next_generation_ = 0;
    std::atomic<uint64_t> malformed_{0};

    std::shared_ptr<Connection> current() const;
};

}  // namespace deck_relay

#endif  // DECK_RELAY_TRANSPORT_HPP
