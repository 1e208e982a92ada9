/*
 * TCP Socket
 *
 * Thin RAII wrappers over POSIX stream sockets: a connected socket with
 * timeout-bounded connect/send/receive, and a listening socket.
 */

#ifndef DECK_RELAY_TCP_SOCKET_HPP
#define DECK_RELAY_TCP_SOCKET_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace deck_relay {

enum class IoStatus {
    Ok,
    Timeout,  // nothing transferred within the timeout
    Closed,   // orderly shutdown by the peer
    Error,
};

class TcpSocket {
public:
    TcpSocket() = default;
    explicit TcpSocket(int fd) : fd_(fd) {}
    ~TcpSocket();

    TcpSocket(TcpSocket&& other) noexcept;
    TcpSocket& operator=(TcpSocket&& other) noexcept;
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Connect with a bounded wait. `address` is an IPv4 address in host order.
    static IoStatus connectTo(uint32_t address, uint16_t port, int timeout_ms, TcpSocket& out);

    bool valid() const { return fd_ >= 0; }
    int fd() const { return fd_; }

    // Sends the whole buffer; Timeout if the kernel buffer stays full
    IoStatus sendAll(const uint8_t* data, size_t size);

    // Waits up to timeout_ms for data and reads what is available
    IoStatus receiveSome(uint8_t* buffer, size_t capacity, size_t& received, int timeout_ms);

    bool setSendTimeout(int timeout_ms);
    bool setNoDelay();

    // Wakes any thread blocked on this socket; the fd stays open
    void shutdownBoth();
    void close();

    std::string peerAddress() const;

private:
    int fd_ = -1;
};

class TcpListener {
public:
    TcpListener() = default;
    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    // Binds 0.0.0.0:port (or `address`); port 0 picks an ephemeral port
    bool bind(uint16_t port, const std::string& address = "0.0.0.0");

    // Waits up to timeout_ms for an incoming connection
    IoStatus accept(TcpSocket& out, int timeout_ms);

    uint16_t port() const { return port_; }
    bool isBound() const { return fd_ >= 0; }
    void close();

private:
    int fd_ = -1;
    uint16_t port_ = 0;
};

}  // namespace deck_relay

#endif  // DECK_RELAY_TCP_SOCKET_HPP
