/*
 * TCP Socket Implementation
 */

#include "tcp_socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>

namespace deck_relay {

namespace {

bool set_blocking(int fd, bool blocking) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) == 0;
}

// poll() that retries on EINTR; returns poll's result
int poll_one(int fd, short events, int timeout_ms, short& revents) {
    struct pollfd pfd = {fd, events, 0};
    int r;
    do {
        r = ::poll(&pfd, 1, timeout_ms);
    } while (r < 0 && errno == EINTR);
    revents = pfd.revents;
    return r;
}

}  // namespace

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

IoStatus TcpSocket::connectTo(uint32_t address, uint16_t port, int timeout_ms, TcpSocket& out) {
    int s = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (s < 0) {
        std::cerr << "socket: " << std::strerror(errno) << std::endl;
        return IoStatus::Error;
    }
    TcpSocket sock(s);

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(address);

    if (!set_blocking(s, false)) {
        return IoStatus::Error;
    }

    if (::connect(s, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        if (errno != EINPROGRESS) {
            return IoStatus::Error;
        }
        short revents = 0;
        int r = poll_one(s, POLLOUT, timeout_ms, revents);
        if (r == 0) {
            return IoStatus::Timeout;
        }
        if (r < 0) {
            return IoStatus::Error;
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(s, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
            return IoStatus::Error;
        }
    }

    if (!set_blocking(s, true)) {
        return IoStatus::Error;
    }
    out = std::move(sock);
    return IoStatus::Ok;
}

IoStatus TcpSocket::sendAll(const uint8_t* data, size_t size) {
    if (fd_ < 0) return IoStatus::Error;

    size_t sent_total = 0;
    while (sent_total < size) {
        ssize_t n = ::send(fd_, data + sent_total, size - sent_total, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return IoStatus::Timeout;
            }
            if (errno == EPIPE || errno == ECONNRESET) {
                return IoStatus::Closed;
            }
            return IoStatus::Error;
        }
        sent_total += static_cast<size_t>(n);
    }
    return IoStatus::Ok;
}

IoStatus TcpSocket::receiveSome(uint8_t* buffer, size_t capacity, size_t& received, int timeout_ms) {
    received = 0;
    if (fd_ < 0) return IoStatus::Error;

    short revents = 0;
    int r = poll_one(fd_, POLLIN, timeout_ms, revents);
    if (r == 0) {
        return IoStatus::Timeout;
    }
    if (r < 0) {
        return IoStatus::Error;
    }

    ssize_t n;
    do {
        n = ::recv(fd_, buffer, capacity, MSG_DONTWAIT);
    } while (n < 0 && errno == EINTR);

    if (n == 0) {
        return IoStatus::Closed;
    }
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return IoStatus::Timeout;
        }
        if (errno == ECONNRESET) {
            return IoStatus::Closed;
        }
        return IoStatus::Error;
    }
    received = static_cast<size_t>(n);
    return IoStatus::Ok;
}

bool TcpSocket::setSendTimeout(int timeout_ms) {
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    if (setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        std::cerr << "setsockopt SO_SNDTIMEO: " << std::strerror(errno) << std::endl;
        return false;
    }
    return true;
}

bool TcpSocket::setNoDelay() {
    int opt = 1;
    if (setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) < 0) {
        std::cerr << "setsockopt TCP_NODELAY: " << std::strerror(errno) << std::endl;
        return false;
    }
    return true;
}

void TcpSocket::shutdownBoth() {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

void TcpSocket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::string TcpSocket::peerAddress() const {
    struct sockaddr_in addr;
    socklen_t len = sizeof(addr);
    if (fd_ < 0 || getpeername(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
        return "?";
    }
    char buf[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf));
    return std::string(buf) + ":" + std::to_string(ntohs(addr.sin_port));
}

TcpListener::~TcpListener() {
    close();
}

bool TcpListener::bind(uint16_t port, const std::string& address) {
    close();

    fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
        std::cerr << "socket (listen): " << std::strerror(errno) << std::endl;
        return false;
    }

    int opt = 1;
    if (setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        std::cerr << "setsockopt SO_REUSEADDR: " << std::strerror(errno) << std::endl;
        close();
        return false;
    }

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) <= 0) {
        std::cerr << "inet_pton " << address << ": invalid address" << std::endl;
        close();
        return false;
    }

    if (::bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::cerr << "bind " << address << ":" << port << ": " << std::strerror(errno) << std::endl;
        close();
        return false;
    }

    if (::listen(fd_, 4) < 0) {
        std::cerr << "listen: " << std::strerror(errno) << std::endl;
        close();
        return false;
    }

    socklen_t len = sizeof(addr);
    if (getsockname(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
        port_ = ntohs(addr.sin_port);
    } else {
        port_ = port;
    }
    return true;
}

IoStatus TcpListener::accept(TcpSocket& out, int timeout_ms) {
    if (fd_ < 0) return IoStatus::Error;

    short revents = 0;
    int r = poll_one(fd_, POLLIN, timeout_ms, revents);
    if (r == 0) {
        return IoStatus::Timeout;
    }
    if (r < 0) {
        std::cerr << "poll (listen): " << std::strerror(errno) << std::endl;
        return IoStatus::Error;
    }

    int s = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (s < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == ECONNABORTED || errno == EINTR) {
            return IoStatus::Timeout;
        }
        std::cerr << "accept: " << std::strerror(errno) << std::endl;
        return IoStatus::Error;
    }
    out = TcpSocket(s);
    return IoStatus::Ok;
}

void TcpListener::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

}  // namespace deck_relay
