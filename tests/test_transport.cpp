/*
 * Tests for transport.hpp over loopback sockets.
 */

#include <catch2/catch.hpp>
#include "transport.hpp"

#include <chrono>
#include <thread>

using namespace deck_relay;

namespace {

const uint32_t LOOPBACK = 0x7F000001u;

// Connected pair: `accepted` from the listener, `dialed` from connectTo
struct SocketPair {
    TcpSocket accepted;
    TcpSocket dialed;
};

SocketPair connected_pair() {
    TcpListener listener;
    REQUIRE(listener.bind(0, "127.0.0.1"));

    SocketPair pair;
    REQUIRE(TcpSocket::connectTo(LOOPBACK, listener.port(), 1000, pair.dialed) == IoStatus::Ok);
    REQUIRE(listener.accept(pair.accepted, 1000) == IoStatus::Ok);
    return pair;
}

void send_raw(TcpSocket& socket, const std::vector<uint8_t>& bytes) {
    REQUIRE(socket.sendAll(bytes.data(), bytes.size()) == IoStatus::Ok);
}

}  // namespace

TEST_CASE("transport - not connected fails immediately", "[transport]") {
    Transport transport;
    Message m;
    REQUIRE_FALSE(transport.isConnected());
    REQUIRE(transport.generation() == 0);
    REQUIRE(transport.send(Ping{1}) == TransportError::NotConnected);
    REQUIRE(transport.receive(m, 10) == TransportError::NotConnected);
}

TEST_CASE("transport - messages cross a loopback connection in order", "[transport]") {
    SocketPair pair = connected_pair();
    Transport a;
    Transport b;
    uint64_t gen_a = a.adopt(std::move(pair.accepted));
    b.adopt(std::move(pair.dialed));

    REQUIRE(a.isConnected());
    REQUIRE(gen_a == a.generation());
    REQUIRE(a.peerAddress().find("127.0.0.1") == 0);

    ButtonSet buttons;
    buttons.set(Button::B, true);
    StateModel state(0.1f, 0.2f, 0.3f, 0.4f, 0.5f, 0.6f, buttons, 99);

    REQUIRE(a.send(ControllerList{{"Steam Deck"}}) == TransportError::None);
    REQUIRE(a.send(ControllerState{state}) == TransportError::None);
    REQUIRE(a.send(Ping{5}) == TransportError::None);

    Message m;
    REQUIRE(b.receive(m, 1000) == TransportError::None);
    REQUIRE(std::get<ControllerList>(m).names == std::vector<std::string>{"Steam Deck"});
    REQUIRE(b.receive(m, 1000) == TransportError::None);
    REQUIRE(std::get<ControllerState>(m).state == state);
    REQUIRE(b.receive(m, 1000) == TransportError::None);
    REQUIRE(m == Message(Ping{5}));

    // Nothing else pending
    REQUIRE(b.receive(m, 30) == TransportError::Timeout);
    REQUIRE(b.isConnected());
}

TEST_CASE("transport - malformed frames are dropped and counted", "[transport][malformed]") {
    SocketPair pair = connected_pair();
    Transport transport;
    transport.adopt(std::move(pair.accepted));

    std::vector<uint8_t> bad = encodeMessage(Pong{1});
    bad[5] = 'X';  // corrupt the magic
    send_raw(pair.dialed, bad);
    send_raw(pair.dialed, encodeMessage(Pong{2}));

    Message m;
    REQUIRE(transport.receive(m, 1000) == TransportError::None);
    REQUIRE(m == Message(Pong{2}));
    REQUIRE(transport.malformedCount() == 1);
    REQUIRE(transport.isConnected());
}

TEST_CASE("transport - peer close is an I/O failure", "[transport]") {
    SocketPair pair = connected_pair();
    Transport transport;
    transport.adopt(std::move(pair.accepted));

    pair.dialed.close();
    Message m;
    REQUIRE(transport.receive(m, 1000) == TransportError::IoFailure);
}

TEST_CASE("transport - oversized length prefix is an I/O failure", "[transport]") {
    SocketPair pair = connected_pair();
    Transport transport;
    transport.adopt(std::move(pair.accepted));

    send_raw(pair.dialed, {0xFF, 0xFF, 0xFF, 0x00});
    Message m;
    REQUIRE(transport.receive(m, 1000) == TransportError::IoFailure);
}

TEST_CASE("transport - adopting a new connection pre-empts the old one", "[transport][generation]") {
    SocketPair first = connected_pair();
    SocketPair second = connected_pair();

    Transport transport;
    uint64_t gen1 = transport.adopt(std::move(first.accepted));
    uint64_t gen2 = transport.adopt(std::move(second.accepted));
    REQUIRE(gen2 > gen1);
    REQUIRE(transport.generation() == gen2);

    // The replaced peer sees its connection end
    uint8_t byte;
    size_t received = 0;
    REQUIRE(first.dialed.receiveSome(&byte, 1, received, 1000) == IoStatus::Closed);

    // Stale generation cannot drop the new connection
    REQUIRE_FALSE(transport.disconnectIf(gen1));
    REQUIRE(transport.isConnected());

    uint64_t sent_on = 0;
    REQUIRE(transport.send(Pong{3}, sent_on) == TransportError::None);
    REQUIRE(sent_on == gen2);

    REQUIRE(transport.disconnectIf(gen2));
    REQUIRE_FALSE(transport.isConnected());
    REQUIRE(transport.send(Pong{4}) == TransportError::NotConnected);
}

TEST_CASE("transport - handshake bytes carried in the decoder are delivered first", "[transport]") {
    SocketPair pair = connected_pair();

    FrameDecoder carried;
    std::vector<uint8_t> early = encodeMessage(Ping{11});
    carried.feed(early.data(), early.size());

    Transport transport;
    transport.adopt(std::move(pair.dialed), std::move(carried));

    Message m;
    REQUIRE(transport.receive(m, 100) == TransportError::None);
    REQUIRE(m == Message(Ping{11}));
}

TEST_CASE("transport - listener accepts pending connections", "[transport]") {
    Transport server;
    REQUIRE(server.listen(0, "127.0.0.1"));
    REQUIRE(server.listenPort() != 0);

    TcpSocket pending;
    REQUIRE(server.acceptPending(20, pending) == IoStatus::Timeout);

    TcpSocket client;
    REQUIRE(TcpSocket::connectTo(LOOPBACK, server.listenPort(), 1000, client) == IoStatus::Ok);
    REQUIRE(server.acceptPending(1000, pending) == IoStatus::Ok);
    REQUIRE(pending.valid());

    server.stopListening();
}
