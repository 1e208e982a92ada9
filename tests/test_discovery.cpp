/*
 * Tests for discovery.hpp. Loopback aliases 127.0.0.2-127.0.0.5 stand in
 * for hosts on a LAN; Linux routes the whole 127/8 block to lo.
 */

#include <catch2/catch.hpp>
#include "discovery.hpp"

#include <chrono>
#include <thread>

using namespace deck_relay;

namespace {

uint32_t ip(const char* text) {
    uint32_t address = 0;
    REQUIRE(parseIpv4(text, address));
    return address;
}

// Accepts one connection and greets it with a controller list
class GreetingServer {
public:
    explicit GreetingServer(const std::string& address) {
        bound_ = listener_.bind(0, address);
        if (bound_) {
            thread_ = std::thread([this] {
                TcpSocket peer;
                if (listener_.accept(peer, 3000) == IoStatus::Ok) {
                    sendControllerList(peer, ControllerList{{"Steam Deck"}});
                    std::this_thread::sleep_for(std::chrono::milliseconds(200));
                }
            });
        }
    }

    ~GreetingServer() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool bound() const { return bound_; }
    uint16_t port() const { return listener_.port(); }

private:
    TcpListener listener_;
    bool bound_ = false;
    std::thread thread_;
};

}  // namespace

TEST_CASE("discovery - scan stops at the first address that completes the handshake", "[discovery]") {
    GreetingServer server("127.0.0.4");
    REQUIRE(server.bound());

    AddressRange range;
    REQUIRE(AddressRange::parse("127.0.0.2-127.0.0.5", range));

    Discovery discovery(server.port(), 300, 1000);
    DiscoveryResult result;
    REQUIRE(discovery.scan(range, result));

    REQUIRE(discovery.attempts() == 3);
    REQUIRE(formatIpv4(result.address) == "127.0.0.4");
    REQUIRE(result.socket.valid());
    REQUIRE(result.controllers.names == std::vector<std::string>{"Steam Deck"});
}

TEST_CASE("discovery - empty range reports failure after trying every address", "[discovery]") {
    // Bind and release to get a port nobody listens on
    TcpListener probe;
    REQUIRE(probe.bind(0, "127.0.0.1"));
    uint16_t port = probe.port();
    probe.close();

    AddressRange range;
    REQUIRE(AddressRange::parse("127.0.0.2-3", range));

    Discovery discovery(port, 200, 200);
    DiscoveryResult result;
    REQUIRE_FALSE(discovery.scan(range, result));
    REQUIRE(discovery.attempts() == 2);
}

TEST_CASE("discovery - a listener that never greets is not a source", "[discovery][handshake]") {
    // The kernel completes the TCP handshake from the backlog; nothing is sent
    TcpListener silent;
    REQUIRE(silent.bind(0, "127.0.0.3"));

    Discovery discovery(silent.port(), 300, 150);
    DiscoveryResult result;
    auto started = std::chrono::steady_clock::now();
    REQUIRE_FALSE(discovery.probe(ip("127.0.0.3"), result));
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(elapsed >= std::chrono::milliseconds(100));
    REQUIRE(elapsed < std::chrono::seconds(2));
    REQUIRE_FALSE(result.socket.valid());
}

TEST_CASE("discovery - cancel stops a scan", "[discovery][cancel]") {
    AddressRange range;
    REQUIRE(AddressRange::parse("127.0.0.2-127.0.0.5", range));

    SECTION("before it starts") {
        Discovery discovery(9, 200, 200);
        discovery.cancel();
        DiscoveryResult result;
        REQUIRE_FALSE(discovery.scan(range, result));
        REQUIRE(discovery.attempts() == 0);

        discovery.reset();
        REQUIRE_FALSE(discovery.isCancelled());
    }

    SECTION("while waiting for a handshake") {
        TcpListener silent;
        REQUIRE(silent.bind(0, "127.0.0.2"));

        Discovery discovery(silent.port(), 300, 10000);
        std::thread canceller([&discovery] {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            discovery.cancel();
        });

        auto started = std::chrono::steady_clock::now();
        DiscoveryResult result;
        REQUIRE_FALSE(discovery.scan(range, result));
        canceller.join();

        REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(3));
        REQUIRE(discovery.attempts() == 1);
    }
}

TEST_CASE("discovery - handshake skips frames before the controller list", "[discovery][handshake]") {
    TcpListener listener;
    REQUIRE(listener.bind(0, "127.0.0.1"));

    TcpSocket client;
    REQUIRE(TcpSocket::connectTo(ip("127.0.0.1"), listener.port(), 1000, client) == IoStatus::Ok);
    TcpSocket server;
    REQUIRE(listener.accept(server, 1000) == IoStatus::Ok);

    std::vector<uint8_t> bytes = encodeMessage(Ping{1});
    std::vector<uint8_t> list = encodeMessage(ControllerList{{"Pad"}});
    std::vector<uint8_t> after = encodeMessage(Pong{2});
    bytes.insert(bytes.end(), list.begin(), list.end());
    bytes.insert(bytes.end(), after.begin(), after.end());
    REQUIRE(server.sendAll(bytes.data(), bytes.size()) == IoStatus::Ok);

    FrameDecoder decoder;
    ControllerList received;
    REQUIRE(awaitControllerList(client, decoder, 1000, received) == IoStatus::Ok);
    REQUIRE(received.names == std::vector<std::string>{"Pad"});

    // Whatever followed stays buffered for the transport
    Message next;
    REQUIRE(decoder.next(next) == FrameDecoder::Status::Ok);
    REQUIRE(next == Message(Pong{2}));
}
