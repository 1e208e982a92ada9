/*
 * Relay Probe
 *
 * Diagnostic client: connects to a deck relay source, prints the controller
 * list and incoming states, and measures round-trip latency with pings.
 * Usage: ./relay_probe <host> [port] [count]
 */

#include "address_range.hpp"
#include "clock.hpp"
#include "codec.hpp"
#include "discovery.hpp"
#include "relay_protocol.hpp"
#include "tcp_socket.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <type_traits>
#include <variant>

namespace {

using namespace deck_relay;

const int CONNECT_TIMEOUT_MS = 2000;
const uint64_t PING_INTERVAL_MS = 1000;

bool send_message(TcpSocket& socket, const Message& message) {
    std::vector<uint8_t> frame = encodeMessage(message);
    IoStatus status = socket.sendAll(frame.data(), frame.size());
    if (status != IoStatus::Ok) {
        std::cerr << "send " << messageName(message) << " failed" << std::endl;
        return false;
    }
    return true;
}

void print_state(const StateModel& s) {
    std::cout << "State  t=" << s.timestamp() << std::fixed << std::setprecision(3)
              << "  L(" << s.leftStickX() << ", " << s.leftStickY() << ")"
              << "  R(" << s.rightStickX() << ", " << s.rightStickY() << ")"
              << "  LT " << s.leftTrigger() << "  RT " << s.rightTrigger()
              << "  buttons:";
    for (Button b : kAllButtons) {
        if (s.pressed(b)) {
            std::cout << " " << buttonName(b);
        }
    }
    std::cout << std::endl;
}

void print_controllers(const ControllerList& list) {
    std::cout << "Controllers (" << list.names.size() << "):" << std::endl;
    for (const auto& name : list.names) {
        std::cout << "  " << name << std::endl;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <host> [port] [count]" << std::endl;
        std::cerr << "  host: Source address (e.g. 192.168.1.20)" << std::endl;
        std::cerr << "  port: Relay port (default: " << DEFAULT_PORT << ")" << std::endl;
        std::cerr << "  count: Stop after this many states (default: 0 = run forever)" << std::endl;
        return 1;
    }

    uint32_t host;
    if (!parseIpv4(argv[1], host)) {
        std::cerr << "Invalid address: " << argv[1] << std::endl;
        return 1;
    }
    unsigned long port_arg = (argc >= 3) ? std::strtoul(argv[2], nullptr, 10) : DEFAULT_PORT;
    if (port_arg == 0 || port_arg > 65535) {
        std::cerr << "Invalid port: " << argv[2] << std::endl;
        return 1;
    }
    unsigned short port = static_cast<unsigned short>(port_arg);
    unsigned long count = (argc >= 4) ? std::strtoul(argv[3], nullptr, 10) : 0;

    TcpSocket socket;
    if (TcpSocket::connectTo(host, port, CONNECT_TIMEOUT_MS, socket) != IoStatus::Ok) {
        std::cerr << "Could not connect to " << argv[1] << ":" << port << std::endl;
        return 1;
    }
    std::cout << "Connected to " << socket.peerAddress() << std::endl;

    FrameDecoder decoder;
    ControllerList list;
    if (awaitControllerList(socket, decoder, CONNECT_TIMEOUT_MS, list) != IoStatus::Ok) {
        std::cerr << "Peer did not send a controller list; not a deck relay source?" << std::endl;
        return 1;
    }
    print_controllers(list);

    unsigned long states = 0;
    uint64_t last_ping = 0;
    uint8_t buffer[4096];

    for (;;) {
        uint64_t now = monotonicMillis();
        if (now - last_ping >= PING_INTERVAL_MS) {
            if (!send_message(socket, Ping{now})) {
                return 1;
            }
            last_ping = now;
        }

        Message message;
        FrameDecoder::Status status = decoder.next(message);
        if (status == FrameDecoder::Status::Malformed) {
            std::cerr << "Malformed frame dropped" << std::endl;
            continue;
        }
        if (status == FrameDecoder::Status::Oversized) {
            std::cerr << "Oversized frame, giving up" << std::endl;
            return 1;
        }
        if (status == FrameDecoder::Status::NeedMore) {
            size_t received = 0;
            IoStatus io = socket.receiveSome(buffer, sizeof(buffer), received, 100);
            if (io == IoStatus::Ok) {
                decoder.feed(buffer, received);
            } else if (io != IoStatus::Timeout) {
                std::cerr << "Connection closed by peer" << std::endl;
                return 1;
            }
            continue;
        }

        bool ok = std::visit([&](const auto& msg) -> bool {
            using T = std::decay_t<decltype(msg)>;
            if constexpr (std::is_same_v<T, ControllerList>) {
                print_controllers(msg);
            } else if constexpr (std::is_same_v<T, ControllerState>) {
                print_state(msg.state);
                ++states;
            } else if constexpr (std::is_same_v<T, Ping>) {
                return send_message(socket, Pong{msg.sent_at});
            } else {
                uint64_t at = monotonicMillis();
                std::cout << "Latency: " << (at >= msg.echoed_at ? at - msg.echoed_at : 0) << " ms" << std::endl;
            }
            return true;
        }, message);

        if (!ok) {
            return 1;
        }
        if (count > 0 && states >= count) {
            break;
        }
    }

    std::cout << "Received " << states << " states" << std::endl;
    return 0;
}
