/*
 * Deck Relay Sink
 *
 * Runs on the PC:
 * - Creates a virtual Xbox 360 controller through uinput
 * - Finds the source on the local network (or dials a given peer)
 * - Applies every received controller state to the virtual pad
 *
 * Usage: ./deck_relay_sink [config.yaml] [peer]
 */

#include "clock.hpp"
#include "relay_config.hpp"
#include "session.hpp"
#include "status_console.hpp"
#include "uinput_pad.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_shutdown{false};

void on_signal(int) {
    g_shutdown = true;
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace deck_relay;

    RelayConfig config;
    if (argc >= 2 && std::string(argv[1]) != "-" && !config.loadFromFile(argv[1])) {
        return 1;
    }
    config.role = Role::Sink;
    if (argc >= 3) {
        config.discovery.peer = argv[2];
    }

    std::string error_text;
    if (!config.validate(error_text)) {
        std::cerr << "Invalid configuration: " << error_text << std::endl;
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    // Keep going without a virtual pad: received input is still shown and
    // creation is retried from the main loop.
    UinputPad pad;
    if (!pad.ensureCreated(monotonicMillis())) {
        std::cerr << "Virtual controller unavailable (is the uinput module loaded and writable?)" << std::endl;
    }

    SessionComponents components;
    components.sink = &pad;
    Session session(config, components);

    SessionError error = session.start();
    if (error != SessionError::None) {
        std::cerr << "Failed to start: " << sessionErrorName(error) << std::endl;
        return 1;
    }

    if (config.discovery.peer.empty()) {
        std::cout << "Searching for a deck relay source in " << config.discovery.range
                  << " port " << config.port << std::endl;
    } else {
        std::cout << "Connecting to " << config.discovery.peer << ":" << config.port << std::endl;
    }
    std::cout << "Press Ctrl+C to exit." << std::endl << std::endl;

    StatusConsole console;
    while (!g_shutdown) {
        if (!pad.isReady() && pad.ensureCreated(monotonicMillis())) {
            std::cout << "Virtual controller ready, states are applied again" << std::endl;
        }
        if (config.console_status) {
            console.render(session);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }

    session.stop();
    pad.destroy();
    return 0;
}
