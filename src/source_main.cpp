/*
 * Deck Relay Source
 *
 * Runs on the device with the physical controller (Steam Deck):
 * - Scans for controllers and loads the matching mapping config
 * - Samples the controller at a fixed rate
 * - Listens for the sink and streams controller state to it
 *
 * Usage: ./deck_relay_source [config.yaml]
 */

#include "evdev_input_source.hpp"
#include "relay_config.hpp"
#include "session.hpp"
#include "status_console.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>

namespace {

std::atomic<bool> g_shutdown{false};

void on_signal(int) {
    g_shutdown = true;
}

std::string resolve_config_dir(const std::string& dir) {
    if (std::filesystem::exists(dir)) {
        return dir;
    }
    return "/usr/share/deck_relay/config";
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace deck_relay;

    RelayConfig config;
    config.role = Role::Source;
    if (argc >= 2 && !config.loadFromFile(argv[1])) {
        return 1;
    }
    // This binary is always the source, whatever the file says
    config.role = Role::Source;

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    EvdevInputSource input(resolve_config_dir(config.controller_config_dir));

    SessionComponents components;
    components.input = &input;
    Session session(config, components);

    SessionError error = session.start();
    if (error != SessionError::None) {
        std::cerr << "Failed to start: " << sessionErrorName(error) << std::endl;
        return 1;
    }

    std::cout << "Deck relay source listening on port " << session.boundPort() << std::endl;
    std::cout << "Press Ctrl+C to exit." << std::endl << std::endl;

    StatusConsole console;
    while (!g_shutdown) {
        if (config.console_status) {
            console.render(session);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }

    session.stop();
    return 0;
}
