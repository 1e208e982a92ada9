/*
 * Relay Configuration
 *
 * Process-wide settings, loaded from YAML and handed to Session as a value.
 *
 *   role: sink                # or source
 *   port: 12345
 *   sample_rate_hz: 60
 *   heartbeat: { interval_ms: 1000, timeout_multiplier: 3 }
 *   reconnect: { initial_delay_ms: 500, max_delay_ms: 5000, multiplier: 2.0, rediscover_after: 5 }
 *   discovery: { range: 192.168.1.2-254, peer: "", connect_timeout_ms: 300,
 *                handshake_timeout_ms: 1000, localhost_first: true }
 *   controller_config_dir: config
 *   console_status: true
 */

#ifndef DECK_RELAY_RELAY_CONFIG_HPP
#define DECK_RELAY_RELAY_CONFIG_HPP

#include "relay_protocol.hpp"

#include <cstdint>
#include <string>

namespace YAML {
class Node;
}

namespace deck_relay {

enum class Role {
    Source,  // samples the physical controller and listens
    Sink,    // discovers the source and drives the virtual pad
};

const char* roleName(Role role);
bool roleFromName(const std::string& name, Role& out);

struct HeartbeatSettings {
    unsigned interval_ms = 1000;
    unsigned timeout_multiplier = 3;

    uint64_t timeoutMs() const { return static_cast<uint64_t>(interval_ms) * timeout_multiplier; }
};

struct ReconnectSettings {
    unsigned initial_delay_ms = 500;
    unsigned max_delay_ms = 5000;
    double multiplier = 2.0;
    unsigned rediscover_after = 5;  // 0 = always redial the last peer
};

struct DiscoverySettings {
    std::string range = "192.168.1.2-254";
    std::string peer;  // fixed source address, skips scanning
    unsigned connect_timeout_ms = 300;
    unsigned handshake_timeout_ms = 1000;
    bool localhost_first = true;
};

class RelayConfig {
public:
    Role role = Role::Sink;
    unsigned port = DEFAULT_PORT;
    double sample_rate_hz = 60.0;
    HeartbeatSettings heartbeat;
    ReconnectSettings reconnect;
    DiscoverySettings discovery;
    std::string controller_config_dir = "config";
    bool console_status = true;

    // Missing keys keep their current value
    bool loadFromFile(const std::string& path);
    bool loadFromString(const std::string& yaml_text);

    // Returns false and explains the first problem in `error`
    bool validate(std::string& error) const;

private:
    bool loadFromNode(const YAML::Node& node, const std::string& origin);
};

}  // namespace deck_relay

#endif  // DECK_RELAY_RELAY_CONFIG_HPP
