/*
 * Relay Configuration Implementation
 */

#include "relay_config.hpp"
#include "address_range.hpp"

#include <yaml-cpp/yaml.h>
#include <iostream>

namespace deck_relay {

const char* roleName(Role role) {
    switch (role) {
        case Role::Source: return "source";
        case Role::Sink: return "sink";
    }
    return "unknown";
}

bool roleFromName(const std::string& name, Role& out) {
    if (name == "source" || name == "deck") {
        out = Role::Source;
        return true;
    }
    if (name == "sink" || name == "server") {
        out = Role::Sink;
        return true;
    }
    return false;
}

bool RelayConfig::loadFromFile(const std::string& path) {
    try {
        YAML::Node config = YAML::LoadFile(path);
        return loadFromNode(config, path);
    } catch (const YAML::Exception& e) {
        std::cerr << "Error loading config file " << path << ": " << e.what() << std::endl;
        return false;
    }
}

bool RelayConfig::loadFromString(const std::string& yaml_text) {
    try {
        YAML::Node config = YAML::Load(yaml_text);
        return loadFromNode(config, "<string>");
    } catch (const YAML::Exception& e) {
        std::cerr << "Error parsing relay config: " << e.what() << std::endl;
        return false;
    }
}

bool RelayConfig::loadFromNode(const YAML::Node& config, const std::string& origin) {
    try {
        if (config["role"]) {
            std::string name = config["role"].as<std::string>();
            if (!roleFromName(name, role)) {
                std::cerr << origin << ": unknown role '" << name << "'" << std::endl;
                return false;
            }
        }

        port = config["port"].as<unsigned>(port);
        sample_rate_hz = config["sample_rate_hz"].as<double>(sample_rate_hz);

        if (config["heartbeat"]) {
            auto hb = config["heartbeat"];
            heartbeat.interval_ms = hb["interval_ms"].as<unsigned>(heartbeat.interval_ms);
            heartbeat.timeout_multiplier = hb["timeout_multiplier"].as<unsigned>(heartbeat.timeout_multiplier);
        }

        if (config["reconnect"]) {
            auto rc = config["reconnect"];
            reconnect.initial_delay_ms = rc["initial_delay_ms"].as<unsigned>(reconnect.initial_delay_ms);
            reconnect.max_delay_ms = rc["max_delay_ms"].as<unsigned>(reconnect.max_delay_ms);
            reconnect.multiplier = rc["multiplier"].as<double>(reconnect.multiplier);
            reconnect.rediscover_after = rc["rediscover_after"].as<unsigned>(reconnect.rediscover_after);
        }

        if (config["discovery"]) {
            auto disc = config["discovery"];
            discovery.range = disc["range"].as<std::string>(discovery.range);
            discovery.peer = disc["peer"].as<std::string>(discovery.peer);
            discovery.connect_timeout_ms = disc["connect_timeout_ms"].as<unsigned>(discovery.connect_timeout_ms);
            discovery.handshake_timeout_ms = disc["handshake_timeout_ms"].as<unsigned>(discovery.handshake_timeout_ms);
            discovery.localhost_first = disc["localhost_first"].as<bool>(discovery.localhost_first);
        }

        controller_config_dir = config["controller_config_dir"].as<std::string>(controller_config_dir);
        console_status = config["console_status"].as<bool>(console_status);
        return true;
    } catch (const YAML::Exception& e) {
        std::cerr << "Error loading config " << origin << ": " << e.what() << std::endl;
        return false;
    }
}

bool RelayConfig::validate(std::string& error) const {
    if (port > 65535 || (port == 0 && role != Role::Source)) {
        error = "invalid port " + std::to_string(port);
        return false;
    }
    if (!(sample_rate_hz > 0.0) || sample_rate_hz > 1000.0) {
        error = "sample_rate_hz must be in (0, 1000]";
        return false;
    }
    if (heartbeat.interval_ms == 0) {
        error = "heartbeat.interval_ms must be positive";
        return false;
    }
    if (heartbeat.timeout_multiplier < 1) {
        error = "heartbeat.timeout_multiplier must be at least 1";
        return false;
    }
    if (reconnect.initial_delay_ms == 0 || reconnect.max_delay_ms < reconnect.initial_delay_ms) {
        error = "reconnect delays must satisfy 0 < initial_delay_ms <= max_delay_ms";
        return false;
    }
    if (!(reconnect.multiplier >= 1.0)) {
        error = "reconnect.multiplier must be at least 1";
        return false;
    }
    if (discovery.connect_timeout_ms == 0 || discovery.handshake_timeout_ms == 0) {
        error = "discovery timeouts must be positive";
        return false;
    }

    if (role == Role::Sink) {
        uint32_t address;
        if (!discovery.peer.empty() && !parseIpv4(discovery.peer, address)) {
            error = "invalid peer address '" + discovery.peer + "'";
            return false;
        }
        if (discovery.peer.empty() && discovery.range.empty()) {
            error = "either discovery.peer or discovery.range is required";
            return false;
        }
        AddressRange range;
        if (!discovery.range.empty() && !AddressRange::parse(discovery.range, range)) {
            error = "invalid discovery range '" + discovery.range + "'";
            return false;
        }
    }
    return true;
}

}  // namespace deck_relay
