/*
 * Tests for relay_config.hpp: YAML loading and validation.
 */

#include <catch2/catch.hpp>
#include "relay_config.hpp"

using namespace deck_relay;

TEST_CASE("relay_config - defaults are valid for a sink", "[relay_config]") {
    RelayConfig config;
    std::string error;
    REQUIRE(config.role == Role::Sink);
    REQUIRE(config.port == DEFAULT_PORT);
    REQUIRE(config.heartbeat.timeoutMs() == 3000);
    REQUIRE(config.validate(error));
}

TEST_CASE("relay_config - loads every section", "[relay_config][yaml]") {
    RelayConfig config;
    REQUIRE(config.loadFromString(R"(
role: source
port: 23456
sample_rate_hz: 120
heartbeat:
  interval_ms: 250
  timeout_multiplier: 4
reconnect:
  initial_delay_ms: 100
  max_delay_ms: 800
  multiplier: 1.5
  rediscover_after: 0
discovery:
  range: 10.0.0.1-20
  peer: 10.0.0.7
  connect_timeout_ms: 150
  handshake_timeout_ms: 600
  localhost_first: false
controller_config_dir: /etc/deck_relay
console_status: false
)"));

    REQUIRE(config.role == Role::Source);
    REQUIRE(config.port == 23456);
    REQUIRE(config.sample_rate_hz == Approx(120.0));
    REQUIRE(config.heartbeat.interval_ms == 250);
    REQUIRE(config.heartbeat.timeoutMs() == 1000);
    REQUIRE(config.reconnect.initial_delay_ms == 100);
    REQUIRE(config.reconnect.max_delay_ms == 800);
    REQUIRE(config.reconnect.multiplier == Approx(1.5));
    REQUIRE(config.reconnect.rediscover_after == 0);
    REQUIRE(config.discovery.range == "10.0.0.1-20");
    REQUIRE(config.discovery.peer == "10.0.0.7");
    REQUIRE(config.discovery.connect_timeout_ms == 150);
    REQUIRE(config.discovery.handshake_timeout_ms == 600);
    REQUIRE_FALSE(config.discovery.localhost_first);
    REQUIRE(config.controller_config_dir == "/etc/deck_relay");
    REQUIRE_FALSE(config.console_status);
}

TEST_CASE("relay_config - missing keys keep their values", "[relay_config][yaml]") {
    RelayConfig config;
    config.port = 4000;
    REQUIRE(config.loadFromString("heartbeat:\n  interval_ms: 500\n"));
    REQUIRE(config.port == 4000);
    REQUIRE(config.heartbeat.interval_ms == 500);
    REQUIRE(config.heartbeat.timeout_multiplier == 3);
}

TEST_CASE("relay_config - rejects bad YAML", "[relay_config][yaml]") {
    RelayConfig config;
    REQUIRE_FALSE(config.loadFromString("role: turbo\n"));
    REQUIRE_FALSE(config.loadFromString("port: [1, 2\n"));
    REQUIRE_FALSE(config.loadFromFile("/nonexistent/relay.yaml"));
}

TEST_CASE("relay_config - role names", "[relay_config]") {
    Role role;
    REQUIRE(roleFromName("deck", role));
    REQUIRE(role == Role::Source);
    REQUIRE(roleFromName("server", role));
    REQUIRE(role == Role::Sink);
    REQUIRE(std::string(roleName(Role::Source)) == "source");
}

TEST_CASE("relay_config - validation rules", "[relay_config][validate]") {
    RelayConfig config;
    std::string error;

    SECTION("port 0 only for the source") {
        config.port = 0;
        REQUIRE_FALSE(config.validate(error));
        config.role = Role::Source;
        REQUIRE(config.validate(error));
    }
    SECTION("port out of range") {
        config.port = 70000;
        REQUIRE_FALSE(config.validate(error));
    }
    SECTION("sample rate") {
        config.sample_rate_hz = 0.0;
        REQUIRE_FALSE(config.validate(error));
        config.sample_rate_hz = 5000.0;
        REQUIRE_FALSE(config.validate(error));
    }
    SECTION("heartbeat") {
        config.heartbeat.interval_ms = 0;
        REQUIRE_FALSE(config.validate(error));
        config.heartbeat.interval_ms = 100;
        config.heartbeat.timeout_multiplier = 0;
        REQUIRE_FALSE(config.validate(error));
    }
    SECTION("reconnect delays") {
        config.reconnect.initial_delay_ms = 1000;
        config.reconnect.max_delay_ms = 500;
        REQUIRE_FALSE(config.validate(error));
        config.reconnect.max_delay_ms = 1000;
        config.reconnect.multiplier = 0.5;
        REQUIRE_FALSE(config.validate(error));
    }
    SECTION("sink needs somewhere to look") {
        config.discovery.range.clear();
        REQUIRE_FALSE(config.validate(error));
        config.discovery.peer = "127.0.0.1";
        REQUIRE(config.validate(error));
        config.discovery.peer = "not-an-ip";
        REQUIRE_FALSE(config.validate(error));
        REQUIRE(error.find("not-an-ip") != std::string::npos);
    }
    SECTION("bad range") {
        config.discovery.range = "10.0.0.9-1";
        REQUIRE_FALSE(config.validate(error));
    }
}
