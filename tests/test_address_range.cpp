/*
 * Tests for address_range.hpp
 */

#include <catch2/catch.hpp>
#include "address_range.hpp"

using namespace deck_relay;

TEST_CASE("address_range - IPv4 parse and format", "[address_range]") {
    uint32_t a;
    REQUIRE(parseIpv4("192.168.1.20", a));
    REQUIRE(a == 0xC0A80114u);
    REQUIRE(formatIpv4(a) == "192.168.1.20");

    REQUIRE(parseIpv4(" 127.0.0.1 ", a));
    REQUIRE(a == 0x7F000001u);

    REQUIRE_FALSE(parseIpv4("256.1.1.1", a));
    REQUIRE_FALSE(parseIpv4("steamdeck.local", a));
    REQUIRE_FALSE(parseIpv4("", a));
}

TEST_CASE("address_range - accepted forms", "[address_range]") {
    AddressRange r;

    SECTION("explicit bounds") {
        REQUIRE(AddressRange::parse("10.0.0.250-10.0.1.5", r));
        REQUIRE(r.size() == 12);
        REQUIRE(formatIpv4(r.at(6)) == "10.0.1.0");
    }
    SECTION("last octet shorthand") {
        REQUIRE(AddressRange::parse("192.168.1.2-254", r));
        REQUIRE(r.size() == 253);
        REQUIRE(formatIpv4(r.first()) == "192.168.1.2");
        REQUIRE(formatIpv4(r.last()) == "192.168.1.254");
        REQUIRE(r.toString() == "192.168.1.2-192.168.1.254");
    }
    SECTION("CIDR skips network and broadcast") {
        REQUIRE(AddressRange::parse("192.168.7.99/24", r));
        REQUIRE(formatIpv4(r.first()) == "192.168.7.1");
        REQUIRE(formatIpv4(r.last()) == "192.168.7.254");
    }
    SECTION("small CIDR keeps every address") {
        REQUIRE(AddressRange::parse("10.1.1.4/31", r));
        REQUIRE(r.size() == 2);
    }
    SECTION("single address") {
        REQUIRE(AddressRange::parse("127.0.0.1", r));
        REQUIRE(r.size() == 1);
        REQUIRE(r.contains(0x7F000001u));
        REQUIRE(r.toString() == "127.0.0.1");
    }
}

TEST_CASE("address_range - rejected forms", "[address_range]") {
    AddressRange r;
    REQUIRE_FALSE(AddressRange::parse("", r));
    REQUIRE_FALSE(AddressRange::parse("192.168.1.9-3", r));
    REQUIRE_FALSE(AddressRange::parse("192.168.1.2-300", r));
    REQUIRE_FALSE(AddressRange::parse("10.0.0.0/8", r));  // too many addresses
    REQUIRE_FALSE(AddressRange::parse("10.0.0.0/33", r));
    REQUIRE_FALSE(AddressRange::parse("a.b.c.d-e", r));
}
