/*
 * IPv4 Address Range Implementation
 */

#include "address_range.hpp"

#include <arpa/inet.h>

#include <cctype>

namespace deck_relay {

namespace {

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool parse_number(const std::string& s, unsigned max, unsigned& out) {
    if (s.empty() || s.size() > 3) return false;
    unsigned v = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + static_cast<unsigned>(c - '0');
    }
    if (v > max) return false;
    out = v;
    return true;
}

}  // namespace

bool parseIpv4(const std::string& text, uint32_t& out) {
    struct in_addr addr;
    if (inet_pton(AF_INET, trim(text).c_str(), &addr) != 1) {
        return false;
    }
    out = ntohl(addr.s_addr);
    return true;
}

std::string formatIpv4(uint32_t address) {
    return std::to_string((address >> 24) & 0xFF) + "." +
           std::to_string((address >> 16) & 0xFF) + "." +
           std::to_string((address >> 8) & 0xFF) + "." +
           std::to_string(address & 0xFF);
}

bool AddressRange::parse(const std::string& raw, AddressRange& out) {
    const std::string text = trim(raw);
    if (text.empty()) return false;

    uint32_t first;
    uint32_t last;

    size_t slash = text.find('/');
    size_t dash = text.find('-');

    if (slash != std::string::npos) {
        unsigned prefix;
        if (!parseIpv4(text.substr(0, slash), first) ||
            !parse_number(trim(text.substr(slash + 1)), 32, prefix)) {
            return false;
        }
        uint32_t mask = prefix == 0 ? 0 : (0xFFFFFFFFu << (32 - prefix));
        uint32_t network = first & mask;
        uint32_t broadcast = network | ~mask;
        if (prefix <= 30) {
            first = network + 1;
            last = broadcast - 1;
        } else {
            first = network;
            last = broadcast;
        }
    } else if (dash != std::string::npos) {
        if (!parseIpv4(text.substr(0, dash), first)) return false;
        std::string tail = trim(text.substr(dash + 1));
        if (tail.find('.') == std::string::npos) {
            unsigned octet;
            if (!parse_number(tail, 255, octet)) return false;
            last = (first & 0xFFFFFF00u) | octet;
        } else if (!parseIpv4(tail, last)) {
            return false;
        }
    } else {
        if (!parseIpv4(text, first)) return false;
        last = first;
    }

    if (last < first || static_cast<uint64_t>(last) - first + 1 > MAX_RANGE_SIZE) {
        return false;
    }
    out = AddressRange(first, last);
    return true;
}

std::string AddressRange::toString() const {
    if (first_ == last_) {
        return formatIpv4(first_);
    }
    return formatIpv4(first_) + "-" + formatIpv4(last_);
}

}  // namespace deck_relay
