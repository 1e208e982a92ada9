/*
 * IPv4 Address Range
 *
 * Discovery scan ranges. Accepted forms:
 *   192.168.1.2-192.168.1.5   explicit first and last address
 *   192.168.1.2-5             last octet only
 *   192.168.1.0/24            CIDR block, network and broadcast skipped (prefix <= 30)
 *   192.168.1.7               single address
 */

#ifndef DECK_RELAY_ADDRESS_RANGE_HPP
#define DECK_RELAY_ADDRESS_RANGE_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace deck_relay {

constexpr size_t MAX_RANGE_SIZE = 65536;

// Addresses are kept in host byte order
bool parseIpv4(const std::string& text, uint32_t& out);
std::string formatIpv4(uint32_t address);

class AddressRange {
public:
    AddressRange() = default;
    AddressRange(uint32_t first, uint32_t last) : first_(first), last_(last) {}

    // False on syntax errors, reversed bounds or more than MAX_RANGE_SIZE addresses
    static bool parse(const std::string& text, AddressRange& out);

    uint32_t first() const { return first_; }
    uint32_t last() const { return last_; }
    size_t size() const { return static_cast<size_t>(last_ - first_) + 1; }
    bool contains(uint32_t address) const { return address >= first_ && address <= last_; }

    // Address at position i (0-based), i < size()
    uint32_t at(size_t i) const { return first_ + static_cast<uint32_t>(i); }

    std::string toString() const;

private:
    uint32_t first_ = 0;
    uint32_t last_ = 0;
};

}  // namespace deck_relay

#endif  // DECK_RELAY_ADDRESS_RANGE_HPP
