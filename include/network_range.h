#pragma once

#include <cstdint>
#include <string>

namespace midea_dehumidifier {

// IPv4 range in CIDR notation; a bare address is a /32
class NetworkRange {
public:
    // Throws UsageError on malformed input
    static NetworkRange parse(const std::string& text);

    bool contains(const std::string& host) const;
    bool contains(uint32_t address) const;

    int prefix_length() const { return prefix_length_; }
    std::string to_string() const;

private:
    NetworkRange(uint32_t network, int prefix_length);

    uint32_t network_;
    int prefix_length_;
};

// Host-order IPv4 address, or false when `text` is not a dotted quad
bool parse_ipv4(const std::string& text, uint32_t& out);

} // namespace midea_dehumidifier
