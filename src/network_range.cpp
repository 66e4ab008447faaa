#include "network_range.h"
#include "errors.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <algorithm>
#include <cctype>

namespace midea_dehumidifier {

namespace {

uint32_t mask_for(int prefix_length) {
    if (prefix_length == 0) return 0;
    return ~uint32_t(0) << (32 - prefix_length);
}

} // namespace

bool parse_ipv4(const std::string& text, uint32_t& out) {
    struct in_addr addr{};
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) return false;
    out = ntohl(addr.s_addr);
    return true;
}

NetworkRange::NetworkRange(uint32_t network, int prefix_length)
    : network_(network), prefix_length_(prefix_length) {}

NetworkRange NetworkRange::parse(const std::string& text) {
    std::string address_part = text;
    int prefix_length = 32;

    size_t slash = text.find('/');
    if (slash != std::string::npos) {
        address_part = text.substr(0, slash);
        std::string prefix_part = text.substr(slash + 1);
        if (prefix_part.empty() || prefix_part.size() > 2 ||
            !std::all_of(prefix_part.begin(), prefix_part.end(), [](unsigned char c) { return std::isdigit(c); }))
            throw UsageError("Invalid network range \"" + text + "\"");
        prefix_length = std::stoi(prefix_part);
        if (prefix_length > 32) throw UsageError("Invalid prefix length in \"" + text + "\"");
    }

    uint32_t address = 0;
    if (!parse_ipv4(address_part, address)) throw UsageError("Invalid network range \"" + text + "\"");

    // Host bits are ignored, so 192.168.1.17/24 means 192.168.1.0/24
    return NetworkRange(address & mask_for(prefix_length), prefix_length);
}

bool NetworkRange::contains(uint32_t address) const {
    return (address & mask_for(prefix_length_)) == network_;
}

bool NetworkRange::contains(const std::string& host) const {
    uint32_t address = 0;
    if (!parse_ipv4(host, address)) return false;
    return contains(address);
}

std::string NetworkRange::to_string() const {
    struct in_addr addr{};
    addr.s_addr = htonl(network_);
    char buf[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &addr, buf, sizeof(buf));
    return std::string(buf) + "/" + std::to_string(prefix_length_);
}

} // namespace midea_dehumidifier
