// src/stack/ip/ip_layer.hpp
// IPv4 Header Layout and Address Helpers (Internal)
//
// INTERNAL: Used by icmp.hpp and responder_config.hpp.
//
// Provides:
//   - IPv4Header struct (20-byte IP header)
//   - IP protocol constants (IP_PROTO_ICMP, ...)
//   - ip_to_string() / string_to_ip() (host byte order)
//
// Note: No IP options support (IHL is always 5)

#pragma once

#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <arpa/inet.h>

namespace responder::stack {

// IP constants
constexpr uint8_t IP_PROTO_ICMP = 1;
constexpr size_t IP_HEADER_LEN = 20;  // No options
constexpr uint8_t IP_VERSION = 4;
constexpr uint8_t IP_VERSION_IHL = 0x45;  // Version 4, IHL 5 (20 bytes)
constexpr uint8_t IP_DEFAULT_TTL = 64;

// IPv4 header structure (20 bytes, no options)
struct __attribute__((packed)) IPv4Header {
    uint8_t  version_ihl;    // 4 bits version + 4 bits IHL (header length)
    uint8_t  tos;            // Type of service
    uint16_t tot_len;        // Total length (header + data)
    uint16_t id;             // Identification
    uint16_t frag_off;       // Flags (3 bits) + Fragment offset (13 bits)
    uint8_t  ttl;            // Time to live
    uint8_t  protocol;       // Protocol (1=ICMP)
    uint16_t check;          // Header checksum
    uint32_t saddr;          // Source address
    uint32_t daddr;          // Destination address
};

static_assert(sizeof(IPv4Header) == IP_HEADER_LEN, "IPv4Header must be 20 bytes");

// Helper: Convert IP to string (for logging)
inline std::string ip_to_string(uint32_t ip_host_order) {
    char buf[INET_ADDRSTRLEN];
    uint32_t ip_net = htonl(ip_host_order);
    if (inet_ntop(AF_INET, &ip_net, buf, sizeof(buf))) {
        return std::string(buf);
    }
    return "?.?.?.?";
}

// Helper: Parse IP string to uint32_t (host byte order)
inline uint32_t string_to_ip(const char* ip_str) {
    struct in_addr addr;
    if (ip_str && inet_pton(AF_INET, ip_str, &addr) == 1) {
        return ntohl(addr.s_addr);
    }
    throw std::runtime_error(std::string("Invalid IP address string: ") +
                             (ip_str ? ip_str : "null"));
}

} // namespace responder::stack
