// src/stack/ip/checksum.hpp
// Internet Checksum Calculation (Internal)
//
// INTERNAL: Used by icmp.hpp for echo replies.
//
// Implements RFC 1071 - Computing the Internet Checksum
//
// Provides:
//   - internet_checksum()  - One's-complement checksum over a byte range
//   - ip_checksum()        - Calculate IPv4 header checksum
//   - verify_ip_checksum() - Verify IPv4 header checksum

#pragma once

#include <cstdint>
#include <cstddef>

namespace responder::stack {

// Compute Internet checksum (RFC 1071)
// Words are read big-endian; an odd trailing byte is the high byte of a word.
inline uint16_t internet_checksum(const void* data, size_t len) {
    const uint8_t* buf = static_cast<const uint8_t*>(data);
    uint32_t sum = 0;

    while (len > 1) {
        sum += (static_cast<uint16_t>(buf[0]) << 8) | buf[1];
        buf += 2;
        len -= 2;
    }

    if (len == 1) {
        sum += static_cast<uint16_t>(buf[0]) << 8;
    }

    // End-around carry
    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return static_cast<uint16_t>(~sum);
}

// Compute IP header checksum
// Assumes 20-byte IPv4 header (no options), checksum field already zeroed
inline uint16_t ip_checksum(const void* ip_header) {
    return internet_checksum(ip_header, 20);
}

// Verify IP header checksum
// Returns 0 if valid, non-zero if invalid
inline int verify_ip_checksum(const void* ip_header) {
    // Summing a header that carries its own checksum yields 0 after complement
    return internet_checksum(ip_header, 20);
}

} // namespace responder::stack
