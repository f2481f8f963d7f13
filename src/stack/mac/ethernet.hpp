// src/stack/mac/ethernet.hpp
// Ethernet Addressing and Byte Helpers (Internal)
//
// INTERNAL: Used by arp.hpp and icmp.hpp frame layouts.
//
// Provides:
//   - MacAddress (6-byte hardware address) and ETH_BROADCAST
//   - EthernetHeader struct (14-byte Ethernet header)
//   - Ethertype constants (ETH_TYPE_IP, ETH_TYPE_ARP)
//   - Big-endian field accessors for fixed-layout frames
//   - mac_to_string() / string_to_mac()

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>

namespace responder::stack {

// Ethernet frame constants
constexpr uint16_t ETH_TYPE_IP = 0x0800;
constexpr uint16_t ETH_TYPE_ARP = 0x0806;
constexpr size_t ETH_HEADER_LEN = 14;
constexpr size_t ETH_ADDR_LEN = 6;

// Ethernet header offsets (all frames start with this header)
constexpr size_t ETH_OFF_DST = 0;
constexpr size_t ETH_OFF_SRC = 6;
constexpr size_t ETH_OFF_TYPE = 12;

using MacAddress = std::array<uint8_t, ETH_ADDR_LEN>;

inline constexpr MacAddress ETH_BROADCAST = {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};

// Ethernet header structure
struct __attribute__((packed)) EthernetHeader {
    uint8_t dst_mac[ETH_ADDR_LEN];
    uint8_t src_mac[ETH_ADDR_LEN];
    uint16_t ethertype;  // Network byte order
};

static_assert(sizeof(EthernetHeader) == ETH_HEADER_LEN, "EthernetHeader must be 14 bytes");

// --- Big-endian field access on raw frame bytes ---

constexpr uint16_t read_be16(const uint8_t* p) {
    return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

constexpr uint32_t read_be32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

constexpr void write_be16(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v >> 8);
    p[1] = static_cast<uint8_t>(v & 0xFF);
}

constexpr void write_be32(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
    p[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
    p[3] = static_cast<uint8_t>(v & 0xFF);
}

inline MacAddress read_mac(const uint8_t* p) {
    MacAddress mac;
    std::memcpy(mac.data(), p, ETH_ADDR_LEN);
    return mac;
}

inline void write_mac(uint8_t* p, const MacAddress& mac) {
    std::memcpy(p, mac.data(), ETH_ADDR_LEN);
}

inline bool mac_equals(const uint8_t* p, const MacAddress& mac) {
    return std::memcmp(p, mac.data(), ETH_ADDR_LEN) == 0;
}

// Helper: Convert MAC to "aa:bb:cc:dd:ee:ff" (for logging)
inline std::string mac_to_string(const MacAddress& mac) {
    char buf[18];
    snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
             mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
    return std::string(buf);
}

// Helper: Parse "aa:bb:cc:dd:ee:ff" (case-insensitive)
inline MacAddress string_to_mac(const char* mac_str) {
    if (!mac_str) {
        throw std::runtime_error("Invalid MAC address string: null");
    }
    unsigned int b[6];
    char trailing;
    if (sscanf(mac_str, "%2x:%2x:%2x:%2x:%2x:%2x%c",
               &b[0], &b[1], &b[2], &b[3], &b[4], &b[5], &trailing) != 6) {
        throw std::runtime_error(std::string("Invalid MAC address string: ") + mac_str);
    }
    MacAddress mac;
    for (size_t i = 0; i < ETH_ADDR_LEN; i++) {
        mac[i] = static_cast<uint8_t>(b[i]);
    }
    return mac;
}

} // namespace responder::stack
