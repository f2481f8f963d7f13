// src/stack/ip/icmp.hpp
// Minimal ICMP for the responder
// Only handle ping (echo request -> echo reply) on a fixed 98-byte frame:
//   Ethernet(14) + IPv4(20, no options) + ICMP(8) + payload(56)

#pragma once

#include "ip_layer.hpp"
#include "checksum.hpp"
#include "../mac/ethernet.hpp"
#include "../validation.hpp"
#include <array>
#include <cstddef>

namespace responder::stack {

// ICMP constants
constexpr uint8_t ICMP_ECHO_REPLY = 0;
constexpr uint8_t ICMP_ECHO_REQUEST = 8;
constexpr uint8_t ICMP_ECHO_CODE = 0;
constexpr size_t ICMP_HEADER_LEN = 8;

// Default payload of `ping` on Linux (56 bytes -> 64-byte ICMP message)
#ifndef RESPONDER_ICMP_PAYLOAD_LEN
#define RESPONDER_ICMP_PAYLOAD_LEN 56
#endif
constexpr size_t ICMP_ECHO_PAYLOAD_LEN = RESPONDER_ICMP_PAYLOAD_LEN;

constexpr size_t ICMP_MESSAGE_LEN = ICMP_HEADER_LEN + ICMP_ECHO_PAYLOAD_LEN;
constexpr size_t ICMP_FRAME_LEN = ETH_HEADER_LEN + IP_HEADER_LEN + ICMP_MESSAGE_LEN;  // 98

// ICMP header structure
struct __attribute__((packed)) ICMPHeader {
    uint8_t  type;       // Message type
    uint8_t  code;       // Message code
    uint16_t checksum;   // Checksum
    uint16_t id;         // Identifier (for echo)
    uint16_t seq;        // Sequence number (for echo)
};

static_assert(sizeof(ICMPHeader) == ICMP_HEADER_LEN, "ICMPHeader must be 8 bytes");

// Field offsets from the start of the Ethernet frame
constexpr size_t IP_OFF = ETH_HEADER_LEN;
constexpr size_t IP_OFF_VERSION_IHL = IP_OFF + offsetof(IPv4Header, version_ihl);
constexpr size_t IP_OFF_TTL = IP_OFF + offsetof(IPv4Header, ttl);
constexpr size_t IP_OFF_PROTOCOL = IP_OFF + offsetof(IPv4Header, protocol);
constexpr size_t IP_OFF_CHECK = IP_OFF + offsetof(IPv4Header, check);
constexpr size_t IP_OFF_SADDR = IP_OFF + offsetof(IPv4Header, saddr);
constexpr size_t IP_OFF_DADDR = IP_OFF + offsetof(IPv4Header, daddr);

constexpr size_t ICMP_OFF = IP_OFF + IP_HEADER_LEN;
constexpr size_t ICMP_OFF_TYPE = ICMP_OFF + offsetof(ICMPHeader, type);
constexpr size_t ICMP_OFF_CODE = ICMP_OFF + offsetof(ICMPHeader, code);
constexpr size_t ICMP_OFF_CHECKSUM = ICMP_OFF + offsetof(ICMPHeader, checksum);
constexpr size_t ICMP_OFF_ID = ICMP_OFF + offsetof(ICMPHeader, id);
constexpr size_t ICMP_OFF_SEQ = ICMP_OFF + offsetof(ICMPHeader, seq);
constexpr size_t ICMP_OFF_PAYLOAD = ICMP_OFF + ICMP_HEADER_LEN;

using IcmpFrame = std::array<uint8_t, ICMP_FRAME_LEN>;

constexpr IcmpFrame make_icmp_echo_template() {
    IcmpFrame f{};
    write_be16(&f[ETH_OFF_TYPE], ETH_TYPE_IP);
    f[IP_OFF_VERSION_IHL] = IP_VERSION_IHL;
    f[IP_OFF_PROTOCOL] = IP_PROTO_ICMP;
    f[ICMP_OFF_TYPE] = ICMP_ECHO_REQUEST;
    f[ICMP_OFF_CODE] = ICMP_ECHO_CODE;
    return f;
}

inline constexpr IcmpFrame ICMP_ECHO_TEMPLATE = make_icmp_echo_template();

inline ValidationResult validate_icmp_echo(const IcmpFrame& f, const Identity& id) {
    const IcmpFrame& t = ICMP_ECHO_TEMPLATE;

    ValidationResult link = check_link_addresses(f.data(), id);
    if (link != ValidationResult::Valid) {
        return link;
    }
    if (read_be16(&f[ETH_OFF_TYPE]) != read_be16(&t[ETH_OFF_TYPE])) {
        return ValidationResult::WrongEtherType;
    }
    // Version nibble only; IHL is not checked
    if ((f[IP_OFF_VERSION_IHL] >> 4) != (t[IP_OFF_VERSION_IHL] >> 4)) {
        return ValidationResult::WrongHwType;
    }
    if (f[IP_OFF_PROTOCOL] != t[IP_OFF_PROTOCOL]) {
        return ValidationResult::WrongProtoType;
    }
    if (f[ICMP_OFF_TYPE] != t[ICMP_OFF_TYPE] || f[ICMP_OFF_CODE] != t[ICMP_OFF_CODE]) {
        return ValidationResult::WrongOpcode;
    }
    if (read_be32(&f[IP_OFF_DADDR]) != id.ip) {
        return ValidationResult::NotOurAddress;
    }
    return ValidationResult::Valid;
}

// Echo reply: addresses swapped, TTL reset, both checksums recomputed.
// TOS, total length, IP id, flags, ICMP id/seq and payload are copied verbatim.
inline IcmpFrame build_icmp_echo_reply(const IcmpFrame& req, const Identity& id) {
    IcmpFrame r = req;

    std::memcpy(&r[ETH_OFF_DST], &req[ETH_OFF_SRC], ETH_ADDR_LEN);
    write_mac(&r[ETH_OFF_SRC], id.mac);

    r[IP_OFF_TTL] = IP_DEFAULT_TTL;
    write_be32(&r[IP_OFF_SADDR], id.ip);
    std::memcpy(&r[IP_OFF_DADDR], &req[IP_OFF_SADDR], 4);
    write_be16(&r[IP_OFF_CHECK], 0);
    write_be16(&r[IP_OFF_CHECK], ip_checksum(&r[IP_OFF]));

    r[ICMP_OFF_TYPE] = ICMP_ECHO_REPLY;
    r[ICMP_OFF_CODE] = ICMP_ECHO_CODE;
    write_be16(&r[ICMP_OFF_CHECKSUM], 0);
    write_be16(&r[ICMP_OFF_CHECKSUM], internet_checksum(&r[ICMP_OFF], ICMP_MESSAGE_LEN));
    return r;
}

// Protocol traits consumed by FrameParser<> / FrameSender<>
struct IcmpProtocol {
    using Frame = IcmpFrame;
    static constexpr const char* NAME = "ICMP";
    static constexpr size_t FRAME_LEN = ICMP_FRAME_LEN;
    static constexpr bool ABORT_ON_END_OF_FRAME = true;

    static ValidationResult validate(const Frame& f, const Identity& id) {
        return validate_icmp_echo(f, id);
    }

    static Frame build_reply(const Frame& req, const Identity& id) {
        return build_icmp_echo_reply(req, id);
    }
};

} // namespace responder::stack
