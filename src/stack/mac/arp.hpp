// src/stack/mac/arp.hpp
// ARP Request Validation and Reply Building (Internal)
//
// INTERNAL: Use ResponderPipeline (pipeline/responder_pipeline.hpp) as the entry point.
//
// Provides:
//   - ArpFrame: fixed 42-byte Ethernet + ARP frame (no padding)
//   - ARP_REQUEST_TEMPLATE: expected static fields of a request
//   - validate_arp_request() - Check a received frame against the template
//   - build_arp_reply()      - Answer a validated request
//   - ArpProtocol            - Protocol traits for FrameParser/FrameSender
//
// Note: Stateless. No ARP cache, replies only to requests for our IP.

#pragma once

#include "ethernet.hpp"
#include "../validation.hpp"
#include <array>

namespace responder::stack {

// ARP constants (RFC 826, Ethernet/IPv4 only)
constexpr uint16_t ARP_HTYPE_ETHERNET = 1;
constexpr uint16_t ARP_OP_REQUEST = 1;
constexpr uint16_t ARP_OP_REPLY = 2;
constexpr uint8_t ARP_HLEN = ETH_ADDR_LEN;
constexpr uint8_t ARP_PLEN = 4;
constexpr size_t ARP_BODY_LEN = 28;
constexpr size_t ARP_FRAME_LEN = ETH_HEADER_LEN + ARP_BODY_LEN;  // 42

// Field offsets from the start of the Ethernet frame
constexpr size_t ARP_OFF_HTYPE = ETH_HEADER_LEN + 0;
constexpr size_t ARP_OFF_PTYPE = ETH_HEADER_LEN + 2;
constexpr size_t ARP_OFF_HLEN = ETH_HEADER_LEN + 4;
constexpr size_t ARP_OFF_PLEN = ETH_HEADER_LEN + 5;
constexpr size_t ARP_OFF_OPCODE = ETH_HEADER_LEN + 6;
constexpr size_t ARP_OFF_SHA = ETH_HEADER_LEN + 8;    // Sender hardware address
constexpr size_t ARP_OFF_SPA = ETH_HEADER_LEN + 14;   // Sender protocol address
constexpr size_t ARP_OFF_THA = ETH_HEADER_LEN + 18;   // Target hardware address
constexpr size_t ARP_OFF_TPA = ETH_HEADER_LEN + 24;   // Target protocol address

static_assert(ARP_OFF_TPA + 4 == ARP_FRAME_LEN, "ARP layout must cover the whole frame");

using ArpFrame = std::array<uint8_t, ARP_FRAME_LEN>;

constexpr ArpFrame make_arp_request_template() {
    ArpFrame f{};
    write_be16(&f[ETH_OFF_TYPE], ETH_TYPE_ARP);
    write_be16(&f[ARP_OFF_HTYPE], ARP_HTYPE_ETHERNET);
    write_be16(&f[ARP_OFF_PTYPE], ETH_TYPE_IP);
    f[ARP_OFF_HLEN] = ARP_HLEN;
    f[ARP_OFF_PLEN] = ARP_PLEN;
    write_be16(&f[ARP_OFF_OPCODE], ARP_OP_REQUEST);
    return f;
}

// Only the static fields are meaningful; addresses are left zero.
inline constexpr ArpFrame ARP_REQUEST_TEMPLATE = make_arp_request_template();

inline ValidationResult validate_arp_request(const ArpFrame& f, const Identity& id) {
    const ArpFrame& t = ARP_REQUEST_TEMPLATE;

    ValidationResult link = check_link_addresses(f.data(), id);
    if (link != ValidationResult::Valid) {
        return link;
    }
    if (read_be16(&f[ETH_OFF_TYPE]) != read_be16(&t[ETH_OFF_TYPE])) {
        return ValidationResult::WrongEtherType;
    }
    if (read_be16(&f[ARP_OFF_HTYPE]) != read_be16(&t[ARP_OFF_HTYPE])) {
        return ValidationResult::WrongHwType;
    }
    if (read_be16(&f[ARP_OFF_PTYPE]) != read_be16(&t[ARP_OFF_PTYPE])) {
        return ValidationResult::WrongProtoType;
    }
    if (f[ARP_OFF_HLEN] != t[ARP_OFF_HLEN]) {
        return ValidationResult::WrongHwLen;
    }
    if (f[ARP_OFF_PLEN] != t[ARP_OFF_PLEN]) {
        return ValidationResult::WrongProtoLen;
    }
    if (read_be16(&f[ARP_OFF_OPCODE]) != read_be16(&t[ARP_OFF_OPCODE])) {
        return ValidationResult::WrongOpcode;
    }
    if (read_be32(&f[ARP_OFF_TPA]) != id.ip) {
        return ValidationResult::NotOurAddress;
    }
    return ValidationResult::Valid;
}

// Reply goes back to the requester: its sender fields become our target fields.
inline ArpFrame build_arp_reply(const ArpFrame& req, const Identity& id) {
    ArpFrame r = ARP_REQUEST_TEMPLATE;

    std::memcpy(&r[ETH_OFF_DST], &req[ETH_OFF_SRC], ETH_ADDR_LEN);
    write_mac(&r[ETH_OFF_SRC], id.mac);

    write_be16(&r[ARP_OFF_OPCODE], ARP_OP_REPLY);
    write_mac(&r[ARP_OFF_SHA], id.mac);
    write_be32(&r[ARP_OFF_SPA], id.ip);
    std::memcpy(&r[ARP_OFF_THA], &req[ARP_OFF_SHA], ETH_ADDR_LEN);
    std::memcpy(&r[ARP_OFF_TPA], &req[ARP_OFF_SPA], ARP_PLEN);
    return r;
}

// Protocol traits consumed by FrameParser<> / FrameSender<>
struct ArpProtocol {
    using Frame = ArpFrame;
    static constexpr const char* NAME = "ARP";
    static constexpr size_t FRAME_LEN = ARP_FRAME_LEN;
    // Falling edge of the input stream does not abort a partial ARP frame.
    static constexpr bool ABORT_ON_END_OF_FRAME = false;

    static ValidationResult validate(const Frame& f, const Identity& id) {
        return validate_arp_request(f, id);
    }

    static Frame build_reply(const Frame& req, const Identity& id) {
        return build_arp_reply(req, id);
    }
};

} // namespace responder::stack
