// src/stack/validation.hpp
// Local Identity and Frame Validation Result (Internal)
//
// Provides:
//   - Identity: local hardware + network address, read-only after startup
//   - ValidationResult: single rejection reason reported by a validator
//   - to_string(ValidationResult)

#pragma once

#include "mac/ethernet.hpp"
#include <cstdint>

namespace responder::stack {

struct Identity {
    MacAddress mac{};    // Local hardware address
    uint32_t ip = 0;     // Local network address (host byte order)
};

// Checks run in this order; the first failing one is reported.
// WrongHwType/WrongProtoType double as IPv4 version/protocol for ICMP,
// WrongOpcode as ICMP type+code.
enum class ValidationResult : uint8_t {
    Valid = 0,
    NotForUs,
    EchoOfSelf,
    WrongEtherType,
    WrongHwType,
    WrongProtoType,
    WrongHwLen,
    WrongProtoLen,
    WrongOpcode,
    NotOurAddress,
};

inline constexpr size_t VALIDATION_RESULT_COUNT =
    static_cast<size_t>(ValidationResult::NotOurAddress) + 1;

inline const char* to_string(ValidationResult r) {
    switch (r) {
        case ValidationResult::Valid:          return "valid";
        case ValidationResult::NotForUs:       return "not-for-us";
        case ValidationResult::EchoOfSelf:     return "echo-of-self";
        case ValidationResult::WrongEtherType: return "wrong-ethertype";
        case ValidationResult::WrongHwType:    return "wrong-hw-type";
        case ValidationResult::WrongProtoType: return "wrong-proto-type";
        case ValidationResult::WrongHwLen:     return "wrong-hw-len";
        case ValidationResult::WrongProtoLen:  return "wrong-proto-len";
        case ValidationResult::WrongOpcode:    return "wrong-opcode";
        case ValidationResult::NotOurAddress:  return "not-our-address";
    }
    return "unknown";
}

// Destination + anti-loopback checks shared by every protocol (steps 1-2)
inline ValidationResult check_link_addresses(const uint8_t* frame, const Identity& id) {
    const uint8_t* dst = frame + ETH_OFF_DST;
    if (!mac_equals(dst, id.mac) && !mac_equals(dst, ETH_BROADCAST)) {
        return ValidationResult::NotForUs;
    }
    if (mac_equals(frame + ETH_OFF_SRC, id.mac)) {
        return ValidationResult::EchoOfSelf;
    }
    return ValidationResult::Valid;
}

} // namespace responder::stack
