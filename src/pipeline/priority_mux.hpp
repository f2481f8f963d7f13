// pipeline/priority_mux.hpp
// Strict-priority arbiter for the single shared output stream
// C++20, policy-based design, two-context (RX/TX) responder
#pragma once

#include <cstdint>

#include "byte_stream.hpp"

namespace responder::pipeline {

enum class Grant : uint8_t {
    NONE,
    HIGH,   // ARP sender
    LOW,    // ICMP sender
};

// ============================================================================
// PriorityMux
//
// Re-arbitrated every TX tick:
//   grant = HIGH if high.active, else LOW if low.active, else NONE
// The downstream ack is routed to the granted port only; the other port sees
// ack=false and is masked from the output.
//
// Handover: when the grant moves directly from one active port to the other,
// one inactive tick is driven first (no ack routed) so the downstream sees a
// frame boundary. A LOW frame in flight is therefore preempted on a byte
// boundary by HIGH and resumes after HIGH drops.
// ============================================================================

struct PriorityMux {
    // Call once per tick with both senders' outputs; returns the shared output
    OutputSample select(const OutputSample& high, const OutputSample& low) {
        Grant want = high.active ? Grant::HIGH
                   : low.active  ? Grant::LOW
                                 : Grant::NONE;

        // grant_ still holds the previous tick's owner here
        if (want != Grant::NONE && grant_ != Grant::NONE && want != grant_) {
            grant_ = Grant::NONE;
            handovers_++;
            return OutputSample{0, false};
        }

        grant_ = want;
        switch (grant_) {
            case Grant::HIGH: return high;
            case Grant::LOW:  return low;
            case Grant::NONE: break;
        }
        return OutputSample{0, false};
    }

    // Ack seen by each port for the tick just selected
    bool ack_high(bool ack) const { return ack && grant_ == Grant::HIGH; }
    bool ack_low(bool ack) const { return ack && grant_ == Grant::LOW; }

    Grant grant() const { return grant_; }
    uint64_t handovers() const { return handovers_; }

private:
    Grant grant_ = Grant::NONE;   // Port driving the output this tick
    uint64_t handovers_ = 0;
};

}  // namespace responder::pipeline
