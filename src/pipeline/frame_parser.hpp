// pipeline/frame_parser.hpp
// Byte-stream frame parser: IDLE -> RECEIVING -> CHECK -> IDLE
// One instance per protocol; every instance sees the same input samples.
// C++20, policy-based design, two-context (RX/TX) responder
#pragma once

#include <array>
#include <cstdint>
#include <cstddef>

#include "byte_stream.hpp"
#include "frame_protocol.hpp"
#include "../stack/validation.hpp"
#include "../core/hexdump.hpp"

namespace responder::pipeline {

// ============================================================================
// ParserStats - diagnostics only, never read by the data path
// ============================================================================

struct ParserStats {
    uint64_t frames_started = 0;     // Rising edges accepted in IDLE
    uint64_t frames_checked = 0;     // Full frames handed to the validator
    uint64_t frames_emitted = 0;     // Validated frames passed downstream
    uint64_t frames_truncated = 0;   // Partial frames dropped on falling edge
    std::array<uint64_t, stack::VALIDATION_RESULT_COUNT> rejected{};

    uint64_t rejected_for(stack::ValidationResult r) const {
        return rejected[static_cast<size_t>(r)];
    }
};

enum class ParserState : uint8_t {
    IDLE,
    RECEIVING,
    CHECK,
};

// ============================================================================
// FrameParser<Protocol>
//
// step() is called once per RX tick with the current input sample (or nullopt
// when no byte is available). It returns true on the single tick a validated
// frame is emitted; frame() holds that frame until the next rising edge.
//
// IDLE       waits for a rising edge of active; that byte is frame[0]
// RECEIVING  appends each active byte; full frame -> CHECK
//            Protocol::ABORT_ON_END_OF_FRAME: inactive sample drops the
//            partial frame (ICMP). Otherwise inactive samples are skipped and
//            the frame keeps filling from later bytes (ARP).
// CHECK      validates once, then IDLE; the sample on this tick is not stored
// ============================================================================

template<FrameProtocol Protocol>
struct FrameParser {
    using Frame = typename Protocol::Frame;
    static constexpr size_t kFrameLen = Protocol::FRAME_LEN;

    explicit FrameParser(const stack::Identity& id) : id_(id) {}

    bool step(const InputStep& in) {
        bool emitted = false;

        switch (state_) {
            case ParserState::IDLE:
                if (in && in->active && !prev_active_) {
                    frame_[0] = in->byte;
                    count_ = 1;
                    state_ = ParserState::RECEIVING;
                    stats_.frames_started++;
                }
                break;

            case ParserState::RECEIVING:
                if (!in) {
                    break;
                }
                if (in->active) {
                    frame_[count_++] = in->byte;
                    if (count_ == kFrameLen) {
                        state_ = ParserState::CHECK;
                    }
                } else if constexpr (Protocol::ABORT_ON_END_OF_FRAME) {
                    count_ = 0;
                    state_ = ParserState::IDLE;
                    stats_.frames_truncated++;
                    DEBUG_PRINT("[%s] Truncated frame dropped\n", Protocol::NAME);
                }
                break;

            case ParserState::CHECK:
                last_result_ = Protocol::validate(frame_, id_);
                stats_.frames_checked++;
                if (last_result_ == stack::ValidationResult::Valid) {
                    stats_.frames_emitted++;
                    emitted = true;
                } else {
                    stats_.rejected[static_cast<size_t>(last_result_)]++;
                    DEBUG_PRINT("[%s] Rejected frame: %s\n", Protocol::NAME,
                                stack::to_string(last_result_));
                }
                count_ = 0;
                state_ = ParserState::IDLE;
                break;
        }

        if (in) {
            prev_active_ = in->active;
        }
        return emitted;
    }

    const Frame& frame() const { return frame_; }
    ParserState state() const { return state_; }
    size_t count() const { return count_; }
    stack::ValidationResult last_result() const { return last_result_; }
    const ParserStats& stats() const { return stats_; }

private:
    stack::Identity id_;
    Frame frame_{};
    size_t count_ = 0;
    ParserState state_ = ParserState::IDLE;
    bool prev_active_ = false;
    stack::ValidationResult last_result_ = stack::ValidationResult::Valid;
    ParserStats stats_;
};

}  // namespace responder::pipeline
