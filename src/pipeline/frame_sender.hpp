// pipeline/frame_sender.hpp
// Byte-stream frame sender: IDLE -> WAIT_ACK -> SENDING -> IDLE
// One instance per protocol, consuming that protocol's FrameQueue.
// C++20, policy-based design, two-context (RX/TX) responder
#pragma once

#include <cstdint>
#include <cstddef>

#include "byte_stream.hpp"
#include "frame_protocol.hpp"
#include "frame_queue.hpp"

namespace responder::pipeline {

enum class SenderState : uint8_t {
    IDLE,
    WAIT_ACK,
    SENDING,
};

// ============================================================================
// FrameSender<Protocol>
//
// One TX tick = output() then step(ack).
//
// IDLE      drives inactive; step() pulls one request from the queue, builds
//           the reply once into reply_ and moves to WAIT_ACK
// WAIT_ACK  drives reply byte 0 until acknowledged, then SENDING
// SENDING   drives reply byte[count]; each ack advances; after the last byte
//           returns to IDLE
//
// No timeout: without an ack the sender holds its byte forever.
// ============================================================================

template<FrameProtocol Protocol, size_t QueueDepth = FRAME_QUEUE_DEPTH>
struct FrameSender {
    using Frame = typename Protocol::Frame;
    using Queue = FrameQueue<Frame, QueueDepth>;
    static constexpr size_t kFrameLen = Protocol::FRAME_LEN;

    FrameSender(const stack::Identity& id, Queue& queue) : id_(id), queue_(queue) {}

    OutputSample output() const {
        switch (state_) {
            case SenderState::WAIT_ACK:
                return OutputSample{reply_[0], true};
            case SenderState::SENDING:
                return OutputSample{reply_[count_], true};
            case SenderState::IDLE:
                break;
        }
        return OutputSample{0, false};
    }

    // Ready for the next request
    bool ready() const { return state_ == SenderState::IDLE; }

    void step(bool ack) {
        switch (state_) {
            case SenderState::IDLE:
                if (queue_.try_consume(request_)) {
                    reply_ = Protocol::build_reply(request_, id_);
                    count_ = 0;
                    state_ = SenderState::WAIT_ACK;
                }
                break;

            case SenderState::WAIT_ACK:
                if (ack) {
                    count_ = 1;
                    state_ = SenderState::SENDING;
                }
                break;

            case SenderState::SENDING:
                if (ack) {
                    count_++;
                    if (count_ == kFrameLen) {
                        count_ = 0;
                        state_ = SenderState::IDLE;
                        frames_sent_++;
                    }
                }
                break;
        }
    }

    SenderState state() const { return state_; }
    size_t count() const { return count_; }
    const Frame& reply() const { return reply_; }
    uint64_t frames_sent() const { return frames_sent_; }

private:
    stack::Identity id_;
    Queue& queue_;
    Frame request_{};
    Frame reply_{};
    size_t count_ = 0;
    SenderState state_ = SenderState::IDLE;
    uint64_t frames_sent_ = 0;
};

}  // namespace responder::pipeline
