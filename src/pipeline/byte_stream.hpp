// pipeline/byte_stream.hpp
// Byte-stream samples exchanged with the responder core, plus the host-side
// adapters that turn whole Ethernet frames into samples and back.
// C++20, policy-based design, two-context (RX/TX) responder
#pragma once

#include <cstdint>
#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace responder::pipeline {

// ============================================================================
// StreamSample - one byte on the wire with its frame-active flag
//
// active: low->high marks start-of-frame, high->low marks end-of-frame/gap.
// An input step with no byte available is std::nullopt.
// ============================================================================

struct StreamSample {
    uint8_t byte = 0;
    bool active = false;
};

// Output side uses the same shape; the collaborator answers with an ack per tick.
using OutputSample = StreamSample;

using InputStep = std::optional<StreamSample>;

// ============================================================================
// FrameStreamSource - frames in, samples out (RX context)
//
// Each pushed frame becomes one active sample per byte followed by a single
// inactive gap sample, so consecutive frames always produce a rising edge.
// ============================================================================

struct FrameStreamSource {
    void push_frame(const uint8_t* data, size_t len) {
        for (size_t i = 0; i < len; i++) {
            pending_.push_back(StreamSample{data[i], true});
        }
        pending_.push_back(StreamSample{0, false});
    }

    void push_frame(const std::vector<uint8_t>& frame) {
        push_frame(frame.data(), frame.size());
    }

    InputStep next() {
        if (pending_.empty()) {
            return std::nullopt;
        }
        StreamSample s = pending_.front();
        pending_.pop_front();
        return s;
    }

    bool empty() const { return pending_.empty(); }
    size_t pending() const { return pending_.size(); }

private:
    std::deque<StreamSample> pending_;
};

// ============================================================================
// FrameCollector - samples out of the core, whole frames back (TX context)
//
// Acknowledges every active byte (accept_ = true) and closes a frame on the
// falling edge of active. With accept_ = false it models a stalled downstream.
// ============================================================================

struct FrameCollector {
    // Returns the ack presented back to the core for this tick
    bool on_output(const OutputSample& out) {
        if (out.active) {
            if (!accept_) {
                return false;
            }
            current_.push_back(out.byte);
            in_frame_ = true;
            return true;
        }
        if (in_frame_) {
            frames_.push_back(std::move(current_));
            current_.clear();
            in_frame_ = false;
        }
        return false;
    }

    bool pop_frame(std::vector<uint8_t>& out) {
        if (frames_.empty()) {
            return false;
        }
        out = std::move(frames_.front());
        frames_.pop_front();
        return true;
    }

    // Bytes of every frame (complete or in progress) in output order
    std::vector<uint8_t> all_bytes() const {
        std::vector<uint8_t> bytes;
        for (const auto& f : frames_) {
            bytes.insert(bytes.end(), f.begin(), f.end());
        }
        bytes.insert(bytes.end(), current_.begin(), current_.end());
        return bytes;
    }

    void set_accept(bool accept) { accept_ = accept; }

    size_t frames_ready() const { return frames_.size(); }
    bool in_frame() const { return in_frame_; }

private:
    std::deque<std::vector<uint8_t>> frames_;
    std::vector<uint8_t> current_;
    bool in_frame_ = false;
    bool accept_ = true;
};

}  // namespace responder::pipeline
