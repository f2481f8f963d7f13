// pipeline/frame_queue.hpp
// Bounded SPSC frame queue between the RX context (parsers) and the
// TX context (senders). Whole frames only: a slot is written before the
// published sequence moves, so the consumer never sees a partial frame.
// C++20, policy-based design, two-context (RX/TX) responder
#pragma once

#include <atomic>
#include <cstdint>
#include <cstddef>
#include <array>

#include "pipeline_config.hpp"

namespace responder::pipeline {

// ============================================================================
// FrameQueue<T, SIZE>
//
// Disruptor-style sequences: producer publishes sequence p, consumer commits
// sequence c; occupancy is p - c. Both start at -1.
//
// Producer side (RX thread only):  try_publish(), dropped()
// Consumer side (TX thread only):  try_consume(), has_data()
// Either side:                     size(), capacity()
//
// Full queue: try_publish() returns false and the caller drops the frame.
// ============================================================================

template<typename T, size_t SIZE = FRAME_QUEUE_DEPTH>
struct FrameQueue {
    static_assert(SIZE > 0 && (SIZE & (SIZE - 1)) == 0, "SIZE must be power of 2");
    static constexpr size_t kMask = SIZE - 1;

    FrameQueue() = default;

    // Shared between threads by reference; never copied or moved
    FrameQueue(const FrameQueue&) = delete;
    FrameQueue& operator=(const FrameQueue&) = delete;

    // ========================================================================
    // Producer
    // ========================================================================

    bool try_publish(const T& item) {
        int64_t seq = published_.load(std::memory_order_relaxed) + 1;
        int64_t cons = consumed_.load(std::memory_order_acquire);

        // Full: producer would wrap onto a slot the consumer has not released
        if (seq - cons > static_cast<int64_t>(SIZE)) {
            dropped_++;
            return false;
        }

        slots_[static_cast<size_t>(seq) & kMask] = item;
        published_.store(seq, std::memory_order_release);
        return true;
    }

    // Frames rejected because the queue was full (producer-owned counter)
    uint64_t dropped() const { return dropped_; }

    // ========================================================================
    // Consumer
    // ========================================================================

    bool has_data() const {
        return consumed_.load(std::memory_order_relaxed) <
               published_.load(std::memory_order_acquire);
    }

    bool try_consume(T& item) {
        int64_t seq = consumed_.load(std::memory_order_relaxed);
        int64_t avail = published_.load(std::memory_order_acquire);

        if (seq >= avail) {
            return false;  // Nothing available
        }

        seq++;
        item = slots_[static_cast<size_t>(seq) & kMask];

        // Release the slot back to the producer
        consumed_.store(seq, std::memory_order_release);
        return true;
    }

    // ========================================================================
    // Monitoring
    // ========================================================================

    size_t size() const {
        int64_t p = published_.load(std::memory_order_acquire);
        int64_t c = consumed_.load(std::memory_order_acquire);
        return p > c ? static_cast<size_t>(p - c) : 0;
    }

    static constexpr size_t capacity() { return SIZE; }

private:
    alignas(CACHE_LINE_SIZE) std::atomic<int64_t> published_{-1};
    uint64_t dropped_ = 0;
    alignas(CACHE_LINE_SIZE) std::atomic<int64_t> consumed_{-1};
    alignas(CACHE_LINE_SIZE) std::array<T, SIZE> slots_{};
};

}  // namespace responder::pipeline
