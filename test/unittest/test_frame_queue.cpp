// test/unittest/test_frame_queue.cpp
// Unit tests for the bounded SPSC FrameQueue

#include "../../src/pipeline/frame_queue.hpp"
#include "../../src/stack/mac/arp.hpp"
#include <iostream>
#include <stdexcept>
#include <thread>
#include <atomic>
#include <array>

using namespace responder::pipeline;

// Test counter
int tests_passed = 0;
int tests_failed = 0;

#define TEST(name) \
    std::cout << "Testing " << name << "... "; \
    try {

#define END_TEST \
        std::cout << "✅ PASS" << std::endl; \
        tests_passed++; \
    } catch (const std::exception& e) { \
        std::cout << "❌ FAIL: " << e.what() << std::endl; \
        tests_failed++; \
    }

#define ASSERT(condition, msg) \
    if (!(condition)) throw std::runtime_error(msg);

void test_empty_queue() {
    TEST("Empty queue")
        FrameQueue<uint32_t, 4> q;
        uint32_t v = 0;
        ASSERT(!q.has_data(), "No data");
        ASSERT(q.size() == 0, "Size 0");
        ASSERT(!q.try_consume(v), "Consume fails");
        ASSERT(q.capacity() == 4, "Capacity 4");
    END_TEST
}

void test_fifo_order() {
    TEST("FIFO order")
        FrameQueue<uint32_t, 4> q;
        for (uint32_t i = 1; i <= 3; i++) {
            ASSERT(q.try_publish(i), "Publish");
        }
        ASSERT(q.size() == 3, "Size 3");
        for (uint32_t i = 1; i <= 3; i++) {
            uint32_t v = 0;
            ASSERT(q.try_consume(v), "Consume");
            ASSERT(v == i, "Order");
        }
        ASSERT(!q.has_data(), "Drained");
    END_TEST
}

void test_full_queue_drops() {
    TEST("Full queue rejects and counts the drop")
        FrameQueue<uint32_t, 4> q;
        for (uint32_t i = 0; i < 4; i++) {
            ASSERT(q.try_publish(i), "Fill");
        }
        ASSERT(q.size() == 4, "Full");
        ASSERT(!q.try_publish(99), "Publish on full fails");
        ASSERT(q.dropped() == 1, "Drop counted");

        // Oldest entries survive; the dropped one never appears
        uint32_t v = 0;
        ASSERT(q.try_consume(v) && v == 0, "Head intact");
        ASSERT(q.try_publish(4), "Slot freed");
        for (uint32_t expect = 1; expect <= 4; expect++) {
            ASSERT(q.try_consume(v) && v == expect, "Remaining order");
        }
        ASSERT(q.dropped() == 1, "Still one drop");
    END_TEST
}

void test_wraparound() {
    TEST("Wraparound across many laps")
        FrameQueue<uint32_t, 4> q;
        uint32_t next_out = 0;
        for (uint32_t i = 0; i < 1000; i++) {
            ASSERT(q.try_publish(i), "Publish");
            if (i % 3 == 2) {
                uint32_t v;
                while (q.try_consume(v)) {
                    ASSERT(v == next_out, "Sequence");
                    next_out++;
                }
            }
        }
        uint32_t v;
        while (q.try_consume(v)) {
            ASSERT(v == next_out, "Tail sequence");
            next_out++;
        }
        ASSERT(next_out == 1000, "All received");
        ASSERT(q.dropped() == 0, "No drops");
    END_TEST
}

void test_whole_frames() {
    TEST("Frames are copied whole")
        FrameQueue<responder::stack::ArpFrame, 2> q;
        responder::stack::ArpFrame f{};
        for (size_t i = 0; i < f.size(); i++) f[i] = static_cast<uint8_t>(i);
        ASSERT(q.try_publish(f), "Publish");
        f.fill(0xEE);  // Producer reuses its buffer
        responder::stack::ArpFrame out{};
        ASSERT(q.try_consume(out), "Consume");
        for (size_t i = 0; i < out.size(); i++) {
            ASSERT(out[i] == static_cast<uint8_t>(i), "Slot holds the published copy");
        }
    END_TEST
}

void test_spsc_threads() {
    TEST("SPSC across threads: every accepted frame arrives once, in order")
        using Frame = std::array<uint8_t, 64>;
        FrameQueue<Frame, 8> q;
        constexpr uint32_t N = 100000;
        std::atomic<bool> producer_done{false};
        uint32_t accepted = 0;

        std::thread producer([&]() {
            for (uint32_t i = 0; i < N; i++) {
                Frame f;
                f.fill(static_cast<uint8_t>(i));
                f[0] = static_cast<uint8_t>(i >> 24);
                f[1] = static_cast<uint8_t>(i >> 16);
                f[2] = static_cast<uint8_t>(i >> 8);
                f[3] = static_cast<uint8_t>(i);
                if (q.try_publish(f)) accepted++;
            }
            producer_done.store(true, std::memory_order_release);
        });

        uint32_t received = 0;
        int64_t last = -1;
        bool torn = false;
        bool out_of_order = false;
        Frame f;
        while (true) {
            if (q.try_consume(f)) {
                uint32_t id = (static_cast<uint32_t>(f[0]) << 24) | (static_cast<uint32_t>(f[1]) << 16) |
                              (static_cast<uint32_t>(f[2]) << 8) | f[3];
                for (size_t i = 4; i < f.size(); i++) {
                    if (f[i] != static_cast<uint8_t>(id)) torn = true;
                }
                if (static_cast<int64_t>(id) <= last) out_of_order = true;
                last = id;
                received++;
            } else if (producer_done.load(std::memory_order_acquire) && !q.has_data()) {
                break;
            }
        }
        producer.join();

        ASSERT(!torn, "No partially written frame observed");
        ASSERT(!out_of_order, "Strictly increasing ids");
        ASSERT(received == accepted, "Received == accepted");
        ASSERT(accepted + q.dropped() == N, "Accepted + dropped == sent");
    END_TEST
}

int main() {
    std::cout << "╔════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║   Responder Pipeline: Frame Queue Tests       ║" << std::endl;
    std::cout << "╚════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;

    test_empty_queue();
    test_fifo_order();
    test_full_queue_drops();
    test_wraparound();
    test_whole_frames();
    test_spsc_threads();

    // Summary
    std::cout << std::endl;
    std::cout << "════════════════════════════════════════════════" << std::endl;
    std::cout << "Tests passed: " << tests_passed << std::endl;
    std::cout << "Tests failed: " << tests_failed << std::endl;
    std::cout << "════════════════════════════════════════════════" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
