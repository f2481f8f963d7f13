// test/unittest/test_frame_parser.cpp
// Unit tests for FrameParser<Protocol> byte-stream state machine

#include "../../src/pipeline/frame_parser.hpp"
#include "frame_fixtures.hpp"
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace responder::stack;
using namespace responder::pipeline;
using namespace fixtures;

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

using ArpParser = FrameParser<ArpProtocol>;
using IcmpParser = FrameParser<IcmpProtocol>;

static InputStep active(uint8_t b) { return StreamSample{b, true}; }
static InputStep gap() { return StreamSample{0, false}; }

// Feed bytes as one active run; returns number of emits seen
template<typename Parser>
static int feed_bytes(Parser& p, const uint8_t* data, size_t len) {
    int emits = 0;
    for (size_t i = 0; i < len; i++) {
        if (p.step(active(data[i]))) emits++;
    }
    return emits;
}

void test_arp_full_frame_emits_once() {
    TEST("ARP: full frame emits exactly once on the CHECK tick")
        ArpParser p(local_identity());
        ArpFrame req = make_arp_request();

        ASSERT(feed_bytes(p, req.data(), req.size()) == 0, "No emit while receiving");
        ASSERT(p.state() == ParserState::CHECK, "Full frame -> CHECK");
        ASSERT(p.step(gap()), "CHECK tick emits");
        ASSERT(p.state() == ParserState::IDLE, "Back to IDLE");
        ASSERT(p.frame() == req, "Frame captured byte-for-byte");
        ASSERT(p.last_result() == ValidationResult::Valid, "last_result Valid");
        ASSERT(!p.step(gap()), "No second emit");
        ASSERT(p.stats().frames_emitted == 1 && p.stats().frames_checked == 1, "Stats");
    END_TEST
}

void test_check_tick_consumes_no_byte() {
    TEST("CHECK tick ignores the sample presented on it")
        ArpParser p(local_identity());
        ArpFrame req = make_arp_request();
        feed_bytes(p, req.data(), req.size());

        // An active byte on the CHECK tick is not stored, and since active
        // stays high there is no rising edge for a new frame either.
        ASSERT(p.step(active(0xAA)), "Emit on CHECK tick");
        ASSERT(p.state() == ParserState::IDLE, "IDLE after CHECK");
        ASSERT(!p.step(active(0xBB)), "Still active, no rising edge");
        ASSERT(p.state() == ParserState::IDLE, "Stays IDLE without rising edge");
        ASSERT(p.frame() == req, "Frame untouched");
    END_TEST
}

void test_trailing_bytes_ignored() {
    TEST("Bytes past frame length are ignored until next rising edge")
        ArpParser p(local_identity());
        ArpFrame req = make_arp_request();
        std::vector<uint8_t> padded(req.begin(), req.end());
        padded.resize(60, 0x00);  // Minimum Ethernet size padding

        int emits = feed_bytes(p, padded.data(), padded.size());
        ASSERT(emits == 1, "Padded frame emits once");
        ASSERT(p.stats().frames_started == 1, "Padding never starts a new frame");

        p.step(gap());
        ASSERT(feed_bytes(p, req.data(), req.size()) == 0, "Second frame receiving");
        ASSERT(p.step(gap()), "Second frame emits after rising edge");
        ASSERT(p.stats().frames_started == 2, "Two frames started");
    END_TEST
}

void test_start_and_check_edges() {
    TEST("Start on first active sample; CHECK also runs on a no-byte step")
        ArpParser p(local_identity());
        p.step(active(0x00));
        ASSERT(p.state() == ParserState::RECEIVING, "First active sample is a rising edge");

        ArpParser q(local_identity());
        ArpFrame req = make_arp_request();
        q.step(gap());
        ASSERT(q.state() == ParserState::IDLE, "Inactive does not start");
        ASSERT(feed_bytes(q, req.data(), req.size()) == 0, "Receiving");
        ASSERT(q.step(std::nullopt), "nullopt still advances CHECK");
    END_TEST
}

void test_nullopt_does_not_advance() {
    TEST("No-byte steps do not store or count bytes")
        IcmpParser p(local_identity());
        IcmpFrame req = make_icmp_echo_request();

        for (size_t i = 0; i < req.size(); i++) {
            p.step(active(req[i]));
            p.step(std::nullopt);
            p.step(std::nullopt);
        }
        // Last byte put it in CHECK; first nullopt after it validated it.
        ASSERT(p.stats().frames_emitted == 1, "Frame emitted despite idle steps");
        ASSERT(p.frame() == req, "Frame intact");
        ASSERT(p.stats().frames_truncated == 0, "nullopt is not a falling edge");
    END_TEST
}

void test_icmp_aborts_on_gap() {
    TEST("ICMP: falling edge mid-frame drops the partial frame")
        IcmpParser p(local_identity());
        IcmpFrame req = make_icmp_echo_request();

        feed_bytes(p, req.data(), 50);
        ASSERT(p.state() == ParserState::RECEIVING && p.count() == 50, "Partial frame");
        p.step(gap());
        ASSERT(p.state() == ParserState::IDLE && p.count() == 0, "Aborted to IDLE");
        ASSERT(p.stats().frames_truncated == 1, "Truncation counted");

        // Remaining bytes begin a new (garbage) frame only on a rising edge
        ASSERT(feed_bytes(p, req.data() + 50, req.size() - 50) == 0, "No emit from remainder");
        p.step(gap());
        ASSERT(p.stats().frames_emitted == 0, "Nothing emitted");

        // Complete frame afterwards is still recognized
        ASSERT(feed_bytes(p, req.data(), req.size()) == 0, "Receiving");
        ASSERT(p.step(gap()), "Emit");
        ASSERT(p.frame() == req, "Clean frame captured");
    END_TEST
}

void test_arp_continues_across_gap() {
    TEST("ARP: falling edge mid-frame is skipped, frame keeps filling")
        ArpParser p(local_identity());
        ArpFrame req = make_arp_request();

        feed_bytes(p, req.data(), 20);
        p.step(gap());
        p.step(gap());
        ASSERT(p.state() == ParserState::RECEIVING && p.count() == 20, "Still receiving");
        feed_bytes(p, req.data() + 20, req.size() - 20);
        ASSERT(p.step(gap()), "Joined frame validates");
        ASSERT(p.frame() == req, "Frame assembled across gap");
        ASSERT(p.stats().frames_truncated == 0, "No truncation for ARP");
    END_TEST
}

void test_rejection_counted() {
    TEST("Rejected frames are counted by reason and not emitted")
        ArpParser p(local_identity());
        ArpFrame req = make_arp_request(0xC0A82B63);

        feed_bytes(p, req.data(), req.size());
        ASSERT(!p.step(gap()), "No emit");
        ASSERT(p.last_result() == ValidationResult::NotOurAddress, "Reason recorded");
        ASSERT(p.stats().rejected_for(ValidationResult::NotOurAddress) == 1, "Reason counted");
        ASSERT(p.stats().frames_checked == 1 && p.stats().frames_emitted == 0, "Stats");
    END_TEST
}

void test_both_parsers_same_stream() {
    TEST("ARP and ICMP parsers share one stream; each emits its own frame")
        ArpParser arp(local_identity());
        IcmpParser icmp(local_identity());
        FrameStreamSource src;
        src.push_frame(to_vector(make_arp_request()));
        src.push_frame(to_vector(make_icmp_echo_request()));

        int arp_emits = 0, icmp_emits = 0;
        while (!src.empty()) {
            InputStep s = src.next();
            if (arp.step(s)) arp_emits++;
            if (icmp.step(s)) icmp_emits++;
        }
        ASSERT(arp_emits == 1, "ARP parser emitted once");
        ASSERT(icmp_emits == 1, "ICMP parser emitted once");
        ASSERT(arp.stats().frames_started == 2, "ARP parser saw both frames");
        // The 42-byte ARP frame ends before ICMP length: ICMP parser truncates it
        ASSERT(icmp.stats().frames_truncated == 1, "ICMP parser dropped short ARP frame");
        // The 98-byte ICMP frame fills ARP's 42 bytes; validated and rejected
        ASSERT(arp.stats().rejected_for(ValidationResult::WrongEtherType) == 1,
               "ARP parser rejected ICMP frame head");
    END_TEST
}

int main() {
    std::cout << "╔════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║   Responder Pipeline: Frame Parser Tests      ║" << std::endl;
    std::cout << "╚════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;

    test_arp_full_frame_emits_once();
    test_check_tick_consumes_no_byte();
    test_trailing_bytes_ignored();
    test_start_and_check_edges();
    test_nullopt_does_not_advance();
    test_icmp_aborts_on_gap();
    test_arp_continues_across_gap();
    test_rejection_counted();
    test_both_parsers_same_stream();

    // Summary
    std::cout << std::endl;
    std::cout << "════════════════════════════════════════════════" << std::endl;
    std::cout << "Tests passed: " << tests_passed << std::endl;
    std::cout << "Tests failed: " << tests_failed << std::endl;
    std::cout << "════════════════════════════════════════════════" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
