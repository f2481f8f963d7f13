// pipeline/responder_pipeline.hpp
// Top-level composition: two protocol pipelines sharing one input stream and
// one arbitrated output stream.
//
//   input samples ─┬─> FrameParser<ARP>  ─> FrameQueue ─> FrameSender<ARP>  ─┐ HIGH
//                  └─> FrameParser<ICMP> ─> FrameQueue ─> FrameSender<ICMP> ─┴─> PriorityMux ─> output
//
// RX context calls rx_step(); TX context calls tx_output()/tx_step() (or
// tx_tick()). The two queues are the only state shared between contexts.
// C++20, policy-based design, two-context (RX/TX) responder
#pragma once

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <thread>
#include <utility>

#include "pipeline_config.hpp"
#include "byte_stream.hpp"
#include "frame_parser.hpp"
#include "frame_queue.hpp"
#include "frame_sender.hpp"
#include "priority_mux.hpp"
#include "../core/hexdump.hpp"
#include "../stack/mac/arp.hpp"
#include "../stack/ip/icmp.hpp"

namespace responder::pipeline {

struct PipelineStats {
    ParserStats arp_parser;
    ParserStats icmp_parser;
    uint64_t arp_queue_drops = 0;
    uint64_t icmp_queue_drops = 0;
    uint64_t arp_sent = 0;
    uint64_t icmp_sent = 0;
    uint64_t handovers = 0;
};

// ============================================================================
// ResponderPipeline
// ============================================================================

struct ResponderPipeline {
    using ArpParser = FrameParser<stack::ArpProtocol>;
    using IcmpParser = FrameParser<stack::IcmpProtocol>;
    using ArpSender = FrameSender<stack::ArpProtocol>;
    using IcmpSender = FrameSender<stack::IcmpProtocol>;
    using ArpQueue = ArpSender::Queue;
    using IcmpQueue = IcmpSender::Queue;

    explicit ResponderPipeline(const stack::Identity& id)
        : id_(id)
        , arp_parser_(id)
        , icmp_parser_(id)
        , arp_sender_(id, arp_queue_)
        , icmp_sender_(id, icmp_queue_)
    {}

    ResponderPipeline(const ResponderPipeline&) = delete;
    ResponderPipeline& operator=(const ResponderPipeline&) = delete;

    // ========================================================================
    // RX context
    // ========================================================================

    // Same sample to both parsers. A full queue drops the frame (counted).
    void rx_step(const InputStep& in) {
        if (arp_parser_.step(in) && !arp_queue_.try_publish(arp_parser_.frame())) {
            DEBUG_FPRINTF(stderr, "[RESPONDER] ARP queue full, request dropped\n");
        }
        if (icmp_parser_.step(in) && !icmp_queue_.try_publish(icmp_parser_.frame())) {
            DEBUG_FPRINTF(stderr, "[RESPONDER] ICMP queue full, request dropped\n");
        }
    }

    // ========================================================================
    // TX context
    // ========================================================================

    // What the shared output drives this tick
    OutputSample tx_output() {
        return mux_.select(arp_sender_.output(), icmp_sender_.output());
    }

    // Advance both senders with the downstream ack for the current tick
    void tx_step(bool ack) {
        arp_sender_.step(mux_.ack_high(ack));
        icmp_sender_.step(mux_.ack_low(ack));
    }

    // One full TX tick against a sink exposing `bool on_output(const OutputSample&)`
    template<typename Sink>
    OutputSample tx_tick(Sink& sink) {
        OutputSample out = tx_output();
        tx_step(sink.on_output(out));
        return out;
    }

    // Both senders idle and nothing queued
    bool tx_idle() const {
        return arp_sender_.ready() && icmp_sender_.ready() &&
               !arp_queue_.has_data() && !icmp_queue_.has_data();
    }

    // ========================================================================
    // Diagnostics (read after both contexts are quiescent)
    // ========================================================================

    PipelineStats stats() const {
        PipelineStats s;
        s.arp_parser = arp_parser_.stats();
        s.icmp_parser = icmp_parser_.stats();
        s.arp_queue_drops = arp_queue_.dropped();
        s.icmp_queue_drops = icmp_queue_.dropped();
        s.arp_sent = arp_sender_.frames_sent();
        s.icmp_sent = icmp_sender_.frames_sent();
        s.handovers = mux_.handovers();
        return s;
    }

    const stack::Identity& identity() const { return id_; }
    const ArpParser& arp_parser() const { return arp_parser_; }
    const IcmpParser& icmp_parser() const { return icmp_parser_; }
    const ArpSender& arp_sender() const { return arp_sender_; }
    const IcmpSender& icmp_sender() const { return icmp_sender_; }
    const ArpQueue& arp_queue() const { return arp_queue_; }
    const IcmpQueue& icmp_queue() const { return icmp_queue_; }
    const PriorityMux& mux() const { return mux_; }

private:
    stack::Identity id_;

    // RX context
    ArpParser arp_parser_;
    IcmpParser icmp_parser_;

    // Cross-context
    ArpQueue arp_queue_;
    IcmpQueue icmp_queue_;

    // TX context
    ArpSender arp_sender_;
    IcmpSender icmp_sender_;
    PriorityMux mux_;
};

inline void print_pipeline_stats(const PipelineStats& s, FILE* out = stdout) {
    auto print_parser = [out](const char* name, const ParserStats& p) {
        fprintf(out, "[RESPONDER] %-4s parser: started=%lu checked=%lu emitted=%lu truncated=%lu\n",
                name,
                static_cast<unsigned long>(p.frames_started),
                static_cast<unsigned long>(p.frames_checked),
                static_cast<unsigned long>(p.frames_emitted),
                static_cast<unsigned long>(p.frames_truncated));
        for (size_t i = 1; i < stack::VALIDATION_RESULT_COUNT; i++) {
            if (p.rejected[i] > 0) {
                fprintf(out, "[RESPONDER]        rejected %-16s %lu\n",
                        stack::to_string(static_cast<stack::ValidationResult>(i)),
                        static_cast<unsigned long>(p.rejected[i]));
            }
        }
    };
    print_parser("ARP", s.arp_parser);
    print_parser("ICMP", s.icmp_parser);
    fprintf(out, "[RESPONDER] queue drops: arp=%lu icmp=%lu\n",
            static_cast<unsigned long>(s.arp_queue_drops),
            static_cast<unsigned long>(s.icmp_queue_drops));
    fprintf(out, "[RESPONDER] replies sent: arp=%lu icmp=%lu (handovers=%lu)\n",
            static_cast<unsigned long>(s.arp_sent),
            static_cast<unsigned long>(s.icmp_sent),
            static_cast<unsigned long>(s.handovers));
}

// ============================================================================
// ResponderRunner - drives the pipeline from two independent threads
//
// RxPoll:  InputStep()                         (may block briefly; nullopt = no byte)
// TxSink:  bool(const OutputSample&)           (returns the ack for the tick)
//
// Loops run until stop(). The TX loop yields after TX_IDLE_SPIN idle ticks.
// ============================================================================

struct ResponderRunner {
    explicit ResponderRunner(ResponderPipeline& pipeline) : pipeline_(pipeline) {}

    ~ResponderRunner() {
        stop();
    }

    ResponderRunner(const ResponderRunner&) = delete;
    ResponderRunner& operator=(const ResponderRunner&) = delete;

    template<typename RxPoll, typename TxSink>
    void start(RxPoll rx_poll, TxSink tx_sink) {
        stop_.store(false, std::memory_order_release);

        rx_thread_ = std::thread([this, rx_poll = std::move(rx_poll)]() mutable {
            while (!stop_.load(std::memory_order_acquire)) {
                pipeline_.rx_step(rx_poll());
            }
        });

        tx_thread_ = std::thread([this, tx_sink = std::move(tx_sink)]() mutable {
            uint32_t idle_ticks = 0;
            while (!stop_.load(std::memory_order_acquire)) {
                OutputSample out = pipeline_.tx_output();
                pipeline_.tx_step(tx_sink(out));
                if (!out.active && pipeline_.tx_idle()) {
                    if (++idle_ticks >= TX_IDLE_SPIN) {
                        idle_ticks = 0;
                        std::this_thread::yield();
                    }
                } else {
                    idle_ticks = 0;
                }
            }
        });
    }

    void stop() {
        stop_.store(true, std::memory_order_release);
        if (rx_thread_.joinable()) rx_thread_.join();
        if (tx_thread_.joinable()) tx_thread_.join();
    }

    bool running() const {
        return !stop_.load(std::memory_order_acquire);
    }

private:
    ResponderPipeline& pipeline_;
    std::atomic<bool> stop_{true};
    std::thread rx_thread_;
    std::thread tx_thread_;
};

}  // namespace responder::pipeline
