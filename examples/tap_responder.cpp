// examples/tap_responder.cpp
// ARP + ICMP echo responder attached to a Linux TAP interface
//
// RX thread: epoll on the TAP fd -> one frame per read -> byte samples -> parsers
// TX thread: mux output -> FrameCollector -> whole reply frames -> TAP write
//
// Setup (once, as root):
//   sudo ip tuntap add dev tap0 mode tap user $USER
//   sudo ip addr add 192.168.43.1/24 dev tap0
//   sudo ip link set tap0 up
//
// Then:
//   ./tap_responder --verbose
//   ping -c 3 192.168.43.2      (from another terminal)

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdint>
#include <stdexcept>
#include <thread>
#include <chrono>
#include <utility>
#include <vector>

#include "responder_config.hpp"
#include "core/hexdump.hpp"
#include "policy/event.hpp"
#include "transport/tap_device.hpp"
#include "pipeline/pipeline_config.hpp"
#include "pipeline/byte_stream.hpp"
#include "pipeline/responder_pipeline.hpp"

using namespace responder;
using namespace responder::pipeline;

std::atomic<bool> g_shutdown{false};

void signal_handler(int) {
    g_shutdown.store(true, std::memory_order_release);
}

template<EventPolicyConcept Event>
static int run(const ResponderConfig& config) {
    transport::TapDevice tap;
    tap.open(config.iface.c_str());

    Event event;
    event.init();
    event.add_read(tap.get_fd());
    event.set_wait_timeout(TAP_POLL_TIMEOUT_MS);

    ResponderPipeline pipeline(config.identity());
    ResponderRunner runner(pipeline);

    const bool verbose = config.verbose;
    std::atomic<uint64_t> rx_frames{0};
    std::atomic<uint64_t> tx_frames{0};
    std::atomic<bool> io_error{false};

    // RX: feed buffered samples first, otherwise wait for the next frame
    auto rx_poll = [&tap, &event, &rx_frames, &io_error, verbose,
                    source = FrameStreamSource{},
                    buf = std::vector<uint8_t>(TAP_MAX_FRAME_LEN)]() mutable -> InputStep {
        if (!source.empty()) {
            return source.next();
        }
        int n = event.wait_with_timeout();
        if (n < 0) {
            io_error.store(true, std::memory_order_release);
            return std::nullopt;
        }
        if (n == 0 || !event.is_readable()) {
            return std::nullopt;
        }
        ssize_t len = tap.read_frame(buf.data(), buf.size());
        if (len < 0) {
            io_error.store(true, std::memory_order_release);
            return std::nullopt;
        }
        if (len == 0) {
            return std::nullopt;
        }
        rx_frames.fetch_add(1, std::memory_order_relaxed);
        if (verbose) {
            printf("[TAP] RX %zd bytes\n", len);
            print_bytes(buf.data(), static_cast<size_t>(len));
        }
        source.push_frame(buf.data(), static_cast<size_t>(len));
        return source.next();
    };

    // TX: acknowledge every byte, write a frame once it is complete
    auto tx_sink = [&tap, &tx_frames, &io_error, verbose,
                    collector = FrameCollector{},
                    frame = std::vector<uint8_t>{}](const OutputSample& out) mutable -> bool {
        bool ack = collector.on_output(out);
        while (collector.pop_frame(frame)) {
            if (verbose) {
                printf("[TAP] TX %zu bytes\n", frame.size());
                print_bytes(frame.data(), frame.size());
            }
            if (!tap.write_frame(frame.data(), frame.size())) {
                io_error.store(true, std::memory_order_release);
                continue;
            }
            tx_frames.fetch_add(1, std::memory_order_relaxed);
        }
        return ack;
    };

    printf("[TAP-RESPONDER] Running on %s with %s (Ctrl-C to stop)\n", tap.name(), Event::name());
    runner.start(std::move(rx_poll), std::move(tx_sink));

    while (!g_shutdown.load(std::memory_order_acquire) &&
           !io_error.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(TAP_POLL_TIMEOUT_MS));
    }
    runner.stop();

    printf("\n[TAP-RESPONDER] Stopped: rx_frames=%lu tx_frames=%lu\n",
           static_cast<unsigned long>(rx_frames.load()),
           static_cast<unsigned long>(tx_frames.load()));
    print_pipeline_stats(pipeline.stats());

    if (io_error.load()) {
        fprintf(stderr, "[TAP-RESPONDER] ERROR: I/O failure on %s\n", tap.name());
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    ResponderConfig config;
    try {
        config.load_from_env();
        config.parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "[TAP-RESPONDER] ERROR: %s\n", e.what());
        ResponderConfig::print_usage(argv[0]);
        return 1;
    }

    if (config.show_help) {
        ResponderConfig::print_usage(argv[0]);
        return 0;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    printf("==============================================\n");
    printf("  TAP ARP/ICMP Responder                      \n");
    printf("==============================================\n");
    config.print();
    printf("==============================================\n\n");

    try {
        return run<EpollPolicy>(config);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "[TAP-RESPONDER] ERROR: %s\n", e.what());
        return 1;
    }
}
