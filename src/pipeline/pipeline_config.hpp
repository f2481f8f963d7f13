// pipeline/pipeline_config.hpp
// Pipeline configuration constants and compile-time validation
// C++20, policy-based design, two-context (RX/TX) responder
#pragma once

#include <cstdint>
#include <cstddef>

#include "../stack/mac/arp.hpp"
#include "../stack/ip/icmp.hpp"

namespace responder::pipeline {

// ============================================================================
// Compile-time Configuration (override via -D flags)
// ============================================================================

// Frames held per protocol between RX and TX contexts
#ifndef RESPONDER_FRAME_QUEUE_DEPTH
#define RESPONDER_FRAME_QUEUE_DEPTH 16
#endif
inline constexpr size_t FRAME_QUEUE_DEPTH = RESPONDER_FRAME_QUEUE_DEPTH;

// Cache line size (configurable for different architectures)
#ifndef CACHE_LINE_SIZE
#if defined(__aarch64__) && defined(__APPLE__)
#define CACHE_LINE_SIZE 128  // Apple Silicon
#else
#define CACHE_LINE_SIZE 64
#endif
#endif

// ============================================================================
// TAP Host Configuration
// ============================================================================

// Largest frame read from the TAP fd: MTU + Ethernet header
#ifndef TAP_MTU
#define TAP_MTU 1500
#endif
inline constexpr size_t TAP_MAX_FRAME_LEN = TAP_MTU + stack::ETH_HEADER_LEN;

// epoll wait timeout so the RX loop can observe the stop flag
inline constexpr int TAP_POLL_TIMEOUT_MS = 100;

// TX loop: idle ticks between yields when both senders are idle
inline constexpr uint32_t TX_IDLE_SPIN = 1024;

// ============================================================================
// Compile-time Validation
// ============================================================================

static_assert((FRAME_QUEUE_DEPTH & (FRAME_QUEUE_DEPTH - 1)) == 0 && FRAME_QUEUE_DEPTH > 0,
              "FRAME_QUEUE_DEPTH must be power of 2");
// Frame lengths are fixed by the stack layouts (arp.hpp, icmp.hpp)
static_assert(stack::ARP_FRAME_LEN == 42, "ARP frame is Ethernet(14) + ARP(28)");
static_assert(stack::ICMP_FRAME_LEN <= TAP_MAX_FRAME_LEN, "ICMP echo frame must fit the TAP MTU");

}  // namespace responder::pipeline
