// policy/event.hpp
// Event Loop Policy for the TAP host (Linux epoll)
//
// Policy interface:
//   - void init()
//   - void add_read(int fd)
//   - void set_wait_timeout(int ms)     // Pre-set timeout (call once)
//   - int wait_with_timeout()           // 0 = timeout, -1 = error
//   - int get_ready_fd() const
//   - bool is_readable() / has_error() const
//
// EventPolicyConcept (bottom of file) checks the interface at compile time.
//
// Namespace: responder::event_policies

#pragma once

#include <stdexcept>
#include <cstdint>
#include <cerrno>

#if defined(__linux__)
    #include <sys/epoll.h>
    #include <unistd.h>
#else
    #error "Unsupported platform for event policy (TAP host is Linux-only)"
#endif

namespace responder {
namespace event_policies {

/**
 * EpollPolicy - Linux epoll-based readiness notification
 *
 * Level-triggered: the RX loop reads one frame per wakeup, so a TAP fd
 * holding several queued frames must stay ready until drained.
 *
 * Thread safety: Not thread-safe (owned by the RX thread)
 */
struct EpollPolicy {
    EpollPolicy() = default;

    ~EpollPolicy() {
        cleanup();
    }

    // Prevent copying
    EpollPolicy(const EpollPolicy&) = delete;
    EpollPolicy& operator=(const EpollPolicy&) = delete;

    EpollPolicy(EpollPolicy&& other) noexcept
        : epfd_(other.epfd_)
        , ready_fd_(other.ready_fd_)
        , ready_events_(other.ready_events_)
        , timeout_ms_(other.timeout_ms_)
    {
        other.epfd_ = -1;
        other.ready_fd_ = -1;
        other.ready_events_ = 0;
    }

    EpollPolicy& operator=(EpollPolicy&& other) noexcept {
        if (this != &other) {
            cleanup();
            epfd_ = other.epfd_;
            ready_fd_ = other.ready_fd_;
            ready_events_ = other.ready_events_;
            timeout_ms_ = other.timeout_ms_;
            other.epfd_ = -1;
            other.ready_fd_ = -1;
            other.ready_events_ = 0;
        }
        return *this;
    }

    /**
     * Initialize epoll instance
     *
     * @throws std::runtime_error if epoll_create1() fails
     */
    void init() {
        epfd_ = epoll_create1(EPOLL_CLOEXEC);
        if (epfd_ < 0) {
            throw std::runtime_error("epoll_create1() failed");
        }
    }

    /**
     * Register file descriptor for read events (EPOLLIN)
     *
     * @throws std::runtime_error if epoll_ctl() fails
     */
    void add_read(int fd) {
        struct epoll_event ev = {};
        ev.events = EPOLLIN;
        ev.data.fd = fd;

        if (epoll_ctl(epfd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            throw std::runtime_error("epoll_ctl(ADD, EPOLLIN) failed");
        }
    }

    /**
     * @param timeout_ms Timeout in milliseconds (-1 = infinite, 0 = poll)
     */
    void set_wait_timeout(int timeout_ms) {
        timeout_ms_ = timeout_ms;
    }

    /**
     * Wait for events with pre-configured timeout
     *
     * EINTR is reported as a timeout so callers re-check their stop flag.
     *
     * @return Number of ready file descriptors (0 = timeout, -1 = error)
     */
    int wait_with_timeout() {
        struct epoll_event events[MAX_EVENTS];
        int n = epoll_wait(epfd_, events, MAX_EVENTS, timeout_ms_);

        if (n > 0) {
            ready_fd_ = events[0].data.fd;
            ready_events_ = events[0].events;
            return n;
        }
        ready_fd_ = -1;
        ready_events_ = 0;
        if (n == 0 || errno == EINTR) {
            return 0;
        }
        return -1;
    }

    int get_ready_fd() const {
        return ready_fd_;
    }

    bool is_readable() const {
        return ready_events_ & EPOLLIN;
    }

    bool has_error() const {
        return ready_events_ & (EPOLLERR | EPOLLHUP);
    }

    static constexpr const char* name() {
        return "epoll";
    }

    static constexpr int MAX_EVENTS = 8;

private:
    void cleanup() {
        if (epfd_ >= 0) {
            ::close(epfd_);
            epfd_ = -1;
        }
    }

    int epfd_ = -1;             // epoll file descriptor
    int ready_fd_ = -1;         // Most recently ready file descriptor
    uint32_t ready_events_ = 0; // Events for ready_fd_
    int timeout_ms_ = -1;       // Pre-configured timeout for wait_with_timeout()
};

} // namespace event_policies
} // namespace responder

using EpollPolicy = responder::event_policies::EpollPolicy;

// ============================================================================
// Event Policy Concept (C++20)
// ============================================================================

#include <concepts>

/**
 * EventPolicyConcept - Required interface for the TAP host's RX wait
 *
 *   - init() - Initialize event mechanism
 *   - add_read(fd) - Monitor fd for read events
 *   - set_wait_timeout(timeout_ms) - Pre-set timeout (call once during setup)
 *   - wait_with_timeout() - Wait with pre-set timeout
 *   - get_ready_fd() / is_readable() - Inspect the ready fd
 */
template<typename T>
concept EventPolicyConcept = requires(T event, const T cevent, int fd, int timeout) {
    { event.init() } -> std::same_as<void>;
    { event.add_read(fd) } -> std::same_as<void>;
    { event.set_wait_timeout(timeout) } -> std::same_as<void>;
    { event.wait_with_timeout() } -> std::convertible_to<int>;
    { cevent.get_ready_fd() } -> std::convertible_to<int>;
    { cevent.is_readable() } -> std::convertible_to<bool>;
};

static_assert(EventPolicyConcept<EpollPolicy>);
