// src/transport/tap_device.hpp
// TAP Device - raw Ethernet frame I/O through /dev/net/tun
//
// Policy-based design: No inheritance, no virtual functions
// Used by the host program to feed the responder core; the core never
// touches file descriptors.
//
// Interface:
//   void open(const char* ifname)       // throws std::runtime_error
//   void close()
//   bool is_open() const
//   ssize_t read_frame(uint8_t*, size_t) // >0 bytes, 0 = nothing (EAGAIN/EINTR), -1 = error
//   bool write_frame(const uint8_t*, size_t)
//   int get_fd() const
//   const char* name() const

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <stdexcept>
#include <string>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/types.h>

#ifdef __linux__
#include <linux/if.h>
#include <linux/if_tun.h>
#else
#error "TAP device is Linux-only"
#endif

namespace responder {
namespace transport {

struct TapDevice {
    TapDevice() = default;

    ~TapDevice() {
        close();
    }

    TapDevice(const TapDevice&) = delete;
    TapDevice& operator=(const TapDevice&) = delete;

    /**
     * Attach to an existing TAP interface (create it with `ip tuntap add`)
     *
     * IFF_TAP: Ethernet frames, IFF_NO_PI: no packet-info prefix.
     * The fd is non-blocking; readiness comes from the event policy.
     *
     * @throws std::runtime_error on open/ioctl/fcntl failure
     */
    void open(const char* ifname) {
        if (!ifname || std::strlen(ifname) >= IFNAMSIZ) {
            throw std::runtime_error("TapDevice: invalid interface name");
        }
        close();

        fd_ = ::open("/dev/net/tun", O_RDWR | O_CLOEXEC);
        if (fd_ < 0) {
            throw std::runtime_error(std::string("TapDevice: failed to open /dev/net/tun: ") +
                                     strerror(errno));
        }

        struct ifreq ifr;
        std::memset(&ifr, 0, sizeof(ifr));
        ifr.ifr_flags = IFF_TAP | IFF_NO_PI;
        std::strncpy(ifr.ifr_name, ifname, IFNAMSIZ - 1);

        if (ioctl(fd_, TUNSETIFF, static_cast<void*>(&ifr)) < 0) {
            int err = errno;
            close();
            throw std::runtime_error(std::string("TapDevice: TUNSETIFF failed for ") + ifname +
                                     ": " + strerror(err));
        }

        int flags = fcntl(fd_, F_GETFL, 0);
        if (flags < 0 || fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
            int err = errno;
            close();
            throw std::runtime_error(std::string("TapDevice: failed to set O_NONBLOCK: ") +
                                     strerror(err));
        }

        std::memcpy(name_, ifr.ifr_name, IFNAMSIZ);
        name_[IFNAMSIZ - 1] = '\0';
        printf("[TAP] Device %s is ready (fd=%d)\n", name_, fd_);
    }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    bool is_open() const { return fd_ >= 0; }

    // One read() returns exactly one frame on a TAP fd
    ssize_t read_frame(uint8_t* buf, size_t cap) {
        ssize_t n = ::read(fd_, buf, cap);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                return 0;
            }
            fprintf(stderr, "[TAP] read failed on %s: %s\n", name_, strerror(errno));
            return -1;
        }
        return n;
    }

    bool write_frame(const uint8_t* data, size_t len) {
        while (true) {
            ssize_t n = ::write(fd_, data, len);
            if (n == static_cast<ssize_t>(len)) {
                return true;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0) {
                fprintf(stderr, "[TAP] write failed on %s: %s\n", name_, strerror(errno));
            } else {
                fprintf(stderr, "[TAP] short write on %s: %zd of %zu bytes\n", name_, n, len);
            }
            return false;
        }
    }

    int get_fd() const { return fd_; }
    const char* name() const { return name_; }

private:
    int fd_ = -1;
    char name_[IFNAMSIZ] = {};
};

} // namespace transport
} // namespace responder
