// core/hexdump.hpp
// Debug printing and wireshark-style hex dump (16 bytes per line)
#pragma once

#include <cstdint>
#include <cstddef>
#include <cstdio>

// Debug printing - enable with -DDEBUG (compiled out otherwise)
#ifdef DEBUG
#define DEBUG_PRINT(...) do { printf(__VA_ARGS__); fflush(stdout); } while(0)
#define DEBUG_FPRINTF(...) do { fprintf(__VA_ARGS__); fflush(stderr); } while(0)
#else
#define DEBUG_PRINT(...) ((void)0)
#define DEBUG_FPRINTF(...) ((void)0)
#endif

namespace responder {

inline void print_bytes(const uint8_t* data, size_t len, FILE* out = stdout) {
    for (size_t i = 0; i < len; i++) {
        if (i > 0 && (i % 16) == 0) {
            fputc('\n', out);
        }
        fprintf(out, "%02x ", data[i]);
    }
    fputc('\n', out);
}

} // namespace responder
