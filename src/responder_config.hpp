// src/responder_config.hpp
// Runtime configuration for the TAP responder host program
//
// Provides:
//   - ResponderConfig: interface name, local MAC/IP, verbose flag
//   - load_from_env(): RESPONDER_TAP_IF / RESPONDER_LOCAL_MAC /
//                      RESPONDER_LOCAL_IP / RESPONDER_VERBOSE
//   - parse_args(): --iface --mac --ip --verbose --help (override env)
//
// Compile-time tuning lives in pipeline/pipeline_config.hpp.

#pragma once

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

#include "stack/mac/ethernet.hpp"
#include "stack/ip/ip_layer.hpp"
#include "stack/validation.hpp"

namespace responder {

inline constexpr const char* DEFAULT_TAP_IF = "tap0";
inline constexpr const char* DEFAULT_LOCAL_MAC = "02:00:00:00:00:01";
inline constexpr const char* DEFAULT_LOCAL_IP = "192.168.43.2";

struct ResponderConfig {
    std::string iface = DEFAULT_TAP_IF;
    stack::MacAddress mac = stack::string_to_mac(DEFAULT_LOCAL_MAC);
    uint32_t ip = stack::string_to_ip(DEFAULT_LOCAL_IP);
    bool verbose = false;
    bool show_help = false;

    stack::Identity identity() const {
        stack::Identity id;
        id.mac = mac;
        id.ip = ip;
        return id;
    }

    /**
     * Apply environment overrides. Unset variables keep their current value.
     * @throws std::runtime_error on malformed MAC/IP
     */
    void load_from_env() {
        if (const char* v = std::getenv("RESPONDER_TAP_IF")) {
            set_iface(v);
        }
        if (const char* v = std::getenv("RESPONDER_LOCAL_MAC")) {
            mac = stack::string_to_mac(v);
        }
        if (const char* v = std::getenv("RESPONDER_LOCAL_IP")) {
            ip = stack::string_to_ip(v);
        }
        if (const char* v = std::getenv("RESPONDER_VERBOSE")) {
            verbose = (std::strcmp(v, "0") != 0 && v[0] != '\0');
        }
    }

    /**
     * Apply command-line overrides (argv[0] is skipped).
     * @throws std::runtime_error on unknown flag, missing value or malformed MAC/IP
     */
    void parse_args(int argc, char* argv[]) {
        for (int i = 1; i < argc; i++) {
            const char* arg = argv[i];
            if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
                show_help = true;
            } else if (std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0) {
                verbose = true;
            } else if (std::strcmp(arg, "--iface") == 0) {
                set_iface(require_value(argc, argv, i));
            } else if (std::strcmp(arg, "--mac") == 0) {
                mac = stack::string_to_mac(require_value(argc, argv, i));
            } else if (std::strcmp(arg, "--ip") == 0) {
                ip = stack::string_to_ip(require_value(argc, argv, i));
            } else {
                throw std::runtime_error(std::string("Unknown argument: ") + arg);
            }
        }
    }

    void print(FILE* out = stdout) const {
        fprintf(out, "[RESPONDER] Interface: %s\n", iface.c_str());
        fprintf(out, "[RESPONDER] Local MAC: %s\n", stack::mac_to_string(mac).c_str());
        fprintf(out, "[RESPONDER] Local IP:  %s\n", stack::ip_to_string(ip).c_str());
        fprintf(out, "[RESPONDER] Verbose:   %s\n", verbose ? "yes" : "no");
    }

    static void print_usage(const char* prog, FILE* out = stderr) {
        fprintf(out, "Usage: %s [--iface NAME] [--mac XX:XX:XX:XX:XX:XX] [--ip A.B.C.D] [--verbose]\n", prog);
        fprintf(out, "\n");
        fprintf(out, "Answers ARP requests and ICMP echo requests on a TAP interface.\n");
        fprintf(out, "\n");
        fprintf(out, "  --iface NAME   TAP interface (default %s, env RESPONDER_TAP_IF)\n", DEFAULT_TAP_IF);
        fprintf(out, "  --mac MAC      Local MAC (default %s, env RESPONDER_LOCAL_MAC)\n", DEFAULT_LOCAL_MAC);
        fprintf(out, "  --ip IP        Local IPv4 (default %s, env RESPONDER_LOCAL_IP)\n", DEFAULT_LOCAL_IP);
        fprintf(out, "  --verbose      Hex dump every frame (env RESPONDER_VERBOSE=1)\n");
        fprintf(out, "  --help         Show this help\n");
        fprintf(out, "\n");
        fprintf(out, "Create the interface first:\n");
        fprintf(out, "  sudo ip tuntap add dev tap0 mode tap user $USER\n");
        fprintf(out, "  sudo ip addr add 192.168.43.1/24 dev tap0\n");
        fprintf(out, "  sudo ip link set tap0 up\n");
    }

private:
    void set_iface(const char* name) {
        if (name[0] == '\0' || std::strlen(name) >= 16) {
            throw std::runtime_error(std::string("Invalid interface name: '") + name + "'");
        }
        iface = name;
    }

    static const char* require_value(int argc, char* argv[], int& i) {
        if (i + 1 >= argc) {
            throw std::runtime_error(std::string("Missing value for ") + argv[i]);
        }
        return argv[++i];
    }
};

}  // namespace responder
