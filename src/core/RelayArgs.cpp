/**
 * @file RelayArgs.cpp
 * @brief Relay server command-line parsing.
 */

#include "peerrelay/RelayArgs.h"

#include <arpa/inet.h>
#include <cctype>
#include <limits>

namespace PeerRelay {
namespace {

bool isAllDigits(const std::string& s) {
    if (s.empty()) return false;
    for (char ch : s) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) return false;
    }
    return true;
}

uint64_t parseNumber(const std::string& flag, const std::string& value, uint64_t maxValue) {
    if (!isAllDigits(value) || value.size() > 19) {
        throw std::runtime_error("Invalid " + flag + " (must be numeric): " + value);
    }
    const unsigned long long n = std::stoull(value);
    if (n > maxValue) {
        throw std::runtime_error("Invalid " + flag + " (out of range): " + value);
    }
    return n;
}

}  // namespace

RelayArgs RelayArgs::parseOrThrow(int argc, const char* const* argv) {
    RelayArgs out;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i] ? std::string(argv[i]) : std::string();

        if (a == "--help" || a == "-h") {
            out.showHelp = true;
            continue;
        }

        auto nextValue = [&]() -> std::string {
            if (i + 1 >= argc || argv[i + 1] == nullptr) {
                throw std::runtime_error("Missing value for " + a);
            }
            return std::string(argv[++i]);
        };

        if (a == "--port") {
            out.options.port = static_cast<uint16_t>(
                parseNumber(a, nextValue(), std::numeric_limits<uint16_t>::max()));
            continue;
        }

        if (a == "--bind") {
            const std::string addr = nextValue();
            in_addr parsed{};
            if (inet_pton(AF_INET, addr.c_str(), &parsed) != 1) {
                throw std::runtime_error("Invalid --bind (IPv4 address expected): " + addr);
            }
            out.options.bindAddress = addr;
            continue;
        }

        if (a == "--trace-log") {
            out.traceLogPath = nextValue();
            if (out.traceLogPath.empty()) {
                throw std::runtime_error("Empty value for --trace-log");
            }
            continue;
        }

        if (a == "--max-frame-bytes") {
            const uint64_t n = parseNumber(a, nextValue(), std::numeric_limits<uint32_t>::max());
            if (n == 0) {
                throw std::runtime_error("Invalid --max-frame-bytes (must be positive)");
            }
            out.options.maxFrameBytes = static_cast<size_t>(n);
            continue;
        }

        if (a == "--stale-timeout-ms") {
            out.options.staleTimeoutMs = static_cast<uint32_t>(
                parseNumber(a, nextValue(), std::numeric_limits<uint32_t>::max()));
            continue;
        }

        if (a == "--retention-ms") {
            out.options.retentionMs = static_cast<uint32_t>(
                parseNumber(a, nextValue(), std::numeric_limits<uint32_t>::max()));
            continue;
        }

        throw std::runtime_error("Unknown argument: " + a);
    }

    return out;
}

std::string RelayArgs::usage(const std::string& programName) {
    return "Usage: " + programName + " [options]\n"
           "  --port <n>               TCP port (default " + std::to_string(RELAY_PORT_DEFAULT) + ", 0 = any)\n"
           "  --bind <ipv4>            Bind address (default " + RELAY_BIND_ADDRESS_DEFAULT + ")\n"
           "  --trace-log <path>       Append lifecycle trace to this file\n"
           "  --max-frame-bytes <n>    Largest accepted frame (default " +
           std::to_string(MAX_FRAME_BYTES_DEFAULT) + ")\n"
           "  --stale-timeout-ms <n>   Close silent connections after n ms (default " +
           std::to_string(STALE_ENDPOINT_TIMEOUT_MS) + ")\n"
           "  --retention-ms <n>       Keep finished transfers for n ms (default " +
           std::to_string(TRANSFER_RETENTION_MS) + ")\n"
           "  --help, -h               Show this help\n";
}

}  // namespace PeerRelay
