/**
 * @file RelayArgs.h
 * @brief Relay server command-line parsing.
 */

#pragma once

#include "RelayServer.h"

#include <stdexcept>
#include <string>

namespace PeerRelay {

struct RelayArgs {
    bool showHelp = false;
    RelayOptions options;
    std::string traceLogPath;   ///< Empty = no trace file

    /**
     * @brief Parse arguments in a strict, fail-closed manner.
     *
     * Supported flags:
     * - --port <0-65535>
     * - --bind <ipv4-address>
     * - --trace-log <path>
     * - --max-frame-bytes <n>
     * - --stale-timeout-ms <n>
     * - --retention-ms <n>
     * - --help, -h
     *
     * @throws std::runtime_error on unknown flags or malformed values
     */
    static RelayArgs parseOrThrow(int argc, const char* const* argv);

    static std::string usage(const std::string& programName);
};

}  // namespace PeerRelay
