/**
 * @file relay_server.cpp
 * @brief PeerRelay server entry point
 *
 * Usage: peerrelay_server [--port n] [--bind ip] [--trace-log path] ...
 * Runs until SIGINT or SIGTERM.
 */

#include "peerrelay/RelayArgs.h"
#include "peerrelay/RelayServer.h"
#include "peerrelay/ThreadSafeLog.h"
#include "peerrelay/Debug.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {

std::atomic<bool> g_shutdownRequested{false};

void onSignal(int) {
    g_shutdownRequested.store(true);
}

}  // namespace

int main(int argc, char* argv[]) {
    PeerRelay::RelayArgs args;
    try {
        args = PeerRelay::RelayArgs::parseOrThrow(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n\n"
                  << PeerRelay::RelayArgs::usage(argv[0]);
        return 2;
    }

    if (args.showHelp) {
        std::cout << PeerRelay::RelayArgs::usage(argv[0]);
        return 0;
    }

    if (!args.traceLogPath.empty()) {
        PeerRelay::ThreadSafeLog::initialize(args.traceLogPath);
    }

    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    std::cout << "=== PeerRelay Server (" << PeerRelay::PROTOCOL_ID << ") ===\n";

    PeerRelay::RelayServer server(args.options);
    if (!server.start()) {
        LOG_ERROR("Failed to start relay on " << args.options.bindAddress << ":" << args.options.port);
        return 1;
    }

    std::cout << "[+] Listening on " << args.options.bindAddress << ":" << server.getPort() << "\n";

    while (!g_shutdownRequested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\n[+] Shutting down...\n";
    server.stop();
    return 0;
}
