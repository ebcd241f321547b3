/**
 * @file RelayServer.h
 * @brief Multi-threaded TCP relay server
 */

#pragma once

#include "config.h"
#include "ChunkForwarder.h"
#include "ConnectionSupervisor.h"
#include "EndpointRegistry.h"
#include "MessageRouter.h"
#include "SignalingRelay.h"
#include "TransferManager.h"
#include "TransportStream.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

namespace PeerRelay {

/**
 * @brief Runtime settings for RelayServer
 */
struct RelayOptions {
    uint16_t port = RELAY_PORT_DEFAULT;                  ///< 0 = OS-assigned
    std::string bindAddress = RELAY_BIND_ADDRESS_DEFAULT;
    size_t maxFrameBytes = MAX_FRAME_BYTES_DEFAULT;
    uint32_t staleTimeoutMs = STALE_ENDPOINT_TIMEOUT_MS;
    uint32_t retentionMs = TRANSFER_RETENTION_MS;
    uint32_t cleanupIntervalMs = CLEANUP_INTERVAL_MS;
};

//=============================================================================
// RelayServer Class
//=============================================================================

/**
 * @class RelayServer
 * @brief TCP server that hosts the signaling relay and transfer tracking
 *
 * Architecture:
 * - Single listener thread that accepts connections
 * - One detached reader thread per connection (counted; stop() waits)
 * - One cleanup thread that garbage-collects finished transfers and closes
 *   connections that have been silent too long
 *
 * Thread Safety:
 * - start() and stop() are NOT thread-safe (call from same thread)
 * - Component accessors return thread-safe objects
 *
 * Usage:
 * @code
 * RelayServer server(options);
 * if (server.start()) {
 *     // ...
 *     server.stop();
 * }
 * @endcode
 */
class RelayServer {
public:
    explicit RelayServer(RelayOptions options = RelayOptions{});

    /**
     * @brief Stops the server if running
     */
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;
    RelayServer(RelayServer&&) = delete;
    RelayServer& operator=(RelayServer&&) = delete;

    //=========================================================================
    // Server Control
    //=========================================================================

    /**
     * @brief Bind, listen and launch the listener and cleanup threads
     * @return false if the socket could not be created, bound or listened on
     */
    bool start();

    /**
     * @brief Stop accepting, close every connection and wait for all threads
     */
    void stop();

    bool isRunning() const { return m_running.load(); }

    /**
     * @brief Bound TCP port (0 when not running)
     */
    uint16_t getPort() const { return m_boundPort.load(); }

    size_t getConnectionCount() const { return m_activeClientThreadCount.load(); }

    //=========================================================================
    // Components
    //=========================================================================

    EndpointRegistry& registry() { return m_registry; }
    SignalingRelay& signaling() { return m_signaling; }
    TransferManager& transfers() { return m_transfers; }

    /**
     * @brief One cleanup pass (GC + stale eviction)
     */
    void runCleanup();

private:
    void listenerThreadFunc();
    void cleanupThreadFunc();
    void handleClient(std::shared_ptr<PlainSocketStream> stream, const std::string& clientAddr);

    bool initializeSocket();
    void cleanupSocket();

    RelayOptions m_options;

    // Components (declaration order = construction order)
    EndpointRegistry m_registry;
    SignalingRelay m_signaling;
    TransferManager m_transfers;
    ChunkForwarder m_chunks;
    ConnectionSupervisor m_supervisor;
    MessageRouter m_router;

    // Socket
    int m_listenSocket;
    std::atomic<uint16_t> m_boundPort;

    // Threads
    std::thread m_listenerThread;
    std::thread m_cleanupThread;

    // Active connections
    std::mutex m_activeClientsMutex;
    std::unordered_set<std::shared_ptr<PlainSocketStream>> m_activeClientStreams;
    std::atomic<size_t> m_activeClientThreadCount;
    std::condition_variable m_activeClientsCv;
    std::mutex m_activeClientsCvMutex;

    // Control flags
    std::atomic<bool> m_running;
    std::atomic<bool> m_stopRequested;
    std::condition_variable m_cleanupCv;  ///< Wakes cleanup thread during shutdown
    std::mutex m_cleanupCvMutex;
    std::atomic<uint64_t> m_connectionSeq;
};

}  // namespace PeerRelay
