/**
 * @file RelayServer.cpp
 * @brief Multi-threaded TCP relay server
 */

#include "peerrelay/RelayServer.h"
#include "peerrelay/Debug.h"
#include "peerrelay/FrameCodec.h"
#include "peerrelay/MessageChannel.h"
#include "peerrelay/ThreadSafeLog.h"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace PeerRelay {

//=============================================================================
// Crash logging (trace support)
//=============================================================================

namespace {
    #define LogRelayTrace(msg) PeerRelay::ThreadSafeLog::log(msg)
} // anonymous namespace

//=============================================================================
// Constructor / Destructor
//=============================================================================

RelayServer::RelayServer(RelayOptions options)
    : m_options(std::move(options))
    , m_registry()
    , m_signaling(m_registry)
    , m_transfers(m_registry)
    , m_chunks(m_registry, m_transfers)
    , m_supervisor(m_registry, m_signaling, m_transfers)
    , m_router(m_registry, m_signaling, m_transfers, m_chunks)
    , m_listenSocket(-1)
    , m_boundPort(0)
    , m_activeClientThreadCount(0)
    , m_running(false)
    , m_stopRequested(false)
    , m_connectionSeq(0)
{
    m_supervisor.attach();
}

RelayServer::~RelayServer() {
    if (m_running.load()) {
        stop();
    }
    cleanupSocket();
}

//=============================================================================
// RelayServer: start() / stop()
//=============================================================================

bool RelayServer::start() {
    if (m_running.load()) {
        return false;
    }

    if (!initializeSocket()) {
        return false;
    }

    m_stopRequested.store(false);
    m_running.store(true);

    m_listenerThread = std::thread(&RelayServer::listenerThreadFunc, this);
    m_cleanupThread = std::thread(&RelayServer::cleanupThreadFunc, this);

    LogRelayTrace("=== RelayServer started on port " + std::to_string(m_boundPort.load()) + " ===");
    return true;
}

void RelayServer::stop() {
    if (!m_running.load()) {
        return;
    }

    LogRelayTrace("=== RelayServer::stop START ===");

    m_stopRequested.store(true);
    {
        std::lock_guard<std::mutex> lock(m_cleanupCvMutex);
    }
    m_cleanupCv.notify_all();

    // Listener polls with a short timeout and exits on the flag.
    if (m_listenerThread.joinable()) {
        m_listenerThread.join();
    }
    cleanupSocket();
    m_boundPort.store(0);

    if (m_cleanupThread.joinable()) {
        m_cleanupThread.join();
    }

    // Unblock every reader; each one deregisters its endpoint on the way out.
    {
        std::vector<std::shared_ptr<PlainSocketStream>> streamsToShutdown;
        {
            std::lock_guard<std::mutex> lock(m_activeClientsMutex);
            streamsToShutdown.assign(m_activeClientStreams.begin(), m_activeClientStreams.end());
        }
        for (const auto& stream : streamsToShutdown) {
            stream->shutdown();
        }
    }

    {
        std::unique_lock<std::mutex> lock(m_activeClientsCvMutex);
        m_activeClientsCv.wait(lock, [this]() {
            return m_activeClientThreadCount.load(std::memory_order_acquire) == 0;
        });
    }

    m_running.store(false);
    LOG_INFO("[RelayServer] Stopped");
    LogRelayTrace("=== RelayServer::stop END ===");
}

//=============================================================================
// RelayServer: listenerThreadFunc()
//=============================================================================

void RelayServer::listenerThreadFunc() {
    while (!m_stopRequested.load()) {
        pollfd pfd{};
        pfd.fd = m_listenSocket;
        pfd.events = POLLIN;

        const int ready = ::poll(&pfd, 1, static_cast<int>(ACCEPT_POLL_INTERVAL_MS));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("[RelayServer] poll() failed: " << std::strerror(errno));
            break;
        }
        if (ready == 0 || m_stopRequested.load()) {
            continue;
        }

        sockaddr_in clientAddr{};
        socklen_t addrLen = sizeof(clientAddr);
        const int clientSocket = ::accept(m_listenSocket,
                                          reinterpret_cast<sockaddr*>(&clientAddr),
                                          &addrLen);
        if (clientSocket < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_WARNING("[RelayServer] accept() failed: " << std::strerror(errno));
            }
            continue;
        }

        auto stream = std::make_shared<PlainSocketStream>(clientSocket);

        if (!setSocketSendTimeout(clientSocket, SOCKET_SEND_TIMEOUT_MS)) {
            LOG_WARNING("[RelayServer] SO_SNDTIMEO failed: " << std::strerror(errno));
        }

        char ipStr[INET_ADDRSTRLEN] = {};
        if (::inet_ntop(AF_INET, &clientAddr.sin_addr, ipStr, sizeof(ipStr)) == nullptr) {
            std::strncpy(ipStr, "unknown", sizeof(ipStr) - 1);
        }
        const std::string clientIp = std::string(ipStr) + ":" + std::to_string(ntohs(clientAddr.sin_port));

        // Cap concurrent reader threads before spawning.
        size_t prev = m_activeClientThreadCount.load(std::memory_order_relaxed);
        bool admitted = false;
        while (prev < MAX_CONCURRENT_CONNECTIONS) {
            if (m_activeClientThreadCount.compare_exchange_weak(
                    prev,
                    prev + 1,
                    std::memory_order_acq_rel,
                    std::memory_order_relaxed)) {
                admitted = true;
                break;
            }
        }
        if (!admitted) {
            LOG_WARNING("[RelayServer] Connection limit reached; rejected " << clientIp);
            continue;  // stream destructor closes the socket
        }

        {
            std::lock_guard<std::mutex> lock(m_activeClientsMutex);
            m_activeClientStreams.insert(stream);
        }

        std::thread clientThread([this, stream, clientIp]() {
            try {
                this->handleClient(stream, clientIp);
            } catch (const std::exception& e) {
                LOG_ERROR("[RelayServer] Reader for " << clientIp << " threw: " << e.what());
                LogRelayTrace(std::string("=== handleClient: UNCAUGHT EXCEPTION === ") + e.what());
            }

            {
                std::lock_guard<std::mutex> lock(m_activeClientsMutex);
                m_activeClientStreams.erase(stream);
            }

            // Notify under the lock: stop() may destroy the server as soon as
            // it observes a zero count.
            std::lock_guard<std::mutex> lock(m_activeClientsCvMutex);
            m_activeClientThreadCount.fetch_sub(1, std::memory_order_acq_rel);
            m_activeClientsCv.notify_all();
        });
        clientThread.detach();
    }
}

//=============================================================================
// RelayServer: cleanupThreadFunc()
//=============================================================================

void RelayServer::cleanupThreadFunc() {
    while (!m_stopRequested.load()) {
        std::unique_lock<std::mutex> waitLock(m_cleanupCvMutex);
        m_cleanupCv.wait_for(
            waitLock,
            std::chrono::milliseconds(m_options.cleanupIntervalMs),
            [this]() { return m_stopRequested.load(); }
        );
        waitLock.unlock();

        if (m_stopRequested.load()) {
            break;
        }

        runCleanup();
    }
}

void RelayServer::runCleanup() {
    const size_t removed = m_transfers.collectGarbage(m_options.retentionMs);
    if (removed > 0) {
        LOG_DEBUG("[RelayServer] Garbage-collected " << removed << " finished transfer(s)");
    }

    for (const std::string& id : m_registry.staleEndpoints(m_options.staleTimeoutMs)) {
        if (m_registry.closeEndpoint(id)) {
            LOG_INFO("[RelayServer] Closed stale endpoint " << id);
            LogRelayTrace("stale endpoint closed: " + id);
        }
    }
}

//=============================================================================
// RelayServer: handleClient()
//=============================================================================

void RelayServer::handleClient(std::shared_ptr<PlainSocketStream> stream, const std::string& clientAddr) {
    auto channel = std::make_shared<StreamMessageChannel>(stream);

    ConnectionContext ctx;
    ctx.connectionId = "conn-" + std::to_string(++m_connectionSeq) + " (" + clientAddr + ")";
    ctx.channel = channel;

    LOG_DEBUG("[RelayServer] " << ctx.connectionId << " opened");
    LogRelayTrace(ctx.connectionId + " opened");

    std::string payload;
    std::string errorMsg;
    try {
        while (!m_stopRequested.load()) {
            if (!readFrame(*stream, payload, m_options.maxFrameBytes, errorMsg)) {
                LOG_DEBUG("[RelayServer] " << ctx.connectionId << " read ended: " << errorMsg);
                break;
            }
            if (!m_router.handleFrame(ctx, payload)) {
                break;
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[RelayServer] " << ctx.connectionId << " reader failed: " << e.what());
        LogRelayTrace(ctx.connectionId + " reader failed: " + e.what());
    }

    const std::string endpointId = ctx.endpointId;
    m_router.onDisconnect(ctx);
    channel->close();

    LOG_DEBUG("[RelayServer] " << ctx.connectionId << " closed"
              << (endpointId.empty() ? "" : " (" + endpointId + ")"));
    LogRelayTrace(ctx.connectionId + " closed");
}

//=============================================================================
// RelayServer: Socket Setup
//=============================================================================

bool RelayServer::initializeSocket() {
    m_listenSocket = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (m_listenSocket < 0) {
        LOG_ERROR("[RelayServer] socket() failed: " << std::strerror(errno));
        return false;
    }

    int reuse = 1;
    if (::setsockopt(m_listenSocket, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) != 0) {
        LOG_WARNING("[RelayServer] SO_REUSEADDR failed: " << std::strerror(errno));
    }

    sockaddr_in serverAddr{};
    serverAddr.sin_family = AF_INET;
    serverAddr.sin_port = htons(m_options.port);
    if (::inet_pton(AF_INET, m_options.bindAddress.c_str(), &serverAddr.sin_addr) != 1) {
        LOG_ERROR("[RelayServer] Invalid bind address: " << m_options.bindAddress);
        cleanupSocket();
        return false;
    }

    if (::bind(m_listenSocket, reinterpret_cast<const sockaddr*>(&serverAddr), sizeof(serverAddr)) != 0) {
        LOG_ERROR("[RelayServer] bind(" << m_options.bindAddress << ":" << m_options.port
                  << ") failed: " << std::strerror(errno));
        cleanupSocket();
        return false;
    }

    if (::listen(m_listenSocket, LISTEN_BACKLOG) != 0) {
        LOG_ERROR("[RelayServer] listen() failed: " << std::strerror(errno));
        cleanupSocket();
        return false;
    }

    sockaddr_in boundAddr{};
    socklen_t addrLen = sizeof(boundAddr);
    if (::getsockname(m_listenSocket, reinterpret_cast<sockaddr*>(&boundAddr), &addrLen) != 0) {
        LOG_ERROR("[RelayServer] getsockname() failed: " << std::strerror(errno));
        cleanupSocket();
        return false;
    }

    m_boundPort.store(ntohs(boundAddr.sin_port));
    LOG_INFO("[RelayServer] Listening on " << m_options.bindAddress << ":" << m_boundPort.load());
    return true;
}

void RelayServer::cleanupSocket() {
    if (m_listenSocket >= 0) {
        ::close(m_listenSocket);
        m_listenSocket = -1;
    }
}

}  // namespace PeerRelay
