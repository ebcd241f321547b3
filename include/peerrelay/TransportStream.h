/**
 * @file TransportStream.h
 * @brief Minimal transport abstraction over a connected stream socket
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

namespace PeerRelay {

/**
 * @brief Minimal stream interface used by the relay framing.
 *
 * Framing requires exact-length reads and writes for the length prefix
 * and the JSON body. This interface keeps the reader loop independent of
 * the socket type so tests can run over socketpair().
 */
class TransportStream {
public:
    virtual ~TransportStream() = default;
    virtual bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg) = 0;
    virtual bool recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) = 0;

    /**
     * @brief Unblock pending reads/writes; further I/O fails
     *
     * Safe to call from any thread, any number of times.
     */
    virtual void shutdown() {}
};

/**
 * @brief TransportStream over a POSIX stream socket
 *
 * Owns the descriptor: it is closed when the stream is destroyed.
 */
class PlainSocketStream final : public TransportStream {
public:
    explicit PlainSocketStream(int socketFd) : m_socket(socketFd) {}
    ~PlainSocketStream() override;

    PlainSocketStream(const PlainSocketStream&) = delete;
    PlainSocketStream& operator=(const PlainSocketStream&) = delete;

    bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg) override;
    bool recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) override;
    void shutdown() override;

    int nativeHandle() const { return m_socket; }

private:
    int m_socket;
    std::atomic<bool> m_shutdown{false};
};

/**
 * @brief Apply SO_SNDTIMEO to a socket
 * @return true if the option was set
 */
bool setSocketSendTimeout(int socketFd, uint32_t timeoutMs);

}  // namespace PeerRelay
