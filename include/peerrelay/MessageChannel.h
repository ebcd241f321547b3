/**
 * @file MessageChannel.h
 * @brief Outbound message channel owned by the endpoint registry
 */

#pragma once

#include "TransportStream.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace PeerRelay {

/**
 * @brief Push-side of one client connection
 *
 * The registry is the only component that holds channels of registered
 * endpoints. Implementations must be safe to call from several threads.
 */
class MessageChannel {
public:
    virtual ~MessageChannel() = default;

    /**
     * @brief Deliver one serialized JSON message
     * @return false if the transport failed or the channel is closed
     */
    virtual bool send(const std::string& message) = 0;

    /**
     * @brief Force the underlying connection closed
     *
     * The owning reader thread observes the close and deregisters.
     */
    virtual void close() = 0;
};

/**
 * @brief MessageChannel writing length-prefixed frames to a TransportStream
 */
class StreamMessageChannel final : public MessageChannel {
public:
    explicit StreamMessageChannel(std::shared_ptr<TransportStream> stream)
        : m_stream(std::move(stream)) {}

    bool send(const std::string& message) override;
    void close() override;

    bool isClosed() const { return m_closed.load(); }

private:
    std::shared_ptr<TransportStream> m_stream;
    std::mutex m_writeMutex;   ///< One frame at a time on the wire
    std::atomic<bool> m_closed{false};
};

}  // namespace PeerRelay
