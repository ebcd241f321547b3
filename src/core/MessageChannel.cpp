/**
 * @file MessageChannel.cpp
 * @brief Stream-backed message channel
 */

#include "peerrelay/MessageChannel.h"
#include "peerrelay/FrameCodec.h"
#include "peerrelay/Debug.h"

namespace PeerRelay {

bool StreamMessageChannel::send(const std::string& message) {
    if (m_closed.load() || !m_stream) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);
    std::string errorMsg;
    if (!writeFrame(*m_stream, message, errorMsg)) {
        LOG_WARNING("[MessageChannel] send failed: " << errorMsg);
        // A half-written frame leaves the stream unusable.
        close();
        return false;
    }
    return true;
}

void StreamMessageChannel::close() {
    bool expected = false;
    if (m_closed.compare_exchange_strong(expected, true) && m_stream) {
        m_stream->shutdown();
    }
}

}  // namespace PeerRelay
