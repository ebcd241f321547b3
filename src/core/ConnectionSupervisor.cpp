/**
 * @file ConnectionSupervisor.cpp
 * @brief Disconnect handling and peer-list broadcasts
 */

#include "peerrelay/ConnectionSupervisor.h"
#include "peerrelay/Debug.h"
#include "peerrelay/Message.h"
#include "peerrelay/ThreadSafeLog.h"

namespace PeerRelay {

void ConnectionSupervisor::attach() {
    bool expected = false;
    if (!m_attached.compare_exchange_strong(expected, true)) {
        return;
    }
    m_registry.subscribe([this](EndpointEvent event, const std::string& endpointId) {
        onEndpointEvent(event, endpointId);
    });
}

void ConnectionSupervisor::onEndpointEvent(EndpointEvent event, const std::string& endpointId) {
    if (event == EndpointEvent::LEFT) {
        const size_t aborted = m_transfers.abortTransfersFor(endpointId);
        const size_t dropped = m_signaling.dropEndpoint(endpointId);
        if (aborted > 0 || dropped > 0) {
            LOG_INFO("[Supervisor] " << endpointId << " left: " << aborted
                     << " transfer(s) aborted, " << dropped << " negotiation(s) dropped");
        }
        ThreadSafeLog::log("endpoint left: " + endpointId +
                           " transfers_aborted=" + std::to_string(aborted));
    } else if (event == EndpointEvent::JOINED) {
        ThreadSafeLog::log("endpoint joined: " + endpointId);
        // The joiner gets the list right after its `registered` reply.
        broadcastPeers(endpointId);
        return;
    }

    broadcastPeers();
}

void ConnectionSupervisor::broadcastPeers(const std::string& exclude) {
    m_registry.broadcast(makePeers(m_registry.snapshot()), exclude);
}

}  // namespace PeerRelay
