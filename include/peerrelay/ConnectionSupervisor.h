/**
 * @file ConnectionSupervisor.h
 * @brief Reacts to endpoints joining and leaving
 */

#pragma once

#include "EndpointRegistry.h"
#include "SignalingRelay.h"
#include "TransferManager.h"
#include <atomic>
#include <string>

namespace PeerRelay {

/**
 * @class ConnectionSupervisor
 * @brief Cleans up after disconnected endpoints
 *
 * On LEFT every live transfer of the endpoint is terminated (the other
 * party is notified once) and its negotiations are dropped. Every
 * membership change broadcasts the current `peers` list.
 */
class ConnectionSupervisor {
public:
    ConnectionSupervisor(EndpointRegistry& registry,
                         SignalingRelay& signaling,
                         TransferManager& transfers)
        : m_registry(registry), m_signaling(signaling), m_transfers(transfers) {}

    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    /**
     * @brief Subscribe to registry events
     *
     * Call once, before the server accepts connections. The supervisor must
     * outlive the registry's event delivery.
     */
    void attach();

    /**
     * @brief Handle one registry event
     */
    void onEndpointEvent(EndpointEvent event, const std::string& endpointId);

    /**
     * @brief Broadcast the current endpoint list
     * @param exclude Endpoint to skip (empty = everyone)
     */
    void broadcastPeers(const std::string& exclude = {});

private:
    EndpointRegistry& m_registry;
    SignalingRelay& m_signaling;
    TransferManager& m_transfers;
    std::atomic<bool> m_attached{false};
};

}  // namespace PeerRelay
