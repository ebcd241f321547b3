/**
 * @file EndpointRegistry.cpp
 * @brief Endpoint registry implementation
 */

#include "peerrelay/EndpointRegistry.h"
#include "peerrelay/Debug.h"

namespace PeerRelay {

std::string endpointEventToString(EndpointEvent event) {
    switch (event) {
        case EndpointEvent::JOINED:  return "joined";
        case EndpointEvent::LEFT:    return "left";
        case EndpointEvent::UPDATED: return "updated";
        default:                     return "unknown";
    }
}

//=============================================================================
// Registration
//=============================================================================

bool EndpointRegistry::registerEndpoint(const std::string& id,
                                        std::shared_ptr<MessageChannel> channel,
                                        const Capabilities& capabilities,
                                        const std::string& deviceName,
                                        RelayError& error) {
    if (id.empty()) {
        error.set(ErrorCodes::MALFORMED_MESSAGE, "endpoint id must not be empty");
        return false;
    }
    if (!channel) {
        error.set(ErrorCodes::MALFORMED_MESSAGE, "endpoint has no channel");
        return false;
    }

    // Event mutex first: keeps joined/left for one id in causal order.
    std::lock_guard<std::mutex> eventLock(m_eventMutex);
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        if (m_endpoints.count(id) != 0) {
            error.set(ErrorCodes::DUPLICATE_IDENTITY, "Endpoint id already registered: " + id);
            return false;
        }

        Endpoint endpoint;
        endpoint.id = id;
        endpoint.deviceName = deviceName;
        endpoint.capabilities = capabilities;
        endpoint.channel = std::move(channel);
        endpoint.connectedAt = std::chrono::system_clock::now();
        endpoint.lastSeen = std::chrono::steady_clock::now();
        m_endpoints.emplace(id, std::move(endpoint));
    }

    LOG_INFO("[Registry] Endpoint joined: " << id
             << (deviceName.empty() ? "" : " (" + deviceName + ")"));
    emit(EndpointEvent::JOINED, id);
    return true;
}

bool EndpointRegistry::deregisterEndpoint(const std::string& id, const MessageChannel* expected) {
    std::lock_guard<std::mutex> eventLock(m_eventMutex);
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_endpoints.find(id);
        if (it == m_endpoints.end()) {
            return false;
        }
        if (expected != nullptr && it->second.channel.get() != expected) {
            // The id now belongs to a different connection.
            return false;
        }
        m_endpoints.erase(it);
    }

    LOG_INFO("[Registry] Endpoint left: " << id);
    emit(EndpointEvent::LEFT, id);
    return true;
}

bool EndpointRegistry::updateProfile(const std::string& id,
                                     const Capabilities& capabilities,
                                     const std::string& deviceName) {
    std::lock_guard<std::mutex> eventLock(m_eventMutex);
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_endpoints.find(id);
        if (it == m_endpoints.end()) {
            return false;
        }
        it->second.capabilities = capabilities;
        it->second.deviceName = deviceName;
        it->second.lastSeen = std::chrono::steady_clock::now();
    }

    LOG_DEBUG("[Registry] Endpoint profile updated: " << id);
    emit(EndpointEvent::UPDATED, id);
    return true;
}

//=============================================================================
// Queries
//=============================================================================

std::optional<Endpoint> EndpointRegistry::lookup(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_endpoints.find(id);
    if (it == m_endpoints.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool EndpointRegistry::isRegistered(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_endpoints.count(id) != 0;
}

std::vector<std::string> EndpointRegistry::endpointIds() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<std::string> ids;
    ids.reserve(m_endpoints.size());
    for (const auto& pair : m_endpoints) {
        ids.push_back(pair.first);
    }
    return ids;
}

std::vector<Endpoint> EndpointRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<Endpoint> out;
    out.reserve(m_endpoints.size());
    for (const auto& pair : m_endpoints) {
        out.push_back(pair.second);
    }
    return out;
}

size_t EndpointRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_endpoints.size();
}

std::vector<std::string> EndpointRegistry::staleEndpoints(uint32_t timeoutMs) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<std::string> stale;
    for (const auto& pair : m_endpoints) {
        if (pair.second.isStale(timeoutMs)) {
            stale.push_back(pair.first);
        }
    }
    return stale;
}

void EndpointRegistry::touch(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_endpoints.find(id);
    if (it != m_endpoints.end()) {
        it->second.lastSeen = std::chrono::steady_clock::now();
    }
}

//=============================================================================
// Delivery
//=============================================================================

bool EndpointRegistry::send(const std::string& id, const nlohmann::json& message) const {
    std::shared_ptr<MessageChannel> channel;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_endpoints.find(id);
        if (it == m_endpoints.end()) {
            return false;
        }
        channel = it->second.channel;
    }

    if (!channel->send(message.dump())) {
        LOG_WARNING("[Registry] Send to " << id << " failed");
        return false;
    }
    return true;
}

void EndpointRegistry::broadcast(const nlohmann::json& message, const std::string& exclude) const {
    std::vector<std::pair<std::string, std::shared_ptr<MessageChannel>>> targets;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        targets.reserve(m_endpoints.size());
        for (const auto& pair : m_endpoints) {
            if (pair.first != exclude) {
                targets.emplace_back(pair.first, pair.second.channel);
            }
        }
    }

    const std::string payload = message.dump();
    for (const auto& target : targets) {
        if (!target.second->send(payload)) {
            LOG_WARNING("[Registry] Broadcast to " << target.first << " failed");
        }
    }
}

bool EndpointRegistry::closeEndpoint(const std::string& id) {
    std::shared_ptr<MessageChannel> channel;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_endpoints.find(id);
        if (it == m_endpoints.end()) {
            return false;
        }
        channel = it->second.channel;
    }
    channel->close();
    return true;
}

//=============================================================================
// Events
//=============================================================================

void EndpointRegistry::subscribe(EndpointEventCallback callback) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    m_listeners.push_back(std::move(callback));
}

void EndpointRegistry::emit(EndpointEvent event, const std::string& id) {
    std::vector<EndpointEventCallback> listeners;
    {
        std::lock_guard<std::mutex> lock(m_listenersMutex);
        listeners = m_listeners;
    }

    for (const auto& listener : listeners) {
        try {
            listener(event, id);
        } catch (const std::exception& e) {
            LOG_ERROR("[Registry] Listener threw on " << endpointEventToString(event)
                      << " for " << id << ": " << e.what());
        }
    }
}

}  // namespace PeerRelay
