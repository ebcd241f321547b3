/**
 * @file EndpointRegistry.h
 * @brief Identity to outbound-channel map for connected clients
 */

#pragma once

#include "Endpoint.h"
#include "ErrorCodes.h"
#include "MessageChannel.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace PeerRelay {

//=============================================================================
// Events
//=============================================================================

enum class EndpointEvent : uint8_t {
    JOINED,
    LEFT,
    UPDATED   ///< Profile (device name / capabilities) changed
};

/**
 * @brief Registry event listener
 *
 * Invoked after the registry lock is released, on the thread that caused
 * the event. Listeners may call send(), broadcast() and lookup(), but must
 * not register or deregister endpoints.
 */
using EndpointEventCallback = std::function<void(EndpointEvent event,
                                                 const std::string& endpointId)>;

//=============================================================================
// EndpointRegistry Class
//=============================================================================

/**
 * @class EndpointRegistry
 * @brief Tracks connected endpoints and owns their outbound channels
 *
 * Thread Safety:
 * - All methods are thread-safe (shared_mutex; lookups take a shared lock)
 * - Channel sends happen outside the registry lock
 * - Events are delivered in order, one at a time
 */
class EndpointRegistry {
public:
    EndpointRegistry() = default;
    ~EndpointRegistry() = default;

    EndpointRegistry(const EndpointRegistry&) = delete;
    EndpointRegistry& operator=(const EndpointRegistry&) = delete;

    /**
     * @brief Register a new endpoint
     * @param id Client-supplied identity (non-empty)
     * @param channel Outbound channel for this connection
     * @param error Filled on failure
     * @return false with DUPLICATE_IDENTITY if the id is taken (the existing
     *         session is kept), MALFORMED_MESSAGE for an empty id
     */
    bool registerEndpoint(const std::string& id,
                          std::shared_ptr<MessageChannel> channel,
                          const Capabilities& capabilities,
                          const std::string& deviceName,
                          RelayError& error);

    /**
     * @brief Remove an endpoint and emit LEFT exactly once
     * @param expected If non-null, only remove the entry bound to this channel
     * @return true if an entry was removed
     *
     * Idempotent: unknown ids are ignored.
     */
    bool deregisterEndpoint(const std::string& id, const MessageChannel* expected = nullptr);

    /**
     * @brief Snapshot of one endpoint
     * @return std::nullopt if not registered
     */
    std::optional<Endpoint> lookup(const std::string& id) const;

    bool isRegistered(const std::string& id) const;

    /**
     * @brief Deliver a message to one endpoint
     * @return false on unknown id or transport failure
     */
    bool send(const std::string& id, const nlohmann::json& message) const;

    /**
     * @brief Deliver a message to every endpoint except @p exclude
     *
     * Per-recipient failures are logged and skipped.
     */
    void broadcast(const nlohmann::json& message, const std::string& exclude = {}) const;

    /**
     * @brief Refresh last-seen time
     */
    void touch(const std::string& id);

    /**
     * @brief Replace device name and capabilities, emit UPDATED
     * @return false if the id is not registered
     */
    bool updateProfile(const std::string& id,
                       const Capabilities& capabilities,
                       const std::string& deviceName);

    std::vector<std::string> endpointIds() const;
    std::vector<Endpoint> snapshot() const;
    size_t size() const;

    /**
     * @brief Ids of endpoints silent for at least @p timeoutMs
     */
    std::vector<std::string> staleEndpoints(uint32_t timeoutMs) const;

    /**
     * @brief Force the endpoint's connection closed
     *
     * The connection's reader observes the close and deregisters.
     * @return false if the id is not registered
     */
    bool closeEndpoint(const std::string& id);

    /**
     * @brief Add an event listener
     */
    void subscribe(EndpointEventCallback callback);

private:
    void emit(EndpointEvent event, const std::string& id);

    mutable std::shared_mutex m_mutex;   ///< Protects m_endpoints
    std::unordered_map<std::string, Endpoint> m_endpoints;

    std::mutex m_listenersMutex;         ///< Protects m_listeners
    std::vector<EndpointEventCallback> m_listeners;

    std::mutex m_eventMutex;             ///< Serializes event delivery
};

std::string endpointEventToString(EndpointEvent event);

}  // namespace PeerRelay
