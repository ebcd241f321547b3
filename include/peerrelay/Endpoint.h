/**
 * @file Endpoint.h
 * @brief Connected client session record
 */

#pragma once

#include "MessageChannel.h"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace PeerRelay {

/**
 * @brief Flat, informational key/value attributes advertised by a client
 */
using Capabilities = std::map<std::string, std::string>;

/**
 * @brief One connected client session, identified by a client-supplied id
 *
 * Instances returned by EndpointRegistry::lookup() are snapshots; the
 * channel pointer keeps the channel alive but the endpoint may already be
 * deregistered.
 */
struct Endpoint {
    std::string id;                                    ///< Unique while connected
    std::string deviceName;                            ///< Cosmetic label
    Capabilities capabilities;                         ///< Informational only
    std::shared_ptr<MessageChannel> channel;           ///< Outbound messages
    std::chrono::system_clock::time_point connectedAt; ///< Registration time
    std::chrono::steady_clock::time_point lastSeen;    ///< Last inbound message

    /**
     * @brief Check if this endpoint has been silent for too long
     * @param timeoutMs Timeout in milliseconds
     */
    bool isStale(uint32_t timeoutMs) const {
        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastSeen);
        return elapsed.count() >= static_cast<int64_t>(timeoutMs);
    }
};

/**
 * @brief Public view used in `peers` broadcasts
 */
inline nlohmann::json toJson(const Endpoint& endpoint) {
    return nlohmann::json{
        {"id", endpoint.id},
        {"device_name", endpoint.deviceName},
        {"capabilities", endpoint.capabilities}
    };
}

}  // namespace PeerRelay
