/**
 * @file SignalingRelay.h
 * @brief Offer/answer/ICE forwarding between two named endpoints
 */

#pragma once

#include "EndpointRegistry.h"
#include "ErrorCodes.h"
#include "Message.h"
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace PeerRelay {

/**
 * @brief ICE candidate held until the answer has been forwarded
 */
struct QueuedCandidate {
    std::string fromId;
    std::string toId;
    nlohmann::json candidate;
};

/**
 * @brief State of one offer/answer exchange
 */
struct Negotiation {
    std::string id;
    std::string initiatorId;    ///< Endpoint that sent the first offer
    std::string responderId;    ///< Endpoint the first offer was addressed to
    std::string offererId;      ///< Sender of the most recent offer
    std::string answererId;     ///< Expected sender of the answer
    std::optional<nlohmann::json> lastOffer;
    std::optional<nlohmann::json> lastAnswer;
    bool answered = false;      ///< Answer for the latest offer forwarded
    std::deque<QueuedCandidate> pendingCandidates;

    bool involves(const std::string& endpointId) const {
        return initiatorId == endpointId || responderId == endpointId;
    }

    bool isPair(const std::string& a, const std::string& b) const {
        return (initiatorId == a && responderId == b) ||
               (initiatorId == b && responderId == a);
    }
};

//=============================================================================
// SignalingRelay Class
//=============================================================================

/**
 * @class SignalingRelay
 * @brief Validates and forwards session-negotiation messages
 *
 * Payloads are forwarded unmodified. ICE candidates that arrive before the
 * answer are queued and flushed, in arrival order and exactly once, right
 * after the answer is forwarded.
 *
 * Thread Safety:
 * - All methods are thread-safe
 * - Forwarding happens under the negotiation lock so an answer and its
 *   queued candidates reach the peer in order
 */
class SignalingRelay {
public:
    explicit SignalingRelay(EndpointRegistry& registry) : m_registry(registry) {}

    SignalingRelay(const SignalingRelay&) = delete;
    SignalingRelay& operator=(const SignalingRelay&) = delete;

    /**
     * @brief Store and forward an offer
     * @return false with UNKNOWN_PEER if the target is not registered,
     *         INVALID_STATE for a self-offer or a third party on an
     *         existing negotiation
     */
    bool offer(const std::string& senderId, const OfferMessage& msg, RelayError& error);

    /**
     * @brief Forward an answer and flush queued candidates
     * @return false with NO_MATCHING_OFFER, INVALID_STATE (wrong direction)
     *         or UNKNOWN_PEER
     */
    bool answer(const std::string& senderId, const AnswerMessage& msg, RelayError& error);

    /**
     * @brief Forward or queue an ICE candidate
     *
     * An empty negotiation id resolves to the single negotiation between
     * sender and target.
     */
    bool iceCandidate(const std::string& senderId, const IceCandidateMessage& msg, RelayError& error);

    /**
     * @brief Discard a negotiation and its queued candidates
     * @return true if it existed
     */
    bool closeNegotiation(const std::string& negotiationId);

    /**
     * @brief Discard every negotiation involving an endpoint
     * @return Number of negotiations removed
     */
    size_t dropEndpoint(const std::string& endpointId);

    bool hasNegotiation(const std::string& negotiationId) const;
    size_t pendingCandidateCount(const std::string& negotiationId) const;
    size_t negotiationCount() const;

private:
    /**
     * @brief Find the negotiation an ICE candidate belongs to (lock held)
     */
    Negotiation* resolveNegotiation(const std::string& senderId,
                                    const IceCandidateMessage& msg,
                                    RelayError& error);

    void flushCandidates(Negotiation& negotiation);

    EndpointRegistry& m_registry;

    mutable std::mutex m_mutex;   ///< Protects m_negotiations
    std::unordered_map<std::string, Negotiation> m_negotiations;
};

}  // namespace PeerRelay
