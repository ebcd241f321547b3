/**
 * @file SignalingRelay.cpp
 * @brief Signaling relay implementation
 */

#include "peerrelay/SignalingRelay.h"
#include "peerrelay/Debug.h"

namespace PeerRelay {

//=============================================================================
// Offer / Answer
//=============================================================================

bool SignalingRelay::offer(const std::string& senderId, const OfferMessage& msg, RelayError& error) {
    if (msg.targetId == senderId) {
        error.set(ErrorCodes::INVALID_STATE, "Cannot send an offer to yourself");
        return false;
    }
    if (!m_registry.isRegistered(msg.targetId)) {
        error.set(ErrorCodes::UNKNOWN_PEER, "Target not connected: " + msg.targetId);
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_negotiations.find(msg.negotiationId);
    const bool isNew = (it == m_negotiations.end());
    if (!isNew && !it->second.isPair(senderId, msg.targetId)) {
        error.set(ErrorCodes::INVALID_STATE,
                  "Negotiation " + msg.negotiationId + " belongs to other endpoints");
        return false;
    }

    if (!m_registry.send(msg.targetId,
                         makeOfferForward(msg.negotiationId, senderId, msg.offerPayload, msg.fileInfo))) {
        error.set(ErrorCodes::UNKNOWN_PEER, "Target not reachable: " + msg.targetId);
        return false;
    }

    if (isNew) {
        Negotiation negotiation;
        negotiation.id = msg.negotiationId;
        negotiation.initiatorId = senderId;
        negotiation.responderId = msg.targetId;
        it = m_negotiations.emplace(msg.negotiationId, std::move(negotiation)).first;
    }

    Negotiation& negotiation = it->second;
    negotiation.offererId = senderId;
    negotiation.answererId = msg.targetId;
    negotiation.lastOffer = msg.offerPayload;
    negotiation.answered = false;

    LOG_DEBUG("[Signaling] " << (isNew ? "Offer " : "Re-offer ") << msg.negotiationId
              << ": " << senderId << " -> " << msg.targetId);
    return true;
}

bool SignalingRelay::answer(const std::string& senderId, const AnswerMessage& msg, RelayError& error) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_negotiations.find(msg.negotiationId);
    if (it == m_negotiations.end() || !it->second.lastOffer) {
        error.set(ErrorCodes::NO_MATCHING_OFFER, "No offer on record for " + msg.negotiationId);
        return false;
    }

    Negotiation& negotiation = it->second;
    if (negotiation.answererId != senderId || negotiation.offererId != msg.targetId) {
        error.set(ErrorCodes::INVALID_STATE,
                  "Answer for " + msg.negotiationId + " must go from " +
                  negotiation.answererId + " to " + negotiation.offererId);
        return false;
    }

    if (!m_registry.send(msg.targetId,
                         makeAnswerForward(msg.negotiationId, senderId, msg.answerPayload))) {
        error.set(ErrorCodes::UNKNOWN_PEER, "Target not reachable: " + msg.targetId);
        return false;
    }

    negotiation.lastAnswer = msg.answerPayload;
    negotiation.answered = true;

    LOG_DEBUG("[Signaling] Answer " << msg.negotiationId << ": " << senderId
              << " -> " << msg.targetId << " (" << negotiation.pendingCandidates.size()
              << " queued candidates)");

    flushCandidates(negotiation);
    return true;
}

void SignalingRelay::flushCandidates(Negotiation& negotiation) {
    while (!negotiation.pendingCandidates.empty()) {
        QueuedCandidate queued = std::move(negotiation.pendingCandidates.front());
        negotiation.pendingCandidates.pop_front();

        if (!m_registry.send(queued.toId,
                             makeIceCandidateForward(negotiation.id, queued.fromId, queued.candidate))) {
            LOG_WARNING("[Signaling] Dropped queued candidate for " << queued.toId
                        << " on " << negotiation.id << ": target not reachable");
        }
    }
}

//=============================================================================
// ICE
//=============================================================================

Negotiation* SignalingRelay::resolveNegotiation(const std::string& senderId,
                                                const IceCandidateMessage& msg,
                                                RelayError& error) {
    if (!msg.negotiationId.empty()) {
        auto it = m_negotiations.find(msg.negotiationId);
        if (it == m_negotiations.end() || !it->second.lastOffer) {
            error.set(ErrorCodes::NO_MATCHING_OFFER, "No offer on record for " + msg.negotiationId);
            return nullptr;
        }
        return &it->second;
    }

    Negotiation* match = nullptr;
    for (auto& pair : m_negotiations) {
        if (!pair.second.isPair(senderId, msg.targetId)) {
            continue;
        }
        if (match != nullptr) {
            error.set(ErrorCodes::INVALID_STATE,
                      "Several negotiations with " + msg.targetId + "; negotiation_id required");
            return nullptr;
        }
        match = &pair.second;
    }

    if (match == nullptr || !match->lastOffer) {
        error.set(ErrorCodes::NO_MATCHING_OFFER, "No offer on record with " + msg.targetId);
        return nullptr;
    }
    return match;
}

bool SignalingRelay::iceCandidate(const std::string& senderId,
                                  const IceCandidateMessage& msg,
                                  RelayError& error) {
    std::lock_guard<std::mutex> lock(m_mutex);

    Negotiation* negotiation = resolveNegotiation(senderId, msg, error);
    if (negotiation == nullptr) {
        return false;
    }

    if (!negotiation->isPair(senderId, msg.targetId)) {
        error.set(ErrorCodes::INVALID_STATE,
                  "Negotiation " + negotiation->id + " belongs to other endpoints");
        return false;
    }

    if (!negotiation->answered) {
        negotiation->pendingCandidates.push_back(QueuedCandidate{senderId, msg.targetId, msg.candidate});
        LOG_DEBUG("[Signaling] Queued candidate on " << negotiation->id << " ("
                  << negotiation->pendingCandidates.size() << " pending)");
        return true;
    }

    if (!m_registry.send(msg.targetId,
                         makeIceCandidateForward(negotiation->id, senderId, msg.candidate))) {
        error.set(ErrorCodes::UNKNOWN_PEER, "Target not reachable: " + msg.targetId);
        return false;
    }
    return true;
}

//=============================================================================
// Teardown / Queries
//=============================================================================

bool SignalingRelay::closeNegotiation(const std::string& negotiationId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_negotiations.erase(negotiationId) != 0;
}

size_t SignalingRelay::dropEndpoint(const std::string& endpointId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t removed = 0;
    for (auto it = m_negotiations.begin(); it != m_negotiations.end();) {
        if (it->second.involves(endpointId)) {
            it = m_negotiations.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        LOG_DEBUG("[Signaling] Dropped " << removed << " negotiation(s) of " << endpointId);
    }
    return removed;
}

bool SignalingRelay::hasNegotiation(const std::string& negotiationId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_negotiations.count(negotiationId) != 0;
}

size_t SignalingRelay::pendingCandidateCount(const std::string& negotiationId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_negotiations.find(negotiationId);
    return it == m_negotiations.end() ? 0 : it->second.pendingCandidates.size();
}

size_t SignalingRelay::negotiationCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_negotiations.size();
}

}  // namespace PeerRelay
