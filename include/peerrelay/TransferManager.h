/**
 * @file TransferManager.h
 * @brief Transfer lifecycle state machine
 */

#pragma once

#include "EndpointRegistry.h"
#include "ErrorCodes.h"
#include "Transfer.h"
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace PeerRelay {

/**
 * @brief Result of submitting one relayed chunk
 */
enum class ChunkAdmission : uint8_t {
    ACCEPTED,   ///< New index, already counted as sent; forward it
    DUPLICATE,  ///< Index already forwarded; counted, not forwarded
    REJECTED    ///< Error filled
};

//=============================================================================
// TransferManager Class
//=============================================================================

/**
 * @class TransferManager
 * @brief Owns every transfer record and drives its status transitions
 *
 * State Machine:
 * @verbatim
 *   PENDING --begin--> ACTIVE --complete--> COMPLETED
 *      |                 |
 *      |                 +--disconnect--> FAILED
 *      +--cancel/reject--+--cancel/reject--> CANCELLED
 * @endverbatim
 *
 * Thread Safety:
 * - All methods are thread-safe (shared_mutex over the transfer map)
 * - Notifications are built under the lock and sent after it is released
 */
class TransferManager {
public:
    explicit TransferManager(EndpointRegistry& registry) : m_registry(registry) {}

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    //=========================================================================
    // Lifecycle
    //=========================================================================

    /**
     * @brief Create a pending transfer and announce it to both peers
     * @param preferredMethod Defaults to RELAYED when not given
     * @param transferId Receives the new id on success
     * @return false with UNKNOWN_PEER (no record kept) if the receiver is
     *         not registered, INVALID_STATE when sending to oneself
     */
    bool startTransfer(const std::string& senderId,
                       const std::string& receiverId,
                       const FileDescriptor& fileInfo,
                       std::optional<TransferMethod> preferredMethod,
                       std::string& transferId,
                       RelayError& error);

    /**
     * @brief Receiver's accept/reject decision on a pending transfer
     *
     * Accepting notifies the sender and begins a direct transfer; a relayed
     * transfer stays pending until its first chunk. Rejecting cancels it.
     */
    bool respond(const std::string& receiverId,
                 const std::string& transferId,
                 bool accepted,
                 const std::string& reason,
                 RelayError& error);

    /**
     * @brief PENDING -> ACTIVE, notifying both peers
     *
     * Idempotent once active; INVALID_STATE on a terminal transfer.
     */
    bool begin(const std::string& transferId, RelayError& error);

    /**
     * @brief Record one role's client-reported progress
     *
     * Progress is clamped to [0, 100] and mirrored to the other peer.
     * Unknown or terminal transfers and reports from the wrong party are
     * logged and ignored. The sender's first report on a DIRECT transfer
     * triggers begin().
     */
    void reportProgress(const std::string& reporterId,
                        const std::string& transferId,
                        std::optional<TransferRole> role,
                        double progress,
                        std::optional<uint64_t> chunkCount);

    /**
     * @brief ACTIVE -> COMPLETED, notifying both peers
     * @param requesterId If non-empty, must be a participant
     *
     * Idempotent on an already completed transfer.
     */
    bool complete(const std::string& transferId,
                  RelayError& error,
                  const std::string& requesterId = {});

    /**
     * @brief Force a non-terminal transfer into CANCELLED or FAILED
     * @param initiatorId Participant that caused it; not notified
     *
     * PENDING always ends CANCELLED. ACTIVE ends CANCELLED for a client
     * cancel or rejection and FAILED on disconnect. No-op on terminal
     * transfers.
     */
    bool failOrCancel(const std::string& transferId,
                      TerminationReason reason,
                      const std::string& initiatorId,
                      RelayError& error,
                      const std::string& detail = {});

    /**
     * @brief DIRECT -> RELAYED after a client-reported P2P failure
     * @return false with INVALID_STATE if already relayed or terminal
     */
    bool downgradeMethod(const std::string& transferId,
                         const std::string& reason,
                         RelayError& error,
                         const std::string& requesterId = {});

    //=========================================================================
    // Relayed Chunk Bookkeeping
    //=========================================================================

    /**
     * @brief Validate a relayed chunk before forwarding
     * @param snapshot Receives the transfer state after admission
     *
     * Begins a pending transfer. A zero descriptor total adopts
     * @p totalChunks. A new index is marked sent before it is forwarded.
     */
    ChunkAdmission admitChunk(const std::string& senderId,
                              const std::string& transferId,
                              uint64_t chunkIndex,
                              uint64_t totalChunks,
                              Transfer& snapshot,
                              RelayError& error);

    /**
     * @brief Undo the sent mark of a chunk the receiver never got
     *
     * No-op once the receiver acknowledged the index.
     */
    void rollbackChunkSent(const std::string& transferId, uint64_t chunkIndex);

    /**
     * @brief Record the receiver's acknowledgment of a forwarded chunk
     * @param duplicate Set when the index was already acknowledged
     */
    bool recordAck(const std::string& receiverId,
                   const std::string& transferId,
                   uint64_t chunkIndex,
                   bool& duplicate,
                   Transfer& snapshot,
                   RelayError& error);

    //=========================================================================
    // Queries / Maintenance
    //=========================================================================

    std::optional<Transfer> getTransfer(const std::string& transferId) const;
    std::vector<Transfer> transfersFor(const std::string& endpointId) const;

    /**
     * @brief failOrCancel(PEER_DISCONNECTED) every live transfer of an endpoint
     * @return Number of transfers terminated
     */
    size_t abortTransfersFor(const std::string& endpointId);

    /**
     * @brief Drop terminal transfers finished more than @p retentionMs ago
     * @return Number of records removed
     */
    size_t collectGarbage(uint32_t retentionMs);

    /**
     * @brief Number of non-terminal transfers
     */
    size_t activeCount() const;
    size_t size() const;

private:
    using Outbox = std::vector<std::pair<std::string, nlohmann::json>>;

    /**
     * @brief Transition to ACTIVE and queue notifications (lock held)
     */
    void activateLocked(Transfer& transfer, Outbox& outbox);

    /**
     * @brief Transition to a terminal status and queue notifications (lock held)
     */
    void terminateLocked(Transfer& transfer,
                         TerminationReason reason,
                         const std::string& initiatorId,
                         const std::string& detail,
                         Outbox& outbox);

    void deliver(const Outbox& outbox) const;

    EndpointRegistry& m_registry;

    mutable std::shared_mutex m_mutex;   ///< Protects m_transfers
    std::unordered_map<std::string, Transfer> m_transfers;
};

}  // namespace PeerRelay
