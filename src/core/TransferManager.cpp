/**
 * @file TransferManager.cpp
 * @brief Transfer state machine implementation
 */

#include "peerrelay/TransferManager.h"
#include "peerrelay/Debug.h"
#include "peerrelay/Message.h"
#include "peerrelay/UuidGenerator.h"

#include <chrono>
#include <mutex>

namespace PeerRelay {

//=============================================================================
// Lifecycle
//=============================================================================

bool TransferManager::startTransfer(const std::string& senderId,
                                    const std::string& receiverId,
                                    const FileDescriptor& fileInfo,
                                    std::optional<TransferMethod> preferredMethod,
                                    std::string& transferId,
                                    RelayError& error) {
    if (senderId == receiverId) {
        error.set(ErrorCodes::INVALID_STATE, "Cannot send a file to yourself");
        return false;
    }
    if (!m_registry.isRegistered(receiverId)) {
        error.set(ErrorCodes::UNKNOWN_PEER, "Receiver not connected: " + receiverId);
        return false;
    }

    Transfer transfer;
    transfer.id = UuidGenerator::generateWithPrefix("xfer_");
    if (transfer.id.empty()) {
        error.set(ErrorCodes::INVALID_STATE, "Failed to generate transfer id");
        LOG_ERROR("[Transfers] RAND_bytes failed while generating a transfer id");
        return false;
    }
    transfer.senderId = senderId;
    transfer.receiverId = receiverId;
    transfer.fileInfo = fileInfo;
    transfer.method = preferredMethod.value_or(TransferMethod::RELAYED);
    transfer.status = TransferStatus::PENDING;
    transfer.createdAt = std::chrono::system_clock::now();

    const nlohmann::json incoming = makeIncomingTransfer(transfer);
    const nlohmann::json started = makeTransferStarted(transfer);
    const std::string id = transfer.id;

    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_transfers.emplace(id, std::move(transfer));
    }

    if (!m_registry.send(receiverId, incoming)) {
        {
            std::unique_lock<std::shared_mutex> lock(m_mutex);
            m_transfers.erase(id);
        }
        error.set(ErrorCodes::UNKNOWN_PEER, "Receiver not reachable: " + receiverId);
        return false;
    }

    if (!m_registry.send(senderId, started)) {
        LOG_WARNING("[Transfers] transfer_started for " << id << " not delivered to " << senderId);
    }

    LOG_INFO("[Transfers] " << id << " pending: " << senderId << " -> " << receiverId
             << " '" << fileInfo.name << "' (" << fileInfo.size << " bytes, "
             << transferMethodToString(preferredMethod.value_or(TransferMethod::RELAYED)) << ")");

    transferId = id;
    return true;
}

bool TransferManager::respond(const std::string& receiverId,
                              const std::string& transferId,
                              bool accepted,
                              const std::string& reason,
                              RelayError& error) {
    Outbox outbox;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_transfers.find(transferId);
        if (it == m_transfers.end()) {
            error.set(ErrorCodes::UNKNOWN_TRANSFER, "Unknown transfer: " + transferId);
            return false;
        }

        Transfer& transfer = it->second;
        if (transfer.receiverId != receiverId) {
            error.set(ErrorCodes::INVALID_STATE, "Only the receiver may respond to " + transferId);
            return false;
        }
        if (transfer.status != TransferStatus::PENDING) {
            error.set(ErrorCodes::INVALID_STATE,
                      "Transfer " + transferId + " is " + transferStatusToString(transfer.status));
            return false;
        }

        if (accepted) {
            outbox.emplace_back(transfer.senderId, makeTransferAccepted(transfer));
            // Acceptance starts a direct transfer.
            if (transfer.method == TransferMethod::DIRECT) {
                activateLocked(transfer, outbox);
            }
        } else {
            terminateLocked(transfer, TerminationReason::REJECTED, receiverId, reason, outbox);
        }
    }

    LOG_INFO("[Transfers] " << transferId << (accepted ? " accepted" : " rejected")
             << " by " << receiverId);
    deliver(outbox);
    return true;
}

bool TransferManager::begin(const std::string& transferId, RelayError& error) {
    Outbox outbox;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_transfers.find(transferId);
        if (it == m_transfers.end()) {
            error.set(ErrorCodes::UNKNOWN_TRANSFER, "Unknown transfer: " + transferId);
            return false;
        }

        Transfer& transfer = it->second;
        if (isTerminal(transfer.status)) {
            error.set(ErrorCodes::INVALID_STATE,
                      "Transfer " + transferId + " is " + transferStatusToString(transfer.status));
            return false;
        }
        if (transfer.status == TransferStatus::PENDING) {
            activateLocked(transfer, outbox);
        }
    }

    deliver(outbox);
    return true;
}

void TransferManager::reportProgress(const std::string& reporterId,
                                     const std::string& transferId,
                                     std::optional<TransferRole> role,
                                     double progress,
                                     std::optional<uint64_t> chunkCount) {
    Outbox outbox;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_transfers.find(transferId);
        if (it == m_transfers.end()) {
            LOG_DEBUG("[Transfers] Progress for unknown transfer " << transferId << " ignored");
            return;
        }

        Transfer& transfer = it->second;
        if (isTerminal(transfer.status)) {
            LOG_DEBUG("[Transfers] Progress for " << transferStatusToString(transfer.status)
                      << " transfer " << transferId << " ignored");
            return;
        }

        TransferRole reporterRole;
        if (reporterId == transfer.senderId) {
            reporterRole = TransferRole::SENDER;
        } else if (reporterId == transfer.receiverId) {
            reporterRole = TransferRole::RECEIVER;
        } else {
            LOG_WARNING("[Transfers] Progress for " << transferId << " from non-participant "
                        << reporterId << " ignored");
            return;
        }
        if (role && *role != reporterRole) {
            LOG_WARNING("[Transfers] " << reporterId << " reported progress as "
                        << transferRoleToString(*role) << " on " << transferId << "; ignored");
            return;
        }

        const double clamped = clampProgress(progress);

        if (reporterRole == TransferRole::SENDER) {
            if (transfer.status == TransferStatus::PENDING && transfer.method == TransferMethod::DIRECT) {
                activateLocked(transfer, outbox);
            }
            transfer.senderProgress = clamped;
            if (chunkCount) {
                transfer.senderChunks = *chunkCount;
            }
        } else {
            transfer.receiverProgress = clamped;
            if (chunkCount) {
                transfer.receiverChunks = *chunkCount;
            }
        }

        const uint64_t chunks = reporterRole == TransferRole::SENDER
            ? transfer.senderChunks
            : transfer.receiverChunks;
        outbox.emplace_back(transfer.peerOf(reporterId),
                            makeTransferProgress(transfer, reporterRole, clamped, chunks));
    }

    deliver(outbox);
}

bool TransferManager::complete(const std::string& transferId,
                               RelayError& error,
                               const std::string& requesterId) {
    Outbox outbox;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_transfers.find(transferId);
        if (it == m_transfers.end() ||
            (!requesterId.empty() && !it->second.involves(requesterId))) {
            error.set(ErrorCodes::UNKNOWN_TRANSFER, "Unknown transfer: " + transferId);
            return false;
        }

        Transfer& transfer = it->second;
        if (transfer.status == TransferStatus::COMPLETED) {
            return true;
        }
        if (transfer.status != TransferStatus::ACTIVE) {
            error.set(ErrorCodes::INVALID_STATE,
                      "Cannot complete " + transferStatusToString(transfer.status) +
                      " transfer " + transferId);
            return false;
        }

        transfer.status = TransferStatus::COMPLETED;
        transfer.finishedAt = std::chrono::steady_clock::now();

        const nlohmann::json completed = makeTransferCompleted(transfer);
        outbox.emplace_back(transfer.senderId, completed);
        outbox.emplace_back(transfer.receiverId, completed);
    }

    LOG_INFO("[Transfers] " << transferId << " completed");
    deliver(outbox);
    return true;
}

bool TransferManager::failOrCancel(const std::string& transferId,
                                   TerminationReason reason,
                                   const std::string& initiatorId,
                                   RelayError& error,
                                   const std::string& detail) {
    Outbox outbox;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_transfers.find(transferId);
        if (it == m_transfers.end()) {
            error.set(ErrorCodes::UNKNOWN_TRANSFER, "Unknown transfer: " + transferId);
            return false;
        }

        Transfer& transfer = it->second;
        if (reason != TerminationReason::PEER_DISCONNECTED && !transfer.involves(initiatorId)) {
            error.set(ErrorCodes::UNKNOWN_TRANSFER, "Unknown transfer: " + transferId);
            return false;
        }
        if (isTerminal(transfer.status)) {
            return true;
        }

        terminateLocked(transfer, reason, initiatorId, detail, outbox);
    }

    deliver(outbox);
    return true;
}

bool TransferManager::downgradeMethod(const std::string& transferId,
                                      const std::string& reason,
                                      RelayError& error,
                                      const std::string& requesterId) {
    Outbox outbox;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_transfers.find(transferId);
        if (it == m_transfers.end() ||
            (!requesterId.empty() && !it->second.involves(requesterId))) {
            error.set(ErrorCodes::UNKNOWN_TRANSFER, "Unknown transfer: " + transferId);
            return false;
        }

        Transfer& transfer = it->second;
        if (isTerminal(transfer.status)) {
            error.set(ErrorCodes::INVALID_STATE,
                      "Transfer " + transferId + " is " + transferStatusToString(transfer.status));
            return false;
        }
        if (transfer.method != TransferMethod::DIRECT) {
            error.set(ErrorCodes::INVALID_STATE, "Transfer " + transferId + " is already relayed");
            return false;
        }

        transfer.method = TransferMethod::RELAYED;

        const nlohmann::json changed = makeTransferMethodChanged(transfer, reason);
        outbox.emplace_back(transfer.senderId, changed);
        outbox.emplace_back(transfer.receiverId, changed);
    }

    LOG_INFO("[Transfers] " << transferId << " downgraded to relayed"
             << (reason.empty() ? "" : ": " + reason));
    deliver(outbox);
    return true;
}

//=============================================================================
// Relayed Chunk Bookkeeping
//=============================================================================

ChunkAdmission TransferManager::admitChunk(const std::string& senderId,
                                           const std::string& transferId,
                                           uint64_t chunkIndex,
                                           uint64_t totalChunks,
                                           Transfer& snapshot,
                                           RelayError& error) {
    Outbox outbox;
    ChunkAdmission result = ChunkAdmission::ACCEPTED;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_transfers.find(transferId);
        if (it == m_transfers.end()) {
            error.set(ErrorCodes::UNKNOWN_TRANSFER, "Unknown transfer: " + transferId);
            return ChunkAdmission::REJECTED;
        }

        Transfer& transfer = it->second;
        if (transfer.senderId != senderId) {
            error.set(ErrorCodes::INVALID_STATE, "Only the sender may send chunks for " + transferId);
            return ChunkAdmission::REJECTED;
        }
        if (transfer.method != TransferMethod::RELAYED) {
            error.set(ErrorCodes::INVALID_STATE, "Transfer " + transferId + " is not relayed");
            return ChunkAdmission::REJECTED;
        }
        if (isTerminal(transfer.status)) {
            error.set(ErrorCodes::INVALID_STATE,
                      "Transfer " + transferId + " is " + transferStatusToString(transfer.status));
            return ChunkAdmission::REJECTED;
        }

        if (transfer.fileInfo.totalChunks == 0) {
            if (totalChunks == 0) {
                error.set(ErrorCodes::INVALID_STATE, "total_chunks must be positive");
                return ChunkAdmission::REJECTED;
            }
            transfer.fileInfo.totalChunks = totalChunks;
        } else if (totalChunks != transfer.fileInfo.totalChunks) {
            error.set(ErrorCodes::INVALID_STATE,
                      "total_chunks " + std::to_string(totalChunks) + " does not match declared " +
                      std::to_string(transfer.fileInfo.totalChunks));
            return ChunkAdmission::REJECTED;
        }
        if (chunkIndex >= transfer.fileInfo.totalChunks) {
            error.set(ErrorCodes::INVALID_STATE,
                      "chunk_index " + std::to_string(chunkIndex) + " out of range");
            return ChunkAdmission::REJECTED;
        }

        if (transfer.status == TransferStatus::PENDING) {
            activateLocked(transfer, outbox);
        }

        if (transfer.sentChunkIndices.insert(chunkIndex).second) {
            ++transfer.chunksSent;
        } else {
            ++transfer.duplicateChunks;
            result = ChunkAdmission::DUPLICATE;
        }
        snapshot = transfer;
    }

    deliver(outbox);
    return result;
}

void TransferManager::rollbackChunkSent(const std::string& transferId, uint64_t chunkIndex) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_transfers.find(transferId);
    if (it == m_transfers.end()) {
        return;
    }

    Transfer& transfer = it->second;
    if (transfer.ackedChunkIndices.count(chunkIndex) != 0) {
        return;
    }
    if (transfer.sentChunkIndices.erase(chunkIndex) != 0 && transfer.chunksSent > 0) {
        --transfer.chunksSent;
    }
}

bool TransferManager::recordAck(const std::string& receiverId,
                                const std::string& transferId,
                                uint64_t chunkIndex,
                                bool& duplicate,
                                Transfer& snapshot,
                                RelayError& error) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_transfers.find(transferId);
    if (it == m_transfers.end()) {
        error.set(ErrorCodes::UNKNOWN_TRANSFER, "Unknown transfer: " + transferId);
        return false;
    }

    Transfer& transfer = it->second;
    if (transfer.receiverId != receiverId) {
        error.set(ErrorCodes::INVALID_STATE, "Only the receiver may acknowledge chunks of " + transferId);
        return false;
    }
    if (transfer.method != TransferMethod::RELAYED || transfer.status != TransferStatus::ACTIVE) {
        error.set(ErrorCodes::INVALID_STATE,
                  "Transfer " + transferId + " is not an active relayed transfer");
        return false;
    }
    if (transfer.sentChunkIndices.count(chunkIndex) == 0) {
        error.set(ErrorCodes::INVALID_STATE,
                  "chunk_index " + std::to_string(chunkIndex) + " was never forwarded");
        return false;
    }

    duplicate = !transfer.ackedChunkIndices.insert(chunkIndex).second;
    if (!duplicate) {
        ++transfer.chunksAcknowledged;
    }
    snapshot = transfer;
    return true;
}

//=============================================================================
// Queries / Maintenance
//=============================================================================

std::optional<Transfer> TransferManager::getTransfer(const std::string& transferId) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_transfers.find(transferId);
    if (it == m_transfers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Transfer> TransferManager::transfersFor(const std::string& endpointId) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<Transfer> out;
    for (const auto& pair : m_transfers) {
        if (pair.second.involves(endpointId)) {
            out.push_back(pair.second);
        }
    }
    return out;
}

size_t TransferManager::abortTransfersFor(const std::string& endpointId) {
    Outbox outbox;
    size_t aborted = 0;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        for (auto& pair : m_transfers) {
            Transfer& transfer = pair.second;
            if (!transfer.involves(endpointId) || isTerminal(transfer.status)) {
                continue;
            }
            terminateLocked(transfer, TerminationReason::PEER_DISCONNECTED, endpointId, {}, outbox);
            ++aborted;
        }
    }

    deliver(outbox);
    return aborted;
}

size_t TransferManager::collectGarbage(uint32_t retentionMs) {
    const auto now = std::chrono::steady_clock::now();
    const auto retention = std::chrono::milliseconds(retentionMs);

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    size_t removed = 0;
    for (auto it = m_transfers.begin(); it != m_transfers.end();) {
        if (isTerminal(it->second.status) && now - it->second.finishedAt >= retention) {
            it = m_transfers.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t TransferManager::activeCount() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    size_t count = 0;
    for (const auto& pair : m_transfers) {
        if (!isTerminal(pair.second.status)) {
            ++count;
        }
    }
    return count;
}

size_t TransferManager::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_transfers.size();
}

//=============================================================================
// Private Helpers
//=============================================================================

void TransferManager::activateLocked(Transfer& transfer, Outbox& outbox) {
    transfer.status = TransferStatus::ACTIVE;

    const nlohmann::json active = makeTransferActive(transfer);
    outbox.emplace_back(transfer.senderId, active);
    outbox.emplace_back(transfer.receiverId, active);

    LOG_INFO("[Transfers] " << transfer.id << " active ("
             << transferMethodToString(transfer.method) << ")");
}

void TransferManager::terminateLocked(Transfer& transfer,
                                      TerminationReason reason,
                                      const std::string& initiatorId,
                                      const std::string& detail,
                                      Outbox& outbox) {
    if (transfer.status == TransferStatus::ACTIVE && reason == TerminationReason::PEER_DISCONNECTED) {
        transfer.status = TransferStatus::FAILED;
    } else {
        transfer.status = TransferStatus::CANCELLED;
    }
    transfer.failureReason = terminationReasonToString(reason);
    if (!detail.empty()) {
        transfer.failureReason += ": " + detail;
    }
    transfer.finishedAt = std::chrono::steady_clock::now();

    const nlohmann::json notice = reason == TerminationReason::REJECTED
        ? makeTransferRejected(transfer)
        : makeTransferTerminated(transfer);

    for (const std::string* participant : {&transfer.senderId, &transfer.receiverId}) {
        if (*participant != initiatorId) {
            outbox.emplace_back(*participant, notice);
        }
    }

    LOG_INFO("[Transfers] " << transfer.id << " " << transferStatusToString(transfer.status)
             << " (" << transfer.failureReason << ")");
}

void TransferManager::deliver(const Outbox& outbox) const {
    for (const auto& item : outbox) {
        if (!m_registry.isRegistered(item.first)) {
            continue;
        }
        if (!m_registry.send(item.first, item.second)) {
            LOG_DEBUG("[Transfers] " << item.second.value("type", "") << " to "
                      << item.first << " not delivered");
        }
    }
}

}  // namespace PeerRelay
