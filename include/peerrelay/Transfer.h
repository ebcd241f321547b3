/**
 * @file Transfer.h
 * @brief Transfer record, file descriptor and state enums
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <nlohmann/json.hpp>

namespace PeerRelay {

//=============================================================================
// Enums
//=============================================================================

/**
 * @brief How file bytes move between the two peers
 */
enum class TransferMethod : uint8_t {
    DIRECT,   ///< WebRTC data channel; relay carries signaling only
    RELAYED   ///< Chunks flow through the relay as opaque messages
};

/**
 * @brief Lifecycle of a transfer
 *
 * PENDING -> ACTIVE -> COMPLETED, ACTIVE -> FAILED,
 * PENDING|ACTIVE -> CANCELLED. The last three are terminal.
 */
enum class TransferStatus : uint8_t {
    PENDING,
    ACTIVE,
    COMPLETED,
    FAILED,
    CANCELLED
};

/**
 * @brief Which side of a transfer reports progress
 */
enum class TransferRole : uint8_t {
    SENDER,
    RECEIVER
};

/**
 * @brief Why a transfer was force-terminated
 */
enum class TerminationReason : uint8_t {
    CLIENT_CANCELLED,  ///< A participant sent cancel_transfer
    REJECTED,          ///< The receiver declined the offer
    PEER_DISCONNECTED  ///< A participant's connection went away
};

std::string transferMethodToString(TransferMethod method);
std::string transferStatusToString(TransferStatus status);
std::string transferRoleToString(TransferRole role);
std::string terminationReasonToString(TerminationReason reason);

/**
 * @brief Parse "direct" / "relayed"
 * @return std::nullopt for any other value
 */
std::optional<TransferMethod> transferMethodFromString(const std::string& value);

/**
 * @brief Parse "sender" / "receiver"
 * @return std::nullopt for any other value
 */
std::optional<TransferRole> transferRoleFromString(const std::string& value);

inline bool isTerminal(TransferStatus status) {
    return status == TransferStatus::COMPLETED ||
           status == TransferStatus::FAILED ||
           status == TransferStatus::CANCELLED;
}

//=============================================================================
// FileDescriptor
//=============================================================================

/**
 * @brief File metadata declared by the sender
 *
 * Opaque to the relay: never validated against actual bytes. The original
 * JSON object is kept verbatim so the receiver sees exactly what the sender
 * declared.
 */
struct FileDescriptor {
    std::string name;
    uint64_t size = 0;
    std::string mimeType;
    uint64_t totalChunks = 0;   ///< 0 = not declared yet
    uint64_t chunkSize = 0;
    nlohmann::json raw = nlohmann::json::object();

    /**
     * @brief Build from a `file_info` object
     * @throws std::invalid_argument if the value is not an object or a
     *         known field has the wrong type
     */
    static FileDescriptor fromJson(const nlohmann::json& j);
};

//=============================================================================
// Transfer
//=============================================================================

/**
 * @brief The relay's record of one file movement between two endpoints
 *
 * sender_id / receiver_id are weak references: the record survives either
 * endpoint disconnecting.
 *
 * Invariant: chunksAcknowledged <= chunksSent <= fileInfo.totalChunks
 * (once totalChunks is known).
 */
struct Transfer {
    std::string id;
    std::string senderId;
    std::string receiverId;
    FileDescriptor fileInfo;
    TransferMethod method = TransferMethod::RELAYED;
    TransferStatus status = TransferStatus::PENDING;

    // Client-reported progress (independent per role)
    double senderProgress = 0.0;
    double receiverProgress = 0.0;
    uint64_t senderChunks = 0;
    uint64_t receiverChunks = 0;

    // Relayed-mode bookkeeping
    uint64_t chunksSent = 0;
    uint64_t chunksAcknowledged = 0;
    uint64_t duplicateChunks = 0;
    std::unordered_set<uint64_t> sentChunkIndices;
    std::unordered_set<uint64_t> ackedChunkIndices;

    std::string failureReason;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::steady_clock::time_point finishedAt;

    bool involves(const std::string& endpointId) const {
        return senderId == endpointId || receiverId == endpointId;
    }

    const std::string& peerOf(const std::string& endpointId) const {
        return endpointId == senderId ? receiverId : senderId;
    }

    double syncLag() const {
        return senderProgress > receiverProgress ? senderProgress - receiverProgress : 0.0;
    }
};

/**
 * @brief Public JSON view of a transfer (chunk index sets omitted)
 */
nlohmann::json toJson(const Transfer& transfer);

/**
 * @brief Clamp client-reported progress into [0, 100]
 *
 * NaN is treated as 0.
 */
double clampProgress(double value);

}  // namespace PeerRelay
