/**
 * @file Message.h
 * @brief Relay wire messages: inbound parsing and outbound builders
 *
 * Every frame carries one JSON object with a "type" discriminator. Inbound
 * frames are parsed once at the connection boundary into InboundMessage;
 * components never touch raw JSON except for opaque payloads they forward.
 */

#pragma once

#include "Endpoint.h"
#include "Transfer.h"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace PeerRelay {

//=============================================================================
// Message Type Names
//=============================================================================

namespace MessageType {
// Inbound
inline constexpr const char* REGISTER = "register";
inline constexpr const char* OFFER = "offer";
inline constexpr const char* ANSWER = "answer";
inline constexpr const char* ICE_CANDIDATE = "ice_candidate";
inline constexpr const char* FILE_TRANSFER_START = "file_transfer_start";
inline constexpr const char* TRANSFER_RESPONSE = "transfer_response";
inline constexpr const char* FILE_CHUNK = "file_chunk";
inline constexpr const char* CHUNK_ACK = "chunk_ack";
inline constexpr const char* TRANSFER_PROGRESS = "transfer_progress";
inline constexpr const char* TRANSFER_DOWNGRADE = "transfer_downgrade";
inline constexpr const char* TRANSFER_COMPLETE = "transfer_complete";
inline constexpr const char* CANCEL_TRANSFER = "cancel_transfer";
inline constexpr const char* TRANSFER_STATUS = "transfer_status";
inline constexpr const char* PING = "ping";

// Outbound only
inline constexpr const char* REGISTERED = "registered";
inline constexpr const char* PEERS = "peers";
inline constexpr const char* INCOMING_TRANSFER = "incoming_transfer";
inline constexpr const char* TRANSFER_STARTED = "transfer_started";
inline constexpr const char* TRANSFER_ACCEPTED = "transfer_accepted";
inline constexpr const char* TRANSFER_REJECTED = "transfer_rejected";
inline constexpr const char* TRANSFER_ACTIVE = "transfer_active";
inline constexpr const char* TRANSFER_METHOD_CHANGED = "transfer_method_changed";
inline constexpr const char* TRANSFER_COMPLETED = "transfer_completed";
inline constexpr const char* TRANSFER_CANCELLED = "transfer_cancelled";
inline constexpr const char* TRANSFER_FAILED = "transfer_failed";
inline constexpr const char* PONG = "pong";
inline constexpr const char* ERROR_REPLY = "error";
}  // namespace MessageType

//=============================================================================
// Inbound Messages
//=============================================================================

/**
 * @brief Thrown when a well-formed JSON object is not a valid message
 *
 * Maps to a MALFORMED_MESSAGE error reply; the connection stays open.
 */
class MessageParseError : public std::runtime_error {
public:
    explicit MessageParseError(const std::string& what) : std::runtime_error(what) {}
};

struct RegisterMessage {
    std::string endpointId;
    Capabilities capabilities;
    std::string deviceName;
};

struct OfferMessage {
    std::string negotiationId;
    std::string targetId;
    nlohmann::json offerPayload;
    std::optional<nlohmann::json> fileInfo;
};

struct AnswerMessage {
    std::string negotiationId;
    std::string targetId;
    nlohmann::json answerPayload;
};

struct IceCandidateMessage {
    std::string negotiationId;  ///< Empty = resolve by sender/target pair
    std::string targetId;
    nlohmann::json candidate;
};

struct FileTransferStartMessage {
    std::string receiverId;
    FileDescriptor fileInfo;
    std::optional<TransferMethod> preferredMethod;
};

struct TransferResponseMessage {
    std::string transferId;
    bool accepted = false;
    std::string reason;
};

struct FileChunkMessage {
    std::string transferId;
    uint64_t chunkIndex = 0;
    uint64_t totalChunks = 0;
    nlohmann::json chunkData;  ///< Opaque, never inspected
};

struct ChunkAckMessage {
    std::string transferId;
    uint64_t chunkIndex = 0;
};

struct TransferProgressMessage {
    std::string transferId;
    std::optional<TransferRole> role;  ///< Inferred from the reporter when absent
    double progress = 0.0;
    std::optional<uint64_t> chunks;
};

struct TransferDowngradeMessage {
    std::string transferId;
    std::string reason;
};

struct TransferCompleteMessage {
    std::string transferId;
};

struct CancelTransferMessage {
    std::string transferId;
    std::string reason;
};

struct TransferStatusMessage {
    std::string transferId;
};

struct PingMessage {
    nlohmann::json timestamp;  ///< Echoed back unchanged
};

using InboundPayload = std::variant<
    RegisterMessage,
    OfferMessage,
    AnswerMessage,
    IceCandidateMessage,
    FileTransferStartMessage,
    TransferResponseMessage,
    FileChunkMessage,
    ChunkAckMessage,
    TransferProgressMessage,
    TransferDowngradeMessage,
    TransferCompleteMessage,
    CancelTransferMessage,
    TransferStatusMessage,
    PingMessage>;

/**
 * @brief One parsed inbound frame
 */
struct InboundMessage {
    std::string type;
    std::optional<std::string> senderId;  ///< Claimed identity, if present
    InboundPayload payload;
};

/**
 * @brief Parse and validate an inbound JSON object
 * @throws MessageParseError on unknown type or missing/mistyped fields
 */
InboundMessage parseInboundMessage(const nlohmann::json& j);

//=============================================================================
// Outbound Builders
//=============================================================================

nlohmann::json makeRegistered(const Endpoint& endpoint);
nlohmann::json makePeers(const std::vector<Endpoint>& endpoints);

nlohmann::json makeOfferForward(const std::string& negotiationId,
                                const std::string& senderId,
                                const nlohmann::json& offerPayload,
                                const std::optional<nlohmann::json>& fileInfo);
nlohmann::json makeAnswerForward(const std::string& negotiationId,
                                 const std::string& senderId,
                                 const nlohmann::json& answerPayload);
nlohmann::json makeIceCandidateForward(const std::string& negotiationId,
                                       const std::string& senderId,
                                       const nlohmann::json& candidate);

nlohmann::json makeIncomingTransfer(const Transfer& transfer);
nlohmann::json makeTransferStarted(const Transfer& transfer);
nlohmann::json makeTransferAccepted(const Transfer& transfer);
nlohmann::json makeTransferRejected(const Transfer& transfer);
nlohmann::json makeTransferActive(const Transfer& transfer);
nlohmann::json makeTransferProgress(const Transfer& transfer,
                                    TransferRole role,
                                    double progress,
                                    uint64_t chunks);
nlohmann::json makeTransferMethodChanged(const Transfer& transfer, const std::string& reason);
nlohmann::json makeTransferCompleted(const Transfer& transfer);

/**
 * @brief transfer_cancelled or transfer_failed, chosen by the terminal status
 */
nlohmann::json makeTransferTerminated(const Transfer& transfer);
nlohmann::json makeTransferStatus(const Transfer& transfer);

nlohmann::json makeFileChunkForward(const std::string& transferId,
                                    const std::string& senderId,
                                    uint64_t chunkIndex,
                                    uint64_t totalChunks,
                                    const nlohmann::json& chunkData);

/**
 * @brief chunk_ack sent to the transfer's sender
 * @param status "acknowledged" or "duplicate"
 */
nlohmann::json makeChunkAck(const Transfer& transfer,
                            uint64_t chunkIndex,
                            const std::string& status);

nlohmann::json makePong(const nlohmann::json& timestamp);

/**
 * @brief Error reply
 * @param ids Correlation ids copied from the request (may be empty)
 */
nlohmann::json makeError(const std::string& code,
                         const std::string& message,
                         const std::string& requestType,
                         const nlohmann::json& ids);

/**
 * @brief Milliseconds since the Unix epoch
 */
int64_t currentTimeMs();

}  // namespace PeerRelay
