/**
 * @file Message.cpp
 * @brief Inbound message parsing and outbound message builders
 */

#include "peerrelay/Message.h"
#include "peerrelay/config.h"

#include <chrono>
#include <unordered_map>

namespace PeerRelay {

//=============================================================================
// Field Readers
//=============================================================================

namespace {

using json = nlohmann::json;

std::string requireString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw MessageParseError(std::string("Missing or non-string field: ") + key);
    }
    std::string value = it->get<std::string>();
    if (value.empty()) {
        throw MessageParseError(std::string("Empty field: ") + key);
    }
    return value;
}

std::string optionalString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        throw MessageParseError(std::string("Non-string field: ") + key);
    }
    return it->get<std::string>();
}

/**
 * @brief Cut @p text to at most @p maxBytes without splitting a UTF-8 sequence
 */
void truncateUtf8(std::string& text, size_t maxBytes) {
    if (text.size() <= maxBytes) {
        return;
    }
    size_t cut = maxBytes;
    // Back off continuation bytes (10xxxxxx) to the lead byte of the cut character.
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    text.resize(cut);
}

uint64_t requireIndex(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) {
        throw MessageParseError(std::string("Missing field: ") + key);
    }
    if (it->is_number_unsigned()) {
        return it->get<uint64_t>();
    }
    if (it->is_number_integer()) {
        const int64_t n = it->get<int64_t>();
        if (n < 0) {
            throw MessageParseError(std::string("Negative field: ") + key);
        }
        return static_cast<uint64_t>(n);
    }
    throw MessageParseError(std::string("Non-integer field: ") + key);
}

const json& requirePresent(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        throw MessageParseError(std::string("Missing field: ") + key);
    }
    return *it;
}

Capabilities readCapabilities(const json& j) {
    Capabilities caps;
    auto it = j.find("capabilities");
    if (it == j.end() || it->is_null()) {
        return caps;
    }
    if (!it->is_object()) {
        throw MessageParseError("capabilities must be an object");
    }
    for (const auto& item : it->items()) {
        const json& v = item.value();
        if (v.is_string()) {
            caps[item.key()] = v.get<std::string>();
        } else if (v.is_boolean() || v.is_number() || v.is_null()) {
            caps[item.key()] = v.dump();
        } else {
            throw MessageParseError("capabilities." + item.key() + " must be a scalar");
        }
    }
    return caps;
}

//=============================================================================
// Per-Type Parsers
//=============================================================================

InboundPayload parseRegister(const json& j) {
    RegisterMessage m;
    m.endpointId = requireString(j, "endpoint_id");
    if (m.endpointId.size() > MAX_ENDPOINT_ID_LENGTH) {
        throw MessageParseError("endpoint_id too long");
    }
    m.capabilities = readCapabilities(j);
    m.deviceName = optionalString(j, "device_name");
    truncateUtf8(m.deviceName, MAX_DEVICE_NAME_LENGTH);
    return m;
}

InboundPayload parseOffer(const json& j) {
    OfferMessage m;
    m.negotiationId = requireString(j, "negotiation_id");
    m.targetId = requireString(j, "target_id");
    m.offerPayload = requirePresent(j, "offer_payload");
    auto it = j.find("file_info");
    if (it != j.end() && !it->is_null()) {
        if (!it->is_object()) {
            throw MessageParseError("file_info must be an object");
        }
        m.fileInfo = *it;
    }
    return m;
}

InboundPayload parseAnswer(const json& j) {
    AnswerMessage m;
    m.negotiationId = requireString(j, "negotiation_id");
    m.targetId = requireString(j, "target_id");
    m.answerPayload = requirePresent(j, "answer_payload");
    return m;
}

InboundPayload parseIceCandidate(const json& j) {
    IceCandidateMessage m;
    m.negotiationId = optionalString(j, "negotiation_id");
    m.targetId = requireString(j, "target_id");
    m.candidate = requirePresent(j, "candidate");
    return m;
}

InboundPayload parseFileTransferStart(const json& j) {
    FileTransferStartMessage m;
    m.receiverId = requireString(j, "receiver_id");
    try {
        m.fileInfo = FileDescriptor::fromJson(requirePresent(j, "file_info"));
    } catch (const std::invalid_argument& e) {
        throw MessageParseError(e.what());
    }
    const std::string method = optionalString(j, "preferred_method");
    if (!method.empty()) {
        m.preferredMethod = transferMethodFromString(method);
        if (!m.preferredMethod) {
            throw MessageParseError("Unknown preferred_method: " + method);
        }
    }
    return m;
}

InboundPayload parseTransferResponse(const json& j) {
    TransferResponseMessage m;
    m.transferId = requireString(j, "transfer_id");
    const json& accepted = requirePresent(j, "accepted");
    if (!accepted.is_boolean()) {
        throw MessageParseError("accepted must be a boolean");
    }
    m.accepted = accepted.get<bool>();
    m.reason = optionalString(j, "reason");
    return m;
}

InboundPayload parseFileChunk(const json& j) {
    FileChunkMessage m;
    m.transferId = requireString(j, "transfer_id");
    m.chunkIndex = requireIndex(j, "chunk_index");
    m.totalChunks = requireIndex(j, "total_chunks");
    m.chunkData = requirePresent(j, "chunk_data");
    return m;
}

InboundPayload parseChunkAck(const json& j) {
    ChunkAckMessage m;
    m.transferId = requireString(j, "transfer_id");
    m.chunkIndex = requireIndex(j, "chunk_index");
    return m;
}

InboundPayload parseTransferProgress(const json& j) {
    TransferProgressMessage m;
    m.transferId = requireString(j, "transfer_id");
    const std::string role = optionalString(j, "role");
    if (!role.empty()) {
        m.role = transferRoleFromString(role);
        if (!m.role) {
            throw MessageParseError("Unknown role: " + role);
        }
    }
    const json& progress = requirePresent(j, "progress");
    if (!progress.is_number()) {
        throw MessageParseError("progress must be a number");
    }
    m.progress = progress.get<double>();
    if (j.contains("chunks") && !j["chunks"].is_null()) {
        m.chunks = requireIndex(j, "chunks");
    }
    return m;
}

InboundPayload parseTransferDowngrade(const json& j) {
    TransferDowngradeMessage m;
    m.transferId = requireString(j, "transfer_id");
    m.reason = optionalString(j, "reason");
    return m;
}

InboundPayload parseTransferComplete(const json& j) {
    TransferCompleteMessage m;
    m.transferId = requireString(j, "transfer_id");
    return m;
}

InboundPayload parseCancelTransfer(const json& j) {
    CancelTransferMessage m;
    m.transferId = requireString(j, "transfer_id");
    m.reason = optionalString(j, "reason");
    return m;
}

InboundPayload parseTransferStatus(const json& j) {
    TransferStatusMessage m;
    m.transferId = requireString(j, "transfer_id");
    return m;
}

InboundPayload parsePing(const json& j) {
    PingMessage m;
    auto it = j.find("timestamp");
    if (it != j.end()) {
        m.timestamp = *it;
    }
    return m;
}

using Parser = InboundPayload (*)(const json&);

const std::unordered_map<std::string, Parser>& parsers() {
    static const std::unordered_map<std::string, Parser> table = {
        {MessageType::REGISTER, &parseRegister},
        {MessageType::OFFER, &parseOffer},
        {MessageType::ANSWER, &parseAnswer},
        {MessageType::ICE_CANDIDATE, &parseIceCandidate},
        {MessageType::FILE_TRANSFER_START, &parseFileTransferStart},
        {MessageType::TRANSFER_RESPONSE, &parseTransferResponse},
        {MessageType::FILE_CHUNK, &parseFileChunk},
        {MessageType::CHUNK_ACK, &parseChunkAck},
        {MessageType::TRANSFER_PROGRESS, &parseTransferProgress},
        {MessageType::TRANSFER_DOWNGRADE, &parseTransferDowngrade},
        {MessageType::TRANSFER_COMPLETE, &parseTransferComplete},
        {MessageType::CANCEL_TRANSFER, &parseCancelTransfer},
        {MessageType::TRANSFER_STATUS, &parseTransferStatus},
        {MessageType::PING, &parsePing},
    };
    return table;
}

json transferHeader(const char* type, const Transfer& transfer) {
    return json{
        {"type", type},
        {"transfer_id", transfer.id},
        {"sender_id", transfer.senderId},
        {"receiver_id", transfer.receiverId},
        {"method", transferMethodToString(transfer.method)}
    };
}

} // anonymous namespace

//=============================================================================
// Inbound
//=============================================================================

InboundMessage parseInboundMessage(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw MessageParseError("Message must be a JSON object");
    }

    auto typeIt = j.find("type");
    if (typeIt == j.end() || !typeIt->is_string()) {
        throw MessageParseError("Missing or non-string field: type");
    }

    InboundMessage msg;
    msg.type = typeIt->get<std::string>();

    const auto& table = parsers();
    auto parser = table.find(msg.type);
    if (parser == table.end()) {
        throw MessageParseError("Unknown message type: " + msg.type);
    }

    auto senderIt = j.find("sender_id");
    if (senderIt != j.end() && !senderIt->is_null()) {
        if (!senderIt->is_string()) {
            throw MessageParseError("Non-string field: sender_id");
        }
        msg.senderId = senderIt->get<std::string>();
    }

    msg.payload = parser->second(j);
    return msg;
}

//=============================================================================
// Outbound
//=============================================================================

nlohmann::json makeRegistered(const Endpoint& endpoint) {
    return json{
        {"type", MessageType::REGISTERED},
        {"endpoint_id", endpoint.id},
        {"device_name", endpoint.deviceName},
        {"protocol", PROTOCOL_ID},
        {"server_time", currentTimeMs()}
    };
}

nlohmann::json makePeers(const std::vector<Endpoint>& endpoints) {
    json list = json::array();
    for (const auto& endpoint : endpoints) {
        list.push_back(toJson(endpoint));
    }
    return json{{"type", MessageType::PEERS}, {"peers", list}};
}

nlohmann::json makeOfferForward(const std::string& negotiationId,
                                const std::string& senderId,
                                const nlohmann::json& offerPayload,
                                const std::optional<nlohmann::json>& fileInfo) {
    json out{
        {"type", MessageType::OFFER},
        {"negotiation_id", negotiationId},
        {"sender_id", senderId},
        {"offer_payload", offerPayload}
    };
    if (fileInfo) {
        out["file_info"] = *fileInfo;
    }
    return out;
}

nlohmann::json makeAnswerForward(const std::string& negotiationId,
                                 const std::string& senderId,
                                 const nlohmann::json& answerPayload) {
    return json{
        {"type", MessageType::ANSWER},
        {"negotiation_id", negotiationId},
        {"sender_id", senderId},
        {"answer_payload", answerPayload}
    };
}

nlohmann::json makeIceCandidateForward(const std::string& negotiationId,
                                       const std::string& senderId,
                                       const nlohmann::json& candidate) {
    return json{
        {"type", MessageType::ICE_CANDIDATE},
        {"negotiation_id", negotiationId},
        {"sender_id", senderId},
        {"candidate", candidate}
    };
}

nlohmann::json makeIncomingTransfer(const Transfer& transfer) {
    json out = transferHeader(MessageType::INCOMING_TRANSFER, transfer);
    out["file_info"] = transfer.fileInfo.raw;
    return out;
}

nlohmann::json makeTransferStarted(const Transfer& transfer) {
    return transferHeader(MessageType::TRANSFER_STARTED, transfer);
}

nlohmann::json makeTransferAccepted(const Transfer& transfer) {
    return transferHeader(MessageType::TRANSFER_ACCEPTED, transfer);
}

nlohmann::json makeTransferRejected(const Transfer& transfer) {
    json out = transferHeader(MessageType::TRANSFER_REJECTED, transfer);
    out["reason"] = transfer.failureReason;
    return out;
}

nlohmann::json makeTransferActive(const Transfer& transfer) {
    return transferHeader(MessageType::TRANSFER_ACTIVE, transfer);
}

nlohmann::json makeTransferProgress(const Transfer& transfer,
                                    TransferRole role,
                                    double progress,
                                    uint64_t chunks) {
    json out = transferHeader(MessageType::TRANSFER_PROGRESS, transfer);
    out["role"] = transferRoleToString(role);
    out["progress"] = progress;
    out["chunks"] = chunks;
    out["sync_lag"] = transfer.syncLag();
    return out;
}

nlohmann::json makeTransferMethodChanged(const Transfer& transfer, const std::string& reason) {
    json out = transferHeader(MessageType::TRANSFER_METHOD_CHANGED, transfer);
    out["previous_method"] = transferMethodToString(TransferMethod::DIRECT);
    out["reason"] = reason;
    return out;
}

nlohmann::json makeTransferCompleted(const Transfer& transfer) {
    json out = transferHeader(MessageType::TRANSFER_COMPLETED, transfer);
    out["chunks_sent"] = transfer.chunksSent;
    out["chunks_acknowledged"] = transfer.chunksAcknowledged;
    return out;
}

nlohmann::json makeTransferTerminated(const Transfer& transfer) {
    const char* type = transfer.status == TransferStatus::FAILED
        ? MessageType::TRANSFER_FAILED
        : MessageType::TRANSFER_CANCELLED;
    json out = transferHeader(type, transfer);
    out["reason"] = transfer.failureReason;
    return out;
}

nlohmann::json makeTransferStatus(const Transfer& transfer) {
    json out = toJson(transfer);
    out["type"] = MessageType::TRANSFER_STATUS;
    return out;
}

nlohmann::json makeFileChunkForward(const std::string& transferId,
                                    const std::string& senderId,
                                    uint64_t chunkIndex,
                                    uint64_t totalChunks,
                                    const nlohmann::json& chunkData) {
    return json{
        {"type", MessageType::FILE_CHUNK},
        {"transfer_id", transferId},
        {"sender_id", senderId},
        {"chunk_index", chunkIndex},
        {"total_chunks", totalChunks},
        {"chunk_data", chunkData}
    };
}

nlohmann::json makeChunkAck(const Transfer& transfer,
                            uint64_t chunkIndex,
                            const std::string& status) {
    return json{
        {"type", MessageType::CHUNK_ACK},
        {"transfer_id", transfer.id},
        {"chunk_index", chunkIndex},
        {"status", status},
        {"chunks_sent", transfer.chunksSent},
        {"chunks_acknowledged", transfer.chunksAcknowledged},
        {"total_chunks", transfer.fileInfo.totalChunks}
    };
}

nlohmann::json makePong(const nlohmann::json& timestamp) {
    return json{
        {"type", MessageType::PONG},
        {"timestamp", timestamp},
        {"server_time", currentTimeMs()}
    };
}

nlohmann::json makeError(const std::string& code,
                         const std::string& message,
                         const std::string& requestType,
                         const nlohmann::json& ids) {
    json out{
        {"type", MessageType::ERROR_REPLY},
        {"code", code},
        {"message", message},
        {"request_type", requestType}
    };
    if (ids.is_object()) {
        for (const auto& item : ids.items()) {
            out[item.key()] = item.value();
        }
    }
    return out;
}

int64_t currentTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace PeerRelay
