/**
 * @file MessageRouter.cpp
 * @brief Inbound message dispatch
 */

#include "peerrelay/MessageRouter.h"
#include "peerrelay/Debug.h"

#include <exception>
#include <variant>

namespace PeerRelay {

namespace {

/**
 * @brief Correlation ids copied from a request into its error reply
 */
nlohmann::json correlationIds(const nlohmann::json& raw) {
    nlohmann::json ids = nlohmann::json::object();
    if (!raw.is_object()) {
        return ids;
    }
    for (const char* key : {"negotiation_id", "transfer_id", "target_id", "receiver_id", "chunk_index"}) {
        auto it = raw.find(key);
        if (it != raw.end() && (it->is_string() || it->is_number())) {
            ids[key] = *it;
        }
    }
    return ids;
}

std::string requestTypeOf(const nlohmann::json& raw) {
    if (raw.is_object()) {
        auto it = raw.find("type");
        if (it != raw.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return {};
}

} // anonymous namespace

//=============================================================================
// Entry Points
//=============================================================================

bool MessageRouter::handleFrame(ConnectionContext& ctx, const std::string& payload) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_WARNING("[Router] " << ctx.connectionId << ": unparseable frame: " << e.what());
        return false;
    }

    try {
        handleJson(ctx, j);
    } catch (const std::exception& e) {
        LOG_ERROR("[Router] " << ctx.connectionId << ": handling frame failed: " << e.what());
        return false;
    }
    return true;
}

void MessageRouter::handleJson(ConnectionContext& ctx, const nlohmann::json& j) {
    InboundMessage msg;
    try {
        msg = parseInboundMessage(j);
    } catch (const MessageParseError& e) {
        replyError(ctx, ErrorCodes::MALFORMED_MESSAGE, e.what(), j);
        return;
    }

    const bool isRegister = std::holds_alternative<RegisterMessage>(msg.payload);
    const bool isPing = std::holds_alternative<PingMessage>(msg.payload);

    if (!ctx.isBound() && !isRegister && !isPing) {
        replyError(ctx, ErrorCodes::NOT_REGISTERED, "Send register before " + msg.type, j);
        return;
    }

    if (msg.senderId) {
        const std::string& claimed = *msg.senderId;
        const std::string& expected = ctx.isBound()
            ? ctx.endpointId
            : (isRegister ? std::get<RegisterMessage>(msg.payload).endpointId : claimed);
        if (claimed != expected) {
            LOG_WARNING("[Router] " << ctx.connectionId << ": sender_id '" << claimed
                        << "' does not match bound identity '" << expected << "'");
            replyError(ctx, ErrorCodes::IDENTITY_SPOOFING,
                       "sender_id does not match the registered identity", j);
            return;
        }
    }

    if (ctx.isBound()) {
        m_registry.touch(ctx.endpointId);
    }

    dispatch(ctx, msg, j);
}

void MessageRouter::onDisconnect(ConnectionContext& ctx) {
    if (!ctx.isBound()) {
        return;
    }
    m_registry.deregisterEndpoint(ctx.endpointId, ctx.channel.get());
    ctx.endpointId.clear();
}

void MessageRouter::dispatch(ConnectionContext& ctx, const InboundMessage& msg, const nlohmann::json& raw) {
    std::visit([&](const auto& m) { handle(ctx, m, raw); }, msg.payload);
}

//=============================================================================
// Registration / Keepalive
//=============================================================================

void MessageRouter::handle(ConnectionContext& ctx, const RegisterMessage& m, const nlohmann::json& raw) {
    if (ctx.isBound()) {
        if (m.endpointId != ctx.endpointId) {
            replyError(ctx, ErrorCodes::IDENTITY_SPOOFING,
                       "Connection is already registered as " + ctx.endpointId, raw);
            return;
        }
        if (!m_registry.updateProfile(ctx.endpointId, m.capabilities, m.deviceName)) {
            replyError(ctx, ErrorCodes::NOT_REGISTERED, "Endpoint is no longer registered", raw);
            return;
        }
    } else {
        RelayError error;
        if (!m_registry.registerEndpoint(m.endpointId, ctx.channel, m.capabilities, m.deviceName, error)) {
            replyError(ctx, error, raw);
            return;
        }
        ctx.endpointId = m.endpointId;
    }

    auto endpoint = m_registry.lookup(ctx.endpointId);
    if (!endpoint) {
        return;
    }
    reply(ctx, makeRegistered(*endpoint));
    reply(ctx, makePeers(m_registry.snapshot()));
}

void MessageRouter::handle(ConnectionContext& ctx, const PingMessage& m, const nlohmann::json&) {
    reply(ctx, makePong(m.timestamp));
}

//=============================================================================
// Signaling
//=============================================================================

void MessageRouter::handle(ConnectionContext& ctx, const OfferMessage& m, const nlohmann::json& raw) {
    RelayError error;
    if (!m_signaling.offer(ctx.endpointId, m, error)) {
        replyError(ctx, error, raw);
    }
}

void MessageRouter::handle(ConnectionContext& ctx, const AnswerMessage& m, const nlohmann::json& raw) {
    RelayError error;
    if (!m_signaling.answer(ctx.endpointId, m, error)) {
        replyError(ctx, error, raw);
    }
}

void MessageRouter::handle(ConnectionContext& ctx, const IceCandidateMessage& m, const nlohmann::json& raw) {
    RelayError error;
    if (!m_signaling.iceCandidate(ctx.endpointId, m, error)) {
        replyError(ctx, error, raw);
    }
}

//=============================================================================
// Transfers
//=============================================================================

void MessageRouter::handle(ConnectionContext& ctx, const FileTransferStartMessage& m, const nlohmann::json& raw) {
    RelayError error;
    std::string transferId;
    if (!m_transfers.startTransfer(ctx.endpointId, m.receiverId, m.fileInfo,
                                   m.preferredMethod, transferId, error)) {
        replyError(ctx, error, raw);
    }
}

void MessageRouter::handle(ConnectionContext& ctx, const TransferResponseMessage& m, const nlohmann::json& raw) {
    RelayError error;
    if (!m_transfers.respond(ctx.endpointId, m.transferId, m.accepted, m.reason, error)) {
        replyError(ctx, error, raw);
        return;
    }
    if (!m.accepted) {
        m_signaling.closeNegotiation(m.transferId);
    }
}

void MessageRouter::handle(ConnectionContext& ctx, const FileChunkMessage& m, const nlohmann::json& raw) {
    RelayError error;
    if (!m_chunks.forwardChunk(ctx.endpointId, m, error)) {
        replyError(ctx, error, raw);
    }
}

void MessageRouter::handle(ConnectionContext& ctx, const ChunkAckMessage& m, const nlohmann::json& raw) {
    RelayError error;
    if (!m_chunks.acknowledgeChunk(ctx.endpointId, m, error)) {
        replyError(ctx, error, raw);
    }
}

void MessageRouter::handle(ConnectionContext& ctx, const TransferProgressMessage& m, const nlohmann::json&) {
    m_transfers.reportProgress(ctx.endpointId, m.transferId, m.role, m.progress, m.chunks);
}

void MessageRouter::handle(ConnectionContext& ctx, const TransferDowngradeMessage& m, const nlohmann::json& raw) {
    RelayError error;
    if (!m_transfers.downgradeMethod(m.transferId, m.reason, error, ctx.endpointId)) {
        replyError(ctx, error, raw);
    }
}

void MessageRouter::handle(ConnectionContext& ctx, const TransferCompleteMessage& m, const nlohmann::json& raw) {
    RelayError error;
    if (!m_transfers.complete(m.transferId, error, ctx.endpointId)) {
        replyError(ctx, error, raw);
        return;
    }
    m_signaling.closeNegotiation(m.transferId);
}

void MessageRouter::handle(ConnectionContext& ctx, const CancelTransferMessage& m, const nlohmann::json& raw) {
    RelayError error;
    if (!m_transfers.failOrCancel(m.transferId, TerminationReason::CLIENT_CANCELLED,
                                  ctx.endpointId, error, m.reason)) {
        replyError(ctx, error, raw);
        return;
    }
    m_signaling.closeNegotiation(m.transferId);
}

void MessageRouter::handle(ConnectionContext& ctx, const TransferStatusMessage& m, const nlohmann::json& raw) {
    auto transfer = m_transfers.getTransfer(m.transferId);
    if (!transfer || !transfer->involves(ctx.endpointId)) {
        replyError(ctx, ErrorCodes::UNKNOWN_TRANSFER, "Unknown transfer: " + m.transferId, raw);
        return;
    }
    reply(ctx, makeTransferStatus(*transfer));
}

//=============================================================================
// Replies
//=============================================================================

void MessageRouter::reply(ConnectionContext& ctx, const nlohmann::json& message) {
    if (!ctx.channel->send(message.dump())) {
        LOG_DEBUG("[Router] " << ctx.connectionId << ": reply "
                  << message.value("type", "") << " not delivered");
    }
}

void MessageRouter::replyError(ConnectionContext& ctx, const RelayError& error, const nlohmann::json& raw) {
    replyError(ctx, error.code.c_str(), error.message, raw);
}

void MessageRouter::replyError(ConnectionContext& ctx,
                               const char* code,
                               const std::string& message,
                               const nlohmann::json& raw) {
    const std::string requestType = requestTypeOf(raw);
    LOG_DEBUG("[Router] " << ctx.connectionId << ": " << code << " on "
              << (requestType.empty() ? "<untyped>" : requestType) << ": " << message);
    reply(ctx, makeError(code, message, requestType, correlationIds(raw)));
}

}  // namespace PeerRelay
