/**
 * @file MessageRouter.h
 * @brief Dispatches inbound frames of one connection to the relay components
 */

#pragma once

#include "ChunkForwarder.h"
#include "EndpointRegistry.h"
#include "ErrorCodes.h"
#include "Message.h"
#include "MessageChannel.h"
#include "SignalingRelay.h"
#include "TransferManager.h"
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace PeerRelay {

/**
 * @brief Per-connection state owned by the connection's reader
 */
struct ConnectionContext {
    std::string connectionId;                 ///< For logs only
    std::string endpointId;                   ///< Empty until register succeeds
    std::shared_ptr<MessageChannel> channel;  ///< Replies go here

    bool isBound() const { return !endpointId.empty(); }
};

/**
 * @class MessageRouter
 * @brief Binds a connection identity to its messages and dispatches them
 *
 * Recoverable failures produce exactly one `error` reply on the
 * originating connection; the connection stays open.
 *
 * Thread Safety:
 * - Stateless apart from the referenced components; one router serves all
 *   connections. Each ConnectionContext is used by a single thread.
 */
class MessageRouter {
public:
    MessageRouter(EndpointRegistry& registry,
                  SignalingRelay& signaling,
                  TransferManager& transfers,
                  ChunkForwarder& chunks)
        : m_registry(registry), m_signaling(signaling),
          m_transfers(transfers), m_chunks(chunks) {}

    MessageRouter(const MessageRouter&) = delete;
    MessageRouter& operator=(const MessageRouter&) = delete;

    /**
     * @brief Handle one raw frame payload
     * @return false if the payload is not JSON or handling it threw
     *         (connection-fatal)
     */
    bool handleFrame(ConnectionContext& ctx, const std::string& payload);

    /**
     * @brief Handle one parsed JSON value
     */
    void handleJson(ConnectionContext& ctx, const nlohmann::json& j);

    /**
     * @brief Deregister the connection's endpoint, if bound
     */
    void onDisconnect(ConnectionContext& ctx);

private:
    void dispatch(ConnectionContext& ctx, const InboundMessage& msg, const nlohmann::json& raw);

    void handle(ConnectionContext& ctx, const RegisterMessage& m, const nlohmann::json& raw);
    void handle(ConnectionContext& ctx, const OfferMessage& m, const nlohmann::json& raw);
    void handle(ConnectionContext& ctx, const AnswerMessage& m, const nlohmann::json& raw);
    void handle(ConnectionContext& ctx, const IceCandidateMessage& m, const nlohmann::json& raw);
    void handle(ConnectionContext& ctx, const FileTransferStartMessage& m, const nlohmann::json& raw);
    void handle(ConnectionContext& ctx, const TransferResponseMessage& m, const nlohmann::json& raw);
    void handle(ConnectionContext& ctx, const FileChunkMessage& m, const nlohmann::json& raw);
    void handle(ConnectionContext& ctx, const ChunkAckMessage& m, const nlohmann::json& raw);
    void handle(ConnectionContext& ctx, const TransferProgressMessage& m, const nlohmann::json& raw);
    void handle(ConnectionContext& ctx, const TransferDowngradeMessage& m, const nlohmann::json& raw);
    void handle(ConnectionContext& ctx, const TransferCompleteMessage& m, const nlohmann::json& raw);
    void handle(ConnectionContext& ctx, const CancelTransferMessage& m, const nlohmann::json& raw);
    void handle(ConnectionContext& ctx, const TransferStatusMessage& m, const nlohmann::json& raw);
    void handle(ConnectionContext& ctx, const PingMessage& m, const nlohmann::json& raw);

    void reply(ConnectionContext& ctx, const nlohmann::json& message);
    void replyError(ConnectionContext& ctx, const RelayError& error, const nlohmann::json& raw);
    void replyError(ConnectionContext& ctx,
                    const char* code,
                    const std::string& message,
                    const nlohmann::json& raw);

    EndpointRegistry& m_registry;
    SignalingRelay& m_signaling;
    TransferManager& m_transfers;
    ChunkForwarder& m_chunks;
};

}  // namespace PeerRelay
