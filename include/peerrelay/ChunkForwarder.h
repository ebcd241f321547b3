/**
 * @file ChunkForwarder.h
 * @brief Opaque pass-through of relayed chunk data
 */

#pragma once

#include "EndpointRegistry.h"
#include "ErrorCodes.h"
#include "Message.h"
#include "TransferManager.h"
#include <string>

namespace PeerRelay {

/**
 * @class ChunkForwarder
 * @brief Forwards chunks and acknowledgments for RELAYED transfers
 *
 * Chunk payloads are never decoded. Only the sent/acknowledged counters
 * kept by TransferManager are updated. Reaching total_chunks does not
 * complete a transfer; the client sends transfer_complete.
 */
class ChunkForwarder {
public:
    ChunkForwarder(EndpointRegistry& registry, TransferManager& transfers)
        : m_registry(registry), m_transfers(transfers) {}

    /**
     * @brief Forward one chunk from the sender to the receiver
     *
     * A duplicate index is not forwarded; the sender gets a chunk_ack
     * with status "duplicate".
     * @return false with UNKNOWN_TRANSFER, INVALID_STATE or UNKNOWN_PEER
     */
    bool forwardChunk(const std::string& fromId, const FileChunkMessage& chunk, RelayError& error);

    /**
     * @brief Forward the receiver's acknowledgment to the sender
     */
    bool acknowledgeChunk(const std::string& fromId, const ChunkAckMessage& ack, RelayError& error);

private:
    EndpointRegistry& m_registry;
    TransferManager& m_transfers;
};

}  // namespace PeerRelay
