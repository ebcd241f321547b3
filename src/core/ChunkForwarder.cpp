/**
 * @file ChunkForwarder.cpp
 * @brief Relayed chunk forwarding
 */

#include "peerrelay/ChunkForwarder.h"
#include "peerrelay/Debug.h"

namespace PeerRelay {

bool ChunkForwarder::forwardChunk(const std::string& fromId,
                                  const FileChunkMessage& chunk,
                                  RelayError& error) {
    Transfer snapshot;
    const ChunkAdmission admission = m_transfers.admitChunk(
        fromId, chunk.transferId, chunk.chunkIndex, chunk.totalChunks, snapshot, error);

    if (admission == ChunkAdmission::REJECTED) {
        return false;
    }

    if (admission == ChunkAdmission::DUPLICATE) {
        LOG_DEBUG("[Chunks] Duplicate chunk " << chunk.chunkIndex << " on " << chunk.transferId);
        if (!m_registry.send(fromId, makeChunkAck(snapshot, chunk.chunkIndex, "duplicate"))) {
            LOG_WARNING("[Chunks] Duplicate notice to " << fromId << " not delivered");
        }
        return true;
    }

    const nlohmann::json forward = makeFileChunkForward(
        snapshot.id, fromId, chunk.chunkIndex, snapshot.fileInfo.totalChunks, chunk.chunkData);
    if (!m_registry.send(snapshot.receiverId, forward)) {
        m_transfers.rollbackChunkSent(snapshot.id, chunk.chunkIndex);
        error.set(ErrorCodes::UNKNOWN_PEER, "Receiver not reachable: " + snapshot.receiverId);
        return false;
    }
    return true;
}

bool ChunkForwarder::acknowledgeChunk(const std::string& fromId,
                                      const ChunkAckMessage& ack,
                                      RelayError& error) {
    Transfer snapshot;
    bool duplicate = false;
    if (!m_transfers.recordAck(fromId, ack.transferId, ack.chunkIndex, duplicate, snapshot, error)) {
        return false;
    }

    if (duplicate) {
        LOG_DEBUG("[Chunks] Duplicate ack " << ack.chunkIndex << " on " << ack.transferId);
    }

    if (!m_registry.send(snapshot.senderId, makeChunkAck(snapshot, ack.chunkIndex, "acknowledged"))) {
        error.set(ErrorCodes::UNKNOWN_PEER, "Sender not reachable: " + snapshot.senderId);
        return false;
    }
    return true;
}

}  // namespace PeerRelay
