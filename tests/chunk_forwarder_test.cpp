/**
 * @file chunk_forwarder_test.cpp
 * @brief Unit tests for relayed chunk forwarding and acknowledgment
 */

#include "peerrelay/ChunkForwarder.h"
#include "TestChannels.h"
#include <gtest/gtest.h>

#include <functional>
#include <memory>
#include <string>

using namespace PeerRelay;
using PeerRelay::testing_support::RecordingChannel;
using PeerRelay::testing_support::registerRecording;

namespace {

/**
 * @brief Channel that runs a callback from inside send()
 */
class CallbackChannel final : public MessageChannel {
public:
    explicit CallbackChannel(std::function<void(const nlohmann::json&)> onSend)
        : m_onSend(std::move(onSend)) {}

    bool send(const std::string& message) override {
        m_onSend(nlohmann::json::parse(message));
        return true;
    }

    void close() override {}

private:
    std::function<void(const nlohmann::json&)> m_onSend;
};

}  // namespace

class ChunkForwarderTest : public ::testing::Test {
protected:
    void SetUp() override {
        alice = registerRecording(registry, "alice");
        bob = registerRecording(registry, "bob");
        ASSERT_TRUE(alice && bob);
    }

    std::string start(TransferMethod method = TransferMethod::RELAYED, uint64_t totalChunks = 3) {
        FileDescriptor file = FileDescriptor::fromJson({
            {"name", "notes.txt"},
            {"size", 3000},
            {"total_chunks", totalChunks}
        });
        std::string id;
        RelayError error;
        EXPECT_TRUE(transfers.startTransfer("alice", "bob", file, method, id, error)) << error.message;
        return id;
    }

    FileChunkMessage chunk(const std::string& id, uint64_t index, uint64_t total = 3) {
        FileChunkMessage msg;
        msg.transferId = id;
        msg.chunkIndex = index;
        msg.totalChunks = total;
        msg.chunkData = "aGVsbG8=";
        return msg;
    }

    ChunkAckMessage ack(const std::string& id, uint64_t index) {
        ChunkAckMessage msg;
        msg.transferId = id;
        msg.chunkIndex = index;
        return msg;
    }

    EndpointRegistry registry;
    TransferManager transfers{registry};
    ChunkForwarder forwarder{registry, transfers};
    std::shared_ptr<RecordingChannel> alice;
    std::shared_ptr<RecordingChannel> bob;
};

TEST_F(ChunkForwarderTest, ForwardsChunkVerbatimAndBeginsTransfer) {
    const std::string id = start();
    RelayError error;
    ASSERT_TRUE(forwarder.forwardChunk("alice", chunk(id, 0), error)) << error.message;

    auto chunks = bob->ofType("file_chunk");
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0]["transfer_id"], id);
    EXPECT_EQ(chunks[0]["sender_id"], "alice");
    EXPECT_EQ(chunks[0]["chunk_index"], 0);
    EXPECT_EQ(chunks[0]["total_chunks"], 3);
    EXPECT_EQ(chunks[0]["chunk_data"], "aGVsbG8=");

    auto transfer = transfers.getTransfer(id);
    EXPECT_EQ(transfer->status, TransferStatus::ACTIVE);
    EXPECT_EQ(transfer->chunksSent, 1u);
    EXPECT_EQ(bob->countOf("transfer_active"), 1u);
}

TEST_F(ChunkForwarderTest, ChunkFromReceiverIsInvalidState) {
    const std::string id = start();
    RelayError error;
    EXPECT_FALSE(forwarder.forwardChunk("bob", chunk(id, 0), error));
    EXPECT_EQ(error.code, ErrorCodes::INVALID_STATE);
    EXPECT_EQ(alice->countOf("file_chunk"), 0u);
}

TEST_F(ChunkForwarderTest, ChunkOnDirectTransferIsInvalidState) {
    const std::string id = start(TransferMethod::DIRECT);
    RelayError error;
    EXPECT_FALSE(forwarder.forwardChunk("alice", chunk(id, 0), error));
    EXPECT_EQ(error.code, ErrorCodes::INVALID_STATE);
    EXPECT_EQ(bob->countOf("file_chunk"), 0u);
}

TEST_F(ChunkForwarderTest, ChunkOnUnknownTransferIsUnknownTransfer) {
    RelayError error;
    EXPECT_FALSE(forwarder.forwardChunk("alice", chunk("xfer_missing", 0), error));
    EXPECT_EQ(error.code, ErrorCodes::UNKNOWN_TRANSFER);
}

TEST_F(ChunkForwarderTest, IndexOutOfRangeOrTotalMismatchIsRejected) {
    const std::string id = start();
    RelayError error;

    EXPECT_FALSE(forwarder.forwardChunk("alice", chunk(id, 3), error));
    EXPECT_EQ(error.code, ErrorCodes::INVALID_STATE);

    error = RelayError{};
    EXPECT_FALSE(forwarder.forwardChunk("alice", chunk(id, 0, 5), error));
    EXPECT_EQ(error.code, ErrorCodes::INVALID_STATE);

    EXPECT_EQ(transfers.getTransfer(id)->chunksSent, 0u);
}

TEST_F(ChunkForwarderTest, UndeclaredTotalIsAdoptedFromFirstChunk) {
    const std::string id = start(TransferMethod::RELAYED, 0);
    RelayError error;
    ASSERT_TRUE(forwarder.forwardChunk("alice", chunk(id, 1, 7), error)) << error.message;
    EXPECT_EQ(transfers.getTransfer(id)->fileInfo.totalChunks, 7u);
}

TEST_F(ChunkForwarderTest, DuplicateChunkIsCountedNotForwarded) {
    const std::string id = start();
    RelayError error;
    ASSERT_TRUE(forwarder.forwardChunk("alice", chunk(id, 0), error));
    ASSERT_TRUE(forwarder.forwardChunk("alice", chunk(id, 0), error));

    EXPECT_EQ(bob->countOf("file_chunk"), 1u);

    auto transfer = transfers.getTransfer(id);
    EXPECT_EQ(transfer->chunksSent, 1u);
    EXPECT_EQ(transfer->duplicateChunks, 1u);

    auto acks = alice->ofType("chunk_ack");
    ASSERT_EQ(acks.size(), 1u);
    EXPECT_EQ(acks[0]["status"], "duplicate");
    EXPECT_EQ(acks[0]["chunk_index"], 0);
}

TEST_F(ChunkForwarderTest, AckIsForwardedToSenderWithCounters) {
    const std::string id = start();
    RelayError error;
    ASSERT_TRUE(forwarder.forwardChunk("alice", chunk(id, 0), error));
    ASSERT_TRUE(forwarder.forwardChunk("alice", chunk(id, 1), error));
    ASSERT_TRUE(forwarder.acknowledgeChunk("bob", ack(id, 0), error)) << error.message;

    auto acks = alice->ofType("chunk_ack");
    ASSERT_EQ(acks.size(), 1u);
    EXPECT_EQ(acks[0]["status"], "acknowledged");
    EXPECT_EQ(acks[0]["chunks_sent"], 2);
    EXPECT_EQ(acks[0]["chunks_acknowledged"], 1);
    EXPECT_EQ(acks[0]["total_chunks"], 3);
}

TEST_F(ChunkForwarderTest, DuplicateAckIsForwardedButNotCounted) {
    const std::string id = start();
    RelayError error;
    ASSERT_TRUE(forwarder.forwardChunk("alice", chunk(id, 0), error));
    ASSERT_TRUE(forwarder.acknowledgeChunk("bob", ack(id, 0), error));
    ASSERT_TRUE(forwarder.acknowledgeChunk("bob", ack(id, 0), error));

    EXPECT_EQ(alice->countOf("chunk_ack"), 2u);
    EXPECT_EQ(transfers.getTransfer(id)->chunksAcknowledged, 1u);
}

TEST_F(ChunkForwarderTest, AllChunksAcknowledgedDoesNotCompleteTransfer) {
    const std::string id = start();
    RelayError error;
    for (uint64_t i = 0; i < 3; ++i) {
        ASSERT_TRUE(forwarder.forwardChunk("alice", chunk(id, i), error));
        ASSERT_TRUE(forwarder.acknowledgeChunk("bob", ack(id, i), error));
    }

    auto transfer = transfers.getTransfer(id);
    EXPECT_EQ(transfer->chunksAcknowledged, 3u);
    EXPECT_EQ(transfer->status, TransferStatus::ACTIVE);
    EXPECT_EQ(bob->countOf("transfer_completed"), 0u);
}

TEST_F(ChunkForwarderTest, AckForUnsentIndexOrFromSenderIsRejected) {
    const std::string id = start();
    RelayError error;
    ASSERT_TRUE(forwarder.forwardChunk("alice", chunk(id, 0), error));

    EXPECT_FALSE(forwarder.acknowledgeChunk("bob", ack(id, 2), error));
    EXPECT_EQ(error.code, ErrorCodes::INVALID_STATE);

    error = RelayError{};
    EXPECT_FALSE(forwarder.acknowledgeChunk("alice", ack(id, 0), error));
    EXPECT_EQ(error.code, ErrorCodes::INVALID_STATE);

    EXPECT_EQ(transfers.getTransfer(id)->chunksAcknowledged, 0u);
}

TEST_F(ChunkForwarderTest, UnreachableReceiverIsUnknownPeerAndNotCounted) {
    const std::string id = start();
    bob->setFailSends(true);

    RelayError error;
    EXPECT_FALSE(forwarder.forwardChunk("alice", chunk(id, 0), error));
    EXPECT_EQ(error.code, ErrorCodes::UNKNOWN_PEER);
    EXPECT_EQ(transfers.getTransfer(id)->chunksSent, 0u);
}

TEST_F(ChunkForwarderTest, FailedForwardCanBeRetried) {
    const std::string id = start();
    bob->setFailSends(true);

    RelayError error;
    EXPECT_FALSE(forwarder.forwardChunk("alice", chunk(id, 1), error));
    EXPECT_FALSE(forwarder.acknowledgeChunk("bob", ack(id, 1), error));
    EXPECT_EQ(error.code, ErrorCodes::INVALID_STATE);

    bob->setFailSends(false);
    ASSERT_TRUE(forwarder.forwardChunk("alice", chunk(id, 1), error)) << error.message;
    EXPECT_EQ(bob->countOf("file_chunk"), 1u);

    auto transfer = transfers.getTransfer(id);
    EXPECT_EQ(transfer->chunksSent, 1u);
    EXPECT_EQ(transfer->duplicateChunks, 0u);
}

TEST_F(ChunkForwarderTest, AckArrivingDuringForwardIsCounted) {
    ASSERT_TRUE(registry.deregisterEndpoint("bob"));

    bool ackAccepted = false;
    std::string ackError;
    auto receiver = std::make_shared<CallbackChannel>([&](const nlohmann::json& message) {
        if (message.value("type", "") != "file_chunk") {
            return;
        }
        RelayError ackErr;
        ackAccepted = forwarder.acknowledgeChunk(
            "bob",
            ack(message["transfer_id"].get<std::string>(), message["chunk_index"].get<uint64_t>()),
            ackErr);
        ackError = ackErr.message;
    });
    RelayError error;
    ASSERT_TRUE(registry.registerEndpoint("bob", receiver, {}, "", error)) << error.message;

    const std::string id = start();
    ASSERT_TRUE(forwarder.forwardChunk("alice", chunk(id, 0), error)) << error.message;
    EXPECT_TRUE(ackAccepted) << ackError;

    auto transfer = transfers.getTransfer(id);
    EXPECT_EQ(transfer->chunksSent, 1u);
    EXPECT_EQ(transfer->chunksAcknowledged, 1u);
    EXPECT_EQ(alice->countOf("chunk_ack"), 1u);
}

TEST_F(ChunkForwarderTest, ChunkAfterCancelIsRejected) {
    const std::string id = start();
    RelayError error;
    ASSERT_TRUE(transfers.failOrCancel(id, TerminationReason::CLIENT_CANCELLED, "alice", error));

    EXPECT_FALSE(forwarder.forwardChunk("alice", chunk(id, 0), error));
    EXPECT_EQ(error.code, ErrorCodes::INVALID_STATE);
    EXPECT_EQ(bob->countOf("file_chunk"), 0u);
}
