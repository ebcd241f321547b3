/**
 * @file transfer_manager_test.cpp
 * @brief Unit tests for the transfer lifecycle state machine
 */

#include "peerrelay/TransferManager.h"
#include "TestChannels.h"
#include <gtest/gtest.h>

#include <string>
#include <thread>

using namespace PeerRelay;
using PeerRelay::testing_support::RecordingChannel;
using PeerRelay::testing_support::registerRecording;

namespace {

FileDescriptor sampleFile(uint64_t totalChunks = 4) {
    return FileDescriptor::fromJson({
        {"name", "photo.jpg"},
        {"size", 4096},
        {"mime_type", "image/jpeg"},
        {"total_chunks", totalChunks},
        {"chunk_size", 1024}
    });
}

}  // namespace

class TransferManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        alice = registerRecording(registry, "alice");
        bob = registerRecording(registry, "bob");
        ASSERT_TRUE(alice && bob);
    }

    std::string start(std::optional<TransferMethod> method = std::nullopt) {
        std::string id;
        RelayError error;
        EXPECT_TRUE(manager.startTransfer("alice", "bob", sampleFile(), method, id, error))
            << error.message;
        return id;
    }

    EndpointRegistry registry;
    TransferManager manager{registry};
    std::shared_ptr<RecordingChannel> alice;
    std::shared_ptr<RecordingChannel> bob;
};

TEST_F(TransferManagerTest, StartCreatesPendingRelayedTransferByDefault) {
    const std::string id = start();
    ASSERT_EQ(id.rfind("xfer_", 0), 0u);

    auto transfer = manager.getTransfer(id);
    ASSERT_TRUE(transfer.has_value());
    EXPECT_EQ(transfer->status, TransferStatus::PENDING);
    EXPECT_EQ(transfer->method, TransferMethod::RELAYED);

    auto incoming = bob->ofType("incoming_transfer");
    ASSERT_EQ(incoming.size(), 1u);
    EXPECT_EQ(incoming[0]["transfer_id"], id);
    EXPECT_EQ(incoming[0]["file_info"]["name"], "photo.jpg");

    auto started = alice->ofType("transfer_started");
    ASSERT_EQ(started.size(), 1u);
    EXPECT_EQ(started[0]["method"], "relayed");
}

TEST_F(TransferManagerTest, StartToUnregisteredReceiverCreatesNoRecord) {
    std::string id;
    RelayError error;
    EXPECT_FALSE(manager.startTransfer("alice", "carol", sampleFile(), std::nullopt, id, error));
    EXPECT_EQ(error.code, ErrorCodes::UNKNOWN_PEER);
    EXPECT_TRUE(id.empty());
    EXPECT_EQ(manager.size(), 0u);
}

TEST_F(TransferManagerTest, StartWhenReceiverSendFailsCreatesNoRecord) {
    bob->setFailSends(true);
    std::string id;
    RelayError error;
    EXPECT_FALSE(manager.startTransfer("alice", "bob", sampleFile(), std::nullopt, id, error));
    EXPECT_EQ(error.code, ErrorCodes::UNKNOWN_PEER);
    EXPECT_EQ(manager.size(), 0u);
}

TEST_F(TransferManagerTest, StartToSelfIsInvalid) {
    std::string id;
    RelayError error;
    EXPECT_FALSE(manager.startTransfer("alice", "alice", sampleFile(), std::nullopt, id, error));
    EXPECT_EQ(error.code, ErrorCodes::INVALID_STATE);
}

TEST_F(TransferManagerTest, BeginIsIdempotentAndNotifiesBothOnce) {
    const std::string id = start();
    RelayError error;
    ASSERT_TRUE(manager.begin(id, error));
    ASSERT_TRUE(manager.begin(id, error));

    EXPECT_EQ(manager.getTransfer(id)->status, TransferStatus::ACTIVE);
    EXPECT_EQ(alice->countOf("transfer_active"), 1u);
    EXPECT_EQ(bob->countOf("transfer_active"), 1u);
}

TEST_F(TransferManagerTest, CompleteRequiresActive) {
    const std::string id = start();
    RelayError error;
    EXPECT_FALSE(manager.complete(id, error));
    EXPECT_EQ(error.code, ErrorCodes::INVALID_STATE);

    ASSERT_TRUE(manager.begin(id, error));
    ASSERT_TRUE(manager.complete(id, error));
    EXPECT_EQ(manager.getTransfer(id)->status, TransferStatus::COMPLETED);

    // Idempotent on an already completed transfer.
    EXPECT_TRUE(manager.complete(id, error));
    EXPECT_EQ(alice->countOf("transfer_completed"), 1u);
    EXPECT_EQ(bob->countOf("transfer_completed"), 1u);
}

TEST_F(TransferManagerTest, CompleteByNonParticipantIsUnknownTransfer) {
    auto carol = registerRecording(registry, "carol");
    ASSERT_NE(carol, nullptr);
    const std::string id = start();
    RelayError error;
    ASSERT_TRUE(manager.begin(id, error));

    EXPECT_FALSE(manager.complete(id, error, "carol"));
    EXPECT_EQ(error.code, ErrorCodes::UNKNOWN_TRANSFER);
}

TEST_F(TransferManagerTest, ProgressIsClampedIntoRange) {
    const std::string id = start(TransferMethod::RELAYED);

    manager.reportProgress("alice", id, TransferRole::SENDER, 150.0, 3);
    EXPECT_DOUBLE_EQ(manager.getTransfer(id)->senderProgress, 100.0);

    manager.reportProgress("bob", id, TransferRole::RECEIVER, -5.0, std::nullopt);
    EXPECT_DOUBLE_EQ(manager.getTransfer(id)->receiverProgress, 0.0);
    EXPECT_EQ(manager.getTransfer(id)->senderChunks, 3u);
}

TEST_F(TransferManagerTest, ProgressNeverChangesStatusOfRelayedTransfer) {
    const std::string id = start(TransferMethod::RELAYED);
    manager.reportProgress("alice", id, TransferRole::SENDER, 50.0, std::nullopt);
    EXPECT_EQ(manager.getTransfer(id)->status, TransferStatus::PENDING);
}

TEST_F(TransferManagerTest, ProgressIsMirroredToPeerWithSyncLag) {
    const std::string id = start();
    manager.reportProgress("alice", id, std::nullopt, 60.0, 6);
    manager.reportProgress("bob", id, std::nullopt, 40.0, 4);

    auto toBob = bob->ofType("transfer_progress");
    ASSERT_EQ(toBob.size(), 1u);
    EXPECT_EQ(toBob[0]["role"], "sender");
    EXPECT_DOUBLE_EQ(toBob[0]["progress"].get<double>(), 60.0);

    auto toAlice = alice->ofType("transfer_progress");
    ASSERT_EQ(toAlice.size(), 1u);
    EXPECT_DOUBLE_EQ(toAlice[0]["sync_lag"].get<double>(), 20.0);
}

TEST_F(TransferManagerTest, ProgressWithMismatchedRoleIsIgnored) {
    const std::string id = start();
    manager.reportProgress("bob", id, TransferRole::SENDER, 80.0, std::nullopt);
    EXPECT_DOUBLE_EQ(manager.getTransfer(id)->senderProgress, 0.0);
    EXPECT_EQ(alice->countOf("transfer_progress"), 0u);
}

TEST_F(TransferManagerTest, ProgressOnUnknownOrTerminalTransferIsIgnored) {
    manager.reportProgress("alice", "xfer_missing", TransferRole::SENDER, 10.0, std::nullopt);

    const std::string id = start();
    RelayError error;
    ASSERT_TRUE(manager.failOrCancel(id, TerminationReason::CLIENT_CANCELLED, "alice", error));
    bob->clear();

    manager.reportProgress("alice", id, TransferRole::SENDER, 10.0, std::nullopt);
    EXPECT_DOUBLE_EQ(manager.getTransfer(id)->senderProgress, 0.0);
    EXPECT_EQ(manager.getTransfer(id)->status, TransferStatus::CANCELLED);
    EXPECT_TRUE(bob->messages().empty());
}

TEST_F(TransferManagerTest, SenderProgressBeginsDirectTransfer) {
    const std::string id = start(TransferMethod::DIRECT);
    manager.reportProgress("bob", id, TransferRole::RECEIVER, 0.0, std::nullopt);
    EXPECT_EQ(manager.getTransfer(id)->status, TransferStatus::PENDING);

    manager.reportProgress("alice", id, TransferRole::SENDER, 5.0, std::nullopt);
    EXPECT_EQ(manager.getTransfer(id)->status, TransferStatus::ACTIVE);
    EXPECT_EQ(bob->countOf("transfer_active"), 1u);
}

TEST_F(TransferManagerTest, CancelPendingEndsCancelledAndNotifiesPeerOnly) {
    const std::string id = start();
    RelayError error;
    ASSERT_TRUE(manager.failOrCancel(id, TerminationReason::CLIENT_CANCELLED, "alice", error, "user"));

    auto transfer = manager.getTransfer(id);
    EXPECT_EQ(transfer->status, TransferStatus::CANCELLED);
    EXPECT_EQ(transfer->failureReason, "cancelled_by_peer: user");
    EXPECT_EQ(bob->countOf("transfer_cancelled"), 1u);
    EXPECT_EQ(alice->countOf("transfer_cancelled"), 0u);

    // No-op once terminal.
    EXPECT_TRUE(manager.failOrCancel(id, TerminationReason::CLIENT_CANCELLED, "bob", error));
    EXPECT_EQ(alice->countOf("transfer_cancelled"), 0u);
}

TEST_F(TransferManagerTest, DisconnectDuringActiveFails) {
    const std::string id = start();
    RelayError error;
    ASSERT_TRUE(manager.begin(id, error));

    EXPECT_EQ(manager.abortTransfersFor("alice"), 1u);
    EXPECT_EQ(manager.getTransfer(id)->status, TransferStatus::FAILED);
    EXPECT_EQ(bob->countOf("transfer_failed"), 1u);

    EXPECT_EQ(manager.abortTransfersFor("alice"), 0u);
    EXPECT_EQ(bob->countOf("transfer_failed"), 1u);
}

TEST_F(TransferManagerTest, RejectCancelsAndTellsSender) {
    const std::string id = start();
    RelayError error;
    ASSERT_TRUE(manager.respond("bob", id, false, "busy", error));

    EXPECT_EQ(manager.getTransfer(id)->status, TransferStatus::CANCELLED);
    auto rejected = alice->ofType("transfer_rejected");
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0]["reason"], "rejected: busy");
}

TEST_F(TransferManagerTest, AcceptNotifiesSenderWithoutStateChange) {
    const std::string id = start();
    RelayError error;
    ASSERT_TRUE(manager.respond("bob", id, true, "", error));

    EXPECT_EQ(manager.getTransfer(id)->status, TransferStatus::PENDING);
    EXPECT_EQ(alice->countOf("transfer_accepted"), 1u);

    EXPECT_FALSE(manager.respond("alice", id, true, "", error));
    EXPECT_EQ(error.code, ErrorCodes::INVALID_STATE);
}

TEST_F(TransferManagerTest, AcceptBeginsDirectTransfer) {
    const std::string id = start(TransferMethod::DIRECT);
    RelayError error;
    ASSERT_TRUE(manager.respond("bob", id, true, "", error)) << error.message;

    EXPECT_EQ(manager.getTransfer(id)->status, TransferStatus::ACTIVE);
    EXPECT_EQ(alice->countOf("transfer_accepted"), 1u);
    EXPECT_EQ(alice->countOf("transfer_active"), 1u);
    EXPECT_EQ(bob->countOf("transfer_active"), 1u);

    ASSERT_TRUE(manager.complete(id, error, "alice")) << error.message;
    EXPECT_EQ(manager.getTransfer(id)->status, TransferStatus::COMPLETED);
}

TEST_F(TransferManagerTest, DowngradeIsOneWay) {
    const std::string id = start(TransferMethod::DIRECT);
    RelayError error;
    ASSERT_TRUE(manager.downgradeMethod(id, "ice_failed", error));
    EXPECT_EQ(manager.getTransfer(id)->method, TransferMethod::RELAYED);
    EXPECT_EQ(alice->countOf("transfer_method_changed"), 1u);
    EXPECT_EQ(bob->countOf("transfer_method_changed"), 1u);

    EXPECT_FALSE(manager.downgradeMethod(id, "again", error));
    EXPECT_EQ(error.code, ErrorCodes::INVALID_STATE);
}

TEST_F(TransferManagerTest, DowngradeOfTerminalTransferIsInvalid) {
    const std::string id = start(TransferMethod::DIRECT);
    RelayError error;
    ASSERT_TRUE(manager.failOrCancel(id, TerminationReason::CLIENT_CANCELLED, "alice", error));
    EXPECT_FALSE(manager.downgradeMethod(id, "late", error));
    EXPECT_EQ(error.code, ErrorCodes::INVALID_STATE);
}

TEST_F(TransferManagerTest, GarbageCollectionKeepsLiveTransfers) {
    const std::string live = start();
    const std::string done = start();
    RelayError error;
    ASSERT_TRUE(manager.failOrCancel(done, TerminationReason::CLIENT_CANCELLED, "alice", error));

    EXPECT_EQ(manager.collectGarbage(60000), 0u);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(manager.collectGarbage(5), 1u);

    EXPECT_TRUE(manager.getTransfer(live).has_value());
    EXPECT_FALSE(manager.getTransfer(done).has_value());
    EXPECT_EQ(manager.activeCount(), 1u);
}
