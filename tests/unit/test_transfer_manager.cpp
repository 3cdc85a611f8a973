/**
 * @file test_transfer_manager.cpp
 * @brief Tests for the chunked, encrypted send and receive loops
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <thread>

#include "ChunkCipher.h"
#include "Constants.h"
#include "Crypto.h"
#include "ErrorCodes.h"
#include "EventBus.h"
#include "IntegrityVerifier.h"
#include "MemoryTransport.h"
#include "P2PEvents.h"
#include "RoomRegistry.h"
#include "TestHelpers.h"
#include "TransferManager.h"

using namespace CubeLink;
using namespace std::chrono_literals;

class TransferManagerTest : public ::testing::Test {
protected:
    TransferManagerTest()
        : registry_(test::testSettings(), bus_)
        , recorder_(std::make_unique<test::TransferRecorder>(bus_))
        , key_(Crypto::generateKey()) {}

    void SetUp() override {
        dir_ = test::makeTempDir("cubelink_transfer");
        auto room = registry_.createRoom(2);
        ASSERT_TRUE(room.isOk());
        roomId_ = room.value().roomId;
    }

    void TearDown() override {
        manager_.reset();
        std::filesystem::remove_all(dir_);
    }

    void start(size_t capacity, const P2PSettings& settings = test::testSettings()) {
        transport_ = std::make_shared<MemoryTransport>(capacity);
        transport_->setPeerHandler([this](const std::string&, const std::string&,
                                          std::shared_ptr<IDataChannel> channel) {
            sink_.accept(std::move(channel));
        });
        manager_ = std::make_unique<TransferManager>(settings, bus_, registry_, transport_);
    }

    std::string writeSource(const std::string& name, size_t size) {
        auto path = (dir_ / name).string();
        test::writeFile(path, test::patternBytes(size));
        return path;
    }

    Transfer finalState(const std::string& id) {
        EXPECT_TRUE(recorder_->waitForTerminal(id));
        auto transfer = manager_->getTransfer(id);
        EXPECT_TRUE(transfer.has_value());
        return transfer.value_or(Transfer{});
    }

    EventBus bus_;
    RoomRegistry registry_;
    std::unique_ptr<test::TransferRecorder> recorder_;
    test::ChannelSink sink_;
    std::vector<uint8_t> key_;
    std::filesystem::path dir_;
    std::string roomId_;
    std::shared_ptr<MemoryTransport> transport_;
    std::unique_ptr<TransferManager> manager_;
};

TEST_F(TransferManagerTest, PartialTailChunkIsCounted) {
    start(constants::DEFAULT_CHANNEL_CAPACITY);
    ASSERT_TRUE(manager_->installSessionKey(roomId_, key_).isOk());

    auto path = writeSource("report.pdf", 2621440);
    auto id = manager_->sendFile(roomId_, path);
    ASSERT_TRUE(id.isOk());

    auto transfer = manager_->getTransfer(id.value());
    ASSERT_TRUE(transfer.has_value());
    EXPECT_EQ(transfer->metadata.chunks, 3u);
    EXPECT_EQ(transfer->metadata.size, 2621440u);
    EXPECT_EQ(transfer->metadata.name, "report.pdf");
    EXPECT_EQ(transfer->metadata.mimeType, "application/pdf");
    EXPECT_EQ(transfer->metadata.checksum, IntegrityVerifier::hashFile(path).value());
    EXPECT_TRUE(transfer->isSender);

    sink_.startDraining();
    auto done = finalState(id.value());
    EXPECT_EQ(done.status, TransferStatus::Completed);
    EXPECT_DOUBLE_EQ(done.progress, 100.0);
    EXPECT_EQ(done.bytesTransferred, 2621440u);
    EXPECT_TRUE(done.startedAt.has_value());
    EXPECT_TRUE(done.completedAt.has_value());
    EXPECT_FALSE(done.error.has_value());

    // Frames open in order under the transfer-bound AAD
    ChunkCipher opener(key_);
    ASSERT_TRUE(sink_.waitForFrames(3));
    auto frames = sink_.frames();
    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(frames[0].size(), ChunkCipher::framedSize(constants::CHUNK_SIZE));
    EXPECT_EQ(frames[2].size(), ChunkCipher::framedSize(2621440 - 2 * constants::CHUNK_SIZE));

    std::vector<uint8_t> reassembled;
    for (size_t i = 0; i < frames.size(); ++i) {
        auto plaintext = opener.decryptChunk(frames[i], ChunkCipher::chunkAad(id.value(), i));
        ASSERT_TRUE(plaintext.isOk()) << "chunk " << i;
        reassembled.insert(reassembled.end(), plaintext.value().begin(), plaintext.value().end());
    }
    EXPECT_EQ(reassembled, test::readFile(path));
}

TEST_F(TransferManagerTest, StatusNeverMovesBackwardAndProgressIsMonotonic) {
    start(constants::DEFAULT_CHANNEL_CAPACITY);
    ASSERT_TRUE(manager_->installSessionKey(roomId_, key_).isOk());

    auto id = manager_->sendFile(roomId_, writeSource("movie.mp4", constants::CHUNK_SIZE * 4 + 17));
    ASSERT_TRUE(id.isOk());
    sink_.startDraining();
    ASSERT_EQ(finalState(id.value()).status, TransferStatus::Completed);

    auto entries = recorder_->entries(id.value());
    ASSERT_FALSE(entries.empty());
    EXPECT_EQ(entries.front().event, events::TRANSFER_CREATED);
    EXPECT_EQ(entries.front().transfer.status, TransferStatus::Pending);
    EXPECT_EQ(entries.back().event, events::TRANSFER_COMPLETED);

    std::vector<TransferStatus> statuses;
    double lastProgress = 0.0;
    uint64_t lastBytes = 0;
    for (const auto& entry : entries) {
        const auto& transfer = entry.transfer;
        if (statuses.empty() || statuses.back() != transfer.status) {
            if (!statuses.empty()) {
                EXPECT_TRUE(canTransition(statuses.back(), transfer.status))
                    << toString(statuses.back()) << " -> " << toString(transfer.status);
            }
            statuses.push_back(transfer.status);
        }
        EXPECT_GE(transfer.progress, lastProgress);
        EXPECT_LE(transfer.progress, 100.0);
        EXPECT_GE(transfer.bytesTransferred, lastBytes);
        lastProgress = transfer.progress;
        lastBytes = transfer.bytesTransferred;
    }

    std::vector<TransferStatus> expected = {
        TransferStatus::Pending, TransferStatus::Connecting, TransferStatus::Connected,
        TransferStatus::Transferring, TransferStatus::Completed};
    EXPECT_EQ(statuses, expected);
    EXPECT_EQ(recorder_->count(id.value(), events::TRANSFER_PROGRESS), 5u);
}

TEST_F(TransferManagerTest, EmptyFileCompletesWithoutFrames) {
    start(constants::DEFAULT_CHANNEL_CAPACITY);
    ASSERT_TRUE(manager_->installSessionKey(roomId_, key_).isOk());

    auto id = manager_->sendFile(roomId_, writeSource("empty.txt", 0));
    ASSERT_TRUE(id.isOk());
    EXPECT_EQ(manager_->getTransfer(id.value())->metadata.chunks, 0u);

    auto done = finalState(id.value());
    EXPECT_EQ(done.status, TransferStatus::Completed);
    EXPECT_DOUBLE_EQ(done.progress, 100.0);
    EXPECT_EQ(sink_.frameCount(), 0u);
}

TEST_F(TransferManagerTest, SourceModifiedDuringSendFailsVerification) {
    // One queued frame holds the sender on its second chunk
    start(1);
    ASSERT_TRUE(manager_->installSessionKey(roomId_, key_).isOk());

    auto path = writeSource("data.bin", constants::CHUNK_SIZE * 3);
    auto id = manager_->sendFile(roomId_, path);
    ASSERT_TRUE(id.isOk());

    ASSERT_TRUE(recorder_->waitFor(id.value(), events::TRANSFER_PROGRESS));
    test::flipByte(path, 10);
    sink_.startDraining();

    auto done = finalState(id.value());
    EXPECT_EQ(done.status, TransferStatus::Failed);
    ASSERT_TRUE(done.error.has_value());
    EXPECT_NE(done.error->find("Checksum mismatch"), std::string::npos);
}

TEST_F(TransferManagerTest, CancelStopsProgressImmediately) {
    start(1);
    ASSERT_TRUE(manager_->installSessionKey(roomId_, key_).isOk());

    auto id = manager_->sendFile(roomId_, writeSource("big.bin", constants::CHUNK_SIZE * 4));
    ASSERT_TRUE(id.isOk());
    ASSERT_TRUE(recorder_->waitFor(id.value(), events::TRANSFER_PROGRESS));
    ASSERT_EQ(manager_->getTransfer(id.value())->status, TransferStatus::Transferring);

    ASSERT_TRUE(manager_->cancelTransfer(id.value()).isOk());
    EXPECT_EQ(manager_->getTransfer(id.value())->status, TransferStatus::Cancelled);

    // Let the sender run past where it was blocked
    sink_.startDraining();
    std::this_thread::sleep_for(300ms);

    auto entries = recorder_->entries(id.value());
    bool seenCancel = false;
    for (const auto& entry : entries) {
        if (entry.event == events::TRANSFER_CANCELLED) {
            seenCancel = true;
        } else {
            EXPECT_FALSE(seenCancel) << "event after cancel: " << entry.event;
        }
    }
    EXPECT_TRUE(seenCancel);
    EXPECT_EQ(manager_->getTransfer(id.value())->status, TransferStatus::Cancelled);
    EXPECT_LE(sink_.frameCount(), 2u);

    auto cancelled = manager_->getTransfer(id.value());
    ASSERT_TRUE(cancelled->startedAt.has_value());
    ASSERT_TRUE(cancelled->completedAt.has_value());
    EXPECT_GE(*cancelled->completedAt, *cancelled->startedAt);

    auto again = manager_->cancelTransfer(id.value());
    ASSERT_TRUE(again.isError());
    EXPECT_TRUE(hasCode(again.error(), ErrorCode::INVALID_TRANSITION));
}

TEST_F(TransferManagerTest, SubscriberCanWaitOnCancelFromAnotherThread) {
    start(1);
    ASSERT_TRUE(manager_->installSessionKey(roomId_, key_).isOk());

    std::atomic<bool> handled{false};
    std::atomic<bool> cancelReturned{false};
    bus_.subscribe(events::TRANSFER_PROGRESS, [&](const std::any& data) {
        if (handled.exchange(true)) {
            return;
        }
        const auto& transfer = std::any_cast<const Transfer&>(data);
        auto canceller = std::async(std::launch::async, [&, id = transfer.id]() {
            return manager_->cancelTransfer(id).isOk();
        });
        if (canceller.wait_for(2s) == std::future_status::ready) {
            cancelReturned = canceller.get();
        }
    });

    auto id = manager_->sendFile(roomId_, writeSource("big.bin", constants::CHUNK_SIZE * 3));
    ASSERT_TRUE(id.isOk());

    auto done = finalState(id.value());
    EXPECT_TRUE(cancelReturned);
    EXPECT_EQ(done.status, TransferStatus::Cancelled);
    EXPECT_EQ(recorder_->count(id.value(), events::TRANSFER_PROGRESS), 1u);

    auto entries = recorder_->entries(id.value());
    ASSERT_FALSE(entries.empty());
    EXPECT_EQ(entries.back().event, events::TRANSFER_CANCELLED);
}

TEST_F(TransferManagerTest, MissingSessionKeyFails) {
    start(constants::DEFAULT_CHANNEL_CAPACITY);
    auto id = manager_->sendFile(roomId_, writeSource("a.txt", 100));
    ASSERT_TRUE(id.isOk());

    auto done = finalState(id.value());
    EXPECT_EQ(done.status, TransferStatus::Failed);
    ASSERT_TRUE(done.error.has_value());
    EXPECT_NE(done.error->find("No session key"), std::string::npos);
}

TEST_F(TransferManagerTest, UnavailableTransportFails) {
    start(constants::DEFAULT_CHANNEL_CAPACITY);
    ASSERT_TRUE(manager_->installSessionKey(roomId_, key_).isOk());
    transport_->setAvailable(false);

    auto id = manager_->sendFile(roomId_, writeSource("a.txt", 100));
    ASSERT_TRUE(id.isOk());

    auto done = finalState(id.value());
    EXPECT_EQ(done.status, TransferStatus::Failed);
    ASSERT_TRUE(done.error.has_value());
    EXPECT_NE(done.error->find("Data channel unavailable"), std::string::npos);
}

TEST_F(TransferManagerTest, SendFileRejectsBadInput) {
    start(constants::DEFAULT_CHANNEL_CAPACITY);

    auto noRoom = manager_->sendFile("no-such-room", writeSource("a.txt", 10));
    ASSERT_TRUE(noRoom.isError());
    EXPECT_TRUE(hasCode(noRoom.error(), ErrorCode::ROOM_NOT_FOUND));

    auto missing = manager_->sendFile(roomId_, (dir_ / "absent.bin").string());
    ASSERT_TRUE(missing.isError());
    EXPECT_TRUE(hasCode(missing.error(), ErrorCode::FILE_IO_ERROR));

    auto directory = manager_->sendFile(roomId_, dir_.string());
    ASSERT_TRUE(directory.isError());
    EXPECT_TRUE(hasCode(directory.error(), ErrorCode::FILE_IO_ERROR));

    EXPECT_TRUE(manager_->listTransfers().empty());
}

TEST_F(TransferManagerTest, InvalidSessionKeyIsRejected) {
    start(constants::DEFAULT_CHANNEL_CAPACITY);
    auto result = manager_->installSessionKey(roomId_, std::vector<uint8_t>(8, 1));
    ASSERT_TRUE(result.isError());
    EXPECT_TRUE(hasCode(result.error(), ErrorCode::INVALID_CONFIGURATION));
    EXPECT_FALSE(manager_->hasSessionKey(roomId_));
}

// ---------------------------------------------------------------------------
// Receiving side, fed by hand through a channel pair
// ---------------------------------------------------------------------------

class IncomingTransferTest : public TransferManagerTest {
protected:
    FileMetadata metadataFor(const std::vector<uint8_t>& data, const std::string& name) {
        FileMetadata metadata;
        metadata.name = name;
        metadata.size = data.size();
        metadata.mimeType = constants::DEFAULT_MIME_TYPE;
        metadata.chunks = (data.size() + constants::CHUNK_SIZE - 1) / constants::CHUNK_SIZE;
        metadata.checksum = IntegrityVerifier::hashBytes(data);
        return metadata;
    }

    // Seals chunk `index` of data with the room key
    std::vector<uint8_t> sealChunk(const std::vector<uint8_t>& data, const std::string& transferId,
                                   uint64_t index) {
        size_t offset = static_cast<size_t>(index) * constants::CHUNK_SIZE;
        size_t length = std::min(constants::CHUNK_SIZE, data.size() - offset);
        std::vector<uint8_t> chunk(data.begin() + offset, data.begin() + offset + length);
        return ChunkCipher(key_).encryptChunk(chunk, ChunkCipher::chunkAad(transferId, index)).value();
    }
};

TEST_F(IncomingTransferTest, ReceivesAndVerifies) {
    start(constants::DEFAULT_CHANNEL_CAPACITY);
    ASSERT_TRUE(manager_->installSessionKey(roomId_, key_).isOk());

    auto data = test::patternBytes(constants::CHUNK_SIZE + 4000, 3);
    auto registered = manager_->registerIncoming(roomId_, "t-in", metadataFor(data, "in.bin"));
    ASSERT_TRUE(registered.isOk());
    EXPECT_FALSE(registered.value().isSender);
    EXPECT_EQ(registered.value().status, TransferStatus::Pending);

    auto [local, remote] = MemoryChannel::createPair(4);
    ASSERT_TRUE(manager_->attachInboundChannel("t-in", remote).isOk());

    auto savePath = (dir_ / "out.bin").string();
    ASSERT_TRUE(manager_->receiveFile("t-in", savePath).isOk());

    ASSERT_TRUE(local->send(sealChunk(data, "t-in", 0), 1s));
    ASSERT_TRUE(local->send(sealChunk(data, "t-in", 1), 1s));

    auto done = finalState("t-in");
    EXPECT_EQ(done.status, TransferStatus::Completed);
    EXPECT_EQ(done.bytesTransferred, data.size());
    EXPECT_EQ(test::readFile(savePath), data);
}

TEST_F(IncomingTransferTest, ChecksumMismatchFails) {
    start(constants::DEFAULT_CHANNEL_CAPACITY);
    ASSERT_TRUE(manager_->installSessionKey(roomId_, key_).isOk());

    auto data = test::patternBytes(5000, 3);
    auto metadata = metadataFor(data, "in.bin");
    metadata.checksum = IntegrityVerifier::hashBytes(test::patternBytes(5000, 4));
    ASSERT_TRUE(manager_->registerIncoming(roomId_, "t-bad", metadata).isOk());

    auto [local, remote] = MemoryChannel::createPair(4);
    ASSERT_TRUE(manager_->attachInboundChannel("t-bad", remote).isOk());
    ASSERT_TRUE(manager_->receiveFile("t-bad", (dir_ / "out.bin").string()).isOk());
    ASSERT_TRUE(local->send(sealChunk(data, "t-bad", 0), 1s));

    auto done = finalState("t-bad");
    EXPECT_EQ(done.status, TransferStatus::Failed);
    ASSERT_TRUE(done.error.has_value());
    EXPECT_NE(done.error->find("Checksum mismatch"), std::string::npos);
}

TEST_F(IncomingTransferTest, OutOfOrderChunkFailsDecryption) {
    start(constants::DEFAULT_CHANNEL_CAPACITY);
    ASSERT_TRUE(manager_->installSessionKey(roomId_, key_).isOk());

    auto data = test::patternBytes(constants::CHUNK_SIZE * 2, 5);
    ASSERT_TRUE(manager_->registerIncoming(roomId_, "t-swap", metadataFor(data, "in.bin")).isOk());

    auto [local, remote] = MemoryChannel::createPair(4);
    ASSERT_TRUE(manager_->attachInboundChannel("t-swap", remote).isOk());
    ASSERT_TRUE(manager_->receiveFile("t-swap", (dir_ / "out.bin").string()).isOk());
    ASSERT_TRUE(local->send(sealChunk(data, "t-swap", 1), 1s));
    ASSERT_TRUE(local->send(sealChunk(data, "t-swap", 0), 1s));

    auto done = finalState("t-swap");
    EXPECT_EQ(done.status, TransferStatus::Failed);
    ASSERT_TRUE(done.error.has_value());
    EXPECT_NE(done.error->find("decryption failed"), std::string::npos);
}

TEST_F(IncomingTransferTest, SilentSenderTimesOut) {
    auto settings = test::testSettings();
    settings.idleTimeout = 200ms;
    start(constants::DEFAULT_CHANNEL_CAPACITY, settings);
    ASSERT_TRUE(manager_->installSessionKey(roomId_, key_).isOk());

    auto data = test::patternBytes(100);
    ASSERT_TRUE(manager_->registerIncoming(roomId_, "t-idle", metadataFor(data, "in.bin")).isOk());
    auto [local, remote] = MemoryChannel::createPair(4);
    ASSERT_TRUE(manager_->attachInboundChannel("t-idle", remote).isOk());
    ASSERT_TRUE(manager_->receiveFile("t-idle", (dir_ / "out.bin").string()).isOk());

    auto done = finalState("t-idle");
    EXPECT_EQ(done.status, TransferStatus::Failed);
    ASSERT_TRUE(done.error.has_value());
    EXPECT_NE(done.error->find("Transfer idle timeout"), std::string::npos);
}

TEST_F(IncomingTransferTest, NoChannelTimesOut) {
    auto settings = test::testSettings();
    settings.idleTimeout = 200ms;
    start(constants::DEFAULT_CHANNEL_CAPACITY, settings);
    ASSERT_TRUE(manager_->installSessionKey(roomId_, key_).isOk());

    ASSERT_TRUE(manager_->registerIncoming(roomId_, "t-none", metadataFor({1, 2, 3}, "in.bin")).isOk());
    ASSERT_TRUE(manager_->receiveFile("t-none", (dir_ / "out.bin").string()).isOk());

    auto done = finalState("t-none");
    EXPECT_EQ(done.status, TransferStatus::Failed);
    EXPECT_NE(done.error.value_or("").find("no data channel"), std::string::npos);
}

TEST_F(IncomingTransferTest, RegistrationAndReceiveErrors) {
    start(constants::DEFAULT_CHANNEL_CAPACITY);
    auto metadata = metadataFor({1, 2, 3}, "in.bin");

    auto noRoom = manager_->registerIncoming("no-such-room", "t-x", metadata);
    ASSERT_TRUE(noRoom.isError());
    EXPECT_TRUE(hasCode(noRoom.error(), ErrorCode::ROOM_NOT_FOUND));

    ASSERT_TRUE(manager_->registerIncoming(roomId_, "t-x", metadata).isOk());
    auto duplicate = manager_->registerIncoming(roomId_, "t-x", metadata);
    ASSERT_TRUE(duplicate.isError());
    EXPECT_TRUE(hasCode(duplicate.error(), ErrorCode::INVALID_TRANSITION));

    auto unknown = manager_->receiveFile("t-unknown", (dir_ / "out.bin").string());
    ASSERT_TRUE(unknown.isError());
    EXPECT_TRUE(hasCode(unknown.error(), ErrorCode::TRANSFER_NOT_FOUND));

    auto cancelUnknown = manager_->cancelTransfer("t-unknown");
    ASSERT_TRUE(cancelUnknown.isError());
    EXPECT_TRUE(hasCode(cancelUnknown.error(), ErrorCode::TRANSFER_NOT_FOUND));

    // Cancelled while still pending; a later receive is refused
    ASSERT_TRUE(manager_->cancelTransfer("t-x").isOk());
    EXPECT_TRUE(manager_->getTransfer("t-x")->completedAt.has_value());
    EXPECT_FALSE(manager_->getTransfer("t-x")->startedAt.has_value());
    auto afterCancel = manager_->receiveFile("t-x", (dir_ / "out.bin").string());
    ASSERT_TRUE(afterCancel.isError());
    EXPECT_TRUE(hasCode(afterCancel.error(), ErrorCode::INVALID_TRANSITION));

    ASSERT_TRUE(manager_->installSessionKey(roomId_, key_).isOk());
    auto outgoing = manager_->sendFile(roomId_, writeSource("a.txt", 10));
    ASSERT_TRUE(outgoing.isOk());
    auto receiveOutgoing = manager_->receiveFile(outgoing.value(), (dir_ / "out.bin").string());
    ASSERT_TRUE(receiveOutgoing.isError());
    EXPECT_TRUE(hasCode(receiveOutgoing.error(), ErrorCode::INVALID_TRANSITION));

    EXPECT_EQ(manager_->listTransfers(roomId_).size(), 2u);
    EXPECT_TRUE(manager_->listTransfers("other-room").empty());
}

TEST_F(IncomingTransferTest, ChannelsOnlyAttachToLiveIncomingTransfers) {
    start(constants::DEFAULT_CHANNEL_CAPACITY);
    ASSERT_TRUE(manager_->installSessionKey(roomId_, key_).isOk());
    auto metadata = metadataFor({1, 2, 3}, "in.bin");

    auto [strayLocal, strayRemote] = MemoryChannel::createPair(4);
    auto stray = manager_->attachInboundChannel("t-unknown", strayRemote);
    ASSERT_TRUE(stray.isError());
    EXPECT_TRUE(hasCode(stray.error(), ErrorCode::TRANSFER_NOT_FOUND));
    EXPECT_FALSE(strayLocal->isOpen());

    auto none = manager_->attachInboundChannel("t-unknown", nullptr);
    ASSERT_TRUE(none.isError());
    EXPECT_TRUE(hasCode(none.error(), ErrorCode::TRANSPORT_UNAVAILABLE));

    // Cancelled before its channel arrived
    ASSERT_TRUE(manager_->registerIncoming(roomId_, "t-gone", metadata).isOk());
    ASSERT_TRUE(manager_->cancelTransfer("t-gone").isOk());
    auto [lateLocal, lateRemote] = MemoryChannel::createPair(4);
    auto late = manager_->attachInboundChannel("t-gone", lateRemote);
    ASSERT_TRUE(late.isError());
    EXPECT_TRUE(hasCode(late.error(), ErrorCode::INVALID_TRANSITION));
    EXPECT_FALSE(lateLocal->isOpen());

    auto outgoing = manager_->sendFile(roomId_, writeSource("a.txt", 10));
    ASSERT_TRUE(outgoing.isOk());
    auto [outLocal, outRemote] = MemoryChannel::createPair(4);
    auto wrongSide = manager_->attachInboundChannel(outgoing.value(), outRemote);
    ASSERT_TRUE(wrongSide.isError());
    EXPECT_TRUE(hasCode(wrongSide.error(), ErrorCode::INVALID_TRANSITION));

    EXPECT_EQ(manager_->pendingChannels(), 0u);
}

TEST_F(IncomingTransferTest, UnclaimedChannelIsReleasedWhenTransferEnds) {
    start(constants::DEFAULT_CHANNEL_CAPACITY);
    ASSERT_TRUE(manager_->registerIncoming(roomId_, "t-idle", metadataFor({1, 2, 3}, "in.bin")).isOk());

    auto [local, remote] = MemoryChannel::createPair(4);
    ASSERT_TRUE(manager_->attachInboundChannel("t-idle", remote).isOk());
    EXPECT_EQ(manager_->pendingChannels(), 1u);

    auto [secondLocal, secondRemote] = MemoryChannel::createPair(4);
    auto second = manager_->attachInboundChannel("t-idle", secondRemote);
    ASSERT_TRUE(second.isError());
    EXPECT_TRUE(hasCode(second.error(), ErrorCode::INVALID_TRANSITION));
    EXPECT_FALSE(secondLocal->isOpen());
    EXPECT_TRUE(local->isOpen());

    // Rejected offer: the receiver never calls receiveFile()
    ASSERT_TRUE(manager_->cancelTransfer("t-idle").isOk());
    EXPECT_EQ(manager_->pendingChannels(), 0u);
    EXPECT_FALSE(local->isOpen());
}

TEST_F(IncomingTransferTest, ShutdownCancelsWaitingReceiver) {
    start(constants::DEFAULT_CHANNEL_CAPACITY);
    ASSERT_TRUE(manager_->installSessionKey(roomId_, key_).isOk());
    ASSERT_TRUE(manager_->registerIncoming(roomId_, "t-wait", metadataFor({1, 2, 3}, "in.bin")).isOk());
    ASSERT_TRUE(manager_->receiveFile("t-wait", (dir_ / "out.bin").string()).isOk());

    manager_->shutdown();
    EXPECT_EQ(manager_->getTransfer("t-wait")->status, TransferStatus::Cancelled);

    auto refused = manager_->sendFile(roomId_, writeSource("late.txt", 10));
    EXPECT_TRUE(refused.isError());
}
