#pragma once

#include "ChunkCipher.h"
#include "EventBus.h"
#include "IDataChannel.h"
#include "P2PSettings.h"
#include "P2PTypes.h"
#include "Result.h"
#include "RoomRegistry.h"
#include "ThreadPool.h"
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace CubeLink {

    /**
     * @brief Drives file transfers through their state machine.
     *
     * Pending -> Connecting -> Connected -> Transferring -> {Completed,
     * Failed, Cancelled}. Each send or receive runs as a task on the
     * manager's ThreadPool, carrying a cancellation token and a join handle.
     *
     * Files move in 1 MiB chunks, each sealed by the room's ChunkCipher and
     * bound to its position through the associated data. Pacing comes from
     * the data channel's backpressure. Both sides re-hash the whole file at
     * the end and fail the transfer on a checksum mismatch.
     *
     * Events of one transfer are queued in status order under the manager's
     * lock and published outside it by one thread at a time. Nothing follows
     * p2p:transfer_cancelled (or any other terminal event) for that transfer.
     * Subscribers may call back into the manager, including cancelTransfer()
     * from another thread they wait on; an event raised while the same
     * transfer's events are being delivered is published after the current
     * subscriber returns.
     */
    class TransferManager {
    public:
        TransferManager(const P2PSettings& settings,
                        EventBus& eventBus,
                        RoomRegistry& rooms,
                        std::shared_ptr<ITransport> transport);
        ~TransferManager();

        TransferManager(const TransferManager&) = delete;
        TransferManager& operator=(const TransferManager&) = delete;

        using CreatedHook = std::function<void(const Transfer&)>;

        /**
         * @brief Start sending a file to a room.
         *
         * Hashes the file and publishes p2p:transfer_created. onCreated, if
         * given, runs next; both happen before the background task starts.
         * @return The transfer id; ROOM_NOT_FOUND or FILE_IO_ERROR otherwise.
         */
        Result<std::string> sendFile(const std::string& roomId, const std::string& path,
                                     const CreatedHook& onCreated = nullptr);

        /**
         * @brief Record a transfer offered by a remote sender.
         * The transfer waits in Pending until receiveFile() is called.
         */
        Result<Transfer> registerIncoming(const std::string& roomId,
                                          const std::string& transferId,
                                          const FileMetadata& metadata);

        /**
         * @brief Hand over the channel a remote sender opened for a transfer.
         *
         * May arrive before or after receiveFile(). A channel waiting here is
         * closed when its transfer ends without claiming it.
         * @return TRANSFER_NOT_FOUND for unregistered ids, INVALID_TRANSITION
         *         for outgoing or finished transfers or a second channel.
         *         A refused channel is closed.
         */
        VoidResult attachInboundChannel(const std::string& transferId,
                                        std::shared_ptr<IDataChannel> channel);

        /**
         * @brief Start receiving a registered transfer into savePath.
         * @return TRANSFER_NOT_FOUND, or INVALID_TRANSITION unless Pending.
         */
        VoidResult receiveFile(const std::string& transferId, const std::string& savePath);

        /**
         * @brief Cancel a transfer.
         * The task stops at its next chunk boundary and releases its file.
         * @return TRANSFER_NOT_FOUND, or INVALID_TRANSITION if already terminal.
         */
        VoidResult cancelTransfer(const std::string& transferId);

        std::optional<Transfer> getTransfer(const std::string& transferId) const;
        std::vector<Transfer> listTransfers() const;
        std::vector<Transfer> listTransfers(const std::string& roomId) const;

        /**
         * @brief Install the chunk key agreed for a room.
         * @return INVALID_CONFIGURATION for a key of the wrong size.
         */
        VoidResult installSessionKey(const std::string& roomId, const std::vector<uint8_t>& key);
        bool hasSessionKey(const std::string& roomId) const;
        void removeSessionKey(const std::string& roomId);

        // Inbound channels not yet claimed by a receive task
        size_t pendingChannels() const;

        /**
         * @brief Cancel every unfinished transfer and join all tasks.
         */
        void shutdown();

    private:
        using CancelToken = ThreadPool::CancelToken;

        struct Outbox {
            std::deque<std::pair<const char*, Transfer>> events;
            bool draining = false;
        };

        void launch(const std::string& transferId,
                    void (TransferManager::*body)(const std::string&, const std::string&, const CancelToken&),
                    const std::string& path);

        void runSend(const std::string& transferId, const std::string& path, const CancelToken& token);
        void runReceive(const std::string& transferId, const std::string& savePath, const CancelToken& token);

        bool transition(const std::string& transferId, TransferStatus to,
                        const std::optional<Error>& error = std::nullopt);
        bool fail(const std::string& transferId, const Error& error);
        bool reportProgress(const std::string& transferId, uint64_t bytes,
                            std::chrono::steady_clock::time_point startedAt);

        // Caller holds mutex_
        void queueEvent(const char* eventName, const Transfer& snapshot);
        // Caller does not hold mutex_; returns at once if another call is already publishing
        void flushEvents(const std::string& transferId);

        std::shared_ptr<ChunkCipher> cipherFor(const std::string& roomId) const;
        std::shared_ptr<IDataChannel> takeInboundChannel(const std::string& transferId);

        P2PSettings settings_;
        EventBus& eventBus_;
        RoomRegistry& rooms_;
        std::shared_ptr<ITransport> transport_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, Transfer> transfers_;
        std::unordered_map<std::string, std::shared_ptr<ChunkCipher>> ciphers_;  // room_id -> cipher
        std::unordered_map<std::string, std::shared_ptr<IDataChannel>> inbound_;
        std::unordered_map<std::string, Outbox> outbox_;

        std::atomic<bool> shuttingDown_{false};
        ThreadPool pool_;
    };

} // namespace CubeLink
