#include "TransferManager.h"
#include "Constants.h"
#include "ErrorCodes.h"
#include "IdGenerator.h"
#include "IntegrityVerifier.h"
#include "MetricsCollector.h"
#include "MimeTypes.h"
#include "P2PEvents.h"
#include "LoggerMacros.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <thread>

namespace CubeLink {

namespace {

const char* COMPONENT = "TransferManager";

enum class WaitOutcome {
    Done,
    Cancelled,
    TimedOut,
    Closed
};

// Closes the channel when the task leaves, whatever the reason
struct ChannelCloser {
    std::shared_ptr<IDataChannel> channel;
    ~ChannelCloser() {
        if (channel) {
            channel->close();
        }
    }
};

std::chrono::milliseconds pollInterval() {
    return std::chrono::milliseconds(constants::CANCEL_POLL_INTERVAL_MS);
}

std::chrono::milliseconds sliceUntil(std::chrono::steady_clock::time_point deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return std::max(std::chrono::milliseconds(0), std::min(pollInterval(), remaining));
}

// Blocks on backpressure in short slices so cancellation is noticed
WaitOutcome sendFrame(IDataChannel& channel,
                      const std::vector<uint8_t>& frame,
                      const std::atomic<bool>& cancelled,
                      std::chrono::milliseconds limit) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (true) {
        if (cancelled.load()) {
            return WaitOutcome::Cancelled;
        }
        if (!channel.isOpen()) {
            return WaitOutcome::Closed;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return WaitOutcome::TimedOut;
        }
        if (channel.send(frame, sliceUntil(deadline))) {
            return WaitOutcome::Done;
        }
    }
}

WaitOutcome receiveFrame(IDataChannel& channel,
                         std::vector<uint8_t>& frame,
                         const std::atomic<bool>& cancelled,
                         std::chrono::milliseconds idleLimit) {
    auto deadline = std::chrono::steady_clock::now() + idleLimit;
    while (true) {
        if (cancelled.load()) {
            return WaitOutcome::Cancelled;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return WaitOutcome::TimedOut;
        }
        auto received = channel.receive(sliceUntil(deadline));
        if (received) {
            frame = std::move(*received);
            return WaitOutcome::Done;
        }
        // receive() only comes back empty-handed from a closed channel once it is drained
        if (!channel.isOpen()) {
            return WaitOutcome::Closed;
        }
    }
}

const char* eventFor(TransferStatus status) {
    switch (status) {
        case TransferStatus::Completed: return events::TRANSFER_COMPLETED;
        case TransferStatus::Failed: return events::TRANSFER_FAILED;
        case TransferStatus::Cancelled: return events::TRANSFER_CANCELLED;
        default: return events::TRANSFER_UPDATED;
    }
}

} // namespace

TransferManager::TransferManager(const P2PSettings& settings,
                                 EventBus& eventBus,
                                 RoomRegistry& rooms,
                                 std::shared_ptr<ITransport> transport)
    : settings_(settings)
    , eventBus_(eventBus)
    , rooms_(rooms)
    , transport_(std::move(transport))
    , pool_(std::max<size_t>(settings.workerThreads, 1)) {}

TransferManager::~TransferManager() {
    shutdown();
}

Result<std::string> TransferManager::sendFile(const std::string& roomId, const std::string& path,
                                              const CreatedHook& onCreated) {
    if (shuttingDown_.load()) {
        return makeError(ErrorCode::INTERNAL_ERROR, "transfer manager is shut down", COMPONENT);
    }

    if (!rooms_.hasRoom(roomId)) {
        return makeError(ErrorCode::ROOM_NOT_FOUND, roomId, COMPONENT);
    }

    std::error_code ec;
    std::filesystem::path filePath(path);
    if (!std::filesystem::is_regular_file(filePath, ec)) {
        return makeError(ErrorCode::FILE_IO_ERROR, "not a regular file: " + path, COMPONENT);
    }
    uint64_t size = std::filesystem::file_size(filePath, ec);
    if (ec) {
        return makeError(ErrorCode::FILE_IO_ERROR, ec.message(), COMPONENT);
    }

    auto checksum = IntegrityVerifier::hashFile(path);
    if (!checksum) {
        return checksum.error();
    }

    FileMetadata metadata;
    metadata.name = filePath.filename().string();
    if (metadata.name.empty()) {
        metadata.name = "unknown";
    }
    metadata.size = size;
    metadata.mimeType = detectMimeType(path);
    metadata.chunks = (size + constants::CHUNK_SIZE - 1) / constants::CHUNK_SIZE;
    metadata.checksum = checksum.value();

    Transfer transfer;
    transfer.id = IdGenerator::uuid();
    transfer.roomId = roomId;
    transfer.metadata = metadata;
    transfer.status = TransferStatus::Pending;
    transfer.isSender = true;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        transfers_[transfer.id] = transfer;
        queueEvent(events::TRANSFER_CREATED, transfer);
    }

    Logger::instance().info("Sending " + metadata.name + " (" + std::to_string(size) +
                            " bytes, " + std::to_string(metadata.chunks) + " chunks) as transfer " +
                            transfer.id, COMPONENT);
    flushEvents(transfer.id);
    if (onCreated) {
        onCreated(transfer);
    }

    launch(transfer.id, &TransferManager::runSend, path);
    return transfer.id;
}

Result<Transfer> TransferManager::registerIncoming(const std::string& roomId,
                                                   const std::string& transferId,
                                                   const FileMetadata& metadata) {
    if (!rooms_.hasRoom(roomId)) {
        return makeError(ErrorCode::ROOM_NOT_FOUND, roomId, COMPONENT);
    }

    Transfer transfer;
    transfer.id = transferId;
    transfer.roomId = roomId;
    transfer.metadata = metadata;
    transfer.status = TransferStatus::Pending;
    transfer.isSender = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (transfers_.count(transferId) > 0) {
            return makeError(ErrorCode::INVALID_TRANSITION, "transfer " + transferId + " already registered",
                             COMPONENT);
        }
        transfers_[transferId] = transfer;
        queueEvent(events::TRANSFER_CREATED, transfer);
    }

    Logger::instance().info("Incoming " + metadata.name + " (" + std::to_string(metadata.size) +
                            " bytes) as transfer " + transferId, COMPONENT);
    flushEvents(transferId);
    return transfer;
}

VoidResult TransferManager::attachInboundChannel(const std::string& transferId,
                                                 std::shared_ptr<IDataChannel> channel) {
    if (!channel) {
        return makeError(ErrorCode::TRANSPORT_UNAVAILABLE, "no channel for transfer " + transferId, COMPONENT);
    }

    std::optional<Error> refused;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transfers_.find(transferId);
        if (it == transfers_.end()) {
            refused = makeError(ErrorCode::TRANSFER_NOT_FOUND, transferId, COMPONENT);
        } else if (it->second.isSender) {
            refused = makeError(ErrorCode::INVALID_TRANSITION, "transfer " + transferId + " is outgoing", COMPONENT);
        } else if (isTerminal(it->second.status)) {
            refused = makeError(ErrorCode::INVALID_TRANSITION,
                                "transfer " + transferId + " is already " + toString(it->second.status), COMPONENT);
        } else if (inbound_.count(transferId) > 0) {
            refused = makeError(ErrorCode::INVALID_TRANSITION,
                                "transfer " + transferId + " already has a channel", COMPONENT);
        } else {
            inbound_[transferId] = std::move(channel);
            return Ok();
        }
    }

    channel->close();
    LOG_WARN_COMP("Refused data channel: " + refused->message, COMPONENT);
    return *refused;
}

VoidResult TransferManager::receiveFile(const std::string& transferId, const std::string& savePath) {
    if (shuttingDown_.load()) {
        return makeError(ErrorCode::INTERNAL_ERROR, "transfer manager is shut down", COMPONENT);
    }

    auto transfer = getTransfer(transferId);
    if (!transfer) {
        return makeError(ErrorCode::TRANSFER_NOT_FOUND, transferId, COMPONENT);
    }
    if (transfer->isSender) {
        return makeError(ErrorCode::INVALID_TRANSITION, "transfer " + transferId + " is outgoing", COMPONENT);
    }
    if (!transition(transferId, TransferStatus::Connecting)) {
        return makeError(ErrorCode::INVALID_TRANSITION,
                         "cannot receive a transfer that is " + toString(transfer->status), COMPONENT);
    }

    launch(transferId, &TransferManager::runReceive, savePath);
    return Ok();
}

VoidResult TransferManager::cancelTransfer(const std::string& transferId) {
    if (!transition(transferId, TransferStatus::Cancelled)) {
        auto transfer = getTransfer(transferId);
        if (!transfer) {
            return makeError(ErrorCode::TRANSFER_NOT_FOUND, transferId, COMPONENT);
        }
        return makeError(ErrorCode::INVALID_TRANSITION,
                         "transfer is already " + toString(transfer->status), COMPONENT);
    }

    // A task that has not started yet sees the Cancelled status instead
    pool_.cancel(transferId);

    Logger::instance().info("Cancelled transfer " + transferId, COMPONENT);
    return Ok();
}

std::optional<Transfer> TransferManager::getTransfer(const std::string& transferId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(transferId);
    if (it == transfers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Transfer> TransferManager::listTransfers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Transfer> result;
    result.reserve(transfers_.size());
    for (const auto& [id, transfer] : transfers_) {
        result.push_back(transfer);
    }
    return result;
}

std::vector<Transfer> TransferManager::listTransfers(const std::string& roomId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Transfer> result;
    for (const auto& [id, transfer] : transfers_) {
        if (transfer.roomId == roomId) {
            result.push_back(transfer);
        }
    }
    return result;
}

VoidResult TransferManager::installSessionKey(const std::string& roomId, const std::vector<uint8_t>& key) {
    std::shared_ptr<ChunkCipher> cipher;
    try {
        cipher = std::make_shared<ChunkCipher>(key);
    } catch (const std::invalid_argument& e) {
        return makeError(ErrorCode::INVALID_CONFIGURATION, e.what(), COMPONENT);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ciphers_[roomId] = std::move(cipher);
    }
    LOG_DEBUG_COMP_IF("Session key installed for room " + roomId, COMPONENT);
    return Ok();
}

bool TransferManager::hasSessionKey(const std::string& roomId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ciphers_.count(roomId) > 0;
}

void TransferManager::removeSessionKey(const std::string& roomId) {
    std::lock_guard<std::mutex> lock(mutex_);
    ciphers_.erase(roomId);
}

size_t TransferManager::pendingChannels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inbound_.size();
}

void TransferManager::shutdown() {
    if (shuttingDown_.exchange(true)) {
        return;
    }

    for (const auto& transfer : listTransfers()) {
        if (!isTerminal(transfer.status)) {
            cancelTransfer(transfer.id).onError([](const Error& error) {
                LOG_DEBUG_COMP_IF("Skipped during shutdown: " + error.message, COMPONENT);
            });
        }
    }

    std::vector<std::shared_ptr<IDataChannel>> unclaimed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, channel] : inbound_) {
            unclaimed.push_back(channel);
        }
        inbound_.clear();
    }
    for (auto& channel : unclaimed) {
        channel->close();
    }

    pool_.shutdown();
    LOG_DEBUG_COMP_IF("Transfer manager stopped", COMPONENT);
}

void TransferManager::launch(const std::string& transferId,
                             void (TransferManager::*body)(const std::string&, const std::string&, const CancelToken&),
                             const std::string& path) {
    bool queued = pool_.submit(transferId, [this, body, transferId, path](const CancelToken& token) {
        (this->*body)(transferId, path, token);
    });
    if (!queued) {
        fail(transferId, makeError(ErrorCode::INTERNAL_ERROR, "no worker accepted transfer " + transferId, COMPONENT));
    }
}

void TransferManager::runSend(const std::string& transferId, const std::string& path, const CancelToken& token) {
    SCOPED_TIMER_COMP("Send " + transferId, COMPONENT);
    try {
        if (!transition(transferId, TransferStatus::Connecting)) {
            return;
        }

        auto transfer = getTransfer(transferId);
        if (!transfer) {
            return;
        }
        const FileMetadata metadata = transfer->metadata;

        auto cipher = cipherFor(transfer->roomId);
        if (!cipher) {
            fail(transferId, makeError(ErrorCode::NO_SESSION_KEY, transfer->roomId, COMPONENT));
            return;
        }

        std::shared_ptr<IDataChannel> channel;
        if (transport_) {
            channel = transport_->openChannel(transfer->roomId, transferId);
        }
        if (!channel) {
            fail(transferId, makeError(ErrorCode::TRANSPORT_UNAVAILABLE, "no data channel to room peers", COMPONENT));
            return;
        }
        ChannelCloser closer{channel};

        if (!transition(transferId, TransferStatus::Connected) ||
            !transition(transferId, TransferStatus::Transferring)) {
            return;
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            fail(transferId, makeError(ErrorCode::FILE_IO_ERROR, "cannot open " + path, COMPONENT));
            return;
        }

        const auto startedAt = std::chrono::steady_clock::now();
        std::vector<uint8_t> buffer(constants::CHUNK_SIZE);
        uint64_t bytesSent = 0;
        uint64_t index = 0;

        while (!token->load()) {
            file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            std::streamsize count = file.gcount();
            if (count <= 0) {
                break;
            }

            std::vector<uint8_t> chunk(buffer.begin(), buffer.begin() + count);
            auto frame = cipher->encryptChunk(chunk, ChunkCipher::chunkAad(transferId, index));
            if (!frame) {
                fail(transferId, frame.error());
                return;
            }

            switch (sendFrame(*channel, frame.value(), *token, settings_.sendTimeout)) {
                case WaitOutcome::Done:
                    break;
                case WaitOutcome::Cancelled:
                    return;
                case WaitOutcome::TimedOut:
                    fail(transferId, makeError(ErrorCode::TRANSFER_TIMEOUT,
                        "send blocked for " + std::to_string(settings_.sendTimeout.count()) + "ms", COMPONENT));
                    return;
                case WaitOutcome::Closed:
                    fail(transferId, makeError(ErrorCode::TRANSPORT_UNAVAILABLE, "channel closed by peer", COMPONENT));
                    return;
            }

            bytesSent += static_cast<uint64_t>(count);
            ++index;
            MetricsCollector::instance().addBytesSent(static_cast<uint64_t>(count));
            LOG_DEBUG_COMP_IF("Sent chunk " + std::to_string(index) + "/" +
                              std::to_string(metadata.chunks) + " of " + transferId, COMPONENT);

            if (!reportProgress(transferId, bytesSent, startedAt)) {
                return;
            }
        }

        if (token->load()) {
            return;
        }
        if (file.bad()) {
            fail(transferId, makeError(ErrorCode::FILE_IO_ERROR, "read error on " + path, COMPONENT));
            return;
        }
        file.close();

        // The source may have changed while it was being sent
        auto verified = IntegrityVerifier::verifyFile(path, metadata.checksum);
        if (!verified) {
            fail(transferId, verified.error());
            return;
        }

        transition(transferId, TransferStatus::Completed);
    } catch (const std::exception& e) {
        fail(transferId, makeError(ErrorCode::INTERNAL_ERROR, e.what(), COMPONENT));
    }
}

void TransferManager::runReceive(const std::string& transferId, const std::string& savePath, const CancelToken& token) {
    SCOPED_TIMER_COMP("Receive " + transferId, COMPONENT);
    try {
        auto transfer = getTransfer(transferId);
        if (!transfer || transfer->status != TransferStatus::Connecting) {
            return;
        }
        const FileMetadata metadata = transfer->metadata;

        auto cipher = cipherFor(transfer->roomId);
        if (!cipher) {
            fail(transferId, makeError(ErrorCode::NO_SESSION_KEY, transfer->roomId, COMPONENT));
            return;
        }

        std::shared_ptr<IDataChannel> channel;
        auto deadline = std::chrono::steady_clock::now() + settings_.idleTimeout;
        while (!(channel = takeInboundChannel(transferId))) {
            if (token->load()) {
                return;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                fail(transferId, makeError(ErrorCode::TRANSFER_TIMEOUT, "no data channel from sender", COMPONENT));
                return;
            }
            std::this_thread::sleep_for(sliceUntil(deadline));
        }
        ChannelCloser closer{channel};

        if (!transition(transferId, TransferStatus::Connected) ||
            !transition(transferId, TransferStatus::Transferring)) {
            return;
        }

        std::ofstream out(savePath, std::ios::binary | std::ios::trunc);
        if (!out) {
            fail(transferId, makeError(ErrorCode::FILE_IO_ERROR, "cannot create " + savePath, COMPONENT));
            return;
        }

        const auto startedAt = std::chrono::steady_clock::now();
        uint64_t bytesReceived = 0;
        std::vector<uint8_t> frame;

        for (uint64_t index = 0; index < metadata.chunks; ++index) {
            switch (receiveFrame(*channel, frame, *token, settings_.idleTimeout)) {
                case WaitOutcome::Done:
                    break;
                case WaitOutcome::Cancelled:
                    return;
                case WaitOutcome::TimedOut:
                    fail(transferId, makeError(ErrorCode::TRANSFER_TIMEOUT, "", COMPONENT));
                    return;
                case WaitOutcome::Closed:
                    fail(transferId, makeError(ErrorCode::TRANSPORT_UNAVAILABLE,
                        "channel closed after " + std::to_string(index) + " of " +
                        std::to_string(metadata.chunks) + " chunks", COMPONENT));
                    return;
            }

            auto plaintext = cipher->decryptChunk(frame, ChunkCipher::chunkAad(transferId, index));
            if (!plaintext) {
                fail(transferId, plaintext.error());
                return;
            }

            const auto& data = plaintext.value();
            out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
            if (!out) {
                fail(transferId, makeError(ErrorCode::FILE_IO_ERROR, "write error on " + savePath, COMPONENT));
                return;
            }

            bytesReceived += data.size();
            MetricsCollector::instance().addBytesReceived(data.size());

            if (!reportProgress(transferId, bytesReceived, startedAt)) {
                return;
            }
        }

        out.close();
        if (!out) {
            fail(transferId, makeError(ErrorCode::FILE_IO_ERROR, "cannot finish " + savePath, COMPONENT));
            return;
        }
        if (token->load()) {
            return;
        }

        auto verified = IntegrityVerifier::verifyFile(savePath, metadata.checksum);
        if (!verified) {
            fail(transferId, verified.error());
            return;
        }

        transition(transferId, TransferStatus::Completed);
    } catch (const std::exception& e) {
        fail(transferId, makeError(ErrorCode::INTERNAL_ERROR, e.what(), COMPONENT));
    }
}

bool TransferManager::transition(const std::string& transferId, TransferStatus to,
                                 const std::optional<Error>& error) {
    Transfer snapshot;
    std::shared_ptr<IDataChannel> unclaimed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transfers_.find(transferId);
        if (it == transfers_.end()) {
            return false;
        }

        Transfer& transfer = it->second;
        if (!canTransition(transfer.status, to)) {
            LOG_DEBUG_COMP_IF("Ignored " + toString(transfer.status) + " -> " + toString(to) +
                              " for " + transferId, COMPONENT);
            return false;
        }

        uint64_t now = nowMillis();
        transfer.status = to;
        if (to == TransferStatus::Transferring && !transfer.startedAt) {
            transfer.startedAt = now;
        }
        if (isTerminal(to)) {
            transfer.completedAt = now;

            auto channel = inbound_.find(transferId);
            if (channel != inbound_.end()) {
                unclaimed = std::move(channel->second);
                inbound_.erase(channel);
            }
        }
        if (to == TransferStatus::Completed) {
            transfer.progress = 100.0;
        }
        if (error) {
            transfer.error = error->message;
        }
        snapshot = transfer;
        queueEvent(eventFor(to), snapshot);
    }

    if (unclaimed) {
        unclaimed->close();
    }

    auto& metrics = MetricsCollector::instance();
    switch (to) {
        case TransferStatus::Transferring:
            metrics.incrementTransfersStarted();
            break;
        case TransferStatus::Completed:
            metrics.incrementTransfersCompleted();
            metrics.recordTransferSpeed(snapshot.speed / 1024);
            Logger::instance().info("Transfer " + transferId + " completed", COMPONENT);
            break;
        case TransferStatus::Failed:
            metrics.incrementTransfersFailed();
            break;
        case TransferStatus::Cancelled:
            metrics.incrementTransfersCancelled();
            break;
        default:
            break;
    }

    flushEvents(transferId);
    return true;
}

bool TransferManager::fail(const std::string& transferId, const Error& error) {
    Logger::instance().warn("Transfer " + transferId + " failed: " + error.message, COMPONENT);
    return transition(transferId, TransferStatus::Failed, error);
}

bool TransferManager::reportProgress(const std::string& transferId, uint64_t bytes,
                                     std::chrono::steady_clock::time_point startedAt) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transfers_.find(transferId);
        if (it == transfers_.end() || it->second.status != TransferStatus::Transferring) {
            return false;
        }

        Transfer& transfer = it->second;
        transfer.bytesTransferred = std::max(transfer.bytesTransferred, bytes);
        transfer.progress = transfer.metadata.size > 0
            ? std::min(100.0, static_cast<double>(transfer.bytesTransferred) * 100.0 /
                              static_cast<double>(transfer.metadata.size))
            : 100.0;

        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startedAt).count();
        transfer.speed = elapsed > 0.0
            ? static_cast<uint64_t>(static_cast<double>(transfer.bytesTransferred) / elapsed)
            : 0;
        queueEvent(events::TRANSFER_PROGRESS, transfer);
    }

    flushEvents(transferId);
    return true;
}

void TransferManager::queueEvent(const char* eventName, const Transfer& snapshot) {
    outbox_[snapshot.id].events.emplace_back(eventName, snapshot);
}

void TransferManager::flushEvents(const std::string& transferId) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = outbox_.find(transferId);
    if (it == outbox_.end() || it->second.draining) {
        return;
    }
    it->second.draining = true;

    while (!it->second.events.empty()) {
        auto next = std::move(it->second.events.front());
        it->second.events.pop_front();

        lock.unlock();
        eventBus_.publish(next.first, next.second);
        lock.lock();

        // Other transfers may have rehashed the map meanwhile
        it = outbox_.find(transferId);
    }
    outbox_.erase(it);
}

std::shared_ptr<ChunkCipher> TransferManager::cipherFor(const std::string& roomId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ciphers_.find(roomId);
    return it != ciphers_.end() ? it->second : nullptr;
}

std::shared_ptr<IDataChannel> TransferManager::takeInboundChannel(const std::string& transferId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = inbound_.find(transferId);
    if (it == inbound_.end()) {
        return nullptr;
    }
    auto channel = std::move(it->second);
    inbound_.erase(it);
    return channel;
}

} // namespace CubeLink
