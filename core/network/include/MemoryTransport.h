#pragma once

#include "IDataChannel.h"
#include "ISignalingTransport.h"
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace CubeLink {

/**
 * @brief In-process data channel with a bounded send queue
 *
 * Channels are created in connected pairs; what one end sends the other
 * receives. Each direction holds at most `capacity` frames, which makes
 * send() block exactly like a real channel above its high-water mark.
 * Closing either end closes both; frames already queued can still be
 * received.
 */
class MemoryChannel : public IDataChannel {
public:
    using Pair = std::pair<std::shared_ptr<MemoryChannel>, std::shared_ptr<MemoryChannel>>;

    static Pair createPair(size_t capacity);

    bool send(const std::vector<uint8_t>& frame, std::chrono::milliseconds timeout) override;
    std::optional<std::vector<uint8_t>> receive(std::chrono::milliseconds timeout) override;
    void close() override;
    bool isOpen() const override;
    size_t bufferedAmount() const override;

private:
    struct Direction {
        std::deque<std::vector<uint8_t>> frames;
        size_t bytes{0};
    };

    struct Shared {
        std::mutex mutex;
        std::condition_variable cv;
        Direction lanes[2];
        size_t capacity{1};
        bool closed{false};
    };

    MemoryChannel(std::shared_ptr<Shared> shared, int side);

    std::shared_ptr<Shared> shared_;
    int side_;
};

/**
 * @brief ITransport that connects both ends inside the process
 *
 * openChannel() creates a MemoryChannel pair, keeps one end for the caller
 * and hands the other to the peer handler (the receiving service). Without
 * a handler, or when disabled, no channel can be opened.
 */
class MemoryTransport : public ITransport {
public:
    using PeerHandler = std::function<void(const std::string& roomId,
                                           const std::string& transferId,
                                           std::shared_ptr<IDataChannel> channel)>;

    explicit MemoryTransport(size_t capacity);

    void setPeerHandler(PeerHandler handler);
    void setAvailable(bool available);

    std::shared_ptr<IDataChannel> openChannel(const std::string& roomId,
                                              const std::string& transferId) override;

private:
    mutable std::mutex mutex_;
    PeerHandler handler_;
    size_t capacity_;
    bool available_{true};
};

/**
 * @brief Signaling relay for services living in one process
 *
 * Every message an endpoint sends is delivered synchronously to every other
 * open endpoint on the same hub, the way a signaling server fans out
 * messages within a room.
 */
class MemorySignalingHub : public std::enable_shared_from_this<MemorySignalingHub> {
public:
    class Endpoint : public ISignalingTransport, public std::enable_shared_from_this<Endpoint> {
    public:
        explicit Endpoint(std::shared_ptr<MemorySignalingHub> hub);

        bool open(const std::string& url) override;
        void close() override;
        bool send(const std::string& text) override;
        void setMessageHandler(MessageHandler handler) override;

    private:
        friend class MemorySignalingHub;
        void deliver(const std::string& text);

        std::shared_ptr<MemorySignalingHub> hub_;
        std::mutex mutex_;
        MessageHandler handler_;
        bool open_{false};
    };

    std::shared_ptr<Endpoint> createEndpoint();

private:
    void attach(const std::shared_ptr<Endpoint>& endpoint);
    void detach(const Endpoint* endpoint);
    void broadcast(const Endpoint* from, const std::string& text);

    std::mutex mutex_;
    std::vector<std::weak_ptr<Endpoint>> endpoints_;
};

} // namespace CubeLink
