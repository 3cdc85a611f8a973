#include "MemoryTransport.h"
#include "LoggerMacros.h"
#include <algorithm>

namespace CubeLink {

// ---------------------------------------------------------------------------
// MemoryChannel
// ---------------------------------------------------------------------------

MemoryChannel::Pair MemoryChannel::createPair(size_t capacity) {
    auto shared = std::make_shared<Shared>();
    shared->capacity = std::max<size_t>(capacity, 1);
    return {
        std::shared_ptr<MemoryChannel>(new MemoryChannel(shared, 0)),
        std::shared_ptr<MemoryChannel>(new MemoryChannel(shared, 1))
    };
}

MemoryChannel::MemoryChannel(std::shared_ptr<Shared> shared, int side)
    : shared_(std::move(shared)), side_(side) {}

bool MemoryChannel::send(const std::vector<uint8_t>& frame, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(shared_->mutex);
    Direction& out = shared_->lanes[side_];

    bool ready = shared_->cv.wait_for(lock, timeout, [&] {
        return shared_->closed || out.frames.size() < shared_->capacity;
    });
    if (!ready || shared_->closed) {
        return false;
    }

    out.frames.push_back(frame);
    out.bytes += frame.size();
    shared_->cv.notify_all();
    return true;
}

std::optional<std::vector<uint8_t>> MemoryChannel::receive(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(shared_->mutex);
    Direction& in = shared_->lanes[1 - side_];

    bool ready = shared_->cv.wait_for(lock, timeout, [&] {
        return shared_->closed || !in.frames.empty();
    });
    if (!ready || in.frames.empty()) {
        return std::nullopt;
    }

    std::vector<uint8_t> frame = std::move(in.frames.front());
    in.frames.pop_front();
    in.bytes -= frame.size();
    shared_->cv.notify_all();
    return frame;
}

void MemoryChannel::close() {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->closed = true;
    shared_->cv.notify_all();
}

bool MemoryChannel::isOpen() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return !shared_->closed;
}

size_t MemoryChannel::bufferedAmount() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->lanes[side_].bytes;
}

// ---------------------------------------------------------------------------
// MemoryTransport
// ---------------------------------------------------------------------------

MemoryTransport::MemoryTransport(size_t capacity) : capacity_(capacity) {}

void MemoryTransport::setPeerHandler(PeerHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

void MemoryTransport::setAvailable(bool available) {
    std::lock_guard<std::mutex> lock(mutex_);
    available_ = available;
}

std::shared_ptr<IDataChannel> MemoryTransport::openChannel(const std::string& roomId,
                                                           const std::string& transferId) {
    PeerHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!available_ || !handler_) {
            return nullptr;
        }
        handler = handler_;
    }

    auto channels = MemoryChannel::createPair(capacity_);
    LOG_DEBUG_COMP_IF("Opened memory channel for transfer " + transferId, "MemoryTransport");
    handler(roomId, transferId, channels.second);
    return channels.first;
}

// ---------------------------------------------------------------------------
// MemorySignalingHub
// ---------------------------------------------------------------------------

std::shared_ptr<MemorySignalingHub::Endpoint> MemorySignalingHub::createEndpoint() {
    return std::make_shared<Endpoint>(shared_from_this());
}

void MemorySignalingHub::attach(const std::shared_ptr<Endpoint>& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    endpoints_.push_back(endpoint);
}

void MemorySignalingHub::detach(const Endpoint* endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    endpoints_.erase(std::remove_if(endpoints_.begin(), endpoints_.end(),
        [endpoint](const std::weak_ptr<Endpoint>& weak) {
            auto locked = weak.lock();
            return !locked || locked.get() == endpoint;
        }), endpoints_.end());
}

void MemorySignalingHub::broadcast(const Endpoint* from, const std::string& text) {
    std::vector<std::shared_ptr<Endpoint>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& weak : endpoints_) {
            auto endpoint = weak.lock();
            if (endpoint && endpoint.get() != from) {
                targets.push_back(endpoint);
            }
        }
    }

    // Delivered without the hub lock so handlers may send in turn
    for (const auto& endpoint : targets) {
        endpoint->deliver(text);
    }
}

MemorySignalingHub::Endpoint::Endpoint(std::shared_ptr<MemorySignalingHub> hub)
    : hub_(std::move(hub)) {}

bool MemorySignalingHub::Endpoint::open(const std::string& /*url*/) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (open_) {
            return true;
        }
        open_ = true;
    }
    hub_->attach(shared_from_this());
    return true;
}

void MemorySignalingHub::Endpoint::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            return;
        }
        open_ = false;
    }
    hub_->detach(this);
}

bool MemorySignalingHub::Endpoint::send(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            return false;
        }
    }
    hub_->broadcast(this, text);
    return true;
}

void MemorySignalingHub::Endpoint::setMessageHandler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

void MemorySignalingHub::Endpoint::deliver(const std::string& text) {
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            return;
        }
        handler = handler_;
    }
    if (handler) {
        handler(text);
    }
}

} // namespace CubeLink
