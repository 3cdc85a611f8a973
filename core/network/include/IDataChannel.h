#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace CubeLink {

    /**
     * @brief Reliable, ordered stream of frames between two peers.
     *
     * Frames arrive in the order they were sent, without loss. send() applies
     * backpressure: it blocks while bufferedAmount() is at the channel's
     * high-water mark.
     */
    class IDataChannel {
    public:
        virtual ~IDataChannel() = default;

        /**
         * @brief Queue a frame for delivery.
         * @param frame The frame to send.
         * @param timeout How long to wait for buffer space.
         * @return true if queued; false on timeout or if the channel is closed.
         */
        virtual bool send(const std::vector<uint8_t>& frame, std::chrono::milliseconds timeout) = 0;

        /**
         * @brief Take the next inbound frame.
         * @return The frame, or std::nullopt on timeout or once the channel is
         *         closed and drained.
         */
        virtual std::optional<std::vector<uint8_t>> receive(std::chrono::milliseconds timeout) = 0;

        virtual void close() = 0;
        virtual bool isOpen() const = 0;

        // Bytes queued by this end and not yet taken by the peer
        virtual size_t bufferedAmount() const = 0;
    };

    /**
     * @brief Opens data channels on behalf of the transfer engine.
     */
    class ITransport {
    public:
        virtual ~ITransport() = default;

        /**
         * @brief Open the channel carrying one transfer.
         * @return The sender's end, or nullptr if no path to the peer exists.
         */
        virtual std::shared_ptr<IDataChannel> openChannel(const std::string& roomId,
                                                          const std::string& transferId) = 0;
    };

} // namespace CubeLink
