#pragma once

#include <functional>
#include <string>

namespace CubeLink {

    /**
     * @brief Text message pipe to a signaling server (typically a WebSocket).
     */
    class ISignalingTransport {
    public:
        using MessageHandler = std::function<void(const std::string&)>;

        virtual ~ISignalingTransport() = default;

        /**
         * @brief Connect to the server.
         * @return true once the pipe is usable.
         */
        virtual bool open(const std::string& url) = 0;

        virtual void close() = 0;

        virtual bool send(const std::string& text) = 0;

        /**
         * @brief Install the callback for inbound messages.
         * Must be set before open(); may be invoked from any thread.
         */
        virtual void setMessageHandler(MessageHandler handler) = 0;
    };

} // namespace CubeLink
