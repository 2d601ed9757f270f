#ifndef SLIDE_VOICE_TRANSPORT_CHANNEL_HPP
#define SLIDE_VOICE_TRANSPORT_CHANNEL_HPP

#include "core/errors.hpp"
#include <string>
#include <memory>

namespace network {
    // Callbacks arrive on the channel's own thread, in arrival order.
    class ChannelListener {
    public:
        virtual ~ChannelListener() = default;

        virtual void on_open() = 0;
        virtual void on_message(std::string text) = 0;

        // Only before the channel opened: ConnectionFailed.
        virtual void on_error(core::ErrorKind kind, const std::string& message) = 0;

        // Exactly once per channel that reached on_open(), whatever closed it.
        virtual void on_close(const std::string& reason) = 0;
    };

    // One ordered, bidirectional stream of complete text messages.
    class TransportChannel {
    public:
        virtual ~TransportChannel() = default;

        // Asynchronous; the outcome is reported through the listener.
        // Throws core::VoiceError(ConnectionFailed) for an unusable URL.
        virtual void open(const std::string& url, std::shared_ptr<ChannelListener> listener) = 0;

        // Returns false (and logs) when the channel is not open.
        virtual bool send(const std::string& text) = 0;

        virtual void close() = 0;
        virtual bool is_open() const = 0;
    };
}

#endif
