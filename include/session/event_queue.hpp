#ifndef SLIDE_VOICE_EVENT_QUEUE_HPP
#define SLIDE_VOICE_EVENT_QUEUE_HPP

#include "core/errors.hpp"
#include <string>
#include <vector>
#include <deque>
#include <variant>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <cstdint>

namespace session {
    // Every event names the connection generation it belongs to, so events
    // from a torn-down connection can be recognized and dropped.
    struct TransportOpened { std::uint64_t generation; };
    struct TransportFailed { std::uint64_t generation; core::ErrorKind kind; std::string message; };
    struct TransportMessage { std::uint64_t generation; std::string text; };
    struct TransportClosed { std::uint64_t generation; std::string reason; };
    struct FrameCaptured { std::uint64_t generation; std::vector<int16_t> samples; };

    // Requests from the interactive front end
    enum class CommandKind { Start, Stop, Next, Previous, GoTo, Cancel };
    struct UserCommand { CommandKind kind; int slide_id = 0; };

    using SessionEvent = std::variant<TransportOpened, TransportFailed, TransportMessage,
                                      TransportClosed, FrameCaptured, UserCommand>;

    // Multi-producer, single-consumer FIFO feeding the session.
    class EventQueue {
    public:
        void push(SessionEvent event);

        // Waits until at least one event is queued or `deadline` passes, then
        // takes everything queued, in arrival order.
        std::deque<SessionEvent> wait_and_take(std::chrono::steady_clock::time_point deadline);

        size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<SessionEvent> events_;
    };
}

#endif
