#include "session/event_queue.hpp"

namespace session {

void EventQueue::push(SessionEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::deque<SessionEvent> EventQueue::wait_and_take(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline, [this] { return !events_.empty(); });

    std::deque<SessionEvent> taken;
    taken.swap(events_);
    return taken;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

}
