#pragma once

#include "session_tracker.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>

// A press reported by an input source for one physical line
struct EdgeEvent {
    int line;
    SteadyClock::time_point at;
};

// Ordered multi-producer, single-consumer queue between input sources and the
// debouncer. Producers never block on toggle processing.
class EdgeChannel {
public:
    // Returns false once the channel is closed
    bool push(const EdgeEvent& edge);

    // Blocks until an edge is available. Returns false when the channel is
    // closed and drained.
    bool pop(EdgeEvent& edge);

    void close();
    bool closed() const;
    std::size_t size() const;

private:
    std::deque<EdgeEvent> queue_;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};
