#include "session_tracker.hpp"

SessionTracker::SessionTracker(std::mutex& state_mutex) : mutex_(state_mutex) {}

void SessionTracker::mark_active(int display_index, SteadyClock::time_point started_at,
                                 std::chrono::seconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[display_index] = ActiveSession{started_at, started_at + duration};
}

void SessionTracker::mark_inactive(int display_index) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(display_index);
}

bool SessionTracker::is_active(int display_index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(display_index) > 0;
}

bool SessionTracker::clear_if_started_before(int display_index, SteadyClock::time_point observed_at) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(display_index);
    if (it == sessions_.end() || it->second.started_at >= observed_at) {
        return false;
    }

    sessions_.erase(it);
    return true;
}

std::optional<long> SessionTracker::remaining_seconds(int display_index, SteadyClock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(display_index);
    if (it == sessions_.end()) {
        return std::nullopt;
    }

    if (it->second.expires_at <= now) {
        return 0L;
    }
    return static_cast<long>(
        std::chrono::duration_cast<std::chrono::seconds>(it->second.expires_at - now).count());
}

std::vector<bool> SessionTracker::snapshot(std::size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<bool> active(count, false);
    for (const auto& [display_index, session] : sessions_) {
        if (display_index >= 0 && static_cast<std::size_t>(display_index) < count) {
            active[display_index] = true;
        }
    }
    return active;
}

std::vector<int> SessionTracker::active_indices() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<int> indices;
    for (const auto& [display_index, session] : sessions_) {
        indices.push_back(display_index);
    }
    return indices;
}
