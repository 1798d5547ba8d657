#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

using SteadyClock = std::chrono::steady_clock;
using TimeSource = std::function<SteadyClock::time_point()>;

// This controller's belief about which stations are running, keyed by display
// index. Sessions never expire on their own; only the toggle coordinator adds
// them, and removal needs a confirmed deactivation or a poll that saw the
// station off.
//
// The mutex is shared with the input debouncer so both paths serialize on one
// lock. No method performs I/O.
class SessionTracker {
public:
    explicit SessionTracker(std::mutex& state_mutex);

    void mark_active(int display_index, SteadyClock::time_point started_at, std::chrono::seconds duration);
    void mark_inactive(int display_index);
    bool is_active(int display_index) const;

    // Removes the session only if it was started before `observed_at`, so a
    // stale "off" reading cannot cancel an activation that raced the poll.
    bool clear_if_started_before(int display_index, SteadyClock::time_point observed_at);

    // Seconds until the expected end, 0 once past it; nullopt when inactive
    std::optional<long> remaining_seconds(int display_index, SteadyClock::time_point now) const;

    // Active flags for display indices [0, count)
    std::vector<bool> snapshot(std::size_t count) const;

    std::vector<int> active_indices() const;

private:
    struct ActiveSession {
        SteadyClock::time_point started_at;
        SteadyClock::time_point expires_at;
    };

    std::map<int, ActiveSession> sessions_;
    std::mutex& mutex_;
};
