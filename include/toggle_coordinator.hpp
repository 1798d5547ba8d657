#pragma once

#include "control_error.hpp"
#include "i_device_client.hpp"
#include "logger/logger.hpp"
#include "session_tracker.hpp"
#include "station_registry.hpp"
#include <optional>
#include <string>

struct ToggleResult {
    enum class Outcome { Activated, Deactivated, Unchanged, Rejected };

    Outcome outcome;
    int duration_sec;
    std::optional<ControlError> reason;

    static ToggleResult activated(int duration_sec);
    static ToggleResult deactivated();
    static ToggleResult unchanged();
    static ToggleResult rejected(ControlError reason);

    bool ok() const { return outcome != Outcome::Rejected; }
};

std::string to_string(const ToggleResult& result);

// The only path that creates sessions. Device I/O happens outside the state
// lock: the tracker is read, the command is sent, and the tracker is updated
// only if the device acknowledged it.
class ToggleCoordinator {
public:
    ToggleCoordinator(
        const StationRegistry& registry,
        SessionTracker& sessions,
        IDeviceClient& client,
        TimeSource now = &SteadyClock::now
    );

    ToggleResult toggle(int display_index, int requested_duration_sec);

    // Drives the station to `on`. A station already in that state is left
    // alone (Unchanged) without any device request.
    ToggleResult set_state(int display_index, bool on, int requested_duration_sec);

private:
    const StationRegistry& registry_;
    SessionTracker& sessions_;
    IDeviceClient& client_;
    TimeSource now_;

    Logger logger_;

    ToggleResult switch_on(int display_index, const Station& station, int requested_duration_sec);
    ToggleResult switch_off(int display_index, const Station& station);
};
