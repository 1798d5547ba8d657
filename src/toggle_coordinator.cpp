#include "toggle_coordinator.hpp"

ToggleResult ToggleResult::activated(int duration_sec) {
    return ToggleResult{Outcome::Activated, duration_sec, std::nullopt};
}

ToggleResult ToggleResult::deactivated() {
    return ToggleResult{Outcome::Deactivated, 0, std::nullopt};
}

ToggleResult ToggleResult::unchanged() {
    return ToggleResult{Outcome::Unchanged, 0, std::nullopt};
}

ToggleResult ToggleResult::rejected(ControlError reason) {
    return ToggleResult{Outcome::Rejected, 0, reason};
}

std::string to_string(const ToggleResult& result) {
    switch (result.outcome) {
        case ToggleResult::Outcome::Activated:
            return "Activated(" + std::to_string(result.duration_sec) + "s)";
        case ToggleResult::Outcome::Deactivated:
            return "Deactivated";
        case ToggleResult::Outcome::Unchanged:
            return "Unchanged";
        case ToggleResult::Outcome::Rejected:
            return "Rejected(" + (result.reason ? to_string(*result.reason) : std::string("?")) + ")";
    }
    return "Unknown";
}

ToggleCoordinator::ToggleCoordinator(
    const StationRegistry& registry,
    SessionTracker& sessions,
    IDeviceClient& client,
    TimeSource now
) : registry_(registry), sessions_(sessions), client_(client), now_(std::move(now)),
    logger_("ToggleCoordinator") {}

ToggleResult ToggleCoordinator::toggle(int display_index, int requested_duration_sec) {
    auto station = registry_.find(display_index);
    if (!station) {
        logger_.error() << "Invalid station ID: " << display_index
                        << " (" << registry_.size() << " stations loaded)";
        return ToggleResult::rejected(ControlError::InvalidStation);
    }

    if (sessions_.is_active(display_index)) {
        return switch_off(display_index, *station);
    }
    return switch_on(display_index, *station, requested_duration_sec);
}

ToggleResult ToggleCoordinator::set_state(int display_index, bool on, int requested_duration_sec) {
    auto station = registry_.find(display_index);
    if (!station) {
        logger_.error() << "Invalid station ID: " << display_index
                        << " (" << registry_.size() << " stations loaded)";
        return ToggleResult::rejected(ControlError::InvalidStation);
    }

    const bool active = sessions_.is_active(display_index);
    if (active == on) {
        logger_.info() << "Station " << display_index << " (" << station->name << ") already "
                       << (on ? "running" : "stopped");
        return ToggleResult::unchanged();
    }

    return on ? switch_on(display_index, *station, requested_duration_sec)
              : switch_off(display_index, *station);
}

ToggleResult ToggleCoordinator::switch_off(int display_index, const Station& station) {
    logger_.info() << "Turning OFF station " << display_index << " (" << station.name << ")";

    if (!client_.deactivate(station.device_index)) {
        // The zone may still be running, keep it marked active
        logger_.error() << "Failed to turn off " << station.name;
        return ToggleResult::rejected(ControlError::DeviceCommunicationFailed);
    }

    sessions_.mark_inactive(display_index);
    logger_.info() << "Successfully turned off " << station.name;
    return ToggleResult::deactivated();
}

ToggleResult ToggleCoordinator::switch_on(int display_index, const Station& station, int requested_duration_sec) {
    if (requested_duration_sec <= 0) {
        logger_.error() << "Refusing to activate " << station.name << ": duration must be greater than 0 seconds, got "
                        << requested_duration_sec;
        return ToggleResult::rejected(ControlError::InvalidDuration);
    }

    logger_.info() << "Turning ON station " << display_index << " (" << station.name << ") for "
                   << requested_duration_sec << " seconds";

    if (!client_.activate(station.device_index, requested_duration_sec)) {
        logger_.error() << "Failed to activate " << station.name;
        return ToggleResult::rejected(ControlError::DeviceCommunicationFailed);
    }

    sessions_.mark_active(display_index, now_(), std::chrono::seconds(requested_duration_sec));
    logger_.info() << "Successfully activated " << station.name << " for " << requested_duration_sec << " seconds";
    return ToggleResult::activated(requested_duration_sec);
}
