#include "status_poller.hpp"

StatusPoller::StatusPoller(
    IDeviceClient& client,
    const StationRegistry& registry,
    SessionTracker& sessions,
    TimeSource now
) : client_(client), registry_(registry), sessions_(sessions), now_(std::move(now)),
    reconciled_(0), logger_("StatusPoller") {}

bool StatusPoller::poll_once() {
    const auto observed_at = now_();

    auto states = client_.list_station_states();
    if (states.empty()) {
        logger_.debug() << "Status poll failed, retrying next tick";
        return false;
    }

    int cleared = 0;
    for (int display_index : sessions_.active_indices()) {
        auto station = registry_.find(display_index);
        if (!station) {
            continue;
        }

        // States may be shorter than the station list: unknown, leave alone
        if (static_cast<std::size_t>(station->device_index) >= states.size()) {
            continue;
        }

        if (!states[station->device_index] && sessions_.clear_if_started_before(display_index, observed_at)) {
            logger_.info() << "Station " << display_index << " (" << station->name
                           << ") reported off by device, session cleared";
            cleared++;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    device_states_ = std::move(states);
    reconciled_ += cleared;
    return true;
}

std::vector<StationStatus> StatusPoller::snapshot() const {
    const auto now = now_();
    auto stations = registry_.stations();

    std::vector<bool> device_states;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        device_states = device_states_;
    }

    std::vector<StationStatus> report;
    report.reserve(stations.size());

    for (const auto& station : stations) {
        StationStatus status;
        status.display_index = station.display_index;
        status.name = station.name;
        status.remaining_seconds = sessions_.remaining_seconds(station.display_index, now);
        status.active = status.remaining_seconds.has_value();

        if (static_cast<std::size_t>(station.device_index) < device_states.size()) {
            status.device_reports_on = device_states[station.device_index];
        }

        report.push_back(status);
    }

    return report;
}

int StatusPoller::reconciled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reconciled_;
}
