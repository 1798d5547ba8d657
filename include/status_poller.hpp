#pragma once

#include "i_device_client.hpp"
#include "logger/logger.hpp"
#include "session_tracker.hpp"
#include "station_registry.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// One row of the pull-style status report
struct StationStatus {
    int display_index;
    std::string name;
    bool active;
    std::optional<long> remaining_seconds;
    std::optional<bool> device_reports_on;
};

// Reads station states from the device and clears sessions the device reports
// off. It never creates a session.
class StatusPoller {
public:
    StatusPoller(
        IDeviceClient& client,
        const StationRegistry& registry,
        SessionTracker& sessions,
        TimeSource now = &SteadyClock::now
    );

    // One reconciliation pass. Returns false when the poll failed and was
    // skipped; the next tick retries.
    bool poll_once();

    std::vector<StationStatus> snapshot() const;

    // Count of sessions cleared by reconciliation since construction
    int reconciled() const;

private:
    IDeviceClient& client_;
    const StationRegistry& registry_;
    SessionTracker& sessions_;
    TimeSource now_;

    std::vector<bool> device_states_;
    int reconciled_;
    mutable std::mutex mutex_;

    Logger logger_;
};
