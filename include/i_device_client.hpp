#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct DeviceClientStats;

// Request/response access to the irrigation controller. Every call is a
// single round trip; failures collapse to an empty or false result.
//
// list_station_names() and list_station_states() share device indexing, but
// the states list may be shorter than the names list. Indices past the end of
// the states list are unknown, not off.
class IDeviceClient {
public:
    virtual ~IDeviceClient() = default;

    virtual std::vector<std::string> list_station_names() = 0;
    virtual std::vector<bool> list_station_states() = 0;

    virtual bool activate(int device_index, int duration_sec) = 0;
    virtual bool deactivate(int device_index) = 0;

    virtual nlohmann::json get_snapshot() = 0;

    virtual std::unique_ptr<DeviceClientStats> get_stats() const = 0;
    virtual void reset_stats() = 0;
};
