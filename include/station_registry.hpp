#pragma once

#include "config.hpp"
#include "i_device_client.hpp"
#include "logger/logger.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct Station {
    int display_index;
    int device_index;
    std::string name;
};

// Auto-assigned placeholder such as "S1", "s12" or a bare "7"
bool is_generic_station_name(const std::string& name);

std::string trim(const std::string& text);

// Filters raw device names (index = device index) into display order
std::vector<Station> build_stations(const std::vector<std::string>& raw_names);

// Display indices in `active` whose station vanished from `after` or now maps
// to a different device index or name than in `before`
std::vector<int> invalidated_sessions(
    const std::vector<Station>& before,
    const std::vector<Station>& after,
    const std::vector<int>& active
);

// Logs each button whose station is outside [0, station_count) as an error.
// Returns how many were found; none of them is fatal.
int report_unmapped_buttons(const std::vector<ButtonConfig>& buttons, std::size_t station_count, Logger& logger);

// Display index -> device index mapping for the stations worth showing to an
// operator. Replaced as a whole on reload; readers always see one consistent
// load.
class StationRegistry {
public:
    StationRegistry();

    // One list_station_names() round trip. An unreachable device leaves the
    // registry empty and returns false (RegistryUnavailable).
    bool reload(IDeviceClient& client);

    // Throws std::out_of_range for an index outside [0, size())
    int resolve(int display_index) const;

    std::optional<Station> find(int display_index) const;
    std::vector<Station> stations() const;
    std::size_t size() const;
    bool empty() const;

private:
    std::vector<Station> stations_;
    mutable std::mutex mutex_;

    Logger logger_;
};
