#include "station_registry.hpp"
#include <cctype>
#include <stdexcept>

bool is_generic_station_name(const std::string& name) {
    std::size_t pos = 0;
    if (!name.empty() && (name[0] == 'S' || name[0] == 's')) {
        pos = 1;
    }

    if (pos == name.size()) {
        return false;
    }

    for (; pos < name.size(); pos++) {
        if (!std::isdigit(static_cast<unsigned char>(name[pos]))) {
            return false;
        }
    }
    return true;
}

std::string trim(const std::string& text) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

    std::size_t begin = 0;
    while (begin < text.size() && is_space(text[begin])) {
        begin++;
    }

    std::size_t end = text.size();
    while (end > begin && is_space(text[end - 1])) {
        end--;
    }

    return text.substr(begin, end - begin);
}

std::vector<Station> build_stations(const std::vector<std::string>& raw_names) {
    std::vector<Station> stations;

    for (std::size_t device_index = 0; device_index < raw_names.size(); device_index++) {
        std::string name = trim(raw_names[device_index]);
        if (name.empty() || is_generic_station_name(name)) {
            continue;
        }

        Station station;
        station.display_index = static_cast<int>(stations.size());
        station.device_index = static_cast<int>(device_index);
        station.name = name;
        stations.push_back(station);
    }

    return stations;
}

std::vector<int> invalidated_sessions(
    const std::vector<Station>& before,
    const std::vector<Station>& after,
    const std::vector<int>& active
) {
    std::vector<int> stale;

    for (int display_index : active) {
        auto in_range = [display_index](const std::vector<Station>& list) {
            return display_index >= 0 && static_cast<std::size_t>(display_index) < list.size();
        };

        if (!in_range(before) || !in_range(after)) {
            stale.push_back(display_index);
            continue;
        }

        const Station& old_station = before[display_index];
        const Station& new_station = after[display_index];
        if (old_station.device_index != new_station.device_index || old_station.name != new_station.name) {
            stale.push_back(display_index);
        }
    }

    return stale;
}

int report_unmapped_buttons(const std::vector<ButtonConfig>& buttons, std::size_t station_count, Logger& logger) {
    int unmapped = 0;

    for (const auto& button : buttons) {
        if (button.station < 0 || static_cast<std::size_t>(button.station) >= station_count) {
            logger.error() << "Button on line " << button.line << " maps to station " << button.station
                           << " but only " << station_count << " stations are loaded";
            unmapped++;
        } else {
            logger.info() << "Station " << button.station << ": line " << button.line
                          << " (slave " << button.slave_id << " input " << button.address << ")";
        }
    }

    return unmapped;
}

StationRegistry::StationRegistry() : logger_("StationRegistry") {}

bool StationRegistry::reload(IDeviceClient& client) {
    logger_.separator("Loading Stations");

    auto raw_names = client.list_station_names();
    auto stations = build_stations(raw_names);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stations_ = stations;
    }

    if (raw_names.empty()) {
        logger_.error() << "No station names received from device, no stations available";
        return false;
    }

    logger_.info() << "Available stations (" << stations.size() << " of " << raw_names.size() << "):";
    for (const auto& station : stations) {
        logger_.info() << "Station " << station.display_index << ": " << station.name
                       << " (device index " << station.device_index << ")";
    }

    return true;
}

int StationRegistry::resolve(int display_index) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (display_index < 0 || static_cast<std::size_t>(display_index) >= stations_.size()) {
        throw std::out_of_range("Invalid station index: " + std::to_string(display_index));
    }
    return stations_[display_index].device_index;
}

std::optional<Station> StationRegistry::find(int display_index) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (display_index < 0 || static_cast<std::size_t>(display_index) >= stations_.size()) {
        return std::nullopt;
    }
    return stations_[display_index];
}

std::vector<Station> StationRegistry::stations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stations_;
}

std::size_t StationRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stations_.size();
}

bool StationRegistry::empty() const {
    return size() == 0;
}
