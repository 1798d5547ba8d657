#include "mqtt_bridge.hpp"
#include <algorithm>
#include <cctype>

MqttStationBridge::MqttStationBridge(
    const MqttConfig& config,
    const ControlConfig& control,
    IMqttManager& mqtt,
    ToggleCoordinator& coordinator,
    const SessionTracker& sessions,
    const StationRegistry& registry,
    TaskSubmit submit,
    Task reload
) : prefix_(config.topic_prefix), default_duration_sec_(control.default_duration_sec),
    mqtt_(mqtt), coordinator_(coordinator), sessions_(sessions), registry_(registry),
    submit_(std::move(submit)), reload_(std::move(reload)), logger_("MqttStationBridge") {}

bool MqttStationBridge::subscribe() {
    bool ok = mqtt_.subscribe(prefix_ + "/station/+/set");
    ok = mqtt_.subscribe(prefix_ + "/registry/reload") && ok;
    return ok;
}

void MqttStationBridge::handle_message(const std::string& topic, const std::string& payload) {
    if (topic == prefix_ + "/registry/reload") {
        logger_.info() << "Station reload requested over MQTT";
        submit_(reload_);
        return;
    }

    auto display_index = parse_station_topic(topic);
    if (!display_index) {
        logger_.debug() << "Ignoring message on " << topic;
        return;
    }

    auto command = parse_command(payload);
    if (!command) {
        logger_.warning() << "Invalid payload for station " << *display_index << ": \"" << payload << "\"";
        return;
    }

    logger_.debug() << "MQTT CMD: station " << *display_index << " = " << payload;

    const int station = *display_index;
    const StationCommand cmd = *command;
    submit_([this, station, cmd]() { execute(station, cmd); });
}

void MqttStationBridge::publish_states(bool force) {
    for (const auto& station : registry_.stations()) {
        const bool active = sessions_.is_active(station.display_index);

        {
            std::lock_guard<std::mutex> lock(publish_mutex_);
            auto it = published_states_.find(station.display_index);
            if (!force && it != published_states_.end() && it->second == active) {
                continue;
            }
            published_states_[station.display_index] = active;
        }

        mqtt_.publish(state_topic(station.display_index), active ? "ON" : "OFF", true);
    }
}

void MqttStationBridge::publish_station(int display_index) {
    if (!registry_.find(display_index)) {
        return;
    }

    const bool active = sessions_.is_active(display_index);
    {
        std::lock_guard<std::mutex> lock(publish_mutex_);
        published_states_[display_index] = active;
    }

    mqtt_.publish(state_topic(display_index), active ? "ON" : "OFF", true);
}

void MqttStationBridge::publish_names() {
    for (const auto& station : registry_.stations()) {
        mqtt_.publish(prefix_ + "/station/" + std::to_string(station.display_index) + "/name", station.name, true);
    }
}

std::optional<int> MqttStationBridge::parse_station_topic(const std::string& topic) const {
    // "<prefix>/station/{n}/set"
    const std::string head = prefix_ + "/station/";
    const std::string tail = "/set";

    if (topic.size() <= head.size() + tail.size() || topic.compare(0, head.size(), head) != 0 ||
        topic.compare(topic.size() - tail.size(), tail.size(), tail) != 0) {
        return std::nullopt;
    }

    const std::string index = topic.substr(head.size(), topic.size() - head.size() - tail.size());
    if (index.size() > 6 || !std::all_of(index.begin(), index.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }

    return std::stoi(index);
}

std::optional<MqttStationBridge::StationCommand> MqttStationBridge::parse_command(const std::string& payload) const {
    std::string value = trim(payload);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    if (value == "ON" || value == "TRUE") {
        return StationCommand{CommandType::On, default_duration_sec_};
    }
    if (value == "OFF" || value == "FALSE") {
        return StationCommand{CommandType::Off, 0};
    }
    if (value == "TOGGLE") {
        return StationCommand{CommandType::Toggle, default_duration_sec_};
    }

    // Bare number: turn on for that many seconds
    if (!value.empty() && value.size() <= 6 &&
        std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return StationCommand{CommandType::On, std::stoi(value)};
    }

    return std::nullopt;
}

void MqttStationBridge::execute(int display_index, const StationCommand& command) {
    ToggleResult result = ToggleResult::unchanged();

    switch (command.type) {
        case CommandType::On:
            result = coordinator_.set_state(display_index, true, command.duration_sec);
            break;
        case CommandType::Off:
            result = coordinator_.set_state(display_index, false, command.duration_sec);
            break;
        case CommandType::Toggle:
            result = coordinator_.toggle(display_index, command.duration_sec);
            break;
    }

    logger_.debug() << "Station " << display_index << ": " << to_string(result);
    publish_station(display_index);
}

std::string MqttStationBridge::state_topic(int display_index) const {
    return prefix_ + "/station/" + std::to_string(display_index) + "/state";
}
