#pragma once

#include "config.hpp"
#include "i_mqtt_manager.hpp"
#include "logger/logger.hpp"
#include "session_tracker.hpp"
#include "station_registry.hpp"
#include "task_runner.hpp"
#include "toggle_coordinator.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>

using TaskSubmit = std::function<void(Task)>;

// Remote command surface over MQTT.
//
//   <prefix>/station/<n>/set    ON | OFF | TOGGLE | <seconds>
//   <prefix>/registry/reload    any payload
//   <prefix>/station/<n>/state  ON | OFF (published, retained)
//   <prefix>/station/<n>/name   station name (published, retained)
//
// Every command goes through the toggle coordinator. ON for a running station
// and OFF for a stopped one are no-ops.
class MqttStationBridge {
public:
    MqttStationBridge(
        const MqttConfig& config,
        const ControlConfig& control,
        IMqttManager& mqtt,
        ToggleCoordinator& coordinator,
        const SessionTracker& sessions,
        const StationRegistry& registry,
        TaskSubmit submit,
        Task reload
    );

    bool subscribe();
    void handle_message(const std::string& topic, const std::string& payload);

    // Publishes states that changed since the last call, or all when forced
    void publish_states(bool force = false);
    void publish_station(int display_index);
    void publish_names();

private:
    enum class CommandType { On, Off, Toggle };

    struct StationCommand {
        CommandType type;
        int duration_sec;
    };

    std::string prefix_;
    int default_duration_sec_;
    IMqttManager& mqtt_;
    ToggleCoordinator& coordinator_;
    const SessionTracker& sessions_;
    const StationRegistry& registry_;
    TaskSubmit submit_;
    Task reload_;

    std::map<int, bool> published_states_;
    std::mutex publish_mutex_;

    Logger logger_;

    std::optional<int> parse_station_topic(const std::string& topic) const;
    std::optional<StationCommand> parse_command(const std::string& payload) const;
    void execute(int display_index, const StationCommand& command);
    std::string state_topic(int display_index) const;
};
