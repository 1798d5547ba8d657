#pragma once

#include "button_board.hpp"
#include "config.hpp"
#include "device_client.hpp"
#include "edge_channel.hpp"
#include "input_debouncer.hpp"
#include "logger/logger.hpp"
#include "modbus_manager.hpp"
#include "mqtt_bridge.hpp"
#include "mqtt_manager.hpp"
#include "session_tracker.hpp"
#include "station_registry.hpp"
#include "status_poller.hpp"
#include "task_runner.hpp"
#include "toggle_coordinator.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

class Application {
public:
    explicit Application(const std::string& config_file);
    ~Application();

    bool initialize();
    void run(std::atomic<bool>& running, std::atomic<bool>& force_exit);
    void shutdown();

    // Re-reads station names; drops sessions whose station moved or vanished
    void reload_stations();

private:
    std::unique_ptr<Config> config_;
    std::unique_ptr<OpenSprinklerClient> client_;
    StationRegistry registry_;

    // Guards session and debounce state
    std::mutex state_mutex_;
    SessionTracker sessions_;

    std::unique_ptr<ToggleCoordinator> coordinator_;
    std::unique_ptr<StatusPoller> poller_;
    std::unique_ptr<InputDebouncer> debouncer_;
    std::unique_ptr<ModbusManager> modbus_;
    std::unique_ptr<ButtonBoard> board_;
    std::unique_ptr<MqttManager> mqtt_;
    std::unique_ptr<MqttStationBridge> bridge_;

    EdgeChannel edges_;
    TaskRunner tasks_;
    std::mutex reload_mutex_;

    std::chrono::steady_clock::time_point last_stats_time_;
    std::vector<bool> last_reported_;

    Logger logger_;

    void check_button_mapping();
    void dispatch_toggle(int display_index, int duration_sec);
    void report_status();
    void print_statistics();
};
