#include "application.hpp"
#include "control_error.hpp"
#include "http_transport.hpp"

Application::Application(const std::string& config_file)
    : config_(std::make_unique<Config>(config_file)),
      sessions_(state_mutex_),
      last_stats_time_(std::chrono::steady_clock::now()),
      logger_("Application") {
    const auto& logging = config_->logging();
    Logger::set_global_level(parse_log_level(logging.level));
    Logger::enable_timestamps(logging.timestamps);
    Logger::enable_colors(logging.colors);
}

Application::~Application() {
    // Stop MQTT from queueing work, then join what it already queued while
    // the members those tasks use are still alive
    if (mqtt_) {
        mqtt_->set_message_callback(nullptr);
    }
    tasks_.wait_all();
}

bool Application::initialize() {
    logger_.separator("Initializing Sprinkler Control System");

    const auto& os = config_->opensprinkler();
    logger_.info() << "OpenSprinkler: " << os.host << ":" << os.port
                   << " (refresh every " << os.refresh_interval_sec << "s)";
    logger_.info() << "Buttons: " << config_->buttons().size()
                   << ", default duration " << config_->control().default_duration_sec << "s"
                   << ", debounce " << config_->control().debounce_ms << "ms";

    client_ = std::make_unique<OpenSprinklerClient>(
        os, std::make_unique<BeastHttpTransport>(os.host, os.port, std::chrono::milliseconds(os.request_timeout_ms)));

    if (!registry_.reload(*client_)) {
        logger_.warning() << to_string(ControlError::RegistryUnavailable)
                          << ": continuing without stations, publish a reload once the device is reachable";
    }
    check_button_mapping();

    coordinator_ = std::make_unique<ToggleCoordinator>(registry_, sessions_, *client_);
    poller_ = std::make_unique<StatusPoller>(*client_, registry_, sessions_);

    debouncer_ = std::make_unique<InputDebouncer>(
        config_->buttons(), config_->control(), state_mutex_,
        [this](int display_index, int duration_sec) { dispatch_toggle(display_index, duration_sec); });

    if (config_->modbus().enabled) {
        modbus_ = std::make_unique<ModbusManager>(config_->modbus());
        if (!modbus_->connect()) {
            logger_.critical() << "Failed to initialize button board";
            return false;
        }
        board_ = std::make_unique<ButtonBoard>(config_->buttons(), *modbus_, edges_);
    } else {
        logger_.warning() << "Button board disabled in config";
    }

    if (config_->mqtt().enabled) {
        mqtt_ = std::make_unique<MqttManager>(config_->mqtt());
        if (!mqtt_->connect()) {
            logger_.critical() << "Failed to initialize MQTT";
            return false;
        }

        bridge_ = std::make_unique<MqttStationBridge>(
            config_->mqtt(), config_->control(), *mqtt_, *coordinator_, sessions_, registry_,
            [this](Task task) { tasks_.submit(std::move(task)); },
            [this]() { reload_stations(); });

        mqtt_->set_message_callback(
            [this](const std::string& topic, const std::string& payload) {
                bridge_->handle_message(topic, payload);
            });

        if (!bridge_->subscribe()) {
            logger_.warning() << "Not all MQTT command topics are subscribed";
        }
        bridge_->publish_names();
        bridge_->publish_states(true);
    }

    logger_.separator("Initialization Complete");
    return true;
}

void Application::run(std::atomic<bool>& running, std::atomic<bool>& force_exit) {
    std::thread consumer([this]() { debouncer_->run(edges_); });

    std::thread scanner;
    if (board_) {
        scanner = std::thread([this, &running]() {
            board_->run(running, std::chrono::milliseconds(config_->modbus().poll_interval_ms));
        });
    }

    logger_.separator("Running");

    const auto refresh = std::chrono::seconds(config_->opensprinkler().refresh_interval_sec);

    while (running && !force_exit) {
        auto start_time = std::chrono::steady_clock::now();

        poller_->poll_once();
        report_status();

        if (bridge_) {
            bridge_->publish_states();
        }

        print_statistics();

        // Sleep for remaining time in short slices so shutdown stays responsive
        while (running && !force_exit && std::chrono::steady_clock::now() - start_time < refresh) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    logger_.info() << "Main loop terminated";

    edges_.close();
    if (scanner.joinable()) {
        scanner.join();
    }
    consumer.join();

    tasks_.wait_all();
}

void Application::shutdown() {
    logger_.separator("Shutdown Initiated");

    if (mqtt_) {
        mqtt_->disconnect();
    }

    if (modbus_) {
        modbus_->disconnect();
    }

    logger_.separator("Shutdown Complete");
}

void Application::reload_stations() {
    std::lock_guard<std::mutex> lock(reload_mutex_);

    auto before = registry_.stations();
    if (!registry_.reload(*client_)) {
        logger_.warning() << to_string(ControlError::RegistryUnavailable) << " on reload";
    }

    for (int display_index : invalidated_sessions(before, registry_.stations(), sessions_.active_indices())) {
        logger_.warning() << "Station " << display_index << " changed on reload, dropping its session";
        sessions_.mark_inactive(display_index);
    }

    check_button_mapping();

    if (bridge_) {
        bridge_->publish_names();
        bridge_->publish_states(true);
    }
}

void Application::check_button_mapping() {
    report_unmapped_buttons(config_->buttons(), registry_.size(), logger_);
}

void Application::dispatch_toggle(int display_index, int duration_sec) {
    tasks_.submit([this, display_index, duration_sec]() {
        auto result = coordinator_->toggle(display_index, duration_sec);
        logger_.info() << "Station " << display_index << ": " << to_string(result);

        if (bridge_) {
            bridge_->publish_station(display_index);
        }
    });
}

void Application::report_status() {
    auto report = poller_->snapshot();

    std::vector<bool> flags;
    for (const auto& status : report) {
        flags.push_back(status.active);
        flags.push_back(status.device_reports_on.value_or(false));
    }

    if (flags == last_reported_) {
        return;
    }
    last_reported_ = flags;

    logger_.separator("Station Status");
    for (const auto& status : report) {
        auto line = logger_.info();
        line << "Station " << status.display_index << " (" << status.name << "): "
             << (status.active ? "ON" : "OFF");
        if (status.remaining_seconds) {
            line << ", " << *status.remaining_seconds << "s remaining";
        }
        if (status.device_reports_on) {
            line << ", device reports " << (*status.device_reports_on ? "ON" : "OFF");
        } else {
            line << ", device state unknown";
        }
    }
}

void Application::print_statistics() {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - last_stats_time_).count();

    if (elapsed < 60) {
        return;
    }

    auto device_stats = client_->get_stats();
    int total_requests = device_stats->request_success + device_stats->request_errors;

    logger_.debug() << "===== STATISTICS =====";
    logger_.debug() << "Device requests: " << device_stats->request_success << "/" << total_requests;
    logger_.debug() << "Sessions cleared by polling: " << poller_->reconciled();
    logger_.debug() << "Presses on unconfigured lines: " << debouncer_->unconfigured_edges();
    client_->reset_stats();

    if (modbus_) {
        auto modbus_stats = modbus_->get_stats();
        logger_.debug() << "Button board reads: " << modbus_stats->read_success << "/"
                        << (modbus_stats->read_success + modbus_stats->read_errors);
        modbus_->reset_stats();
    }

    if (mqtt_) {
        auto mqtt_stats = mqtt_->get_stats();
        logger_.debug() << "MQTT publishes: " << mqtt_stats->publish_success << "/"
                        << (mqtt_stats->publish_success + mqtt_stats->publish_errors)
                        << ", received " << mqtt_stats->messages_received;
        mqtt_->reset_stats();
    }

    last_stats_time_ = now;
}
