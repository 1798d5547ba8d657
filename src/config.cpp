#include "config.hpp"
#include "logger/logger.hpp"
#include <fstream>
#include <set>
#include <stdexcept>

OpenSprinklerConfig OpenSprinklerConfig::from_json(const nlohmann::json& j) {
    OpenSprinklerConfig config;
    config.host = j.value("host", "192.168.1.15");
    config.password = j.value("password", "opendoor");
    config.port = j.value("port", 80);
    config.refresh_interval_sec = j.value("refresh_interval", 1);
    config.request_timeout_ms = j.value("request_timeout_ms", 3000);

    return config;
}

ControlConfig ControlConfig::from_json(const nlohmann::json& j) {
    ControlConfig config;
    config.default_duration_sec = j.value("default_duration_sec", 300);
    config.debounce_ms = j.value("debounce_ms", 300);

    return config;
}

ButtonConfig ButtonConfig::from_json(const nlohmann::json& j) {
    ButtonConfig button;
    button.line = j.at("line").get<int>();
    button.station = j.at("station").get<int>();
    button.slave_id = j.value("slave_id", 1);
    button.address = j.at("address").get<int>();

    return button;
}

ModbusConfig ModbusConfig::from_json(const nlohmann::json& j) {
    ModbusConfig config;
    config.enabled = j.value("enabled", true);
    config.port = j.value("port", "/dev/ttyUSB0");
    config.baudrate = j.value("baudrate", 9600);

    std::string parity = j.value("parity", "N");
    config.parity = parity.empty() ? 'N' : parity[0];

    config.data_bits = j.value("data_bits", 8);
    config.stop_bits = j.value("stop_bits", 1);
    config.response_timeout_ms = j.value("response_timeout_ms", 300);
    config.byte_timeout_ms = j.value("byte_timeout_ms", 100);
    config.max_retries = j.value("max_retries", 3);
    config.poll_interval_ms = j.value("poll_interval_ms", 20);

    return config;
}

MqttConfig MqttConfig::from_json(const nlohmann::json& j) {
    MqttConfig config;
    config.enabled = j.value("enabled", false);
    config.broker_address = j.value("broker_address", "tcp://localhost:1883");
    config.client_id = j.value("client_id", "sprinkler_bridge");
    config.username = j.value("username", "");
    config.password = j.value("password", "");
    config.qos = j.value("qos", 1);
    config.keep_alive_sec = j.value("keep_alive_sec", 60);
    config.operation_timeout_ms = j.value("operation_timeout_ms", 500);
    config.topic_prefix = j.value("topic_prefix", "sprinkler");

    return config;
}

LoggingConfig LoggingConfig::from_json(const nlohmann::json& j) {
    LoggingConfig config;
    config.level = j.value("level", "info");
    config.timestamps = j.value("timestamps", true);
    config.colors = j.value("colors", true);

    return config;
}

Config::Config(const std::string& filename) {
    load(filename);
    validate();
}

void Config::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filename);
    }

    nlohmann::json j;
    file >> j;

    const nlohmann::json empty = nlohmann::json::object();

    opensprinkler_ = OpenSprinklerConfig::from_json(j.at("opensprinkler"));
    control_ = ControlConfig::from_json(j.value("control", empty));
    modbus_ = ModbusConfig::from_json(j.value("modbus", empty));
    mqtt_ = MqttConfig::from_json(j.value("mqtt", empty));
    logging_ = LoggingConfig::from_json(j.value("logging", empty));

    for (const auto& item : j.at("buttons")) {
        buttons_.push_back(ButtonConfig::from_json(item));
    }
}

void Config::validate() const {
    if (opensprinkler_.host.empty()) {
        throw std::runtime_error("opensprinkler.host must not be empty");
    }
    if (opensprinkler_.port <= 0 || opensprinkler_.port > 65535) {
        throw std::runtime_error("opensprinkler.port out of range: " + std::to_string(opensprinkler_.port));
    }
    if (opensprinkler_.refresh_interval_sec <= 0) {
        throw std::runtime_error("opensprinkler.refresh_interval must be positive");
    }
    if (opensprinkler_.request_timeout_ms <= 0) {
        throw std::runtime_error("opensprinkler.request_timeout_ms must be positive");
    }
    if (control_.default_duration_sec <= 0) {
        throw std::runtime_error("control.default_duration_sec must be positive");
    }
    if (control_.debounce_ms < 0) {
        throw std::runtime_error("control.debounce_ms must not be negative");
    }
    if (modbus_.poll_interval_ms <= 0) {
        throw std::runtime_error("modbus.poll_interval_ms must be positive");
    }

    // Throws std::invalid_argument on an unknown level name
    parse_log_level(logging_.level);

    std::set<int> lines;
    for (const auto& button : buttons_) {
        if (button.station < 0) {
            throw std::runtime_error("Button on line " + std::to_string(button.line) +
                                     " has negative station index");
        }
        if (button.address < 0 || button.address > 7) {
            throw std::runtime_error("Button on line " + std::to_string(button.line) +
                                     " has input address outside 0-7");
        }
        if (!lines.insert(button.line).second) {
            throw std::runtime_error("Duplicate button line: " + std::to_string(button.line));
        }
    }
}
