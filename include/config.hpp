#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct OpenSprinklerConfig {
    std::string host;
    std::string password;
    int port;
    int refresh_interval_sec;
    int request_timeout_ms;

    static OpenSprinklerConfig from_json(const nlohmann::json& j);
};

struct ControlConfig {
    int default_duration_sec;
    int debounce_ms;

    static ControlConfig from_json(const nlohmann::json& j);
};

// One physical pushbutton. `line` is the identifier edges are reported with,
// `station` is a display index into the station registry.
struct ButtonConfig {
    int line;
    int slave_id;
    int address;
    int station;

    static ButtonConfig from_json(const nlohmann::json& j);
};

struct ModbusConfig {
    bool enabled;
    std::string port;
    int baudrate;
    char parity;
    int data_bits;
    int stop_bits;
    int response_timeout_ms;
    int byte_timeout_ms;
    int max_retries;
    int poll_interval_ms;

    static ModbusConfig from_json(const nlohmann::json& j);
};

struct MqttConfig {
    bool enabled;
    std::string broker_address;
    std::string client_id;
    std::string username;
    std::string password;
    int qos;
    int keep_alive_sec;
    int operation_timeout_ms;
    std::string topic_prefix;

    static MqttConfig from_json(const nlohmann::json& j);
};

struct LoggingConfig {
    std::string level;
    bool timestamps;
    bool colors;

    static LoggingConfig from_json(const nlohmann::json& j);
};

class Config {
public:
    explicit Config(const std::string& filename);

    const OpenSprinklerConfig& opensprinkler() const { return opensprinkler_; }
    const ControlConfig& control() const { return control_; }
    const ModbusConfig& modbus() const { return modbus_; }
    const MqttConfig& mqtt() const { return mqtt_; }
    const LoggingConfig& logging() const { return logging_; }
    const std::vector<ButtonConfig>& buttons() const { return buttons_; }

private:
    OpenSprinklerConfig opensprinkler_;
    ControlConfig control_;
    ModbusConfig modbus_;
    MqttConfig mqtt_;
    LoggingConfig logging_;
    std::vector<ButtonConfig> buttons_;

    void load(const std::string& filename);
    void validate() const;
};
