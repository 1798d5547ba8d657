#pragma once

#include "config.hpp"
#include "i_mqtt_manager.hpp"
#include "logger/logger.hpp"
#include <mqtt/async_client.h>
#include <atomic>
#include <mutex>
#include <vector>

struct MqttManagerStats {
    int publish_success;
    int publish_errors;
    int messages_received;

    MqttManagerStats(int ps, int pe, int mr);
};

// Broker session for the station bridge. The session is clean, so every
// topic passed to subscribe() is remembered and subscribed again after an
// automatic reconnect.
class MqttManager : public IMqttManager, public mqtt::callback {
public:
    explicit MqttManager(const MqttConfig& config);
    ~MqttManager();

    MqttManager(const MqttManager&) = delete;
    MqttManager& operator=(const MqttManager&) = delete;

    bool connect() override;
    void disconnect() override;

    // Records the topic even when the broker does not confirm it in time.
    bool subscribe(const std::string& topic) override;
    bool publish(const std::string& topic, const std::string& payload, bool retained = true) override;

    void set_message_callback(MqttMessageCallback callback) override;

    std::unique_ptr<MqttManagerStats> get_stats() const override;
    void reset_stats() override;

    // "<prefix>/status", carries online/offline and the last will
    std::string availability_topic() const;
    std::vector<std::string> subscriptions() const;

private:
    MqttConfig config_;
    std::unique_ptr<mqtt::async_client> client_;
    MqttMessageCallback message_callback_;
    std::mutex mutex_;
    std::mutex callback_mutex_;
    mutable std::mutex subscriptions_mutex_;
    std::vector<std::string> subscriptions_;

    std::atomic<int> publish_success_;
    std::atomic<int> publish_errors_;
    std::atomic<int> messages_received_;

    Logger logger_;

    mqtt::delivery_token_ptr publish_availability(const std::string& state);
    void resubscribe();

    void message_arrived(mqtt::const_message_ptr msg) override;
    void connection_lost(const std::string& cause) override;
    void connected(const std::string& cause) override;
};
