#include "mqtt_manager.hpp"

#include <algorithm>

namespace {
constexpr auto CONNECT_TIMEOUT = std::chrono::milliseconds(5000);
constexpr auto SUBSCRIBE_TIMEOUT = std::chrono::milliseconds(2000);
constexpr auto GOODBYE_TIMEOUT = std::chrono::milliseconds(1000);
}

MqttManagerStats::MqttManagerStats(int ps, int pe, int mr)
    : publish_success(ps), publish_errors(pe), messages_received(mr) {}

MqttManager::MqttManager(const MqttConfig& config)
    : config_(config),
      publish_success_(0),
      publish_errors_(0),
      messages_received_(0),
      logger_("MqttManager") {

    client_ = std::make_unique<mqtt::async_client>(config_.broker_address, config_.client_id);
    client_->set_callback(*this);

    logger_.debug() << "Station bridge client " << config_.client_id
                    << " for broker " << config_.broker_address;
}

MqttManager::~MqttManager() {
    disconnect();
}

std::string MqttManager::availability_topic() const {
    return config_.topic_prefix + "/status";
}

std::vector<std::string> MqttManager::subscriptions() const {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    return subscriptions_;
}

mqtt::delivery_token_ptr MqttManager::publish_availability(const std::string& state) {
    auto msg = mqtt::make_message(availability_topic(), state);
    msg->set_qos(config_.qos);
    msg->set_retained(true);
    return client_->publish(msg);
}

bool MqttManager::connect() {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        mqtt::connect_options opts;
        opts.set_clean_session(true);
        opts.set_automatic_reconnect(true);
        opts.set_keep_alive_interval(config_.keep_alive_sec);

        if (!config_.username.empty()) {
            opts.set_user_name(config_.username);
            opts.set_password(config_.password);
        }

        // Retained "offline" replaces "online" if the bridge dies without a goodbye.
        mqtt::message will(availability_topic(), "offline", config_.qos, true);
        opts.set_will(mqtt::will_options(will));

        logger_.info() << "Connecting to " << config_.broker_address
                       << " (availability on " << availability_topic() << ")";

        if (!client_->connect(opts)->wait_for(CONNECT_TIMEOUT)) {
            logger_.error() << "MQTT connection timeout";
            return false;
        }
        return true;

    } catch (const mqtt::exception& exc) {
        logger_.error() << "MQTT connection error: " << exc.what();
        return false;
    }
}

void MqttManager::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!client_ || !client_->is_connected()) {
        return;
    }

    try {
        publish_availability("offline")->wait_for(GOODBYE_TIMEOUT);
        client_->disconnect()->wait_for(GOODBYE_TIMEOUT);
        logger_.info() << "MQTT disconnected, station commands no longer accepted";
    } catch (const mqtt::exception& exc) {
        logger_.error() << "MQTT disconnect error: " << exc.what();
    }
}

bool MqttManager::subscribe(const std::string& topic) {
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        if (std::find(subscriptions_.begin(), subscriptions_.end(), topic) == subscriptions_.end()) {
            subscriptions_.push_back(topic);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        if (client_->subscribe(topic, config_.qos)->wait_for(SUBSCRIBE_TIMEOUT)) {
            logger_.info() << "Subscribed to: " << topic;
            return true;
        }
        logger_.error() << "Subscribe timeout for topic: " << topic;
        return false;
    } catch (const mqtt::exception& exc) {
        logger_.error() << "Subscribe error (" << topic << "): " << exc.what();
        return false;
    }
}

bool MqttManager::publish(const std::string& topic, const std::string& payload, bool retained) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        auto msg = mqtt::make_message(topic, payload);
        msg->set_qos(config_.qos);
        msg->set_retained(retained);

        if (client_->publish(msg)->wait_for(std::chrono::milliseconds(config_.operation_timeout_ms))) {
            publish_success_++;
            logger_.debug() << "Published to " << topic << ": " << payload;
            return true;
        }

        publish_errors_++;
        logger_.warning() << "Publish timeout for topic: " << topic;
        return false;

    } catch (const mqtt::exception& exc) {
        publish_errors_++;
        logger_.error() << "Publish error (" << topic << "): " << exc.what();
        return false;
    }
}

void MqttManager::set_message_callback(MqttMessageCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    message_callback_ = std::move(callback);
}

void MqttManager::message_arrived(mqtt::const_message_ptr msg) {
    messages_received_++;
    logger_.debug() << "Command on " << msg->get_topic() << ": " << msg->to_string();

    MqttMessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = message_callback_;
    }

    if (callback) {
        callback(msg->get_topic(), msg->to_string());
    }
}

void MqttManager::connection_lost(const std::string& cause) {
    logger_.warning() << "MQTT connection lost: " << (cause.empty() ? "no cause given" : cause);
}

// Runs on the client thread for the first connect and every reconnect.
// Nothing here waits on a token: connect() may still hold mutex_.
void MqttManager::connected(const std::string&) {
    try {
        publish_availability("online");
        resubscribe();
    } catch (const mqtt::exception& exc) {
        logger_.error() << "MQTT session restore failed: " << exc.what();
    }
}

void MqttManager::resubscribe() {
    auto topics = subscriptions();
    if (topics.empty()) {
        logger_.info() << "MQTT connected";
        return;
    }

    for (const auto& topic : topics) {
        client_->subscribe(topic, config_.qos);
    }
    logger_.info() << "MQTT reconnected, restored " << topics.size() << " subscription(s)";
}

std::unique_ptr<MqttManagerStats> MqttManager::get_stats() const {
    return std::make_unique<MqttManagerStats>(
        publish_success_.load(),
        publish_errors_.load(),
        messages_received_.load()
    );
}

void MqttManager::reset_stats() {
    publish_success_ = 0;
    publish_errors_ = 0;
    messages_received_ = 0;
}
