#include "mqtt_manager.hpp"
#include <gtest/gtest.h>

class MqttManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.enabled = true;
        config_.broker_address = "tcp://localhost:1883";
        config_.client_id = "test_client";
        config_.username = "";
        config_.password = "";
        config_.qos = 1;
        config_.keep_alive_sec = 60;
        config_.operation_timeout_ms = 500;
        config_.topic_prefix = "garden";
    }

    MqttConfig config_;
};

TEST_F(MqttManagerTest, ConstructorDestructor) {
    ASSERT_NO_THROW({
        MqttManager manager(config_);
    });
}

TEST_F(MqttManagerTest, NoSubscriptionsInitially) {
    MqttManager manager(config_);

    EXPECT_TRUE(manager.subscriptions().empty());
}

TEST_F(MqttManagerTest, SubscribeWhileDisconnectedIsRememberedForReconnect) {
    MqttManager manager(config_);

    EXPECT_FALSE(manager.subscribe("garden/station/+/set"));
    EXPECT_FALSE(manager.subscribe("garden/registry/reload"));
    EXPECT_FALSE(manager.subscribe("garden/station/+/set"));

    std::vector<std::string> expected{"garden/station/+/set", "garden/registry/reload"};
    EXPECT_EQ(manager.subscriptions(), expected);
}

TEST_F(MqttManagerTest, PublishWhileDisconnectedCountsError) {
    MqttManager manager(config_);

    EXPECT_FALSE(manager.publish("garden/station/0/state", "ON"));

    auto stats = manager.get_stats();
    EXPECT_EQ(stats->publish_success, 0);
    EXPECT_EQ(stats->publish_errors, 1);
}

TEST_F(MqttManagerTest, AvailabilityTopic) {
    MqttManager manager(config_);

    EXPECT_EQ(manager.availability_topic(), "garden/status");
}

TEST_F(MqttManagerTest, Statistics) {
    MqttManager manager(config_);

    auto stats = manager.get_stats();
    EXPECT_EQ(stats->publish_success, 0);
    EXPECT_EQ(stats->publish_errors, 0);
    EXPECT_EQ(stats->messages_received, 0);
}

TEST_F(MqttManagerTest, ResetStatistics) {
    MqttManager manager(config_);

    manager.reset_stats();

    auto stats = manager.get_stats();
    EXPECT_EQ(stats->publish_success, 0);
    EXPECT_EQ(stats->publish_errors, 0);
    EXPECT_EQ(stats->messages_received, 0);
}

TEST_F(MqttManagerTest, MessageCallbackCanBeReplaced) {
    MqttManager manager(config_);

    EXPECT_NO_THROW({
        manager.set_message_callback([](const std::string&, const std::string&) {});
        manager.set_message_callback(nullptr);
    });
}
