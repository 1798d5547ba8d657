#include "device_client.hpp"
#include "http_transport_mock.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using ::testing::_;
using ::testing::Return;

namespace {

const std::string kHash = "a6d82bced638de3def1e9bbb4983225c";

HttpResponse reply(const std::string& body, int status = 200) {
    return HttpResponse{status, body};
}

}

class DeviceClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.host = "192.168.1.15";
        config_.password = "opendoor";
        config_.port = 80;
        config_.refresh_interval_sec = 1;
        config_.request_timeout_ms = 3000;

        auto transport = std::make_unique<MockHttpTransport>();
        transport_ = transport.get();
        client_ = std::make_unique<OpenSprinklerClient>(config_, std::move(transport));
    }

    OpenSprinklerConfig config_;
    MockHttpTransport* transport_;
    std::unique_ptr<OpenSprinklerClient> client_;
};

TEST(Md5Test, KnownDigests) {
    EXPECT_EQ(md5_hex(""), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(md5_hex("abc"), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(md5_hex("opendoor"), kHash);
}

TEST(ResultCodeTest, KnownCodes) {
    EXPECT_EQ(describe_result_code(1), "Success");
    EXPECT_EQ(describe_result_code(2), "Unauthorized");
    EXPECT_EQ(describe_result_code(17), "Out of Range");
    EXPECT_EQ(describe_result_code(48), "Not Permitted");
    EXPECT_EQ(describe_result_code(99), "Unknown result 99");
}

TEST_F(DeviceClientTest, ListStationNames) {
    EXPECT_CALL(*transport_, get("/jn?pw=" + kHash))
        .WillOnce(Return(reply(R"({"snames":["S1","Front Lawn","s2","Back Garden",""],"maxlen":32})")));

    auto names = client_->list_station_names();

    std::vector<std::string> expected = {"S1", "Front Lawn", "s2", "Back Garden", ""};
    EXPECT_EQ(names, expected);
}

TEST_F(DeviceClientTest, NonStringNamesKeepTheirPosition) {
    EXPECT_CALL(*transport_, get(_))
        .WillOnce(Return(reply(R"({"snames":["Front Lawn",7,null,"Roses"]})")));

    auto names = client_->list_station_names();

    ASSERT_EQ(names.size(), 4u);
    EXPECT_EQ(names[0], "Front Lawn");
    EXPECT_EQ(names[1], "");
    EXPECT_EQ(names[2], "");
    EXPECT_EQ(names[3], "Roses");
}

TEST_F(DeviceClientTest, ListStationStates) {
    EXPECT_CALL(*transport_, get("/js?pw=" + kHash))
        .WillOnce(Return(reply(R"({"sn":[0,1,0,1],"nstations":4})")));

    auto states = client_->list_station_states();

    std::vector<bool> expected = {false, true, false, true};
    EXPECT_EQ(states, expected);
}

TEST_F(DeviceClientTest, StatesMayBeShorterThanNames) {
    EXPECT_CALL(*transport_, get("/js?pw=" + kHash))
        .WillOnce(Return(reply(R"({"sn":[1,0]})")));

    EXPECT_EQ(client_->list_station_states().size(), 2u);
}

TEST_F(DeviceClientTest, ActivateSendsRunCommand) {
    EXPECT_CALL(*transport_, get("/cm?pw=" + kHash + "&sid=3&en=1&t=120"))
        .WillOnce(Return(reply(R"({"result":1})")));

    EXPECT_TRUE(client_->activate(3, 120));
}

TEST_F(DeviceClientTest, DeactivateSendsStopCommand) {
    EXPECT_CALL(*transport_, get("/cm?pw=" + kHash + "&sid=3&en=0"))
        .WillOnce(Return(reply(R"({"result":1})")));

    EXPECT_TRUE(client_->deactivate(3));
}

TEST_F(DeviceClientTest, CommandRejectedByResultCode) {
    EXPECT_CALL(*transport_, get(_))
        .WillOnce(Return(reply(R"({"result":2})")))
        .WillOnce(Return(reply(R"({"result":17})")));

    EXPECT_FALSE(client_->activate(0, 60));
    EXPECT_FALSE(client_->deactivate(0));

    auto stats = client_->get_stats();
    EXPECT_EQ(stats->request_success, 0);
    EXPECT_EQ(stats->request_errors, 2);
}

TEST_F(DeviceClientTest, CommandWithoutResultCodeAccepted) {
    EXPECT_CALL(*transport_, get(_)).WillOnce(Return(reply("{}")));

    EXPECT_TRUE(client_->deactivate(1));
}

TEST_F(DeviceClientTest, InvalidArgumentsSendNothing) {
    EXPECT_CALL(*transport_, get(_)).Times(0);

    EXPECT_FALSE(client_->activate(-1, 60));
    EXPECT_FALSE(client_->activate(0, 0));
    EXPECT_FALSE(client_->activate(0, -5));
    EXPECT_FALSE(client_->deactivate(-1));
}

TEST_F(DeviceClientTest, NoResponse) {
    EXPECT_CALL(*transport_, get(_)).WillRepeatedly(Return(std::nullopt));

    EXPECT_TRUE(client_->list_station_names().empty());
    EXPECT_TRUE(client_->list_station_states().empty());
    EXPECT_FALSE(client_->activate(0, 60));
    EXPECT_FALSE(client_->deactivate(0));
    EXPECT_TRUE(client_->get_snapshot().empty());

    EXPECT_EQ(client_->get_stats()->request_errors, 5);
}

TEST_F(DeviceClientTest, HttpErrorStatus) {
    EXPECT_CALL(*transport_, get(_))
        .WillOnce(Return(reply(R"({"snames":["Front Lawn"]})", 500)))
        .WillOnce(Return(reply(R"({"result":1})", 404)));

    EXPECT_TRUE(client_->list_station_names().empty());
    EXPECT_FALSE(client_->activate(0, 60));
}

TEST_F(DeviceClientTest, MalformedJson) {
    EXPECT_CALL(*transport_, get(_))
        .WillOnce(Return(reply("<html>not json</html>")))
        .WillOnce(Return(reply(R"(["Front Lawn"])")))
        .WillOnce(Return(reply(R"({"sn":)")));

    EXPECT_TRUE(client_->list_station_names().empty());
    EXPECT_TRUE(client_->list_station_names().empty());
    EXPECT_TRUE(client_->list_station_states().empty());
}

TEST_F(DeviceClientTest, MissingArrayField) {
    EXPECT_CALL(*transport_, get(_))
        .WillOnce(Return(reply(R"({"maxlen":32})")))
        .WillOnce(Return(reply(R"({"sn":"none"})")));

    EXPECT_TRUE(client_->list_station_names().empty());
    EXPECT_TRUE(client_->list_station_states().empty());
}

TEST_F(DeviceClientTest, ReadRefusedWithWrongPassword) {
    EXPECT_CALL(*transport_, get("/jn?pw=" + kHash)).WillOnce(Return(reply(R"({"result":2})")));

    EXPECT_TRUE(client_->list_station_names().empty());
    EXPECT_EQ(client_->get_stats()->request_errors, 1);
}

TEST_F(DeviceClientTest, Snapshot) {
    EXPECT_CALL(*transport_, get("/ja?pw=" + kHash))
        .WillOnce(Return(reply(R"({"settings":{"devt":1700000000},"status":{"sn":[0,1]}})")));

    auto snapshot = client_->get_snapshot();

    ASSERT_TRUE(snapshot.contains("status"));
    EXPECT_EQ(snapshot["status"]["sn"][1], 1);
}

TEST_F(DeviceClientTest, Statistics) {
    EXPECT_CALL(*transport_, get(_))
        .WillOnce(Return(reply(R"({"snames":["Front Lawn"]})")))
        .WillOnce(Return(reply(R"({"result":1})")))
        .WillOnce(Return(std::nullopt));

    client_->list_station_names();
    client_->activate(0, 60);
    client_->list_station_states();

    auto stats = client_->get_stats();
    EXPECT_EQ(stats->request_success, 2);
    EXPECT_EQ(stats->request_errors, 1);

    client_->reset_stats();
    stats = client_->get_stats();
    EXPECT_EQ(stats->request_success, 0);
    EXPECT_EQ(stats->request_errors, 0);
}
