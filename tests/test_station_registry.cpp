#include "station_registry.hpp"
#include "device_client_mock.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using ::testing::Return;

TEST(GenericStationNameTest, PlaceholderNames) {
    EXPECT_TRUE(is_generic_station_name("S1"));
    EXPECT_TRUE(is_generic_station_name("s2"));
    EXPECT_TRUE(is_generic_station_name("S012"));
    EXPECT_TRUE(is_generic_station_name("7"));
    EXPECT_TRUE(is_generic_station_name("123"));
}

TEST(GenericStationNameTest, RealNames) {
    EXPECT_FALSE(is_generic_station_name("S"));
    EXPECT_FALSE(is_generic_station_name("s"));
    EXPECT_FALSE(is_generic_station_name(""));
    EXPECT_FALSE(is_generic_station_name("Front Lawn"));
    EXPECT_FALSE(is_generic_station_name("S1a"));
    EXPECT_FALSE(is_generic_station_name("Zone 3"));
    EXPECT_FALSE(is_generic_station_name("SS1"));
    EXPECT_FALSE(is_generic_station_name("x1"));
}

TEST(TrimTest, Whitespace) {
    EXPECT_EQ(trim("  Front Lawn \t"), "Front Lawn");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim("Roses"), "Roses");
}

TEST(BuildStationsTest, FiltersGenericAndBlank) {
    auto stations = build_stations({"S1", "Front Lawn", "s2", "Back Garden", ""});

    ASSERT_EQ(stations.size(), 2u);
    EXPECT_EQ(stations[0].display_index, 0);
    EXPECT_EQ(stations[0].device_index, 1);
    EXPECT_EQ(stations[0].name, "Front Lawn");
    EXPECT_EQ(stations[1].display_index, 1);
    EXPECT_EQ(stations[1].device_index, 3);
    EXPECT_EQ(stations[1].name, "Back Garden");
}

TEST(BuildStationsTest, NamesAreTrimmed) {
    auto stations = build_stations({"  Roses  ", " S4 ", "   "});

    ASSERT_EQ(stations.size(), 1u);
    EXPECT_EQ(stations[0].name, "Roses");
    EXPECT_EQ(stations[0].device_index, 0);
}

TEST(BuildStationsTest, DeviceIndicesStrictlyIncrease) {
    auto stations = build_stations({"A", "S2", "B", "", "C", "9", "D"});

    ASSERT_EQ(stations.size(), 4u);
    for (std::size_t i = 0; i < stations.size(); i++) {
        EXPECT_EQ(stations[i].display_index, static_cast<int>(i));
        if (i > 0) {
            EXPECT_GT(stations[i].device_index, stations[i - 1].device_index);
        }
    }
}

TEST(BuildStationsTest, AllGeneric) {
    EXPECT_TRUE(build_stations({"S1", "S2", "S3"}).empty());
}

class StationRegistryTest : public ::testing::Test {
protected:
    MockDeviceClient client_;
    StationRegistry registry_;
};

TEST_F(StationRegistryTest, ReloadFromDevice) {
    EXPECT_CALL(client_, list_station_names())
        .WillOnce(Return(std::vector<std::string>{"S1", "Front Lawn", "s2", "Back Garden", ""}));

    EXPECT_TRUE(registry_.reload(client_));

    EXPECT_EQ(registry_.size(), 2u);
    EXPECT_FALSE(registry_.empty());
    EXPECT_EQ(registry_.resolve(0), 1);
    EXPECT_EQ(registry_.resolve(1), 3);
    EXPECT_THROW(registry_.resolve(2), std::out_of_range);
    EXPECT_THROW(registry_.resolve(-1), std::out_of_range);
}

TEST_F(StationRegistryTest, Find) {
    EXPECT_CALL(client_, list_station_names())
        .WillOnce(Return(std::vector<std::string>{"Front Lawn", "S2", "Roses"}));

    registry_.reload(client_);

    auto station = registry_.find(1);
    ASSERT_TRUE(station.has_value());
    EXPECT_EQ(station->name, "Roses");
    EXPECT_EQ(station->device_index, 2);

    EXPECT_FALSE(registry_.find(2).has_value());
    EXPECT_FALSE(registry_.find(-1).has_value());
}

TEST_F(StationRegistryTest, UnreachableDeviceLeavesRegistryEmpty) {
    EXPECT_CALL(client_, list_station_names()).WillOnce(Return(std::vector<std::string>{}));

    EXPECT_FALSE(registry_.reload(client_));
    EXPECT_TRUE(registry_.empty());
    EXPECT_THROW(registry_.resolve(0), std::out_of_range);
}

TEST_F(StationRegistryTest, FailedReloadReplacesPreviousLoad) {
    EXPECT_CALL(client_, list_station_names())
        .WillOnce(Return(std::vector<std::string>{"Front Lawn"}))
        .WillOnce(Return(std::vector<std::string>{}));

    EXPECT_TRUE(registry_.reload(client_));
    EXPECT_EQ(registry_.size(), 1u);

    EXPECT_FALSE(registry_.reload(client_));
    EXPECT_TRUE(registry_.empty());
}

TEST_F(StationRegistryTest, OnlyGenericNamesIsStillASuccessfulLoad) {
    EXPECT_CALL(client_, list_station_names())
        .WillOnce(Return(std::vector<std::string>{"S1", "S2"}));

    EXPECT_TRUE(registry_.reload(client_));
    EXPECT_TRUE(registry_.empty());
}

TEST_F(StationRegistryTest, ReloadPicksUpRenames) {
    EXPECT_CALL(client_, list_station_names())
        .WillOnce(Return(std::vector<std::string>{"S1", "Front Lawn"}))
        .WillOnce(Return(std::vector<std::string>{"Veggies", "Front Lawn"}));

    registry_.reload(client_);
    EXPECT_EQ(registry_.resolve(0), 1);

    registry_.reload(client_);
    ASSERT_EQ(registry_.size(), 2u);
    EXPECT_EQ(registry_.resolve(0), 0);
    EXPECT_EQ(registry_.resolve(1), 1);
    EXPECT_EQ(registry_.stations()[0].name, "Veggies");
}

class SessionInvalidationTest : public ::testing::Test {
protected:
    void SetUp() override {
        before_ = build_stations({"S1", "Front Lawn", "s2", "Back Garden", "Roses"});
    }

    std::vector<Station> before_;
};

TEST_F(SessionInvalidationTest, UnchangedStationsKeepSessions) {
    auto after = build_stations({"S1", "Front Lawn", "s2", "Back Garden", "Roses"});

    EXPECT_TRUE(invalidated_sessions(before_, after, {0, 1, 2}).empty());
}

TEST_F(SessionInvalidationTest, RenamedStationDropped) {
    auto after = build_stations({"S1", "Front Lawn", "s2", "Vegetable Beds", "Roses"});

    EXPECT_EQ(invalidated_sessions(before_, after, {0, 1}), std::vector<int>{1});
}

TEST_F(SessionInvalidationTest, ShiftedDeviceIndexDropped) {
    // Naming device 0 shifts every display index onto a different device
    auto after = build_stations({"Patio", "Front Lawn", "s2", "Back Garden", "Roses"});

    std::vector<int> expected = {0, 2};
    EXPECT_EQ(invalidated_sessions(before_, after, {0, 2}), expected);
}

TEST_F(SessionInvalidationTest, FailedReloadDropsEverything) {
    std::vector<Station> after;

    std::vector<int> expected = {0, 1, 2};
    EXPECT_EQ(invalidated_sessions(before_, after, {0, 1, 2}), expected);
}

TEST_F(SessionInvalidationTest, VanishedStationDropped) {
    auto after = build_stations({"S1", "Front Lawn", "s2", "Back Garden", ""});

    EXPECT_EQ(invalidated_sessions(before_, after, {0, 2}), std::vector<int>{2});
}

TEST_F(SessionInvalidationTest, SessionFromEmptyRegistryDropped) {
    std::vector<Station> before;
    auto after = build_stations({"Front Lawn"});

    EXPECT_EQ(invalidated_sessions(before, after, {0}), std::vector<int>{0});
}

class ButtonMappingTest : public ::testing::Test {
protected:
    void SetUp() override {
        buttons_.push_back(ButtonConfig{26, 1, 0, 0});
        buttons_.push_back(ButtonConfig{6, 1, 1, 1});
        buttons_.push_back(ButtonConfig{13, 1, 2, 4});

        Logger::set_sink([this](LogLevel level, const std::string& line) {
            if (level == LogLevel::LEVEL_ERROR) {
                errors_.push_back(line);
            }
        });
    }

    void TearDown() override { Logger::set_sink(nullptr); }

    std::vector<ButtonConfig> buttons_;
    std::vector<std::string> errors_;
    Logger logger_{"ButtonMappingTest"};
};

TEST_F(ButtonMappingTest, ButtonPastLoadedStationsReported) {
    EXPECT_EQ(report_unmapped_buttons(buttons_, 2, logger_), 1);

    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_NE(errors_[0].find("line 13"), std::string::npos);
    EXPECT_NE(errors_[0].find("station 4"), std::string::npos);
}

TEST_F(ButtonMappingTest, EmptyRegistryReportsEveryButton) {
    EXPECT_EQ(report_unmapped_buttons(buttons_, 0, logger_), 3);
    EXPECT_EQ(errors_.size(), 3u);
}

TEST_F(ButtonMappingTest, AllMapped) {
    EXPECT_EQ(report_unmapped_buttons(buttons_, 5, logger_), 0);
    EXPECT_TRUE(errors_.empty());
}
