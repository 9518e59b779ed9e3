#include <gtest/gtest.h>
#include <fstream>
#include <string>

#include "ddc_config.hpp"

TEST(ConfigTest, Defaults)
{
    DDCConfig config;
    EXPECT_DOUBLE_EQ(config.geofence_radius_m, 100.0);
    EXPECT_DOUBLE_EQ(config.gps_noise_threshold_m, 50.0);
    EXPECT_EQ(config.stale_after_s, 300u);
    EXPECT_DOUBLE_EQ(config.off_route_threshold_km, 0.5);
    EXPECT_EQ(config.reassignment_threshold_s, 600u);
    EXPECT_DOUBLE_EQ(config.driver_commission_rate, 0.8);
    EXPECT_DOUBLE_EQ(config.assumed_speed_kmh, 30.0);
    EXPECT_EQ(config.ws_port, 8081);
    EXPECT_TRUE(config.webhook_url.empty());
}

TEST(ConfigTest, OverlayKeepsUnsetKeys)
{
    DDCConfig config;
    string error;
    nlohmann::json j = {{"geofence_radius_m", 150.0}, {"webhook_url", "http://localhost:9000/events"}};

    ASSERT_TRUE(config_from_json(j, config, error)) << error;
    EXPECT_DOUBLE_EQ(config.geofence_radius_m, 150.0);
    EXPECT_EQ(config.webhook_url, "http://localhost:9000/events");
    EXPECT_EQ(config.stale_after_s, 300u);
}

TEST(ConfigTest, RejectsOutOfRangeAndLeavesConfigUntouched)
{
    DDCConfig config;
    string error;

    nlohmann::json too_generous = {{"driver_commission_rate", 1.5}, {"geofence_radius_m", 10.0}};
    EXPECT_FALSE(config_from_json(too_generous, config, error));
    EXPECT_NE(error.find("driver_commission_rate"), string::npos);
    EXPECT_DOUBLE_EQ(config.driver_commission_rate, 0.8);
    EXPECT_DOUBLE_EQ(config.geofence_radius_m, 100.0);

    error.clear();
    nlohmann::json standing_still = {{"assumed_speed_kmh", 0.0}};
    EXPECT_FALSE(config_from_json(standing_still, config, error));
    EXPECT_FALSE(error.empty());
}

TEST(ConfigTest, RejectsWrongTypesAndNonObjects)
{
    DDCConfig config;
    string error;

    nlohmann::json wrong_type = {{"stale_after_s", "five minutes"}};
    EXPECT_FALSE(config_from_json(wrong_type, config, error));
    EXPECT_FALSE(error.empty());

    error.clear();
    EXPECT_FALSE(config_from_json(nlohmann::json::array({1, 2}), config, error));
    EXPECT_FALSE(error.empty());
}

TEST(ConfigTest, LoadsFromFile)
{
    string path = ::testing::TempDir() + "ddc_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"stale_after_s": 120, "verbose": false})";
    }

    DDCConfig config;
    ASSERT_TRUE(load_config(path, config));
    EXPECT_EQ(config.stale_after_s, 120u);
    EXPECT_FALSE(config.verbose);

    EXPECT_FALSE(load_config(path + ".missing", config));
    EXPECT_EQ(config.stale_after_s, 120u);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_FALSE(load_config(path, config));
}
