#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

#include "config.hpp"

using namespace std::chrono_literals;

TEST(ConfigTest, DefaultsForEmptyObject)
{
    config::renderer_config cfg = config::from_json(json::object());

    EXPECT_EQ(cfg.discovery_timeout, 5000ms);
    EXPECT_EQ(cfg.description_timeout, 5000ms);
    EXPECT_EQ(cfg.control_timeout, 10000ms);
    EXPECT_EQ(cfg.server_port, 0);
    EXPECT_TRUE(cfg.advertise_address.empty());
    EXPECT_EQ(cfg.store_capacity, 10u);
    EXPECT_EQ(cfg.jpeg_quality, 85);
    EXPECT_EQ(cfg.log_level, logging::level::info);
}

TEST(ConfigTest, ReadsAllKeys)
{
    json j = {
        {"discovery_timeout_ms", 2000},
        {"description_timeout_ms", 1500},
        {"control_timeout_ms", 3000},
        {"server_port", 8099},
        {"advertise_address", "192.168.1.12"},
        {"store_capacity", 4},
        {"jpeg_quality", 60},
        {"log_level", "warning"}
    };
    config::renderer_config cfg = config::from_json(j);

    EXPECT_EQ(cfg.discovery_timeout, 2000ms);
    EXPECT_EQ(cfg.description_timeout, 1500ms);
    EXPECT_EQ(cfg.control_timeout, 3000ms);
    EXPECT_EQ(cfg.server_port, 8099);
    EXPECT_EQ(cfg.store_capacity, 4u);
    EXPECT_EQ(cfg.jpeg_quality, 60);
    EXPECT_EQ(cfg.log_level, logging::level::warn);
    EXPECT_EQ(config::address_provider(cfg)(), "192.168.1.12");
}

TEST(ConfigTest, RejectsInvalidValues)
{
    EXPECT_THROW(config::from_json(json::array()), std::invalid_argument);
    EXPECT_THROW(config::from_json({{"control_timeout_ms", 0}}), std::invalid_argument);
    EXPECT_THROW(config::from_json({{"server_port", 70000}}), std::invalid_argument);
    EXPECT_THROW(config::from_json({{"store_capacity", 0}}), std::invalid_argument);
    EXPECT_THROW(config::from_json({{"jpeg_quality", 101}}), std::invalid_argument);
    EXPECT_THROW(config::from_json({{"log_level", "loud"}}), std::invalid_argument);
    EXPECT_THROW(config::from_json({{"server_port", "eighty"}}), std::invalid_argument);
}

TEST(ConfigTest, LoadsFile)
{
    std::string path = ::testing::TempDir() + "tvcast_config_test.json";
    {
        std::ofstream ofs {path};
        ofs << R"({"store_capacity": 3, "log_level": "debug"})";
    }

    config::renderer_config cfg = config::load_config(path);
    EXPECT_EQ(cfg.store_capacity, 3u);
    EXPECT_EQ(cfg.log_level, logging::level::debug);
    std::remove(path.c_str());

    EXPECT_THROW(config::load_config(path), std::invalid_argument);
}

TEST(ConfigTest, BrokenJsonFile)
{
    std::string path = ::testing::TempDir() + "tvcast_broken_config.json";
    {
        std::ofstream ofs {path};
        ofs << "{\"store_capacity\": ";
    }

    EXPECT_THROW(config::load_config(path), std::invalid_argument);
    std::remove(path.c_str());
}
