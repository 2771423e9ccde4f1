// SPDX-License-Identifier: AGPL-3.0-or-later
#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "molxr/config/viewer_config.hpp"
#include "molxr/error.hpp"

using namespace molxr::config;
using nlohmann::json;

namespace
{
    std::string WriteTemp(const std::string &name, const std::string &contents)
    {
        const auto path = std::filesystem::path(::testing::TempDir()) / name;
        std::ofstream out(path);
        out << contents;
        return path.string();
    }

    class PortEnvironment : public ::testing::Test
    {
    protected:
        void TearDown() override { unsetenv("PORT"); }
    };
}

TEST(ViewerConfig, DefaultsMatchViewerConstants)
{
    const auto cfg = default_config();
    EXPECT_EQ(cfg.syncHost, "localhost");
    EXPECT_EQ(cfg.syncPort, 8080);
    EXPECT_EQ(cfg.fetchBaseUrl, "https://files.rcsb.org/download/");
    EXPECT_EQ(cfg.fetchTimeoutSeconds, 30);
    EXPECT_FLOAT_EQ(cfg.panelDistance, 1.0f);
    EXPECT_FLOAT_EQ(cfg.stickDeadZone, 0.2f);
    EXPECT_DOUBLE_EQ(cfg.longPressSeconds, 0.4);
    EXPECT_EQ(cfg.quickLoadIds.size(), 5u);
    EXPECT_FLOAT_EQ(cfg.transitionSeconds, 0.5f);
    EXPECT_EQ(cfg.logLevel, "info");
}

TEST(ViewerConfig, PartialJsonKeepsDefaults)
{
    const auto cfg = config_from_json(json::parse(R"({
        "sync": {"port": 9000},
        "ui": {"quickLoadIds": ["1CRN"], "longPressSeconds": 0.8}
    })"));
    EXPECT_EQ(cfg.syncPort, 9000);
    EXPECT_EQ(cfg.syncHost, "localhost");
    EXPECT_EQ(cfg.quickLoadIds, std::vector<std::string>{"1CRN"});
    EXPECT_DOUBLE_EQ(cfg.longPressSeconds, 0.8);
    EXPECT_FLOAT_EQ(cfg.panelDistance, 1.0f);
}

TEST(ViewerConfig, RejectsWrongTypes)
{
    EXPECT_THROW(config_from_json(json::array()), molxr::ConfigError);
    EXPECT_THROW(config_from_json(json::parse(R"({"sync": 8080})")), molxr::ConfigError);
    EXPECT_THROW(config_from_json(json::parse(R"({"sync": {"port": "http"}})")), molxr::ConfigError);
    EXPECT_THROW(config_from_json(json::parse(R"({"ui": {"quickLoadIds": "1CRN"}})")), molxr::ConfigError);
}

TEST(ViewerConfig, RejectsOutOfRangeValues)
{
    EXPECT_THROW(config_from_json(json::parse(R"({"sync": {"port": 0}})")), molxr::ConfigError);
    EXPECT_THROW(config_from_json(json::parse(R"({"sync": {"port": 70000}})")), molxr::ConfigError);
    EXPECT_THROW(config_from_json(json::parse(R"({"fetch": {"timeoutSeconds": 0}})")), molxr::ConfigError);
    EXPECT_THROW(config_from_json(json::parse(R"({"ui": {"stickDeadZone": 1.0}})")), molxr::ConfigError);
    EXPECT_THROW(config_from_json(json::parse(R"({"transition": {"seconds": -1}})")), molxr::ConfigError);
    EXPECT_NO_THROW(config_from_json(json::parse(R"({"sync": {"port": 65535}})")));
}

TEST(ViewerConfig, MissingFileGivesDefaults)
{
    const auto cfg = load_config((std::filesystem::path(::testing::TempDir()) / "molxr_no_such_config.json").string());
    EXPECT_EQ(cfg.syncPort, 8080);
}

TEST(ViewerConfig, InvalidFileThrows)
{
    const auto path = WriteTemp("molxr_invalid_config.json", "{ \"sync\": ");
    EXPECT_THROW(load_config(path), molxr::ConfigError);
}

TEST(ViewerConfig, LoadsFileFromDisk)
{
    const auto path = WriteTemp("molxr_config.json", R"({"log": {"level": "debug"}, "transition": {"seconds": 0.25}})");
    const auto cfg = load_config(path);
    EXPECT_EQ(cfg.logLevel, "debug");
    EXPECT_FLOAT_EQ(cfg.transitionSeconds, 0.25f);
}

TEST(ViewerConfig, ShippedConfigParses)
{
    const auto path = default_config_path();
    ASSERT_TRUE(std::filesystem::exists(path)) << path;
    const auto cfg = load_config(path);
    EXPECT_EQ(cfg.syncPort, default_config().syncPort);
    EXPECT_EQ(cfg.quickLoadIds, default_config().quickLoadIds);
}

TEST_F(PortEnvironment, OverridesSyncPort)
{
    setenv("PORT", "9443", 1);
    auto cfg = default_config();
    apply_environment(cfg);
    EXPECT_EQ(cfg.syncPort, 9443);
}

TEST_F(PortEnvironment, IgnoresInvalidPort)
{
    auto cfg = default_config();
    setenv("PORT", "80a", 1);
    apply_environment(cfg);
    EXPECT_EQ(cfg.syncPort, 8080);
    setenv("PORT", "99999", 1);
    apply_environment(cfg);
    EXPECT_EQ(cfg.syncPort, 8080);
}

TEST_F(PortEnvironment, UnsetLeavesConfigAlone)
{
    unsetenv("PORT");
    auto cfg = default_config();
    cfg.syncPort = 1234;
    apply_environment(cfg);
    EXPECT_EQ(cfg.syncPort, 1234);
}
