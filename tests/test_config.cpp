// =============================================================================
// Unit tests for config.hpp
// Tests: defaults, file loading, section parsing, BotConfig patch validation
// =============================================================================
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>

#include "config.hpp"

using namespace rampart;
using namespace rampart::config;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static void writeTmpJson(const char* path, const char* content) {
    std::ofstream f(path);
    f << content;
}

// ---------------------------------------------------------------------------
// Defaults
// ---------------------------------------------------------------------------
TEST(ConfigTest, DefaultValues) {
    AppConfig cfg;
    EXPECT_EQ(cfg.bridge.scan_start,            5555);
    EXPECT_EQ(cfg.bridge.scan_end,              5585);
    EXPECT_EQ(cfg.bridge.scan_concurrency,      10);
    EXPECT_EQ(cfg.bridge.game_package,          "com.my.defense");
    EXPECT_EQ(cfg.grid.rows,                    4);
    EXPECT_EQ(cfg.grid.cols,                    4);
    EXPECT_EQ(cfg.grid.origin_x,                100);
    EXPECT_EQ(cfg.grid.origin_y,                200);
    EXPECT_EQ(cfg.mana.max_mana,                10);
    EXPECT_EQ(cfg.bot.max_errors,               5);
    EXPECT_TRUE(cfg.bot.restart_on_error);
    EXPECT_EQ(cfg.bot.play_button.x,            540);
    EXPECT_EQ(cfg.bot.play_button.y,            1200);
    EXPECT_FLOAT_EQ(cfg.vision.confidence_threshold, 0.80f);
    EXPECT_EQ(cfg.log.path,                     "rampart.log");
}

TEST(ConfigTest, MissingFileReturnsDefaults) {
    AppConfig cfg = loadConfig("/nonexistent/rampart_config.json", true);
    EXPECT_EQ(cfg.grid.rows, 4);
    EXPECT_EQ(cfg.bot.min_unit_cost, 3);
}

TEST(ConfigTest, MalformedFileReturnsDefaults) {
    const char* path = "rampart_test_bad_config.json";
    writeTmpJson(path, "{ \"grid\": { \"rows\": ");
    AppConfig cfg = loadConfig(path, true);
    EXPECT_EQ(cfg.grid.rows, 4);
    std::remove(path);
}

TEST(ConfigTest, LoadsSections) {
    const char* path = "rampart_test_config.json";
    writeTmpJson(path, R"({
        "bridge": {"adb_path": "/opt/adb", "scan_start": 6000, "scan_end": 6010},
        "bot":    {"max_errors": 3, "auto_queue": true, "play_button": {"x": 10, "y": 20}},
        "grid":   {"rows": 5, "cols": 3, "spacing": 4},
        "mana":   {"region": [1, 2, 30, 4], "max_mana": 12, "lower_hsv": [90, 100, 100]},
        "vision": {"confidence_threshold": 0.6, "crop_cells": false},
        "log":    {"level": "debug"}
    })");

    AppConfig cfg = loadConfig(path, true);
    EXPECT_EQ(cfg.bridge.adb_path, "/opt/adb");
    EXPECT_EQ(cfg.bridge.scan_start, 6000);
    EXPECT_EQ(cfg.bridge.scan_end, 6010);
    EXPECT_EQ(cfg.bot.max_errors, 3);
    EXPECT_TRUE(cfg.bot.auto_queue);
    EXPECT_EQ(cfg.bot.play_button.x, 10);
    EXPECT_EQ(cfg.grid.rows, 5);
    EXPECT_EQ(cfg.grid.cols, 3);
    EXPECT_EQ(cfg.grid.spacing, 4);
    EXPECT_EQ(cfg.grid.cell_width, 80);           // untouched key keeps default
    EXPECT_EQ(cfg.mana.region.w, 30);
    EXPECT_EQ(cfg.mana.max_mana, 12);
    EXPECT_EQ(cfg.mana.lower_hsv[0], 90);
    EXPECT_EQ(cfg.mana.upper_hsv[0], 120);
    EXPECT_FLOAT_EQ(cfg.vision.confidence_threshold, 0.6f);
    EXPECT_FALSE(cfg.vision.crop_cells);
    EXPECT_EQ(cfg.log.level, "debug");
    std::remove(path);
}

TEST(ConfigTest, WrongTypeFallsBackToDefault) {
    auto j = nlohmann::json::parse(R"({"grid": {"rows": "four"}, "bridge": {"scan_end": 5600}})");
    AppConfig cfg = configFromJson(j);
    EXPECT_EQ(cfg.grid.rows, 4);
    EXPECT_EQ(cfg.bridge.scan_end, 5600);
}

TEST(ConfigTest, NonPositiveGridRejected) {
    auto j = nlohmann::json::parse(R"({"grid": {"rows": 0, "cols": 6}})");
    AppConfig cfg = configFromJson(j);
    EXPECT_EQ(cfg.grid.rows, 4);
    EXPECT_EQ(cfg.grid.cols, 4);
}

TEST(ConfigTest, ThresholdOutOfRangeRejected) {
    auto j = nlohmann::json::parse(R"({"vision": {"confidence_threshold": 1.5}})");
    EXPECT_FLOAT_EQ(configFromJson(j).vision.confidence_threshold, 0.80f);
}

TEST(ConfigTest, JsonGetMissingSection) {
    nlohmann::json j = nlohmann::json::object();
    EXPECT_EQ(jsonGet<int>(j, "grid", "rows", 7), 7);
}

// ---------------------------------------------------------------------------
// applyBotConfigPatch
// ---------------------------------------------------------------------------
TEST(BotConfigPatchTest, EmptyPatchIsIdempotent) {
    BotConfig current;
    current.max_errors = 9;
    current.preferred_device = "emulator-5554";

    auto r = applyBotConfigPatch(current, nlohmann::json::object());
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(botConfigToJson(r.value()), botConfigToJson(current));

    auto again = applyBotConfigPatch(r.value(), nlohmann::json::object());
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(botConfigToJson(again.value()), botConfigToJson(current));
}

TEST(BotConfigPatchTest, PartialUpdateMerges) {
    BotConfig current;
    auto r = applyBotConfigPatch(current, {{"auto_merge", false}, {"cycle_interval", 0.25}});
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value().auto_merge);
    EXPECT_DOUBLE_EQ(r.value().cycle_interval, 0.25);
    EXPECT_TRUE(r.value().auto_upgrade);
}

TEST(BotConfigPatchTest, UnknownKeyRejected) {
    auto r = applyBotConfigPatch(BotConfig{}, {{"turbo", true}});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidConfig);
}

TEST(BotConfigPatchTest, WrongTypeRejected) {
    auto r = applyBotConfigPatch(BotConfig{}, {{"max_errors", "five"}});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidConfig);
}

TEST(BotConfigPatchTest, OutOfRangeRejected) {
    EXPECT_TRUE(applyBotConfigPatch(BotConfig{}, {{"max_errors", 0}}).is_err());
    EXPECT_TRUE(applyBotConfigPatch(BotConfig{}, {{"cycle_interval", 0}}).is_err());
    EXPECT_TRUE(applyBotConfigPatch(BotConfig{}, {{"action_delay", -1.0}}).is_err());
    EXPECT_TRUE(applyBotConfigPatch(BotConfig{}, {{"action_delay", 0.0}}).is_ok());
}

TEST(BotConfigPatchTest, RejectedPatchLeavesNothingApplied) {
    BotConfig current;
    auto r = applyBotConfigPatch(current, {{"auto_merge", false}, {"bogus", 1}});
    EXPECT_TRUE(r.is_err());
    EXPECT_TRUE(current.auto_merge);
}

TEST(BotConfigPatchTest, PlayButtonNeedsBothCoordinates) {
    EXPECT_TRUE(applyBotConfigPatch(BotConfig{}, {{"play_button", {{"x", 1}}}}).is_err());
    auto r = applyBotConfigPatch(BotConfig{}, {{"play_button", {{"x", 1}, {"y", 2}}}});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().play_button.y, 2);
}

TEST(BotConfigPatchTest, NonObjectRejected) {
    auto r = applyBotConfigPatch(BotConfig{}, nlohmann::json::array({1, 2}));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidConfig);
}

TEST(BotConfigPatchTest, VisionConfidenceThreshold) {
    auto r = applyBotConfigPatch(BotConfig{}, {{"vision_confidence_threshold", 0.7}});
    ASSERT_TRUE(r.is_ok());
    EXPECT_FLOAT_EQ(r.value().vision_confidence_threshold, 0.7f);
    EXPECT_FLOAT_EQ(botConfigToJson(r.value())["vision_confidence_threshold"].get<float>(), 0.7f);

    EXPECT_TRUE(applyBotConfigPatch(BotConfig{}, {{"vision_confidence_threshold", 0}}).is_ok());
    EXPECT_TRUE(applyBotConfigPatch(BotConfig{}, {{"vision_confidence_threshold", 1}}).is_ok());
    auto high = applyBotConfigPatch(BotConfig{}, {{"vision_confidence_threshold", 1.5}});
    ASSERT_TRUE(high.is_err());
    EXPECT_EQ(high.error().code, ErrorCode::InvalidConfig);
    EXPECT_TRUE(applyBotConfigPatch(BotConfig{}, {{"vision_confidence_threshold", -0.1}}).is_err());
    EXPECT_TRUE(applyBotConfigPatch(BotConfig{}, {{"vision_confidence_threshold", "x"}}).is_err());
}

TEST(ConfigTest, VisionThresholdSpellingsAgree) {
    auto from_vision = configFromJson(nlohmann::json::parse(R"({"vision": {"confidence_threshold": 0.6}})"));
    EXPECT_FLOAT_EQ(from_vision.bot.vision_confidence_threshold, 0.6f);

    auto from_bot = configFromJson(nlohmann::json::parse(
        R"({"vision": {"confidence_threshold": 0.6}, "bot": {"vision_confidence_threshold": 0.9}})"));
    EXPECT_FLOAT_EQ(from_bot.vision.confidence_threshold, 0.9f);
    EXPECT_FLOAT_EQ(from_bot.bot.vision_confidence_threshold, 0.9f);

    // a rejected bot section does not override the vision value
    auto rejected = configFromJson(nlohmann::json::parse(
        R"({"vision": {"confidence_threshold": 0.6}, "bot": {"vision_confidence_threshold": 2.0}})"));
    EXPECT_FLOAT_EQ(rejected.vision.confidence_threshold, 0.6f);
    EXPECT_FLOAT_EQ(rejected.bot.vision_confidence_threshold, 0.6f);
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
