#pragma once
// =============================================================================
// Rampart Config
// =============================================================================
// Typed settings tree loaded from config.json with nlohmann/json.
// Missing keys keep their defaults; a missing or malformed file yields a
// fully default AppConfig.
// =============================================================================

#include <array>
#include <string>

#include <nlohmann/json.hpp>

#include "result.hpp"
#include "rampart_log.hpp"

namespace rampart {
namespace config {

struct Point {
    int x = 0;
    int y = 0;
};

struct Rect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
};

struct BridgeConfig {
    std::string adb_path;              // empty: search ADB_PATH, PATH, SDK dirs
    int command_timeout_ms = 30000;
    int scan_timeout_ms = 3000;        // per-port connect during scans
    int scan_start = 5555;
    int scan_end = 5585;
    int scan_concurrency = 10;
    std::string game_package = "com.my.defense";
};

struct BotConfig {
    bool auto_start = false;
    bool auto_merge = true;
    bool auto_upgrade = true;          // allows spending mana on placement
    bool auto_queue = false;           // tap play_button when out of game
    double action_delay = 1.0;         // seconds between actions in one cycle
    double cycle_interval = 1.0;       // seconds between cycles
    double error_backoff = 5.0;        // seconds to wait after a failed cycle
    int max_errors = 5;
    bool restart_on_error = true;
    std::string preferred_device;
    int min_unit_cost = 3;
    int merge_swipe_ms = 300;
    Point play_button{540, 1200};
    double stop_grace_seconds = 10.0;
    int max_games = 0;                 // 0 = unlimited
    float vision_confidence_threshold = 0.80f;  // mirrors vision.confidence_threshold
};

struct GridConfig {
    int rows = 4;
    int cols = 4;
    int cell_width = 80;
    int cell_height = 80;
    int origin_x = 100;
    int origin_y = 200;
    int spacing = 10;
};

struct ManaConfig {
    Rect region{50, 50, 200, 30};
    // OpenCV 8-bit HSV convention: H in [0,180), S and V in [0,255]
    std::array<int, 3> lower_hsv{100, 150, 200};
    std::array<int, 3> upper_hsv{120, 255, 255};
    int max_mana = 10;
};

struct VisionConfig {
    std::string references_dir = "assets/units";
    std::string templates_dir = "assets/templates";
    std::string rank_model_path = "models/rank_model.json";
    std::string training_dir = "data/rank_training";
    float confidence_threshold = 0.80f;  // template acceptance when unset per template
    int brightness_min = 30;
    int brightness_max = 220;
    int color_bucket = 20;
    int top_colors = 5;
    int max_color_distance = 2000;       // squared RGB distance
    // inner crop applied to each cell before colour sampling
    bool crop_cells = true;
    int cell_inset_x = 17;
    int cell_inset_y = 15;
    int cell_crop_max = 90;
    float rank_min_confidence = 0.5f;
};

struct LogConfig {
    std::string path = "rampart.log";
    std::string level = "info";
};

struct AppConfig {
    BridgeConfig bridge;
    BotConfig bot;
    GridConfig grid;
    ManaConfig mana;
    VisionConfig vision;
    LogConfig log;
};

// Safe JSON accessor with section/key and default value.
// A present key with the wrong type logs a warning and yields the default.
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    if (!j.contains(section) || !j[section].is_object() || !j[section].contains(key)) {
        return def;
    }
    try {
        return j[section][key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        RLOG_WARN("config", "%s.%s has wrong type, using default (%s)",
                  section.c_str(), key.c_str(), e.what());
    }
    return def;
}

// Parse an already-loaded document
AppConfig configFromJson(const nlohmann::json& j);

// @param configPath  Path to config file
// @param strict      If true, only try the exact path (no fallback search)
AppConfig loadConfig(const std::string& configPath = "config.json", bool strict = false);

nlohmann::json botConfigToJson(const BotConfig& c);

// Validate a partial update against `current` and return the merged value.
// Unknown keys, wrong types and out-of-range values are InvalidConfig;
// an empty patch returns `current` unchanged.
Result<BotConfig> applyBotConfigPatch(const BotConfig& current, const nlohmann::json& patch);

} // namespace config
} // namespace rampart
