// =============================================================================
// Rampart Config - loader and BotConfig patching
// =============================================================================
#include "config.hpp"

#include <fstream>
#include <set>
#include <vector>

namespace rampart {
namespace config {

namespace {

std::array<int, 3> hsvTriple(const nlohmann::json& j, const char* key,
                             const std::array<int, 3>& def) {
    auto v = jsonGet<std::vector<int>>(j, "mana", key, {});
    if (v.size() != 3) {
        if (!v.empty()) RLOG_WARN("config", "mana.%s needs 3 values, using default", key);
        return def;
    }
    return {v[0], v[1], v[2]};
}

} // anonymous namespace

AppConfig configFromJson(const nlohmann::json& j) {
    AppConfig config;

    const BridgeConfig bd;
    config.bridge.adb_path = jsonGet<std::string>(j, "bridge", "adb_path", bd.adb_path);
    config.bridge.command_timeout_ms = jsonGet<int>(j, "bridge", "command_timeout_ms", bd.command_timeout_ms);
    config.bridge.scan_timeout_ms = jsonGet<int>(j, "bridge", "scan_timeout_ms", bd.scan_timeout_ms);
    config.bridge.scan_start = jsonGet<int>(j, "bridge", "scan_start", bd.scan_start);
    config.bridge.scan_end = jsonGet<int>(j, "bridge", "scan_end", bd.scan_end);
    config.bridge.scan_concurrency = jsonGet<int>(j, "bridge", "scan_concurrency", bd.scan_concurrency);
    config.bridge.game_package = jsonGet<std::string>(j, "bridge", "game_package", bd.game_package);

    bool bot_threshold = false;
    if (j.contains("bot")) {
        auto bot = applyBotConfigPatch(BotConfig{}, j["bot"]);
        if (bot) {
            config.bot = bot.value();
            bot_threshold = j["bot"].contains("vision_confidence_threshold");
        } else {
            RLOG_ERROR("config", "bot section rejected: %s", bot.error().message.c_str());
        }
    }

    const GridConfig gd;
    config.grid.rows = jsonGet<int>(j, "grid", "rows", gd.rows);
    config.grid.cols = jsonGet<int>(j, "grid", "cols", gd.cols);
    config.grid.cell_width = jsonGet<int>(j, "grid", "cell_width", gd.cell_width);
    config.grid.cell_height = jsonGet<int>(j, "grid", "cell_height", gd.cell_height);
    config.grid.origin_x = jsonGet<int>(j, "grid", "origin_x", gd.origin_x);
    config.grid.origin_y = jsonGet<int>(j, "grid", "origin_y", gd.origin_y);
    config.grid.spacing = jsonGet<int>(j, "grid", "spacing", gd.spacing);
    if (config.grid.rows <= 0 || config.grid.cols <= 0 ||
        config.grid.cell_width <= 0 || config.grid.cell_height <= 0) {
        RLOG_ERROR("config", "grid dimensions must be positive, using defaults");
        config.grid = gd;
    }

    const ManaConfig md;
    auto region = jsonGet<std::vector<int>>(j, "mana", "region", {});
    if (region.size() == 4) {
        config.mana.region = {region[0], region[1], region[2], region[3]};
    }
    config.mana.lower_hsv = hsvTriple(j, "lower_hsv", md.lower_hsv);
    config.mana.upper_hsv = hsvTriple(j, "upper_hsv", md.upper_hsv);
    config.mana.max_mana = jsonGet<int>(j, "mana", "max_mana", md.max_mana);

    const VisionConfig vd;
    config.vision.references_dir = jsonGet<std::string>(j, "vision", "references_dir", vd.references_dir);
    config.vision.templates_dir = jsonGet<std::string>(j, "vision", "templates_dir", vd.templates_dir);
    config.vision.rank_model_path = jsonGet<std::string>(j, "vision", "rank_model_path", vd.rank_model_path);
    config.vision.training_dir = jsonGet<std::string>(j, "vision", "training_dir", vd.training_dir);
    config.vision.confidence_threshold = jsonGet<float>(j, "vision", "confidence_threshold", vd.confidence_threshold);
    config.vision.brightness_min = jsonGet<int>(j, "vision", "brightness_min", vd.brightness_min);
    config.vision.brightness_max = jsonGet<int>(j, "vision", "brightness_max", vd.brightness_max);
    config.vision.color_bucket = jsonGet<int>(j, "vision", "color_bucket", vd.color_bucket);
    config.vision.top_colors = jsonGet<int>(j, "vision", "top_colors", vd.top_colors);
    config.vision.max_color_distance = jsonGet<int>(j, "vision", "max_color_distance", vd.max_color_distance);
    config.vision.crop_cells = jsonGet<bool>(j, "vision", "crop_cells", vd.crop_cells);
    config.vision.cell_inset_x = jsonGet<int>(j, "vision", "cell_inset_x", vd.cell_inset_x);
    config.vision.cell_inset_y = jsonGet<int>(j, "vision", "cell_inset_y", vd.cell_inset_y);
    config.vision.cell_crop_max = jsonGet<int>(j, "vision", "cell_crop_max", vd.cell_crop_max);
    config.vision.rank_min_confidence = jsonGet<float>(j, "vision", "rank_min_confidence", vd.rank_min_confidence);
    if (config.vision.confidence_threshold < 0.0f || config.vision.confidence_threshold > 1.0f) {
        RLOG_WARN("config", "vision.confidence_threshold out of [0,1], using %.2f", vd.confidence_threshold);
        config.vision.confidence_threshold = vd.confidence_threshold;
    }
    if (config.vision.color_bucket <= 0) config.vision.color_bucket = vd.color_bucket;

    // One threshold, two spellings: bot.vision_confidence_threshold wins
    if (bot_threshold) {
        config.vision.confidence_threshold = config.bot.vision_confidence_threshold;
    } else {
        config.bot.vision_confidence_threshold = config.vision.confidence_threshold;
    }

    config.log.path = jsonGet<std::string>(j, "log", "path", LogConfig{}.path);
    config.log.level = jsonGet<std::string>(j, "log", "level", LogConfig{}.level);

    return config;
}

AppConfig loadConfig(const std::string& configPath, bool strict) {
    std::ifstream file(configPath);
    if (!file.is_open() && !strict) {
        file.open("config.json");
        if (!file.is_open()) {
            file.open("../config.json");
        }
    }
    if (!file.is_open()) {
        RLOG_WARN("config", "config.json not found, using defaults");
        return AppConfig{};
    }

    AppConfig config;
    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config = configFromJson(j);
    } catch (const nlohmann::json::exception& e) {
        RLOG_ERROR("config", "JSON parse error: %s", e.what());
        return AppConfig{};
    }

    RLOG_INFO("config", "Loaded: grid=%dx%d, scan=%d-%d, max_errors=%d",
              config.grid.rows, config.grid.cols,
              config.bridge.scan_start, config.bridge.scan_end,
              config.bot.max_errors);
    return config;
}

nlohmann::json botConfigToJson(const BotConfig& c) {
    return {
        {"auto_start", c.auto_start},
        {"auto_merge", c.auto_merge},
        {"auto_upgrade", c.auto_upgrade},
        {"auto_queue", c.auto_queue},
        {"action_delay", c.action_delay},
        {"cycle_interval", c.cycle_interval},
        {"error_backoff", c.error_backoff},
        {"max_errors", c.max_errors},
        {"restart_on_error", c.restart_on_error},
        {"preferred_device", c.preferred_device},
        {"min_unit_cost", c.min_unit_cost},
        {"merge_swipe_ms", c.merge_swipe_ms},
        {"play_button", {{"x", c.play_button.x}, {"y", c.play_button.y}}},
        {"stop_grace_seconds", c.stop_grace_seconds},
        {"max_games", c.max_games},
        {"vision_confidence_threshold", c.vision_confidence_threshold},
    };
}

// =============================================================================
// Patch validation
// =============================================================================

namespace {

Error invalid(const std::string& key, const char* why) {
    return Error("config key '" + key + "' " + why, ErrorCode::InvalidConfig);
}

Result<bool> readBool(const std::string& key, const nlohmann::json& v) {
    if (!v.is_boolean()) return invalid(key, "must be a boolean");
    return v.get<bool>();
}

Result<double> readSeconds(const std::string& key, const nlohmann::json& v, double min_exclusive) {
    if (!v.is_number()) return invalid(key, "must be a number");
    double d = v.get<double>();
    if (!(d > min_exclusive)) return invalid(key, "is out of range");
    return d;
}

Result<int> readInt(const std::string& key, const nlohmann::json& v, int min_inclusive) {
    if (!v.is_number_integer()) return invalid(key, "must be an integer");
    auto n = v.get<int64_t>();
    if (n < min_inclusive || n > 1000000000) return invalid(key, "is out of range");
    return static_cast<int>(n);
}

} // anonymous namespace

Result<BotConfig> applyBotConfigPatch(const BotConfig& current, const nlohmann::json& patch) {
    if (patch.is_null()) return current;
    if (!patch.is_object()) {
        return Err<BotConfig>("config update must be an object", ErrorCode::InvalidConfig);
    }

    // Every value is validated before anything is written to the copy
    BotConfig next = current;
    for (auto it = patch.begin(); it != patch.end(); ++it) {
        const std::string& key = it.key();
        const nlohmann::json& v = it.value();

        if (key == "auto_start") {
            next.auto_start = RAMPART_TRY(readBool(key, v));
        } else if (key == "auto_merge") {
            next.auto_merge = RAMPART_TRY(readBool(key, v));
        } else if (key == "auto_upgrade") {
            next.auto_upgrade = RAMPART_TRY(readBool(key, v));
        } else if (key == "auto_queue") {
            next.auto_queue = RAMPART_TRY(readBool(key, v));
        } else if (key == "restart_on_error") {
            next.restart_on_error = RAMPART_TRY(readBool(key, v));
        } else if (key == "action_delay") {
            // zero delay is allowed, negative is not
            next.action_delay = RAMPART_TRY(readSeconds(key, v, -1e-9));
        } else if (key == "cycle_interval") {
            next.cycle_interval = RAMPART_TRY(readSeconds(key, v, 0.0));
        } else if (key == "error_backoff") {
            next.error_backoff = RAMPART_TRY(readSeconds(key, v, -1e-9));
        } else if (key == "stop_grace_seconds") {
            next.stop_grace_seconds = RAMPART_TRY(readSeconds(key, v, 0.0));
        } else if (key == "max_errors") {
            next.max_errors = RAMPART_TRY(readInt(key, v, 1));
        } else if (key == "min_unit_cost") {
            next.min_unit_cost = RAMPART_TRY(readInt(key, v, 0));
        } else if (key == "merge_swipe_ms") {
            next.merge_swipe_ms = RAMPART_TRY(readInt(key, v, 1));
        } else if (key == "max_games") {
            next.max_games = RAMPART_TRY(readInt(key, v, 0));
        } else if (key == "vision_confidence_threshold") {
            if (!v.is_number()) return invalid(key, "must be a number");
            double t = v.get<double>();
            if (t < 0.0 || t > 1.0) return invalid(key, "must be within [0, 1]");
            next.vision_confidence_threshold = static_cast<float>(t);
        } else if (key == "preferred_device") {
            if (!v.is_string()) return invalid(key, "must be a string");
            next.preferred_device = v.get<std::string>();
        } else if (key == "play_button") {
            if (!v.is_object() || !v.contains("x") || !v.contains("y")) {
                return invalid(key, "must be an object with x and y");
            }
            next.play_button.x = RAMPART_TRY(readInt("play_button.x", v["x"], 0));
            next.play_button.y = RAMPART_TRY(readInt("play_button.y", v["y"], 0));
        } else {
            return invalid(key, "is not a known option");
        }
    }
    return next;
}

} // namespace config
} // namespace rampart
