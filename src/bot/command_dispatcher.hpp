#pragma once
// =============================================================================
// CommandDispatcher - JSON command surface
// =============================================================================
// Request:  {"id": 7, "command": "tap", "params": {"x": 540, "y": 300}}
// Response: {"id": 7, "success": true, "message": "...", "data": {...}}
//           failures add "code" (ErrorCode name) and never throw.
//
// Commands:
//   bot      start stop pause resume toggle_pause update_config get_status
//            get_stats reset_stats get_logs clear_logs
//   input    tap swipe long_press input_text key_event launch_app get_screenshot
//   devices  list_devices scan_ports auto_discover connect_device
//            disconnect_device restart_adb
//   vision   get_game_state analyze_grid analyze_mana recognize_unit
//            get_vision_stats reset_vision_stats add_training_sample
//            train_rank_model save_rank_model
//
// Vision commands analyse params.image (base64 PNG/JPEG) when given,
// otherwise a fresh screenshot of the target device.
// =============================================================================

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "action_executor.hpp"
#include "bot/bot_orchestrator.hpp"
#include "config.hpp"
#include "device_bridge.hpp"
#include "result.hpp"
#include "vision/perception_pipeline.hpp"

namespace rampart {

class CommandDispatcher {
public:
    static constexpr size_t DEFAULT_LOG_LIMIT = 100;

    CommandDispatcher(BotOrchestrator& bot, ActionExecutor& executor, DeviceBridge& bridge,
                      vision::PerceptionPipeline& perception, const config::BridgeConfig& bridge_cfg);

    nlohmann::json dispatch(const nlohmann::json& request);

    // One JSON line in, one JSON line out (no trailing newline)
    std::string dispatchLine(const std::string& line);

    static nlohmann::json success(const std::string& message,
                                  nlohmann::json data = nlohmann::json::object());
    static nlohmann::json failure(const Error& err);

    static std::string base64Encode(const std::vector<uint8_t>& data);
    static Result<std::vector<uint8_t>> base64Decode(const std::string& text);

private:
    nlohmann::json route(const std::string& command, const nlohmann::json& params);

    nlohmann::json handleStart(const nlohmann::json& params);
    nlohmann::json handleUpdateConfig(const nlohmann::json& params);
    nlohmann::json handleTap(const nlohmann::json& params);
    nlohmann::json handleSwipe(const nlohmann::json& params);
    nlohmann::json handleScreenshot(const nlohmann::json& params);
    nlohmann::json handleStats();
    nlohmann::json handleLogs(const nlohmann::json& params);
    nlohmann::json handleListDevices();
    nlohmann::json handleScanPorts(const nlohmann::json& params);
    nlohmann::json handleConnect(const nlohmann::json& params);
    nlohmann::json handleDisconnect(const nlohmann::json& params);
    nlohmann::json handleAutoDiscover();
    nlohmann::json handleRestartAdb();
    nlohmann::json handleLongPress(const nlohmann::json& params);
    nlohmann::json handleInputText(const nlohmann::json& params);
    nlohmann::json handleKeyEvent(const nlohmann::json& params);
    nlohmann::json handleLaunchApp(const nlohmann::json& params);
    nlohmann::json handleResetStats();
    nlohmann::json handleClearLogs();
    nlohmann::json handleVision(const std::string& command, const nlohmann::json& params);
    nlohmann::json handleAddTrainingSample(const nlohmann::json& params);
    nlohmann::json handleTrainRankModel(const nlohmann::json& params);
    nlohmann::json handleSaveRankModel(const nlohmann::json& params);

    // params.device_id, else the bot's session device
    Result<std::string> targetDevice(const nlohmann::json& params) const;
    // Decoded params.image, else a screenshot of targetDevice(params)
    Result<std::vector<uint8_t>> frame(const nlohmann::json& params);

    BotOrchestrator& bot_;
    ActionExecutor& executor_;
    DeviceBridge& bridge_;
    vision::PerceptionPipeline& perception_;
    config::BridgeConfig bridge_cfg_;
};

} // namespace rampart
