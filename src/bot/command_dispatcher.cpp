#include "bot/command_dispatcher.hpp"
#include "rampart_log.hpp"
#include "vision/image.hpp"

using json = nlohmann::json;

static constexpr const char* TAG = "command";

namespace rampart {

namespace {

Result<int> intParam(const json& params, const char* key) {
    if (!params.contains(key)) {
        return Err<int>(std::string("missing parameter: ") + key, ErrorCode::InvalidArgument);
    }
    const auto& v = params[key];
    if (!v.is_number_integer()) {
        return Err<int>(std::string(key) + " must be an integer", ErrorCode::InvalidArgument);
    }
    return v.get<int>();
}

int intParamOr(const json& params, const char* key, int def) {
    if (params.contains(key) && params[key].is_number_integer()) return params[key].get<int>();
    return def;
}

std::string stringParam(const json& params, const char* key) {
    if (params.contains(key) && params[key].is_string()) return params[key].get<std::string>();
    return "";
}

json fromResult(const Result<void>& r, const std::string& ok_message, json data = json::object()) {
    if (r.is_err()) return CommandDispatcher::failure(r.error());
    return CommandDispatcher::success(ok_message, std::move(data));
}

} // namespace

CommandDispatcher::CommandDispatcher(BotOrchestrator& bot, ActionExecutor& executor,
                                     DeviceBridge& bridge, vision::PerceptionPipeline& perception,
                                     const config::BridgeConfig& bridge_cfg)
    : bot_(bot), executor_(executor), bridge_(bridge), perception_(perception),
      bridge_cfg_(bridge_cfg) {}

json CommandDispatcher::success(const std::string& message, json data) {
    return {{"success", true}, {"message", message}, {"data", std::move(data)}};
}

json CommandDispatcher::failure(const Error& err) {
    return {{"success", false}, {"message", err.message},
            {"code", errorCodeName(err.code)}, {"data", nullptr}};
}

std::string CommandDispatcher::base64Encode(const std::vector<uint8_t>& data) {
    static const char b64[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    const size_t len = data.size();
    std::string out;
    out.reserve((len + 2) / 3 * 4);
    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < len) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < len) n |= static_cast<uint32_t>(data[i + 2]);
        out.push_back(b64[(n >> 18) & 0x3F]);
        out.push_back(b64[(n >> 12) & 0x3F]);
        out.push_back((i + 1 < len) ? b64[(n >> 6) & 0x3F] : '=');
        out.push_back((i + 2 < len) ? b64[n & 0x3F] : '=');
    }
    return out;
}

Result<std::vector<uint8_t>> CommandDispatcher::base64Decode(const std::string& text) {
    auto value = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    };

    // Accept a data URI prefix and embedded whitespace
    size_t start = 0;
    if (text.compare(0, 5, "data:") == 0) {
        size_t comma = text.find(',');
        if (comma == std::string::npos) {
            return Err<std::vector<uint8_t>>("malformed data URI", ErrorCode::InvalidArgument);
        }
        start = comma + 1;
    }

    std::vector<uint8_t> out;
    out.reserve((text.size() - start) / 4 * 3);
    uint32_t acc = 0;
    int bits = 0;
    bool padding = false;
    for (size_t i = start; i < text.size(); ++i) {
        char c = text[i];
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        if (c == '=') {
            padding = true;
            continue;
        }
        int v = value(c);
        if (v < 0 || padding) {
            return Err<std::vector<uint8_t>>("invalid base64 data", ErrorCode::InvalidArgument);
        }
        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((acc >> bits) & 0xFF));
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

std::string CommandDispatcher::dispatchLine(const std::string& line) {
    json request;
    try {
        request = json::parse(line);
    } catch (const json::parse_error& e) {
        return failure(Error(std::string("JSON parse error: ") + e.what(),
                             ErrorCode::InvalidArgument)).dump();
    }
    return dispatch(request).dump();
}

json CommandDispatcher::dispatch(const json& request) {
    if (!request.is_object()) {
        return failure(Error("request must be a JSON object", ErrorCode::InvalidArgument));
    }

    std::string command = stringParam(request, "command");
    json params = request.contains("params") ? request["params"] : json::object();
    if (params.is_null()) params = json::object();

    json response;
    if (command.empty()) {
        response = failure(Error("missing command", ErrorCode::InvalidArgument));
    } else if (!params.is_object()) {
        response = failure(Error("params must be an object", ErrorCode::InvalidArgument));
    } else {
        RLOG_DEBUG(TAG, "command=%s params=%s", command.c_str(), params.dump().c_str());
        try {
            response = route(command, params);
        } catch (const BridgeError& e) {
            RLOG_ERROR(TAG, "%s: %s", command.c_str(), e.what());
            response = failure(Error(e.what(), e.code()));
        } catch (const json::exception& e) {
            response = failure(Error(std::string("bad parameter: ") + e.what(),
                                     ErrorCode::InvalidArgument));
        } catch (const std::exception& e) {
            RLOG_ERROR(TAG, "%s: internal error: %s", command.c_str(), e.what());
            response = failure(Error(std::string("internal error: ") + e.what()));
        }
    }

    if (request.contains("id")) response["id"] = request["id"];
    return response;
}

json CommandDispatcher::route(const std::string& command, const json& params) {
    if (command == "start") return handleStart(params);
    if (command == "stop") {
        auto r = bot_.stop();
        return fromResult(r, "Bot stopped", bot_.status().toJson());
    }
    if (command == "pause") return fromResult(bot_.pause(), "Bot paused");
    if (command == "resume") return fromResult(bot_.resume(), "Bot resumed");
    if (command == "toggle_pause") {
        auto r = bot_.togglePause();
        if (r.is_err()) return failure(r.error());
        return success(r.value() == BotState::Paused ? "Bot paused" : "Bot resumed",
                       {{"state", botStateName(r.value())}});
    }
    if (command == "update_config") return handleUpdateConfig(params);
    if (command == "tap") return handleTap(params);
    if (command == "swipe") return handleSwipe(params);
    if (command == "get_screenshot") return handleScreenshot(params);
    if (command == "get_status") return success("ok", bot_.status().toJson());
    if (command == "get_stats") return handleStats();
    if (command == "get_logs") return handleLogs(params);
    if (command == "list_devices") return handleListDevices();
    if (command == "scan_ports") return handleScanPorts(params);
    if (command == "connect_device") return handleConnect(params);
    if (command == "disconnect_device") return handleDisconnect(params);
    if (command == "long_press") return handleLongPress(params);
    if (command == "input_text") return handleInputText(params);
    if (command == "key_event") return handleKeyEvent(params);
    if (command == "launch_app") return handleLaunchApp(params);
    if (command == "reset_stats") return handleResetStats();
    if (command == "clear_logs") return handleClearLogs();
    if (command == "auto_discover") return handleAutoDiscover();
    if (command == "restart_adb") return handleRestartAdb();
    if (command == "get_game_state" || command == "analyze_grid" ||
        command == "analyze_mana" || command == "recognize_unit") {
        return handleVision(command, params);
    }
    if (command == "add_training_sample") return handleAddTrainingSample(params);
    if (command == "train_rank_model") return handleTrainRankModel(params);
    if (command == "save_rank_model") return handleSaveRankModel(params);
    if (command == "reset_vision_stats") {
        perception_.resetStats();
        return success("Vision statistics reset", perception_.stats().toJson());
    }
    if (command == "get_vision_stats") {
        json data = perception_.stats().toJson();
        data["training"] = perception_.trainingStats();
        return success("ok", std::move(data));
    }

    return failure(Error("unknown command: " + command, ErrorCode::InvalidArgument));
}

Result<std::string> CommandDispatcher::targetDevice(const json& params) const {
    std::string id = stringParam(params, "device_id");
    if (id.empty()) id = bot_.deviceId();
    if (id.empty()) return Err<std::string>("no device selected", ErrorCode::DeviceUnreachable);
    return id;
}

Result<std::vector<uint8_t>> CommandDispatcher::frame(const json& params) {
    std::string image = stringParam(params, "image");
    if (!image.empty()) return base64Decode(image);

    auto device = targetDevice(params);
    if (device.is_err()) return device.error();
    auto png = executor_.screenshot(device.value());
    if (png.empty()) {
        return Err<std::vector<uint8_t>>("screenshot failed on " + device.value(),
                                         ErrorCode::CommandFailed);
    }
    return png;
}

// ---------------------------------------------------------------------------
// Handlers
// ---------------------------------------------------------------------------

json CommandDispatcher::handleStart(const json& params) {
    auto r = bot_.start(stringParam(params, "device_id"));
    return fromResult(r, "Bot started", bot_.status().toJson());
}

json CommandDispatcher::handleUpdateConfig(const json& params) {
    // Either {"config": {...}} or the partial config itself
    const json& patch = params.contains("config") ? params["config"] : params;
    auto r = bot_.updateConfig(patch);
    if (r.is_err()) return failure(r.error());
    return success("Configuration updated", config::botConfigToJson(r.value()));
}

json CommandDispatcher::handleTap(const json& params) {
    auto device = targetDevice(params);
    if (device.is_err()) return failure(device.error());
    auto x = intParam(params, "x");
    if (x.is_err()) return failure(x.error());
    auto y = intParam(params, "y");
    if (y.is_err()) return failure(y.error());

    if (!executor_.tap(device.value(), x.value(), y.value())) {
        return failure(Error("tap failed on " + device.value(), ErrorCode::CommandFailed));
    }
    return success("Tap sent", {{"x", x.value()}, {"y", y.value()}, {"device_id", device.value()}});
}

json CommandDispatcher::handleSwipe(const json& params) {
    auto device = targetDevice(params);
    if (device.is_err()) return failure(device.error());

    int coords[4];
    const char* keys[4] = {"x1", "y1", "x2", "y2"};
    for (int i = 0; i < 4; ++i) {
        auto v = intParam(params, keys[i]);
        if (v.is_err()) return failure(v.error());
        coords[i] = v.value();
    }
    int duration = intParamOr(params, "duration", 300);
    if (duration < 0) return failure(Error("duration must be >= 0", ErrorCode::InvalidArgument));

    if (!executor_.swipe(device.value(), coords[0], coords[1], coords[2], coords[3], duration)) {
        return failure(Error("swipe failed on " + device.value(), ErrorCode::CommandFailed));
    }
    return success("Swipe sent", {{"from", {coords[0], coords[1]}},
                                  {"to", {coords[2], coords[3]}},
                                  {"duration", duration},
                                  {"device_id", device.value()}});
}

json CommandDispatcher::handleScreenshot(const json& params) {
    auto device = targetDevice(params);
    if (device.is_err()) return failure(device.error());

    auto png = executor_.screenshot(device.value());
    if (png.empty()) {
        return failure(Error("screenshot failed on " + device.value(), ErrorCode::CommandFailed));
    }
    return success("ok", {{"format", "png"},
                          {"size", png.size()},
                          {"device_id", device.value()},
                          {"image", base64Encode(png)}});
}

json CommandDispatcher::handleStats() {
    return success("ok", {{"bot", bot_.stats().toJson()},
                          {"actions", {{"sent", executor_.actionsSent()},
                                       {"failed", executor_.actionsFailed()}}},
                          {"vision", perception_.stats().toJson()}});
}

json CommandDispatcher::handleLogs(const json& params) {
    int limit = intParamOr(params, "limit", static_cast<int>(DEFAULT_LOG_LIMIT));
    if (limit < 0) return failure(Error("limit must be >= 0", ErrorCode::InvalidArgument));

    json events = json::array();
    for (const auto& e : bot_.eventHistory(static_cast<size_t>(limit))) {
        events.push_back(e.toJson());
    }
    return success("ok", {{"events", events}, {"count", events.size()}});
}

json CommandDispatcher::handleListDevices() {
    json list = json::array();
    for (const auto& d : bridge_.listDevices()) list.push_back(d.toJson());
    return success("ok", {{"devices", list}, {"count", list.size()},
                          {"bridge_available", bridge_.isAvailable()}});
}

json CommandDispatcher::handleScanPorts(const json& params) {
    int start = intParamOr(params, "start", bridge_cfg_.scan_start);
    int end = intParamOr(params, "end", bridge_cfg_.scan_end);
    int workers = intParamOr(params, "concurrency", bridge_cfg_.scan_concurrency);
    if (start <= 0 || end < start || end > 65535 || workers <= 0) {
        return failure(Error("invalid port range", ErrorCode::InvalidArgument));
    }

    auto ports = bridge_.scanPortRange(start, end, workers);
    json devices = json::array();
    for (const auto& d : bridge_.listDevices()) devices.push_back(d.toJson());
    return success("Found " + std::to_string(ports.size()) + " port(s)",
                   {{"ports", ports}, {"devices", devices}});
}

json CommandDispatcher::handleConnect(const json& params) {
    std::string id = stringParam(params, "device_id");
    if (id.empty()) id = stringParam(params, "address");
    if (id.empty()) return failure(Error("missing parameter: device_id", ErrorCode::InvalidArgument));

    auto r = bridge_.connect(id);
    if (r.is_err()) return failure(r.error());
    auto rec = bridge_.device(id);
    return success("Connected " + id, rec ? rec->toJson() : json{{"id", id}});
}

json CommandDispatcher::handleDisconnect(const json& params) {
    std::string id = stringParam(params, "device_id");
    if (id.empty()) return failure(Error("missing parameter: device_id", ErrorCode::InvalidArgument));
    return fromResult(bridge_.disconnect(id), "Disconnected " + id, {{"id", id}});
}

json CommandDispatcher::handleAutoDiscover() {
    json list = json::array();
    for (const auto& d : bridge_.autoDiscover()) list.push_back(d.toJson());
    return success("Discovered " + std::to_string(list.size()) + " device(s)",
                   {{"devices", list}, {"count", list.size()}});
}

json CommandDispatcher::handleRestartAdb() {
    RLOG_INFO(TAG, "restarting adb server");
    auto r = bridge_.restartServer();
    if (r.is_err()) return failure(r.error());
    json list = json::array();
    for (const auto& d : bridge_.listDevices()) list.push_back(d.toJson());
    return success("ADB server restarted", {{"devices", list}, {"count", list.size()}});
}

// ---------------------------------------------------------------------------
// Input
// ---------------------------------------------------------------------------

json CommandDispatcher::handleLongPress(const json& params) {
    auto device = targetDevice(params);
    if (device.is_err()) return failure(device.error());
    auto x = intParam(params, "x");
    if (x.is_err()) return failure(x.error());
    auto y = intParam(params, "y");
    if (y.is_err()) return failure(y.error());
    int duration = intParamOr(params, "duration", 1000);
    if (duration < 0) return failure(Error("duration must be >= 0", ErrorCode::InvalidArgument));

    if (!executor_.longPress(device.value(), x.value(), y.value(), duration)) {
        return failure(Error("long press failed on " + device.value(), ErrorCode::CommandFailed));
    }
    return success("Long press sent", {{"x", x.value()}, {"y", y.value()},
                                       {"duration", duration}, {"device_id", device.value()}});
}

json CommandDispatcher::handleInputText(const json& params) {
    auto device = targetDevice(params);
    if (device.is_err()) return failure(device.error());
    if (!params.contains("text") || !params["text"].is_string()) {
        return failure(Error("missing parameter: text", ErrorCode::InvalidArgument));
    }
    std::string text = params["text"].get<std::string>();

    if (!executor_.sendText(device.value(), text)) {
        return failure(Error("text input failed on " + device.value(), ErrorCode::CommandFailed));
    }
    return success("Text sent", {{"length", text.size()}, {"device_id", device.value()}});
}

json CommandDispatcher::handleKeyEvent(const json& params) {
    auto device = targetDevice(params);
    if (device.is_err()) return failure(device.error());
    auto code = intParam(params, "keycode");
    if (code.is_err()) return failure(code.error());
    if (code.value() < 0) return failure(Error("keycode must be >= 0", ErrorCode::InvalidArgument));

    if (!executor_.sendKeyEvent(device.value(), code.value())) {
        return failure(Error("key event failed on " + device.value(), ErrorCode::CommandFailed));
    }
    return success("Key event sent", {{"keycode", code.value()}, {"device_id", device.value()}});
}

json CommandDispatcher::handleLaunchApp(const json& params) {
    auto device = targetDevice(params);
    if (device.is_err()) return failure(device.error());
    std::string package = stringParam(params, "package");
    if (package.empty()) package = bridge_cfg_.game_package;

    if (!executor_.launchApp(device.value(), package)) {
        return failure(Error("launch of " + package + " failed on " + device.value(),
                             ErrorCode::CommandFailed));
    }
    return success("Launched " + package, {{"package", package}, {"device_id", device.value()}});
}

// ---------------------------------------------------------------------------
// Bookkeeping
// ---------------------------------------------------------------------------

json CommandDispatcher::handleResetStats() {
    bot_.resetStats();
    perception_.resetStats();
    return success("Statistics reset", {{"bot", bot_.stats().toJson()},
                                        {"vision", perception_.stats().toJson()}});
}

json CommandDispatcher::handleClearLogs() {
    size_t cleared = bot_.clearEventHistory();
    RLOG_INFO(TAG, "cleared %zu event(s)", cleared);
    return success("Logs cleared", {{"cleared", cleared}});
}

// ---------------------------------------------------------------------------
// Vision
// ---------------------------------------------------------------------------

json CommandDispatcher::handleVision(const std::string& command, const json& params) {
    auto bytes = frame(params);
    if (bytes.is_err()) return failure(bytes.error());

    if (command == "analyze_grid") {
        auto grid = perception_.analyzeGrid(bytes.value());
        if (!grid.valid) return failure(Error("frame could not be decoded", ErrorCode::InvalidArgument));
        return success("ok", grid.toJson());
    }
    if (command == "analyze_mana" || command == "recognize_unit") {
        // these readings carry no validity flag; reject undecodable input up front
        auto decoded = vision::decodeImage(bytes.value().data(), bytes.value().size());
        if (decoded.is_err()) {
            return failure(Error("frame could not be decoded: " + decoded.error().message,
                                 ErrorCode::InvalidArgument));
        }
        if (command == "analyze_mana") return success("ok", perception_.analyzeMana(bytes.value()).toJson());
        return success("ok", perception_.recognizeUnit(bytes.value()).toJson());
    }

    auto state = perception_.analyze(bytes.value());
    if (!state.valid) return failure(Error("frame could not be decoded", ErrorCode::InvalidArgument));
    json data = state.toJson();
    data["bot_state"] = botStateName(bot_.state());
    return success(state.inGame() ? "in game" : "not in game", std::move(data));
}

json CommandDispatcher::handleAddTrainingSample(const json& params) {
    auto rank = intParam(params, "rank");
    if (rank.is_err()) return failure(rank.error());
    if (stringParam(params, "image").empty()) {
        return failure(Error("missing parameter: image", ErrorCode::InvalidArgument));
    }
    auto bytes = base64Decode(stringParam(params, "image"));
    if (bytes.is_err()) return failure(bytes.error());

    auto saved = perception_.addTrainingSample(bytes.value(), rank.value());
    if (saved.is_err()) return failure(saved.error());
    return success("Training sample saved", {{"path", saved.value()},
                                             {"rank", rank.value()},
                                             {"training", perception_.trainingStats()}});
}

json CommandDispatcher::handleTrainRankModel(const json& params) {
    std::string dir = stringParam(params, "dir");
    if (dir.empty()) dir = perception_.trainingDir();

    vision::RankTrainingOptions opts;
    opts.max_iter = intParamOr(params, "max_iter", opts.max_iter);
    if (opts.max_iter <= 0) return failure(Error("max_iter must be > 0", ErrorCode::InvalidArgument));

    auto trained = perception_.trainRankModel(dir, opts);
    if (trained.is_err()) return failure(trained.error());
    return success("Rank model trained on " + std::to_string(trained.value()) + " sample(s)",
                   {{"samples", trained.value()}, {"dir", dir},
                    {"training", perception_.trainingStats()}});
}

json CommandDispatcher::handleSaveRankModel(const json& params) {
    std::string path = stringParam(params, "path");
    if (path.empty()) path = perception_.rankModelPath();
    return fromResult(perception_.saveRankModel(path), "Rank model saved", {{"path", path}});
}

} // namespace rampart
