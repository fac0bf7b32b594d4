#include "bot/bot_orchestrator.hpp"
#include "rampart_log.hpp"

#include <algorithm>
#include <chrono>

static constexpr const char* TAG = "bot";

namespace rampart {

const char* botStateName(BotState s) {
    switch (s) {
        case BotState::Stopped:  return "stopped";
        case BotState::Starting: return "starting";
        case BotState::Running:  return "running";
        case BotState::Paused:   return "paused";
        case BotState::Stopping: return "stopping";
        case BotState::Error:    return "error";
    }
    return "unknown";
}

nlohmann::json BotStats::toJson() const {
    return {
        {"games_played", games_played},
        {"actions_performed", actions_performed},
        {"errors", errors},
        {"units_placed", units_placed},
        {"merges_performed", merges_performed},
        {"cycles_completed", cycles_completed},
        {"failed_cycles", failed_cycles},
        {"restarts", restarts},
    };
}

nlohmann::json BotStatus::toJson() const {
    return {
        {"state", botStateName(state)},
        {"started_at", started_at_ms},
        {"uptime", uptime_seconds},
        {"error_count", error_count},
        {"last_action", last_action},
        {"last_error", last_error},
        {"device_id", device_id},
        {"stats", stats.toJson()},
        {"config", config::botConfigToJson(bot_config)},
    };
}

namespace {

Error rejected(const char* op, BotState current) {
    return Error(std::string("cannot ") + op + " while " + botStateName(current),
                 ErrorCode::StateTransitionRejected);
}

} // namespace

BotOrchestrator::BotOrchestrator(DeviceBridge& bridge, ActionExecutor& executor,
                                 vision::PerceptionPipeline& perception, EventBus& bus,
                                 config::BotConfig cfg, std::optional<uint32_t> seed)
    : bridge_(bridge), executor_(executor), perception_(perception), bus_(bus),
      cfg_(std::move(cfg)), rng_(seed ? *seed : std::random_device{}()) {
    history_sub_ = bus_.subscribe([this](const BotEvent& e) { onEvent(e); });
}

BotOrchestrator::~BotOrchestrator() {
    joinLoop();
}

// =============================================================================
// Lifecycle
// =============================================================================

Result<void> BotOrchestrator::start(const std::string& device_id) {
    std::lock_guard<std::mutex> control(control_mutex_);
    BotState prev;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != BotState::Stopped && state_ != BotState::Error) {
            return rejected("start", state_);
        }
        prev = state_;
        state_ = BotState::Starting;
        stop_requested_ = true;
    }
    gate_cv_.notify_all();
    publishTransition(prev, BotState::Starting);

    // An Error session may still own a loop that is backing off
    joinLoop();

    auto dev = resolveDevice(device_id);
    if (dev.is_err()) {
        const auto& err = dev.error();
        RLOG_ERROR(TAG, "start failed: %s", err.message.c_str());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_error_ = err.message;
        }
        setState(BotState::Error, err.message);
        bus_.publish(EventType::ErrorOccurred, {{"error", err.message},
                                                {"code", errorCodeName(err.code)}});
        return err;
    }

    const std::string& id = dev.value();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        device_id_ = id;
        stats_ = BotStats{};
        error_count_ = 0;
        last_error_.clear();
        last_action_.clear();
        started_at_ms_ = wallClockMs();
        paused_ = false;
        stop_requested_ = false;
        self_stop_ = false;
        loop_done_ = false;
        was_in_game_ = false;
    }
    executor_.invalidateCache(id);

    setState(BotState::Running);
    loop_thread_ = std::thread(&BotOrchestrator::loop, this);

    RLOG_INFO(TAG, "Bot started on %s", id.c_str());
    bus_.publish(EventType::BotStarted, {{"device_id", id}});
    return Ok();
}

Result<void> BotOrchestrator::stop() {
    std::lock_guard<std::mutex> control(control_mutex_);
    BotState prev;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == BotState::Stopped || state_ == BotState::Stopping) {
            return rejected("stop", state_);
        }
        prev = state_;
        state_ = BotState::Stopping;
        stop_requested_ = true;
    }
    gate_cv_.notify_all();
    publishTransition(prev, BotState::Stopping);

    joinLoop();

    std::string id;
    BotStats snapshot;
    bool ended_by_loop;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = device_id_;
        snapshot = stats_;
        ended_by_loop = self_stop_;
    }
    if (ended_by_loop) {
        // The loop already moved to Stopped and announced it
        RLOG_INFO(TAG, "session on %s had already ended (max_games)", id.c_str());
        return Ok();
    }
    setState(BotState::Stopped);
    RLOG_INFO(TAG, "Bot stopped (%llu cycles, %llu actions)",
              (unsigned long long)snapshot.cycles_completed,
              (unsigned long long)snapshot.actions_performed);
    bus_.publish(EventType::BotStopped, {{"device_id", id}, {"stats", snapshot.toJson()}});
    return Ok();
}

Result<void> BotOrchestrator::pause() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != BotState::Running) return rejected("pause", state_);
        state_ = BotState::Paused;
        paused_ = true;
    }
    publishTransition(BotState::Running, BotState::Paused);
    bus_.publish(EventType::BotPaused, {{"device_id", deviceId()}});
    return Ok();
}

Result<void> BotOrchestrator::resume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != BotState::Paused) return rejected("resume", state_);
        state_ = BotState::Running;
        paused_ = false;
    }
    gate_cv_.notify_all();
    publishTransition(BotState::Paused, BotState::Running);
    bus_.publish(EventType::BotResumed, {{"device_id", deviceId()}});
    return Ok();
}

Result<BotState> BotOrchestrator::togglePause() {
    switch (state()) {
        case BotState::Running: {
            auto r = pause();
            if (r.is_err()) return r.error();
            return BotState::Paused;
        }
        case BotState::Paused: {
            auto r = resume();
            if (r.is_err()) return r.error();
            return BotState::Running;
        }
        default:
            return rejected("toggle pause", state());
    }
}

Result<config::BotConfig> BotOrchestrator::updateConfig(const nlohmann::json& patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto merged = config::applyBotConfigPatch(cfg_, patch);
    if (merged.is_err()) {
        RLOG_WARN(TAG, "config update rejected: %s", merged.error().message.c_str());
        return merged;
    }
    cfg_ = merged.value();
    perception_.setConfidenceThreshold(cfg_.vision_confidence_threshold);
    RLOG_INFO(TAG, "config updated: %s", patch.dump().c_str());
    return merged;
}

// Waits stop_grace_seconds for the loop, then kills bridge commands and joins
void BotOrchestrator::joinLoop() {
    if (!loop_thread_.joinable()) return;

    bool finished;
    double grace;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        stop_requested_ = true;
        grace = cfg_.stop_grace_seconds;
        gate_cv_.notify_all();
        finished = gate_cv_.wait_for(lock, std::chrono::duration<double>(grace),
                                     [this] { return loop_done_; });
    }
    if (!finished) {
        RLOG_WARN(TAG, "loop still busy after %.1fs, cancelling bridge commands", grace);
        bridge_.cancelPending();
    }
    loop_thread_.join();
}

Result<std::string> BotOrchestrator::resolveDevice(const std::string& requested) {
    std::string preferred;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        preferred = cfg_.preferred_device;
    }

    try {
        if (!requested.empty()) {
            auto r = bridge_.connect(requested);
            if (r.is_err()) return r.error();
            return requested;
        }

        auto devices = bridge_.listDevices();
        auto connected = [&](const std::string& id) {
            return std::any_of(devices.begin(), devices.end(), [&](const DeviceRecord& d) {
                return d.id == id && d.status == DeviceStatus::Connected;
            });
        };

        if (!preferred.empty()) {
            if (connected(preferred)) return preferred;
            if (bridge_.connect(preferred).is_ok()) return preferred;
            RLOG_WARN(TAG, "preferred device %s unavailable, trying others", preferred.c_str());
        }
        for (const auto& d : devices) {
            if (d.status == DeviceStatus::Connected) return d.id;
        }
    } catch (const BridgeError& e) {
        return Error(e.what(), e.code());
    }
    return Error("no connected device", ErrorCode::DeviceUnreachable);
}

// =============================================================================
// Main loop
// =============================================================================

bool BotOrchestrator::sleepFor(double seconds) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (seconds > 0) {
        gate_cv_.wait_for(lock, std::chrono::duration<double>(seconds),
                          [this] { return stop_requested_; });
    }
    return !stop_requested_;
}

bool BotOrchestrator::waitWhilePaused() {
    std::unique_lock<std::mutex> lock(mutex_);
    gate_cv_.wait(lock, [this] { return !paused_ || stop_requested_; });
    return !stop_requested_;
}

void BotOrchestrator::loop() {
    RLOG_INFO(TAG, "Main loop started");
    while (waitWhilePaused()) {
        double delay;
        try {
            CycleOutcome outcome = runCycle();
            if (outcome == CycleOutcome::Stopped) break;
            std::lock_guard<std::mutex> lock(mutex_);
            delay = cfg_.cycle_interval;
        } catch (const std::exception& e) {
            if (!handleLoopException(e.what())) break;
            std::lock_guard<std::mutex> lock(mutex_);
            delay = cfg_.error_backoff;
        }
        if (!sleepFor(delay)) break;
    }

    bool self_stop;
    std::string id;
    BotStats snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        self_stop = self_stop_;
        id = device_id_;
        snapshot = stats_;
        loop_done_ = true;
    }
    gate_cv_.notify_all();

    if (self_stop) {
        setState(BotState::Stopped, "game limit reached");
        bus_.publish(EventType::BotStopped, {{"device_id", id}, {"reason", "max_games"},
                                             {"stats", snapshot.toJson()}});
    }
    RLOG_INFO(TAG, "Main loop exited");
}

bool BotOrchestrator::handleLoopException(const std::string& what) {
    int count;
    int max_errors;
    bool restart;
    BotState prev;
    {
        // Error and the pause reset land together: pause() only accepts
        // Running, so no pause can slip in and leave the gate closed
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_requested_) return false;
        error_count_++;
        stats_.errors++;
        last_error_ = what;
        paused_ = false;
        prev = state_;
        state_ = BotState::Error;
        count = error_count_;
        max_errors = cfg_.max_errors;
        restart = cfg_.restart_on_error;
    }
    gate_cv_.notify_all();
    RLOG_ERROR(TAG, "cycle failed (%d/%d): %s", count, max_errors, what.c_str());
    if (prev != BotState::Error) publishTransition(prev, BotState::Error, what);
    bus_.publish(EventType::ErrorOccurred, {{"error", what}, {"error_count", count}});

    if (count < max_errors) return true;
    if (restart) return restartInLoop();

    RLOG_ERROR(TAG, "giving up after %d consecutive errors", count);
    return false;
}

// Stop-then-start performed by the loop thread itself
bool BotOrchestrator::restartInLoop() {
    std::string id;
    double backoff;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = device_id_;
        backoff = cfg_.error_backoff;
    }
    RLOG_WARN(TAG, "restarting session on %s after repeated errors", id.c_str());
    bus_.publish(EventType::BotStopped, {{"device_id", id}, {"reason", "restart"}});

    if (!sleepFor(backoff)) return false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != BotState::Error) return !stop_requested_;
        state_ = BotState::Starting;
    }
    publishTransition(BotState::Error, BotState::Starting, "restart");

    auto dev = resolveDevice(id);
    if (dev.is_err()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_error_ = dev.error().message;
        }
        RLOG_ERROR(TAG, "restart failed: %s", dev.error().message.c_str());
        if (!loopTransition(BotState::Error, dev.error().message)) return false;
        bus_.publish(EventType::ErrorOccurred, {{"error", dev.error().message},
                                                {"code", errorCodeName(dev.error().code)}});
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_requested_) return false;
        device_id_ = dev.value();
        error_count_ = 0;
        was_in_game_ = false;
        stats_.restarts++;
        state_ = BotState::Running;
    }
    publishTransition(BotState::Starting, BotState::Running, "restart");
    executor_.invalidateCache(dev.value());
    bus_.publish(EventType::BotStarted, {{"device_id", dev.value()}, {"reason", "restart"}});
    return true;
}

CycleOutcome BotOrchestrator::runCycle() {
    std::string device;
    config::BotConfig cfg;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_requested_) return CycleOutcome::Stopped;
        device = device_id_;
        cfg = cfg_;
    }
    if (device.empty()) {
        RLOG_WARN(TAG, "cycle skipped: no session device");
        return CycleOutcome::NoFrame;
    }

    auto png = executor_.screenshot(device);
    vision::PerceptionResult frame;
    if (!png.empty()) frame = perception_.analyze(png);
    // Next cycle needs a fresh capture: the screen changes once we act on it,
    // and a bad frame must not be served again from the cache
    executor_.invalidateCache(device);
    if (!frame.valid) {
        RLOG_WARN(TAG, "no usable frame from %s", device.c_str());
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.failed_cycles++;
        return CycleOutcome::NoFrame;
    }

    const bool in_game = frame.inGame();
    bool game_finished = false;
    uint64_t games = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (was_in_game_ && !in_game) {
            stats_.games_played++;
            game_finished = true;
        }
        was_in_game_ = in_game;
        games = stats_.games_played;
    }
    if (game_finished) {
        RLOG_INFO(TAG, "Game finished (%llu played)", (unsigned long long)games);
        if (cfg.max_games > 0 && games >= static_cast<uint64_t>(cfg.max_games)) {
            RLOG_INFO(TAG, "Reached max_games=%d, ending session", cfg.max_games);
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_ = true;
            self_stop_ = true;
            return CycleOutcome::Stopped;
        }
    }

    CycleOutcome outcome = CycleOutcome::Completed;
    if (!in_game) {
        outcome = CycleOutcome::OutOfGame;
        if (cfg.auto_queue &&
            executor_.tap(device, cfg.play_button.x, cfg.play_button.y)) {
            recordAction("queue_game", {{"x", cfg.play_button.x}, {"y", cfg.play_button.y}});
        }
    } else {
        const auto& cells = frame.grid.cells;

        if (cfg.auto_upgrade && frame.mana.current >= cfg.min_unit_cost) {
            std::vector<const vision::GridCell*> empty;
            for (const auto& c : cells) {
                if (!c.occupied) empty.push_back(&c);
            }
            if (!empty.empty()) {
                size_t pick;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    pick = std::uniform_int_distribution<size_t>(0, empty.size() - 1)(rng_);
                }
                const vision::GridCell& cell = *empty[pick];
                if (executor_.tap(device, cell.centerX(), cell.centerY())) {
                    {
                        std::lock_guard<std::mutex> lock(mutex_);
                        stats_.units_placed++;
                    }
                    recordAction("place_unit", {{"row", cell.row}, {"col", cell.col},
                                                {"x", cell.centerX()}, {"y", cell.centerY()},
                                                {"mana", frame.mana.current}});
                }
                if (!sleepFor(cfg.action_delay)) return CycleOutcome::Stopped;
            }
        }

        if (cfg.auto_merge && !frame.grid.mergeable.empty()) {
            const auto& pair = frame.grid.mergeable.front();
            const int cols = perception_.gridConfig().cols;
            const auto& from = cells[static_cast<size_t>(pair.from_row) * cols + pair.from_col];
            const auto& to = cells[static_cast<size_t>(pair.to_row) * cols + pair.to_col];
            if (executor_.swipe(device, from.centerX(), from.centerY(),
                                to.centerX(), to.centerY(), cfg.merge_swipe_ms)) {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    stats_.merges_performed++;
                }
                recordAction("merge", {{"unit_type", pair.label},
                                       {"from", {pair.from_row, pair.from_col}},
                                       {"to", {pair.to_row, pair.to_col}}});
            }
            if (!sleepFor(cfg.action_delay)) return CycleOutcome::Stopped;
        }
    }

    bool recovered = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.cycles_completed++;
        error_count_ = 0;
        if (state_ == BotState::Error && !stop_requested_) {
            state_ = BotState::Running;
            recovered = true;
        }
    }
    if (recovered) publishTransition(BotState::Error, BotState::Running, "cycle succeeded");
    return outcome;
}

// =============================================================================
// State / events
// =============================================================================

bool BotOrchestrator::loopTransition(BotState to, const std::string& reason) {
    BotState prev;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_requested_) return false;
        prev = state_;
        state_ = to;
    }
    if (prev != to) publishTransition(prev, to, reason);
    return true;
}

void BotOrchestrator::setState(BotState s, const std::string& reason) {
    BotState prev;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        prev = state_;
        if (prev == s) return;
        state_ = s;
    }
    publishTransition(prev, s, reason);
}

void BotOrchestrator::publishTransition(BotState from, BotState to, const std::string& reason) {
    RLOG_INFO(TAG, "%s -> %s%s%s", botStateName(from), botStateName(to),
              reason.empty() ? "" : ": ", reason.c_str());
    nlohmann::json data = {{"old_state", botStateName(from)}, {"new_state", botStateName(to)}};
    if (!reason.empty()) data["reason"] = reason;
    bus_.publish(EventType::StatusChanged, std::move(data));
}

void BotOrchestrator::recordAction(const std::string& name, nlohmann::json details) {
    std::string device;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.actions_performed++;
        last_action_ = name;
        device = device_id_;
    }
    RLOG_DEBUG(TAG, "action %s %s", name.c_str(), details.dump().c_str());
    details["action"] = name;
    details["device_id"] = device;
    bus_.publish(EventType::ActionPerformed, std::move(details));
}

void BotOrchestrator::onEvent(const BotEvent& e) {
    std::lock_guard<std::mutex> lock(history_mutex_);
    history_.push_back(e);
    while (history_.size() > EVENT_HISTORY) history_.pop_front();
}

size_t BotOrchestrator::clearEventHistory() {
    std::lock_guard<std::mutex> lock(history_mutex_);
    size_t n = history_.size();
    history_.clear();
    return n;
}

void BotOrchestrator::resetStats() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = BotStats{};
    RLOG_INFO(TAG, "statistics reset");
}

std::vector<BotEvent> BotOrchestrator::eventHistory(size_t limit) const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    size_t n = (limit == 0) ? history_.size() : std::min(limit, history_.size());
    return std::vector<BotEvent>(history_.end() - static_cast<std::ptrdiff_t>(n), history_.end());
}

BotState BotOrchestrator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

BotStatus BotOrchestrator::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    BotStatus s;
    s.state = state_;
    s.started_at_ms = started_at_ms_;
    if (started_at_ms_ > 0 && state_ != BotState::Stopped) {
        s.uptime_seconds = (wallClockMs() - started_at_ms_) / 1000.0;
    }
    s.error_count = error_count_;
    s.last_action = last_action_;
    s.last_error = last_error_;
    s.device_id = device_id_;
    s.stats = stats_;
    s.bot_config = cfg_;
    return s;
}

BotStats BotOrchestrator::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

config::BotConfig BotOrchestrator::botConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_;
}

std::string BotOrchestrator::deviceId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return device_id_;
}

} // namespace rampart
