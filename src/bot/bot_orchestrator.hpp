#pragma once
// =============================================================================
// BotOrchestrator - lifecycle state machine and main game loop
// =============================================================================
//   Stopped -> Starting -> Running <-> Paused -> Stopping -> Stopped
//   Error is reachable from every non-terminal state.
//
// One loop thread per session. pause/resume/stop are gates checked at the top
// of each cycle and inside every sleep. stop() waits stop_grace_seconds for
// the loop, then kills in-flight bridge commands and joins.
//
// Every event on the bus (including device events published by the bridge)
// is also kept in a 1000-entry history served by eventHistory().
// =============================================================================

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "action_executor.hpp"
#include "config.hpp"
#include "device_bridge.hpp"
#include "event_bus.hpp"
#include "result.hpp"
#include "vision/perception_pipeline.hpp"

namespace rampart {

enum class BotState { Stopped, Starting, Running, Paused, Stopping, Error };

const char* botStateName(BotState s);

struct BotStats {
    uint64_t games_played = 0;
    uint64_t actions_performed = 0;
    uint64_t errors = 0;
    uint64_t units_placed = 0;
    uint64_t merges_performed = 0;
    uint64_t cycles_completed = 0;
    uint64_t failed_cycles = 0;      // no frame captured or frame undecodable
    uint64_t restarts = 0;

    nlohmann::json toJson() const;
};

struct BotStatus {
    BotState state = BotState::Stopped;
    int64_t started_at_ms = 0;       // 0 when never started
    double uptime_seconds = 0.0;
    int error_count = 0;             // consecutive loop exceptions
    std::string last_action;
    std::string last_error;
    std::string device_id;
    BotStats stats;
    config::BotConfig bot_config;

    nlohmann::json toJson() const;
};

// Result of one perception/decision cycle
enum class CycleOutcome { Completed, NoFrame, OutOfGame, Stopped };

class BotOrchestrator {
public:
    static constexpr size_t EVENT_HISTORY = 1000;

    BotOrchestrator(DeviceBridge& bridge, ActionExecutor& executor,
                    vision::PerceptionPipeline& perception, EventBus& bus,
                    config::BotConfig cfg, std::optional<uint32_t> seed = std::nullopt);
    ~BotOrchestrator();

    BotOrchestrator(const BotOrchestrator&) = delete;
    BotOrchestrator& operator=(const BotOrchestrator&) = delete;

    // --- lifecycle (StateTransitionRejected from incompatible states) ---
    // Empty device_id: preferred_device, then the first connected device
    Result<void> start(const std::string& device_id = "");
    Result<void> stop();
    Result<void> pause();
    Result<void> resume();
    Result<BotState> togglePause();

    // Validate and swap in a partial BotConfig update
    Result<config::BotConfig> updateConfig(const nlohmann::json& patch);

    // One capture -> perceive -> act pass against the session device.
    // Exceptions propagate; the loop counts them.
    CycleOutcome runCycle();

    BotState state() const;
    BotStatus status() const;
    BotStats stats() const;
    config::BotConfig botConfig() const;
    std::string deviceId() const;

    // Newest last; limit 0 means everything retained
    std::vector<BotEvent> eventHistory(size_t limit = 0) const;
    // Returns the number of events dropped
    size_t clearEventHistory();
    void resetStats();

private:
    void loop();
    // false when the loop should exit
    bool handleLoopException(const std::string& what);
    bool restartInLoop();
    Result<std::string> resolveDevice(const std::string& requested);
    void joinLoop();

    // Waits up to `seconds`; false when a stop was requested meanwhile
    bool sleepFor(double seconds);
    // Blocks while paused; false when a stop was requested
    bool waitWhilePaused();

    void setState(BotState s, const std::string& reason = "");
    // Loop-side transition; skipped (false) once a stop is in progress
    bool loopTransition(BotState to, const std::string& reason = "");
    void publishTransition(BotState from, BotState to, const std::string& reason = "");
    void recordAction(const std::string& name, nlohmann::json details);
    void onEvent(const BotEvent& e);

    DeviceBridge& bridge_;
    ActionExecutor& executor_;
    vision::PerceptionPipeline& perception_;
    EventBus& bus_;

    mutable std::mutex mutex_;         // state, stats, config, gates
    std::condition_variable gate_cv_;
    BotState state_ = BotState::Stopped;
    config::BotConfig cfg_;
    BotStats stats_;
    std::string device_id_;
    std::string last_action_;
    std::string last_error_;
    int error_count_ = 0;
    int64_t started_at_ms_ = 0;
    bool paused_ = false;
    bool stop_requested_ = false;
    bool self_stop_ = false;           // loop ended the session itself (max_games)
    bool loop_done_ = true;
    bool was_in_game_ = false;

    std::thread loop_thread_;
    std::mutex control_mutex_;         // serializes start/stop
    std::mt19937 rng_;

    mutable std::mutex history_mutex_;
    std::deque<BotEvent> history_;
    SubscriptionHandle history_sub_;
};

} // namespace rampart
