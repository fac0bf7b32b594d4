// =============================================================================
// Unit tests for BotOrchestrator (src/bot/bot_orchestrator.hpp)
// The whole stack runs for real; only adb is scripted through
// FakeProcessRunner, and screenshots are synthetic PNG frames.
// =============================================================================
#include <gtest/gtest.h>

#include <atomic>
#include <functional>
#include <thread>

#include "bot/bot_orchestrator.hpp"
#include "fake_process_runner.hpp"
#include "test_images.hpp"

using namespace rampart;
using namespace rampart::test;
using namespace std::chrono_literals;

namespace {

const char* kDevice = "emulator-5554";

bool waitUntil(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

std::string asString(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

class BotOrchestratorTest : public ::testing::Test {
protected:
    BotOrchestratorTest()
        : bridge(runner, config::BridgeConfig{}, "/opt/adb", &bus),
          executor(bridge),
          perception(grid, mana, vision_cfg) {
        perception.setReferences({{"archer", {200, 40, 40}}});

        auto in_game = darkFrame(480, 600);
        fillCell(in_game, grid, 0, 0, 200, 40, 40);
        fillCell(in_game, grid, 0, 1, 200, 40, 40);
        fillMana(in_game, mana, 0.4);
        in_game_png = asString(png(in_game));
        lobby_png = asString(png(darkFrame(480, 600)));

        runner.on("devices -l", 0, std::string("List of devices attached\n") + kDevice + "\tdevice\n");
        runner.on("input tap", 0, "");
        runner.on("input swipe", 0, "");
    }

    ~BotOrchestratorTest() override {
        bot.reset();
    }

    static config::BotConfig fastConfig() {
        config::BotConfig cfg;
        cfg.action_delay = 0.0;
        cfg.cycle_interval = 0.01;
        cfg.error_backoff = 0.01;
        cfg.stop_grace_seconds = 2.0;
        return cfg;
    }

    BotOrchestrator& makeBot(config::BotConfig cfg = fastConfig()) {
        bot = std::make_unique<BotOrchestrator>(bridge, executor, perception, bus, cfg, 42u);
        return *bot;
    }

    void serve(const std::string& frame) { runner.on("exec-out screencap -p", 0, frame); }

    size_t countEvents(EventType type, const std::string& reason = "") {
        size_t n = 0;
        for (const auto& e : bot->eventHistory()) {
            if (e.type != type) continue;
            if (!reason.empty() && e.data.value("reason", std::string()) != reason) continue;
            n++;
        }
        return n;
    }

    FakeProcessRunner runner;
    EventBus bus;
    AdbBridge bridge;
    ActionExecutor executor;
    config::GridConfig grid;
    config::ManaConfig mana;
    config::VisionConfig vision_cfg;
    vision::PerceptionPipeline perception;
    std::string in_game_png;
    std::string lobby_png;
    std::unique_ptr<BotOrchestrator> bot;
};

} // namespace

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(BotOrchestratorTest, RejectsTransitionsWhileStopped) {
    auto& b = makeBot();
    EXPECT_EQ(b.state(), BotState::Stopped);
    EXPECT_EQ(b.pause().error().code, ErrorCode::StateTransitionRejected);
    EXPECT_EQ(b.resume().error().code, ErrorCode::StateTransitionRejected);
    EXPECT_EQ(b.stop().error().code, ErrorCode::StateTransitionRejected);
    EXPECT_EQ(b.togglePause().error().code, ErrorCode::StateTransitionRejected);
    EXPECT_TRUE(b.eventHistory().empty());
}

TEST_F(BotOrchestratorTest, StartAndStop) {
    serve(lobby_png);
    auto& b = makeBot();
    ASSERT_TRUE(b.start(kDevice).is_ok());
    EXPECT_EQ(b.state(), BotState::Running);
    EXPECT_EQ(b.deviceId(), kDevice);
    EXPECT_EQ(b.start().error().code, ErrorCode::StateTransitionRejected);

    ASSERT_TRUE(waitUntil([&] { return b.stats().cycles_completed >= 2; }));
    auto status = b.status();
    EXPECT_GT(status.started_at_ms, 0);
    EXPECT_EQ(status.device_id, kDevice);

    ASSERT_TRUE(b.stop().is_ok());
    EXPECT_EQ(b.state(), BotState::Stopped);
    EXPECT_EQ(countEvents(EventType::BotStarted), 1u);
    EXPECT_EQ(countEvents(EventType::BotStopped), 1u);

    // stopped -> starting -> running -> stopping -> stopped
    std::vector<std::string> transitions;
    for (const auto& e : b.eventHistory()) {
        if (e.type == EventType::StatusChanged) transitions.push_back(e.data["new_state"].get<std::string>());
    }
    EXPECT_EQ(transitions, (std::vector<std::string>{"starting", "running", "stopping", "stopped"}));
}

TEST_F(BotOrchestratorTest, StartPicksFirstConnectedDevice) {
    runner.on("devices -l", 0,
              "List of devices attached\nR58M123ABC\tunauthorized\nemulator-5556\tdevice\n");
    serve(lobby_png);
    auto& b = makeBot();
    ASSERT_TRUE(b.start().is_ok());
    EXPECT_EQ(b.deviceId(), "emulator-5556");
}

TEST_F(BotOrchestratorTest, StartPrefersConfiguredDevice) {
    runner.on("devices -l", 0,
              "List of devices attached\nemulator-5554\tdevice\nemulator-5556\tdevice\n");
    serve(lobby_png);
    auto cfg = fastConfig();
    cfg.preferred_device = "emulator-5556";
    auto& b = makeBot(cfg);
    ASSERT_TRUE(b.start().is_ok());
    EXPECT_EQ(b.deviceId(), "emulator-5556");
}

TEST_F(BotOrchestratorTest, StartWithoutDeviceEntersError) {
    runner.on("devices -l", 0, "List of devices attached\n");
    auto& b = makeBot();
    auto r = b.start();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::DeviceUnreachable);
    EXPECT_EQ(b.state(), BotState::Error);
    EXPECT_EQ(countEvents(EventType::ErrorOccurred), 1u);

    // Error -> start is allowed once a device appears
    runner.on("devices -l", 0, std::string("List of devices attached\n") + kDevice + "\tdevice\n");
    serve(lobby_png);
    ASSERT_TRUE(b.start().is_ok());
    EXPECT_EQ(b.state(), BotState::Running);
}

TEST_F(BotOrchestratorTest, PauseAndResume) {
    serve(lobby_png);
    auto& b = makeBot();
    ASSERT_TRUE(b.start(kDevice).is_ok());
    ASSERT_TRUE(waitUntil([&] { return b.stats().cycles_completed >= 1; }));

    auto toggled = b.togglePause();
    ASSERT_TRUE(toggled.is_ok());
    EXPECT_EQ(toggled.value(), BotState::Paused);
    EXPECT_EQ(b.pause().error().code, ErrorCode::StateTransitionRejected);

    // let an in-flight cycle drain, then nothing more may happen
    std::this_thread::sleep_for(50ms);
    size_t shots = runner.count("screencap");
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(runner.count("screencap"), shots);

    ASSERT_TRUE(b.resume().is_ok());
    EXPECT_EQ(b.state(), BotState::Running);
    EXPECT_TRUE(waitUntil([&] { return runner.count("screencap") > shots; }));
    EXPECT_EQ(countEvents(EventType::BotPaused), 1u);
    EXPECT_EQ(countEvents(EventType::BotResumed), 1u);

    // stop is accepted from Paused too
    ASSERT_TRUE(b.pause().is_ok());
    ASSERT_TRUE(b.stop().is_ok());
    EXPECT_EQ(b.state(), BotState::Stopped);
}

// =============================================================================
// Game cycle
// =============================================================================

TEST_F(BotOrchestratorTest, PlacesAndMergesInGame) {
    serve(in_game_png);
    auto cfg = fastConfig();
    cfg.cycle_interval = 60.0;    // exactly one cycle before stop()
    auto& b = makeBot(cfg);
    ASSERT_TRUE(b.start(kDevice).is_ok());
    ASSERT_TRUE(waitUntil([&] { return b.stats().cycles_completed >= 1; }));
    ASSERT_TRUE(b.stop().is_ok());

    auto stats = b.stats();
    EXPECT_EQ(stats.units_placed, 1u);
    EXPECT_EQ(stats.merges_performed, 1u);
    EXPECT_EQ(stats.actions_performed, 2u);
    EXPECT_EQ(runner.count("input tap"), 1u);

    // (0,0) centre -> (0,1) centre
    EXPECT_EQ(runner.count("-s emulator-5554 shell input swipe 140 240 230 240 300"), 1u);
    EXPECT_EQ(countEvents(EventType::ActionPerformed), 2u);
    EXPECT_EQ(b.status().last_action, "merge");
}

TEST_F(BotOrchestratorTest, PlacementNeedsManaAndAutoUpgrade) {
    serve(in_game_png);
    auto cfg = fastConfig();
    cfg.cycle_interval = 60.0;
    cfg.min_unit_cost = 5;        // bar shows 4
    cfg.auto_merge = false;
    auto& b = makeBot(cfg);
    ASSERT_TRUE(b.start(kDevice).is_ok());
    ASSERT_TRUE(waitUntil([&] { return b.stats().cycles_completed >= 1; }));
    ASSERT_TRUE(b.stop().is_ok());

    EXPECT_EQ(b.stats().units_placed, 0u);
    EXPECT_EQ(b.stats().merges_performed, 0u);
    EXPECT_EQ(runner.count("input"), 0u);
}

TEST_F(BotOrchestratorTest, AutoQueueTapsPlayButtonOutOfGame) {
    serve(lobby_png);
    auto cfg = fastConfig();
    cfg.cycle_interval = 60.0;
    cfg.auto_queue = true;
    auto& b = makeBot(cfg);
    ASSERT_TRUE(b.start(kDevice).is_ok());
    ASSERT_TRUE(waitUntil([&] { return b.stats().cycles_completed >= 1; }));
    ASSERT_TRUE(b.stop().is_ok());

    EXPECT_EQ(runner.count("-s emulator-5554 shell input tap 540 1200"), 1u);
    EXPECT_EQ(b.status().last_action, "queue_game");
}

TEST_F(BotOrchestratorTest, UnusableFrameIsAFailedCycle) {
    runner.on("exec-out screencap -p", 0, "definitely not a png");
    auto& b = makeBot();
    ASSERT_TRUE(b.start(kDevice).is_ok());
    ASSERT_TRUE(waitUntil([&] { return b.stats().failed_cycles >= 2; }));
    EXPECT_EQ(b.state(), BotState::Running);
    EXPECT_EQ(b.stats().errors, 0u);
    EXPECT_EQ(b.stats().cycles_completed, 0u);
    EXPECT_GE(perception.stats().decode_failures, 2u);
}

TEST_F(BotOrchestratorTest, MaxGamesEndsSession) {
    std::atomic<int> shots{0};
    std::string in_game = in_game_png;
    std::string lobby = lobby_png;
    runner.onCall("exec-out screencap -p", [&shots, in_game, lobby](const std::string&) {
        return Result<CommandOutput>(output(0, shots++ == 0 ? in_game : lobby));
    });
    auto cfg = fastConfig();
    cfg.max_games = 1;
    cfg.auto_upgrade = false;
    cfg.auto_merge = false;
    auto& b = makeBot(cfg);
    ASSERT_TRUE(b.start(kDevice).is_ok());

    ASSERT_TRUE(waitUntil([&] { return b.state() == BotState::Stopped; }));
    EXPECT_EQ(b.stats().games_played, 1u);
    EXPECT_EQ(countEvents(EventType::BotStopped, "max_games"), 1u);
    EXPECT_EQ(b.stop().error().code, ErrorCode::StateTransitionRejected);
}

TEST_F(BotOrchestratorTest, StopDuringFinalGameStopsOnce) {
    std::atomic<int> shots{0};
    std::atomic<bool> final_frame_in_flight{false};
    std::string in_game = in_game_png;
    std::string lobby = lobby_png;
    runner.onCall("exec-out screencap -p", [&shots, &final_frame_in_flight, in_game, lobby](const std::string&) {
        int n = shots++;
        if (n == 1) {
            final_frame_in_flight = true;
            std::this_thread::sleep_for(100ms);
        }
        return Result<CommandOutput>(output(0, n == 0 ? in_game : lobby));
    });
    auto cfg = fastConfig();
    cfg.max_games = 1;
    cfg.auto_upgrade = false;
    cfg.auto_merge = false;
    auto& b = makeBot(cfg);
    ASSERT_TRUE(b.start(kDevice).is_ok());

    ASSERT_TRUE(waitUntil([&] { return final_frame_in_flight.load(); }));
    ASSERT_TRUE(b.stop().is_ok());
    EXPECT_EQ(b.state(), BotState::Stopped);
    EXPECT_EQ(countEvents(EventType::BotStopped), 1u);

    size_t stopped_transitions = 0;
    for (const auto& e : b.eventHistory()) {
        if (e.type == EventType::StatusChanged && e.data.value("new_state", std::string()) == "stopped") {
            stopped_transitions++;
        }
    }
    EXPECT_EQ(stopped_transitions, 1u);
}

// =============================================================================
// Errors and restart
// =============================================================================

TEST_F(BotOrchestratorTest, RestartsAfterMaxErrors) {
    std::atomic<int> shots{0};
    std::string frame = lobby_png;
    runner.onCall("exec-out screencap -p", [&shots, frame](const std::string&) {
        if (shots++ < 3) {
            return Err<CommandOutput>("adb server went away", ErrorCode::BridgeUnavailable);
        }
        return Result<CommandOutput>(output(0, frame));
    });
    auto cfg = fastConfig();
    cfg.max_errors = 3;
    cfg.restart_on_error = true;
    auto& b = makeBot(cfg);
    ASSERT_TRUE(b.start(kDevice).is_ok());

    ASSERT_TRUE(waitUntil([&] {
        auto s = b.stats();
        return s.restarts == 1 && s.cycles_completed >= 1;
    }));
    EXPECT_EQ(b.state(), BotState::Running);
    EXPECT_EQ(b.stats().errors, 3u);
    EXPECT_EQ(b.status().error_count, 0);
    EXPECT_EQ(countEvents(EventType::ErrorOccurred), 3u);
    EXPECT_EQ(countEvents(EventType::BotStopped, "restart"), 1u);
    EXPECT_EQ(countEvents(EventType::BotStarted, "restart"), 1u);

    // the restart's bot_started follows its bot_stopped
    int stopped_at = -1, started_at = -1, i = 0;
    for (const auto& e : b.eventHistory()) {
        std::string reason = e.data.value("reason", std::string());
        if (e.type == EventType::BotStopped && reason == "restart") stopped_at = i;
        if (e.type == EventType::BotStarted && reason == "restart") started_at = i;
        i++;
    }
    EXPECT_GE(stopped_at, 0);
    EXPECT_GT(started_at, stopped_at);
}

TEST_F(BotOrchestratorTest, GivesUpWithoutRestart) {
    runner.onCall("exec-out screencap -p", [](const std::string&) {
        return Err<CommandOutput>("adb server went away", ErrorCode::BridgeUnavailable);
    });
    auto cfg = fastConfig();
    cfg.max_errors = 2;
    cfg.restart_on_error = false;
    auto& b = makeBot(cfg);
    ASSERT_TRUE(b.start(kDevice).is_ok());

    ASSERT_TRUE(waitUntil([&] { return b.stats().errors == 2; }));
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(b.state(), BotState::Error);
    EXPECT_EQ(runner.count("screencap"), 2u);
    EXPECT_EQ(b.stats().restarts, 0u);
    EXPECT_FALSE(b.status().last_error.empty());

    ASSERT_TRUE(b.stop().is_ok());
    EXPECT_EQ(b.state(), BotState::Stopped);
}

TEST_F(BotOrchestratorTest, SuccessfulCycleClearsErrorState) {
    std::atomic<int> shots{0};
    std::string frame = lobby_png;
    runner.onCall("exec-out screencap -p", [&shots, frame](const std::string&) {
        if (shots++ == 0) return Err<CommandOutput>("transient", ErrorCode::BridgeUnavailable);
        return Result<CommandOutput>(output(0, frame));
    });
    auto& b = makeBot();
    ASSERT_TRUE(b.start(kDevice).is_ok());
    ASSERT_TRUE(waitUntil([&] { return b.stats().cycles_completed >= 1; }));
    EXPECT_EQ(b.state(), BotState::Running);
    EXPECT_EQ(b.stats().errors, 1u);
    EXPECT_EQ(b.stats().restarts, 0u);
}

TEST_F(BotOrchestratorTest, PauseDuringFailingCycleDoesNotWedgeLoop) {
    std::atomic<int> shots{0};
    std::atomic<bool> paused_mid_cycle{false};
    std::atomic<int> pause_in_error{-1};
    std::string frame = lobby_png;
    runner.onCall("exec-out screencap -p", [&, frame](const std::string&) {
        if (shots++ == 0) {
            paused_mid_cycle = bot->pause().is_ok();
            return Err<CommandOutput>("adb server went away", ErrorCode::BridgeUnavailable);
        }
        return Result<CommandOutput>(output(0, frame));
    });
    auto& b = makeBot();
    auto sub = bus.subscribe([&](const BotEvent& e) {
        if (e.type == EventType::StatusChanged && e.data.value("new_state", std::string()) == "error") {
            pause_in_error = b.pause().is_ok() ? 1 : 0;
        }
    });
    ASSERT_TRUE(b.start(kDevice).is_ok());

    // the failed cycle overrides the pause; the next cycle recovers
    ASSERT_TRUE(waitUntil([&] { return b.stats().cycles_completed >= 1; }));
    EXPECT_TRUE(paused_mid_cycle.load());
    EXPECT_EQ(pause_in_error.load(), 0);
    EXPECT_EQ(b.state(), BotState::Running);
    EXPECT_EQ(b.stats().errors, 1u);
    EXPECT_EQ(countEvents(EventType::BotPaused), 1u);

    // pause still works afterwards
    ASSERT_TRUE(b.pause().is_ok());
    ASSERT_TRUE(b.resume().is_ok());
    ASSERT_TRUE(b.stop().is_ok());
}

TEST_F(BotOrchestratorTest, StopCancelsStuckCommandAfterGrace) {
    runner.onCall("exec-out screencap -p", [](const std::string&) {
        std::this_thread::sleep_for(400ms);
        CommandOutput o;
        o.cancelled = true;
        return Result<CommandOutput>(o);
    });
    auto cfg = fastConfig();
    cfg.stop_grace_seconds = 0.05;
    auto& b = makeBot(cfg);
    ASSERT_TRUE(b.start(kDevice).is_ok());
    ASSERT_TRUE(waitUntil([&] { return runner.count("screencap") >= 1; }));

    ASSERT_TRUE(b.stop().is_ok());
    EXPECT_EQ(b.state(), BotState::Stopped);
    EXPECT_EQ(runner.cancelCalls(), 1);
}

// =============================================================================
// Config and history
// =============================================================================

TEST_F(BotOrchestratorTest, UpdateConfig) {
    auto& b = makeBot();
    auto r = b.updateConfig({{"auto_merge", false}, {"max_errors", 7}});
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(b.botConfig().auto_merge);
    EXPECT_EQ(b.botConfig().max_errors, 7);

    auto bad = b.updateConfig({{"max_errors", 0}});
    ASSERT_TRUE(bad.is_err());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidConfig);
    EXPECT_EQ(b.botConfig().max_errors, 7);

    auto same = b.updateConfig(nlohmann::json::object());
    ASSERT_TRUE(same.is_ok());
    EXPECT_EQ(config::botConfigToJson(same.value()), config::botConfigToJson(b.botConfig()));
}

TEST_F(BotOrchestratorTest, UpdateConfigRoutesVisionThreshold) {
    auto& b = makeBot();
    EXPECT_FLOAT_EQ(perception.confidenceThreshold(), vision_cfg.confidence_threshold);

    ASSERT_TRUE(b.updateConfig({{"vision_confidence_threshold", 0.6}}).is_ok());
    EXPECT_FLOAT_EQ(b.botConfig().vision_confidence_threshold, 0.6f);
    EXPECT_FLOAT_EQ(perception.confidenceThreshold(), 0.6f);

    auto bad = b.updateConfig({{"vision_confidence_threshold", 1.5}});
    ASSERT_TRUE(bad.is_err());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidConfig);
    EXPECT_FLOAT_EQ(perception.confidenceThreshold(), 0.6f);
}

TEST_F(BotOrchestratorTest, EventHistoryIsBounded) {
    auto& b = makeBot();
    for (int i = 0; i < 1100; ++i) {
        bus.publish(EventType::ActionPerformed, {{"seq", i}});
    }
    auto all = b.eventHistory();
    ASSERT_EQ(all.size(), BotOrchestrator::EVENT_HISTORY);
    EXPECT_EQ(all.front().data["seq"], 100);
    EXPECT_EQ(all.back().data["seq"], 1099);

    auto last = b.eventHistory(3);
    ASSERT_EQ(last.size(), 3u);
    EXPECT_EQ(last[0].data["seq"], 1097);
}

TEST_F(BotOrchestratorTest, StatusJson) {
    auto& b = makeBot();
    auto j = b.status().toJson();
    EXPECT_EQ(j["state"], "stopped");
    EXPECT_EQ(j["uptime"], 0.0);
    EXPECT_TRUE(j["stats"].contains("games_played"));
    EXPECT_TRUE(j["config"].contains("max_errors"));
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
