#pragma once
// =============================================================================
// BotContext - every long-lived service, built once and wired explicitly
// =============================================================================
// Members are declared in dependency order; destruction runs in reverse, so
// the orchestrator loop is joined before the bridge and runner go away.
// =============================================================================

#include <memory>

#include "action_executor.hpp"
#include "bot/bot_orchestrator.hpp"
#include "bot/command_dispatcher.hpp"
#include "config.hpp"
#include "device_bridge.hpp"
#include "event_bus.hpp"
#include "process_runner.hpp"
#include "vision/perception_pipeline.hpp"

namespace rampart {

struct BotContext {
    // runner == nullptr: spawn real child processes
    explicit BotContext(config::AppConfig cfg, std::unique_ptr<ProcessRunner> runner = nullptr);

    BotContext(const BotContext&) = delete;
    BotContext& operator=(const BotContext&) = delete;

    config::AppConfig cfg;
    EventBus bus;
    std::unique_ptr<ProcessRunner> runner;
    std::unique_ptr<DeviceBridge> bridge;
    ActionExecutor executor;
    vision::PerceptionPipeline perception;
    BotOrchestrator bot;
    CommandDispatcher commands;
};

} // namespace rampart
