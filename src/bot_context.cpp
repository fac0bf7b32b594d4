#include "bot_context.hpp"
#include "rampart_log.hpp"

namespace rampart {

namespace {

std::unique_ptr<ProcessRunner> orDefaultRunner(std::unique_ptr<ProcessRunner> runner) {
    if (runner) return runner;
    return std::make_unique<PosixProcessRunner>();
}

} // namespace

BotContext::BotContext(config::AppConfig app, std::unique_ptr<ProcessRunner> r)
    : cfg(std::move(app)),
      runner(orDefaultRunner(std::move(r))),
      bridge(makeDeviceBridge(*runner, cfg.bridge, &bus)),
      executor(*bridge, cfg.bridge.game_package),
      perception(cfg.grid, cfg.mana, cfg.vision),
      bot(*bridge, executor, perception, bus, cfg.bot),
      commands(bot, executor, *bridge, perception, cfg.bridge) {
    RLOG_INFO("context", "Services ready (bridge %s)",
              bridge->isAvailable() ? "available" : "unavailable");
}

} // namespace rampart
