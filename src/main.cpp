// =============================================================================
// Rampart - headless bot host
// =============================================================================
// Reads one JSON command per line on stdin and answers on stdout; bot events
// are interleaved on stdout as {"event": {...}} lines. Logs go to stderr and
// the configured log file.
//
//   rampart [config.json]
// =============================================================================

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "bot_context.hpp"
#include "config.hpp"
#include "rampart_log.hpp"

static constexpr size_t EVENT_QUEUE_CAPACITY = 256;

namespace {

struct WriterJoin {
    std::atomic<bool>& running;
    std::thread& thread;
    ~WriterJoin() {
        running = false;
        if (thread.joinable()) thread.join();
    }
};

} // namespace

int main(int argc, char* argv[]) {
    const std::string config_path = argc > 1 ? argv[1] : "config.json";
    auto cfg = rampart::config::loadConfig(config_path);

    rampart::log::setLogLevel(rampart::log::levelFromString(cfg.log.level));
    if (!cfg.log.path.empty() && !rampart::log::openLogFile(cfg.log.path.c_str())) {
        RLOG_WARN("main", "cannot open log file %s", cfg.log.path.c_str());
    }
    RLOG_INFO("main", "Rampart starting...");

    int rc = 0;
    try {
        rampart::BotContext ctx(cfg);
        ctx.perception.loadAll();

        // Events reach stdout through a bounded channel drained by a writer
        // thread; overflow drops the oldest.
        std::mutex out_mutex;
        std::atomic<bool> writing{true};
        auto events = ctx.bus.openChannel(EVENT_QUEUE_CAPACITY);
        std::thread writer([&] {
            while (writing.load() || events->size() > 0) {
                auto e = events->waitNext(std::chrono::milliseconds(100));
                if (!e) continue;
                std::lock_guard<std::mutex> lock(out_mutex);
                std::cout << nlohmann::json{{"event", e->toJson()}}.dump() << std::endl;
            }
        });
        WriterJoin writer_join{writing, writer};

        if (ctx.cfg.bot.auto_start) {
            auto r = ctx.bot.start(ctx.cfg.bot.preferred_device);
            if (r.is_err()) RLOG_WARN("main", "auto start failed: %s", r.error().message.c_str());
        }

        std::string line;
        while (std::getline(std::cin, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;
            std::string response = ctx.commands.dispatchLine(line);
            std::lock_guard<std::mutex> lock(out_mutex);
            std::cout << response << std::endl;
        }

        RLOG_INFO("main", "stdin closed, shutting down");
        if (ctx.bot.state() != rampart::BotState::Stopped) {
            auto r = ctx.bot.stop();
            if (r.is_err()) RLOG_WARN("main", "stop: %s", r.error().message.c_str());
        }

        writing = false;
        writer.join();
        if (events->dropped() > 0) {
            RLOG_WARN("main", "%llu events dropped (slow stdout)",
                      (unsigned long long)events->dropped());
        }
    } catch (const std::exception& e) {
        RLOG_FATAL("main", "fatal: %s", e.what());
        rc = 1;
    }

    rampart::log::closeLogFile();
    return rc;
}
