#pragma once
// =============================================================================
// ActionExecutor - input injection and screen capture over the bridge
// =============================================================================
// Thin layer over DeviceBridge::runCommand. Per-action failures (non-zero
// exit, timeout) are logged and reported as false; only BridgeUnavailable
// escapes to the caller.
// =============================================================================

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "device_bridge.hpp"

namespace rampart {

// Android KeyEvent codes used by the bot
namespace keycode {
constexpr int HOME = 3;
constexpr int BACK = 4;
constexpr int ENTER = 66;
}

class ActionExecutor {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    static constexpr std::chrono::milliseconds SCREENSHOT_TTL{1000};

    explicit ActionExecutor(DeviceBridge& bridge, std::string game_package = "com.my.defense",
                            ClockFn clock = {});

    // PNG bytes; empty on failure. Served from cache if younger than SCREENSHOT_TTL.
    std::vector<uint8_t> screenshot(const std::string& device_id);

    bool tap(const std::string& device_id, int x, int y);
    bool swipe(const std::string& device_id, int x1, int y1, int x2, int y2, int duration_ms);
    bool longPress(const std::string& device_id, int x, int y, int duration_ms = 1000);
    bool sendText(const std::string& device_id, const std::string& text);
    bool sendKeyEvent(const std::string& device_id, int code);
    bool back(const std::string& device_id) { return sendKeyEvent(device_id, keycode::BACK); }

    // Launch via the launcher intent; empty package means the configured game
    bool launchApp(const std::string& device_id, const std::string& package = "");

    // Drop cached screenshots (all devices when device_id is empty)
    void invalidateCache(const std::string& device_id = "");

    // "input text" argument: spaces -> %s, shell metacharacters escaped,
    // control characters dropped
    static std::string escapeText(const std::string& text);

    uint64_t actionsSent() const;
    uint64_t actionsFailed() const;

private:
    bool runShell(const std::string& device_id, const std::vector<std::string>& args,
                  const char* what);

    DeviceBridge& bridge_;
    std::string game_package_;
    ClockFn clock_;

    struct CachedShot {
        Clock::time_point taken;
        std::vector<uint8_t> png;
    };
    mutable std::mutex mutex_;
    std::map<std::string, CachedShot> cache_;
    uint64_t sent_ = 0;
    uint64_t failed_ = 0;
};

} // namespace rampart
