#include "action_executor.hpp"
#include "rampart_log.hpp"

#include <cctype>
#include <cstring>

namespace rampart {

namespace {
constexpr const char* TAG = "action";

// Characters the device shell would interpret inside `input text`
constexpr const char* SHELL_METACHARACTERS = "|;&$`\\\"'<>(){}[]!#*?~";
}

ActionExecutor::ActionExecutor(DeviceBridge& bridge, std::string game_package, ClockFn clock)
    : bridge_(bridge), game_package_(std::move(game_package)), clock_(std::move(clock)) {
    if (!clock_) clock_ = [] { return Clock::now(); };
}

bool ActionExecutor::runShell(const std::string& device_id, const std::vector<std::string>& args,
                              const char* what) {
    std::vector<std::string> full;
    full.reserve(args.size() + 1);
    full.push_back("shell");
    full.insert(full.end(), args.begin(), args.end());

    bool ok = false;
    try {
        auto r = bridge_.runCommand(full, device_id);
        ok = r.ok();
        if (!ok) {
            RLOG_WARN(TAG, "%s on %s failed (exit %d): %s", what, device_id.c_str(),
                      r.exit_code, r.stderr_data.c_str());
        }
    } catch (const BridgeUnavailable&) {
        throw;
    } catch (const BridgeError& e) {
        RLOG_WARN(TAG, "%s on %s: %s", what, device_id.c_str(), e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    sent_++;
    if (!ok) failed_++;
    return ok;
}

std::vector<uint8_t> ActionExecutor::screenshot(const std::string& device_id) {
    const auto now = clock_();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(device_id);
        if (it != cache_.end() && now - it->second.taken < SCREENSHOT_TTL) {
            return it->second.png;
        }
    }

    std::vector<uint8_t> png;
    try {
        auto r = bridge_.runCommand({"exec-out", "screencap", "-p"}, device_id);
        if (!r.ok() || r.stdout_data.empty()) {
            RLOG_WARN(TAG, "screencap on %s failed (exit %d): %s", device_id.c_str(),
                      r.exit_code, r.stderr_data.c_str());
            return png;
        }
        png.assign(r.stdout_data.begin(), r.stdout_data.end());
    } catch (const BridgeUnavailable&) {
        throw;
    } catch (const BridgeError& e) {
        RLOG_WARN(TAG, "screencap on %s: %s", device_id.c_str(), e.what());
        return png;
    }

    RLOG_DEBUG(TAG, "Screenshot captured: %zu bytes", png.size());
    std::lock_guard<std::mutex> lock(mutex_);
    cache_[device_id] = CachedShot{now, png};
    return png;
}

bool ActionExecutor::tap(const std::string& device_id, int x, int y) {
    return runShell(device_id, {"input", "tap", std::to_string(x), std::to_string(y)}, "tap");
}

bool ActionExecutor::swipe(const std::string& device_id, int x1, int y1, int x2, int y2,
                           int duration_ms) {
    return runShell(device_id,
                    {"input", "swipe", std::to_string(x1), std::to_string(y1),
                     std::to_string(x2), std::to_string(y2), std::to_string(duration_ms)},
                    "swipe");
}

bool ActionExecutor::longPress(const std::string& device_id, int x, int y, int duration_ms) {
    // a zero-distance swipe is a long press
    return swipe(device_id, x, y, x, y, duration_ms);
}

bool ActionExecutor::sendText(const std::string& device_id, const std::string& text) {
    std::string escaped = escapeText(text);
    if (escaped.empty()) return true;
    return runShell(device_id, {"input", "text", escaped}, "text");
}

bool ActionExecutor::sendKeyEvent(const std::string& device_id, int code) {
    return runShell(device_id, {"input", "keyevent", std::to_string(code)}, "keyevent");
}

bool ActionExecutor::launchApp(const std::string& device_id, const std::string& package) {
    const std::string& pkg = package.empty() ? game_package_ : package;
    return runShell(device_id,
                    {"monkey", "-p", pkg, "-c", "android.intent.category.LAUNCHER", "1"},
                    "launch");
}

void ActionExecutor::invalidateCache(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (device_id.empty()) cache_.clear();
    else cache_.erase(device_id);
}

std::string ActionExecutor::escapeText(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size() * 2);
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == ' ') { escaped += "%s"; continue; }
        if (uc < 0x20 || uc == 0x7f) continue;
        if (std::strchr(SHELL_METACHARACTERS, c) != nullptr) escaped += '\\';
        escaped += c;
    }
    return escaped;
}

uint64_t ActionExecutor::actionsSent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
}

uint64_t ActionExecutor::actionsFailed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

} // namespace rampart
