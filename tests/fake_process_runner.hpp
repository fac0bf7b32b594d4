#pragma once
// =============================================================================
// FakeProcessRunner - scripted adb for tests
// =============================================================================
// Commands are matched by substring against the argv joined with spaces
// (argv[0], the adb path, excluded). The most recently added rule wins.
// Unscripted commands exit 1.
// =============================================================================

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "process_runner.hpp"

namespace rampart::test {

inline CommandOutput output(int exit_code, std::string out, std::string err = "") {
    CommandOutput o;
    o.exit_code = exit_code;
    o.stdout_data = std::move(out);
    o.stderr_data = std::move(err);
    return o;
}

class FakeProcessRunner : public ProcessRunner {
public:
    using Handler = std::function<Result<CommandOutput>(const std::string& cmd)>;

    void on(const std::string& needle, int exit_code, const std::string& out,
            const std::string& err = "") {
        CommandOutput o = output(exit_code, out, err);
        onCall(needle, [o](const std::string&) -> Result<CommandOutput> { return o; });
    }

    void timeoutOn(const std::string& needle) {
        onCall(needle, [](const std::string&) -> Result<CommandOutput> {
            CommandOutput o;
            o.timed_out = true;
            return o;
        });
    }

    void onCall(const std::string& needle, Handler h) {
        std::lock_guard<std::mutex> lock(mutex_);
        rules_.push_back({needle, std::move(h)});
    }

    Result<CommandOutput> run(const std::vector<std::string>& argv,
                              std::chrono::milliseconds timeout) override {
        std::string cmd;
        for (size_t i = 1; i < argv.size(); ++i) {
            if (!cmd.empty()) cmd += ' ';
            cmd += argv[i];
        }

        Handler h;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(cmd);
            last_timeout_ = timeout;
            for (auto it = rules_.rbegin(); it != rules_.rend(); ++it) {
                if (cmd.find(it->needle) != std::string::npos) {
                    h = it->handler;
                    break;
                }
            }
        }
        if (h) return h(cmd);
        return output(1, "", "unscripted: " + cmd);
    }

    void cancelAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        cancel_calls_++;
    }

    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    size_t count(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& c : calls_) {
            if (c.find(needle) != std::string::npos) n++;
        }
        return n;
    }

    int cancelCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancel_calls_;
    }

    std::chrono::milliseconds lastTimeout() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_timeout_;
    }

    void clearCalls() {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.clear();
    }

private:
    struct Rule {
        std::string needle;
        Handler handler;
    };

    mutable std::mutex mutex_;
    std::vector<Rule> rules_;
    std::vector<std::string> calls_;
    std::chrono::milliseconds last_timeout_{0};
    int cancel_calls_ = 0;
};

} // namespace rampart::test
