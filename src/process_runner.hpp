#pragma once
// =============================================================================
// ProcessRunner - child process execution with a hard deadline
// =============================================================================
// All bridge traffic is a short-lived child process. The runner captures
// stdout/stderr separately, kills the child when its deadline passes, and
// can kill every in-flight child on demand (used when a stop request runs
// past its grace period).
// =============================================================================

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <sys/types.h>

#include "result.hpp"

namespace rampart {

struct CommandOutput {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
    bool timed_out = false;
    bool cancelled = false;     // killed by cancelAll()

    bool ok() const { return exit_code == 0 && !timed_out && !cancelled; }
};

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Spawn argv[0] with the remaining arguments. A timeout or cancellation is
    // reported through the flags of a successful Result; only a failure to
    // start the process is an error.
    virtual Result<CommandOutput> run(const std::vector<std::string>& argv,
                                      std::chrono::milliseconds timeout) = 0;

    // Kill every process started by run() that has not finished yet
    virtual void cancelAll() = 0;
};

class PosixProcessRunner : public ProcessRunner {
public:
    static constexpr size_t MAX_OUTPUT_BYTES = 50 * 1024 * 1024;

    Result<CommandOutput> run(const std::vector<std::string>& argv,
                              std::chrono::milliseconds timeout) override;
    void cancelAll() override;

private:
    std::mutex mutex_;
    std::unordered_map<pid_t, bool> running_;   // pid -> cancel requested
};

} // namespace rampart
