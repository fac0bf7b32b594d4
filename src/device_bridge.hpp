#pragma once
// =============================================================================
// DeviceBridge - ADB session, device registry, port discovery
// =============================================================================
// Every bridge interaction flows through runCommand(). The registry of
// DeviceRecords is owned here and replaced wholesale on each listDevices();
// callers only ever receive copies.
// =============================================================================

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config.hpp"
#include "event_bus.hpp"
#include "process_runner.hpp"
#include "result.hpp"

namespace rampart {

// =============================================================================
// Bridge exceptions (raised by runCommand)
// =============================================================================

class BridgeError : public std::runtime_error {
public:
    BridgeError(const std::string& what, ErrorCode code)
        : std::runtime_error(what), code_(code) {}
    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class BridgeUnavailable : public BridgeError {
public:
    explicit BridgeUnavailable(const std::string& what)
        : BridgeError(what, ErrorCode::BridgeUnavailable) {}
};

class BridgeTimeout : public BridgeError {
public:
    explicit BridgeTimeout(const std::string& what)
        : BridgeError(what, ErrorCode::BridgeTimeout) {}
};

// =============================================================================
// Device model
// =============================================================================

enum class DeviceStatus { Disconnected, Connecting, Connected, Unauthorized, Error };
enum class ConnectionKind { USB, Network, Emulator };

const char* deviceStatusName(DeviceStatus s);
const char* connectionKindName(ConnectionKind k);

struct DeviceRecord {
    std::string id;                   // serial or host:port
    std::string display_name;
    std::string model = "unknown";
    std::string os_version = "unknown";
    int api_level = 0;
    std::string architecture = "unknown";
    DeviceStatus status = DeviceStatus::Disconnected;
    ConnectionKind kind = ConnectionKind::USB;
    int64_t last_seen_ms = 0;         // wall clock

    int battery_level = -1;           // -1 = unknown
    bool charging = false;
    uint64_t total_memory = 0;        // bytes
    uint64_t available_memory = 0;
    int screen_width = 0;
    int screen_height = 0;
    int screen_density = 0;
    bool game_installed = false;
    std::string game_version;

    nlohmann::json toJson() const;
};

struct BridgeResult {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;

    bool ok() const { return exit_code == 0; }
};

// =============================================================================
// DeviceBridge interface
// =============================================================================

class DeviceBridge {
public:
    virtual ~DeviceBridge() = default;

    // Single choke point for bridge traffic.
    // Throws BridgeTimeout on expiry, BridgeUnavailable if adb is missing.
    virtual BridgeResult runCommand(const std::vector<std::string>& args,
                                    const std::optional<std::string>& device_id,
                                    std::chrono::milliseconds timeout) = 0;

    BridgeResult runCommand(const std::vector<std::string>& args,
                            const std::optional<std::string>& device_id = std::nullopt) {
        return runCommand(args, device_id, defaultTimeout());
    }

    virtual bool isAvailable() const = 0;
    virtual std::chrono::milliseconds defaultTimeout() const = 0;

    // Enumerate, enrich Connected devices, prune vanished ones
    virtual std::vector<DeviceRecord> listDevices() = 0;
    virtual std::vector<DeviceRecord> devices() const = 0;
    virtual std::optional<DeviceRecord> device(const std::string& id) const = 0;

    virtual Result<void> connect(const std::string& id_or_address) = 0;
    virtual Result<void> disconnect(const std::string& id) = 0;

    // Sorted, duplicate-free ports that accepted `connect 127.0.0.1:<port>`
    virtual std::vector<int> scanPortRange(int start, int end, int concurrency) = 0;
    virtual std::vector<DeviceRecord> autoDiscover() = 0;

    virtual Result<void> startServer() = 0;
    virtual Result<void> restartServer() = 0;

    // Kill every in-flight bridge command
    virtual void cancelPending() = 0;
};

// =============================================================================
// AdbBridge - real implementation over the adb executable
// =============================================================================

class AdbBridge : public DeviceBridge {
public:
    // Throws BridgeUnavailable when adb_path is empty
    AdbBridge(ProcessRunner& runner, config::BridgeConfig cfg, std::string adb_path,
              EventBus* bus = nullptr);

    BridgeResult runCommand(const std::vector<std::string>& args,
                            const std::optional<std::string>& device_id,
                            std::chrono::milliseconds timeout) override;
    using DeviceBridge::runCommand;

    bool isAvailable() const override { return true; }
    std::chrono::milliseconds defaultTimeout() const override {
        return std::chrono::milliseconds(cfg_.command_timeout_ms);
    }

    std::vector<DeviceRecord> listDevices() override;
    std::vector<DeviceRecord> devices() const override;
    std::optional<DeviceRecord> device(const std::string& id) const override;

    Result<void> connect(const std::string& id_or_address) override;
    Result<void> disconnect(const std::string& id) override;

    std::vector<int> scanPortRange(int start, int end, int concurrency) override;
    std::vector<DeviceRecord> autoDiscover() override;

    Result<void> startServer() override;
    Result<void> restartServer() override;

    void cancelPending() override { runner_.cancelAll(); }

    const std::string& adbPath() const { return adb_path_; }

    // --- Output parsers (static, no I/O) ---

    struct DeviceLine {
        std::string id;
        std::string status_token;
        std::string model_hint;    // "model:" field of `devices -l`, if any
    };

    static std::vector<DeviceLine> parseDeviceList(const std::string& output);
    static DeviceStatus statusFromToken(const std::string& token);
    static ConnectionKind inferConnectionKind(const std::string& id);
    // Accepts getprop dumps ("[key]: [value]") and "key: value" dumps
    static std::map<std::string, std::string> parseProperties(const std::string& output);
    static int parseBatteryLevel(const std::string& dumpsys);
    static bool parseCharging(const std::string& dumpsys);
    static bool parseMemInfo(const std::string& meminfo, uint64_t& total, uint64_t& available);
    static bool parseScreenSize(const std::string& s, int& w, int& h);
    static int parseDensity(const std::string& s);
    static std::string parseVersionName(const std::string& dumpsys_package);

private:
    void enrich(DeviceRecord& rec);
    bool tryConnectPort(int port);

    ProcessRunner& runner_;
    config::BridgeConfig cfg_;
    std::string adb_path_;
    EventBus* bus_;

    mutable std::mutex registry_mutex_;
    std::map<std::string, DeviceRecord> registry_;

    std::mutex scan_mutex_;     // serializes scanPortRange
};

// =============================================================================
// NullBridge - selected when no adb executable exists
// =============================================================================

class NullBridge : public DeviceBridge {
public:
    explicit NullBridge(std::string reason = "adb executable not found")
        : reason_(std::move(reason)) {}

    BridgeResult runCommand(const std::vector<std::string>&,
                            const std::optional<std::string>&,
                            std::chrono::milliseconds) override {
        throw BridgeUnavailable(reason_);
    }
    using DeviceBridge::runCommand;

    bool isAvailable() const override { return false; }
    std::chrono::milliseconds defaultTimeout() const override { return std::chrono::milliseconds(0); }

    std::vector<DeviceRecord> listDevices() override { return {}; }
    std::vector<DeviceRecord> devices() const override { return {}; }
    std::optional<DeviceRecord> device(const std::string&) const override { return std::nullopt; }

    Result<void> connect(const std::string&) override { return unavailable(); }
    Result<void> disconnect(const std::string&) override { return unavailable(); }
    std::vector<int> scanPortRange(int, int, int) override { return {}; }
    std::vector<DeviceRecord> autoDiscover() override { return {}; }
    Result<void> startServer() override { return unavailable(); }
    Result<void> restartServer() override { return unavailable(); }
    void cancelPending() override {}

private:
    Result<void> unavailable() const { return Error(reason_, ErrorCode::BridgeUnavailable); }
    std::string reason_;
};

// =============================================================================
// Factory
// =============================================================================

// Lookup order: configured path, $ADB_PATH, $PATH, common SDK locations
std::optional<std::string> locateAdbExecutable(const std::string& configured);

std::unique_ptr<DeviceBridge> makeDeviceBridge(ProcessRunner& runner,
                                               const config::BridgeConfig& cfg,
                                               EventBus* bus = nullptr);

} // namespace rampart
