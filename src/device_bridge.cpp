#include "device_bridge.hpp"
#include "rampart_log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <regex>
#include <set>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace rampart {

namespace {

constexpr const char* TAG = "adb";

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Leading integer of s, or `def` if there is none
long parseLeadingInt(const std::string& s, long def) {
    std::string t = trim(s);
    if (t.empty()) return def;
    char* end = nullptr;
    long v = std::strtol(t.c_str(), &end, 10);
    if (end == t.c_str()) return def;
    return v;
}

bool isNetworkAddress(const std::string& id) {
    return id.find(':') != std::string::npos;
}

std::string joinArgs(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

} // anonymous namespace

const char* deviceStatusName(DeviceStatus s) {
    switch (s) {
        case DeviceStatus::Disconnected: return "disconnected";
        case DeviceStatus::Connecting:   return "connecting";
        case DeviceStatus::Connected:    return "connected";
        case DeviceStatus::Unauthorized: return "unauthorized";
        case DeviceStatus::Error:        return "error";
    }
    return "error";
}

const char* connectionKindName(ConnectionKind k) {
    switch (k) {
        case ConnectionKind::USB:      return "usb";
        case ConnectionKind::Network:  return "network";
        case ConnectionKind::Emulator: return "emulator";
    }
    return "usb";
}

nlohmann::json DeviceRecord::toJson() const {
    return {
        {"id", id},
        {"display_name", display_name},
        {"model", model},
        {"os_version", os_version},
        {"api_level", api_level},
        {"architecture", architecture},
        {"status", deviceStatusName(status)},
        {"connection_kind", connectionKindName(kind)},
        {"last_seen", last_seen_ms},
        {"battery_level", battery_level},
        {"charging", charging},
        {"total_memory", total_memory},
        {"available_memory", available_memory},
        {"screen_width", screen_width},
        {"screen_height", screen_height},
        {"screen_density", screen_density},
        {"game_installed", game_installed},
        {"game_version", game_version},
    };
}

// =============================================================================
// Construction / command execution
// =============================================================================

AdbBridge::AdbBridge(ProcessRunner& runner, config::BridgeConfig cfg, std::string adb_path,
                     EventBus* bus)
    : runner_(runner), cfg_(std::move(cfg)), adb_path_(std::move(adb_path)), bus_(bus) {
    if (adb_path_.empty()) {
        throw BridgeUnavailable("adb executable path is empty");
    }
    RLOG_INFO(TAG, "Using adb at %s", adb_path_.c_str());
}

BridgeResult AdbBridge::runCommand(const std::vector<std::string>& args,
                                   const std::optional<std::string>& device_id,
                                   std::chrono::milliseconds timeout) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 3);
    argv.push_back(adb_path_);
    if (device_id && !device_id->empty()) {
        argv.push_back("-s");
        argv.push_back(*device_id);
    }
    argv.insert(argv.end(), args.begin(), args.end());

    auto out = runner_.run(argv, timeout);
    if (out.is_err()) {
        const Error& e = out.error();
        if (e.code == ErrorCode::BridgeUnavailable) throw BridgeUnavailable(e.message);
        throw BridgeError(e.message, e.code);
    }

    CommandOutput& co = out.value();
    if (co.timed_out) {
        throw BridgeTimeout("adb " + joinArgs(args) + " timed out after " +
                            std::to_string(timeout.count()) + " ms");
    }
    if (co.cancelled) {
        throw BridgeError("adb " + joinArgs(args) + " cancelled", ErrorCode::CommandFailed);
    }

    BridgeResult r;
    r.exit_code = co.exit_code;
    r.stdout_data = std::move(co.stdout_data);
    r.stderr_data = std::move(co.stderr_data);
    if (r.exit_code != 0) {
        RLOG_DEBUG(TAG, "adb %s exited %d: %s", joinArgs(args).c_str(), r.exit_code,
                   trim(r.stderr_data).c_str());
    }
    return r;
}

// =============================================================================
// Enumeration
// =============================================================================

std::vector<DeviceRecord> AdbBridge::listDevices() {
    // Phase 1: enumerate (no lock, I/O only)
    BridgeResult listing;
    try {
        listing = runCommand({"devices", "-l"});
    } catch (const BridgeUnavailable&) {
        throw;
    } catch (const BridgeError& e) {
        RLOG_ERROR(TAG, "device enumeration failed: %s", e.what());
        return devices();
    }
    if (!listing.ok()) {
        RLOG_ERROR(TAG, "adb devices failed: %s", trim(listing.stderr_data).c_str());
        return devices();
    }

    // Phase 2: build fresh records, enrich Connected ones
    std::map<std::string, DeviceRecord> fresh;
    const int64_t now = wallClockMs();
    for (const auto& line : parseDeviceList(listing.stdout_data)) {
        DeviceRecord rec;
        rec.id = line.id;
        rec.status = statusFromToken(line.status_token);
        rec.kind = inferConnectionKind(line.id);
        rec.last_seen_ms = now;
        if (!line.model_hint.empty()) rec.model = line.model_hint;
        if (rec.status == DeviceStatus::Connected) {
            enrich(rec);
        }
        rec.display_name = (rec.model == "unknown" ? rec.id : rec.model + " (" + rec.id + ")");
        fresh[rec.id] = std::move(rec);
    }

    // Phase 3: swap registry under lock, diff for events
    std::vector<std::string> connected_ids;
    std::vector<std::string> dropped_ids;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        for (const auto& [id, rec] : fresh) {
            auto it = registry_.find(id);
            bool was_connected = it != registry_.end() && it->second.status == DeviceStatus::Connected;
            if (rec.status == DeviceStatus::Connected && !was_connected) connected_ids.push_back(id);
            if (rec.status != DeviceStatus::Connected && was_connected) dropped_ids.push_back(id);
        }
        for (const auto& [id, rec] : registry_) {
            if (fresh.count(id) == 0) {
                RLOG_INFO(TAG, "Device %s no longer enumerated, pruning", id.c_str());
                if (rec.status == DeviceStatus::Connected) dropped_ids.push_back(id);
            }
        }
        registry_ = fresh;
    }

    if (bus_) {
        for (const auto& id : connected_ids) {
            const auto& rec = fresh[id];
            bus_->publish(EventType::DeviceConnected,
                          {{"device_id", id}, {"model", rec.model},
                           {"connection_kind", connectionKindName(rec.kind)}});
        }
        for (const auto& id : dropped_ids) {
            bus_->publish(EventType::DeviceDisconnected, {{"device_id", id}});
        }
    }

    std::vector<DeviceRecord> out;
    out.reserve(fresh.size());
    for (auto& [id, rec] : fresh) out.push_back(std::move(rec));
    RLOG_INFO(TAG, "Enumerated %zu device(s)", out.size());
    return out;
}

void AdbBridge::enrich(DeviceRecord& rec) {
    // Each query degrades independently: a failure leaves the field "unknown"
    auto shell = [&](std::vector<std::string> args) -> std::optional<std::string> {
        args.insert(args.begin(), "shell");
        try {
            auto r = runCommand(args, rec.id);
            if (r.ok()) return r.stdout_data;
            RLOG_DEBUG(TAG, "%s: query '%s' failed", rec.id.c_str(), joinArgs(args).c_str());
        } catch (const BridgeUnavailable&) {
            throw;
        } catch (const BridgeError& e) {
            RLOG_WARN(TAG, "%s: %s", rec.id.c_str(), e.what());
        }
        return std::nullopt;
    };

    if (auto props_out = shell({"getprop"})) {
        auto props = parseProperties(*props_out);
        auto get = [&](const char* key) -> std::string {
            auto it = props.find(key);
            return (it == props.end() || it->second.empty()) ? "unknown" : it->second;
        };
        rec.model = get("ro.product.model");
        rec.os_version = get("ro.build.version.release");
        rec.architecture = get("ro.product.cpu.abi");
        rec.api_level = static_cast<int>(parseLeadingInt(get("ro.build.version.sdk"), 0));
    }

    if (auto battery = shell({"dumpsys", "battery"})) {
        rec.battery_level = parseBatteryLevel(*battery);
        rec.charging = parseCharging(*battery);
    }

    if (auto mem = shell({"cat", "/proc/meminfo"})) {
        parseMemInfo(*mem, rec.total_memory, rec.available_memory);
    }

    if (auto wm = shell({"wm", "size"})) {
        parseScreenSize(*wm, rec.screen_width, rec.screen_height);
    }
    if (auto density = shell({"wm", "density"})) {
        rec.screen_density = parseDensity(*density);
    }

    if (!cfg_.game_package.empty()) {
        if (auto pkgs = shell({"pm", "list", "packages", cfg_.game_package})) {
            std::istringstream iss(*pkgs);
            std::string line;
            while (std::getline(iss, line)) {
                if (trim(line) == "package:" + cfg_.game_package) {
                    rec.game_installed = true;
                    break;
                }
            }
        }
        if (rec.game_installed) {
            if (auto pkg = shell({"dumpsys", "package", cfg_.game_package})) {
                rec.game_version = parseVersionName(*pkg);
            }
        }
    }
}

std::vector<DeviceRecord> AdbBridge::devices() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::vector<DeviceRecord> out;
    out.reserve(registry_.size());
    for (const auto& [id, rec] : registry_) out.push_back(rec);
    return out;
}

std::optional<DeviceRecord> AdbBridge::device(const std::string& id) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = registry_.find(id);
    if (it == registry_.end()) return std::nullopt;
    return it->second;
}

// =============================================================================
// Connect / disconnect
// =============================================================================

Result<void> AdbBridge::connect(const std::string& id_or_address) {
    if (id_or_address.empty()) {
        return Error("empty device id", ErrorCode::InvalidArgument);
    }

    if (!isNetworkAddress(id_or_address)) {
        // USB and emulator devices are attached implicitly; verify via enumeration
        listDevices();
        auto rec = device(id_or_address);
        if (rec && rec->status == DeviceStatus::Connected) return Ok();
        std::string why = rec ? std::string("device is ") + deviceStatusName(rec->status)
                              : std::string("device not attached");
        return Error(id_or_address + ": " + why, ErrorCode::DeviceUnreachable);
    }

    BridgeResult r;
    try {
        r = runCommand({"connect", id_or_address});
    } catch (const BridgeUnavailable&) {
        throw;
    } catch (const BridgeError& e) {
        return Error(e.what(), e.code());
    }
    std::string text = toLower(r.stdout_data);
    if (r.ok() && text.find("connected") != std::string::npos &&
        text.find("failed") == std::string::npos) {
        RLOG_INFO(TAG, "Connected %s", id_or_address.c_str());
        return Ok();
    }

    std::string raw = trim(r.stdout_data + r.stderr_data);
    RLOG_WARN(TAG, "connect %s failed: %s", id_or_address.c_str(), raw.c_str());
    return Error(raw.empty() ? "connect failed" : raw, ErrorCode::DeviceUnreachable);
}

Result<void> AdbBridge::disconnect(const std::string& id) {
    if (isNetworkAddress(id)) {
        BridgeResult r;
        try {
            r = runCommand({"disconnect", id});
        } catch (const BridgeUnavailable&) {
            throw;
        } catch (const BridgeError& e) {
            return Error(e.what(), e.code());
        }
        if (!r.ok()) {
            return Error(trim(r.stdout_data + r.stderr_data), ErrorCode::CommandFailed);
        }
    }

    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        removed = registry_.erase(id) > 0;
    }
    if (removed && bus_) {
        bus_->publish(EventType::DeviceDisconnected, {{"device_id", id}});
    }
    RLOG_INFO(TAG, "Disconnected %s", id.c_str());
    return Ok();
}

// =============================================================================
// Port discovery
// =============================================================================

bool AdbBridge::tryConnectPort(int port) {
    const std::string addr = "127.0.0.1:" + std::to_string(port);
    try {
        auto r = runCommand({"connect", addr}, std::nullopt,
                            std::chrono::milliseconds(cfg_.scan_timeout_ms));
        return toLower(r.stdout_data).find("connected") != std::string::npos &&
               toLower(r.stdout_data).find("failed") == std::string::npos;
    } catch (const BridgeError& e) {
        RLOG_DEBUG(TAG, "scan connect %s: %s", addr.c_str(), e.what());
    }
    return false;
}

std::vector<int> AdbBridge::scanPortRange(int start, int end, int concurrency) {
    std::lock_guard<std::mutex> scan_lock(scan_mutex_);
    if (start > end || start < 1 || end > 65535) {
        RLOG_WARN(TAG, "invalid scan range %d-%d", start, end);
        return {};
    }

    const int count = end - start + 1;
    const int workers = std::clamp(concurrency, 1, count);
    std::atomic<int> next{start};
    std::mutex found_mutex;
    std::set<int> found;

    RLOG_INFO(TAG, "Scanning ports %d-%d with %d worker(s)", start, end, workers);
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (int i = 0; i < workers; ++i) {
        pool.emplace_back([&] {
            for (int port = next.fetch_add(1); port <= end; port = next.fetch_add(1)) {
                if (tryConnectPort(port)) {
                    std::lock_guard<std::mutex> lk(found_mutex);
                    found.insert(port);
                }
            }
        });
    }
    for (auto& t : pool) t.join();

    std::vector<int> ports(found.begin(), found.end());
    RLOG_INFO(TAG, "Scan finished: %zu responsive port(s)", ports.size());
    return ports;
}

std::vector<DeviceRecord> AdbBridge::autoDiscover() {
    // a successful scan connect leaves the port connected
    auto ports = scanPortRange(cfg_.scan_start, cfg_.scan_end, cfg_.scan_concurrency);
    for (int port : ports) {
        RLOG_INFO(TAG, "Discovered 127.0.0.1:%d", port);
    }
    return listDevices();
}

// =============================================================================
// Server lifecycle
// =============================================================================

Result<void> AdbBridge::startServer() {
    BridgeResult r;
    try {
        r = runCommand({"start-server"});
    } catch (const BridgeUnavailable&) {
        throw;
    } catch (const BridgeError& e) {
        return Error(e.what(), e.code());
    }
    if (!r.ok()) {
        return Error("start-server failed: " + trim(r.stderr_data), ErrorCode::CommandFailed);
    }
    return Ok();
}

Result<void> AdbBridge::restartServer() {
    try {
        auto r = runCommand({"kill-server"});
        if (!r.ok()) RLOG_WARN(TAG, "kill-server: %s", trim(r.stderr_data).c_str());
    } catch (const BridgeUnavailable&) {
        throw;
    } catch (const BridgeError& e) {
        RLOG_WARN(TAG, "kill-server: %s", e.what());
    }
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        registry_.clear();
    }
    return startServer();
}

// =============================================================================
// Parsers
// =============================================================================

std::vector<AdbBridge::DeviceLine> AdbBridge::parseDeviceList(const std::string& output) {
    std::vector<DeviceLine> out;
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        line = trim(line);
        if (line.empty()) continue;
        if (line.find("List of devices") != std::string::npos) continue;
        if (line[0] == '*') continue;  // "* daemon started successfully"

        std::istringstream ls(line);
        DeviceLine d;
        if (!(ls >> d.id >> d.status_token)) continue;

        // mDNS records duplicate a real transport
        if (d.id.rfind("adb-", 0) == 0 && d.id.find("._adb") != std::string::npos) continue;

        std::string field;
        while (ls >> field) {
            if (field.rfind("model:", 0) == 0) {
                d.model_hint = field.substr(6);
                std::replace(d.model_hint.begin(), d.model_hint.end(), '_', ' ');
            }
        }
        out.push_back(std::move(d));
    }
    return out;
}

DeviceStatus AdbBridge::statusFromToken(const std::string& token) {
    if (token == "device") return DeviceStatus::Connected;
    if (token == "offline") return DeviceStatus::Disconnected;
    if (token == "unauthorized") return DeviceStatus::Unauthorized;
    return DeviceStatus::Error;
}

ConnectionKind AdbBridge::inferConnectionKind(const std::string& id) {
    // host:port with a dotted-quad host
    size_t colon = id.find(':');
    if (colon != std::string::npos) {
        std::string host = id.substr(0, colon);
        int octets = 0;
        bool numeric = !host.empty();
        std::istringstream hs(host);
        std::string part;
        while (std::getline(hs, part, '.')) {
            octets++;
            if (part.empty() || part.size() > 3 ||
                !std::all_of(part.begin(), part.end(), [](unsigned char c) { return std::isdigit(c); })) {
                numeric = false;
            }
        }
        if (numeric && octets == 4 && host.back() != '.') return ConnectionKind::Network;
    }
    if (id.find("emulator") != std::string::npos) return ConnectionKind::Emulator;
    return ConnectionKind::USB;
}

std::map<std::string, std::string> AdbBridge::parseProperties(const std::string& output) {
    static const std::regex getprop_line(R"(\[([^\]]+)\]:\s*\[([^\]]*)\])");
    std::map<std::string, std::string> props;
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        std::smatch m;
        if (std::regex_search(line, m, getprop_line)) {
            props[m[1].str()] = m[2].str();
            continue;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = trim(line.substr(0, colon));
        if (key.empty()) continue;
        props[key] = trim(line.substr(colon + 1));
    }
    return props;
}

int AdbBridge::parseBatteryLevel(const std::string& s) {
    // "dumpsys battery" output contains line: "  level: 78"
    auto props = parseProperties(s);
    auto it = props.find("level");
    if (it == props.end()) return -1;
    long v = parseLeadingInt(it->second, -1);
    return (v >= 0 && v <= 100) ? static_cast<int>(v) : -1;
}

bool AdbBridge::parseCharging(const std::string& s) {
    auto props = parseProperties(s);
    for (const char* key : {"AC powered", "USB powered", "Wireless powered"}) {
        auto it = props.find(key);
        if (it != props.end() && it->second == "true") return true;
    }
    return false;
}

bool AdbBridge::parseMemInfo(const std::string& meminfo, uint64_t& total, uint64_t& available) {
    // "MemTotal:        5843576 kB"
    auto props = parseProperties(meminfo);
    auto kb = [&](const char* key) -> long {
        auto it = props.find(key);
        return it == props.end() ? -1 : parseLeadingInt(it->second, -1);
    };
    long t = kb("MemTotal");
    long a = kb("MemAvailable");
    if (t >= 0) total = static_cast<uint64_t>(t) * 1024;
    if (a >= 0) available = static_cast<uint64_t>(a) * 1024;
    return t >= 0;
}

bool AdbBridge::parseScreenSize(const std::string& s, int& w, int& h) {
    // "Physical size: 1080x2400", possibly followed by "Override size: 720x1600"
    auto props = parseProperties(s);
    std::string dims;
    if (props.count("Override size")) dims = props["Override size"];
    else if (props.count("Physical size")) dims = props["Physical size"];
    else dims = trim(s);

    size_t x = dims.find('x');
    if (x == std::string::npos || x == 0) return false;
    long pw = parseLeadingInt(dims.substr(0, x), -1);
    long ph = parseLeadingInt(dims.substr(x + 1), -1);
    if (pw <= 0 || ph <= 0) return false;
    w = static_cast<int>(pw);
    h = static_cast<int>(ph);
    return true;
}

int AdbBridge::parseDensity(const std::string& s) {
    // "Physical density: 480" or "Override density: 420"
    auto props = parseProperties(s);
    const char* key = props.count("Override density") ? "Override density" : "Physical density";
    auto it = props.find(key);
    if (it == props.end()) return 0;
    long v = parseLeadingInt(it->second, 0);
    return v > 0 ? static_cast<int>(v) : 0;
}

std::string AdbBridge::parseVersionName(const std::string& dumpsys_package) {
    static const std::string key = "versionName=";
    size_t pos = dumpsys_package.find(key);
    if (pos == std::string::npos) return "";
    pos += key.size();
    size_t end = pos;
    while (end < dumpsys_package.size() &&
           !std::isspace(static_cast<unsigned char>(dumpsys_package[end]))) {
        end++;
    }
    return dumpsys_package.substr(pos, end - pos);
}

// =============================================================================
// Factory
// =============================================================================

namespace {

bool isExecutable(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

} // anonymous namespace

std::optional<std::string> locateAdbExecutable(const std::string& configured) {
    if (!configured.empty()) {
        if (isExecutable(configured)) return configured;
        RLOG_WARN(TAG, "configured adb_path %s is not executable", configured.c_str());
    }

    if (const char* env = std::getenv("ADB_PATH")) {
        if (isExecutable(env)) return std::string(env);
    }

    if (const char* path = std::getenv("PATH")) {
        std::istringstream ps(path);
        std::string dir;
        while (std::getline(ps, dir, ':')) {
            if (dir.empty()) continue;
            fs::path candidate = fs::path(dir) / "adb";
            if (isExecutable(candidate)) return candidate.string();
        }
    }

    std::vector<fs::path> common;
    for (const char* var : {"ANDROID_HOME", "ANDROID_SDK_ROOT"}) {
        if (const char* root = std::getenv(var)) common.push_back(fs::path(root) / "platform-tools" / "adb");
    }
    if (const char* home = std::getenv("HOME")) {
        common.push_back(fs::path(home) / "Android" / "Sdk" / "platform-tools" / "adb");
    }
    common.push_back("/usr/local/bin/adb");
    common.push_back("/usr/bin/adb");
    common.push_back("/opt/android-sdk/platform-tools/adb");
    for (const auto& p : common) {
        if (isExecutable(p)) return p.string();
    }
    return std::nullopt;
}

std::unique_ptr<DeviceBridge> makeDeviceBridge(ProcessRunner& runner,
                                               const config::BridgeConfig& cfg,
                                               EventBus* bus) {
    auto adb = locateAdbExecutable(cfg.adb_path);
    if (!adb) {
        RLOG_ERROR(TAG, "adb not found; device features disabled");
        return std::make_unique<NullBridge>();
    }
    return std::make_unique<AdbBridge>(runner, cfg, *adb, bus);
}

} // namespace rampart
