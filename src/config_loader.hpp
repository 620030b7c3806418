#pragma once
// =============================================================================
// PhoneBridge Config Loader
// =============================================================================
// Loads settings from phonebridge.json with nlohmann/json.
// Missing file or missing keys fall back to the defaults below; command-line
// flags are applied on top by each executable.
// =============================================================================

#include <string>
#include <fstream>
#include <cstdlib>
#include <cstddef>
#include <sys/stat.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "phonebridge_log.hpp"
#include "rpc_protocol.hpp"

namespace phonebridge {
namespace config {

struct BridgeConfig {
    std::string host = rpc::DEFAULT_HOST;
    int port = rpc::DEFAULT_PORT;
    std::string serial;                 // empty = the only connected device
    std::string adb_path;               // empty = resolve_adb_binary()
    int idle_timeout_ms = 60000;        // 0 disables
    int accept_poll_ms = 500;
    size_t max_line_bytes = rpc::DEFAULT_MAX_LINE_BYTES;
    int command_timeout_ms = 30000;
};

struct ForwardConfig {
    int port = rpc::DEFAULT_PORT;
    int device_port = rpc::DEFAULT_PORT;
    std::string udid;
    int connect_timeout_ms = 2000;
    std::string hostname_suffix = ".coredevice.local";
    int lister_timeout_ms = 5000;
    std::string adb_path;
};

struct ClientConfig {
    std::string host = rpc::DEFAULT_HOST;
    int port = rpc::DEFAULT_PORT;
    int connect_timeout_ms = 5000;
    int read_timeout_ms = 30000;
    size_t max_bytes = rpc::DEFAULT_MAX_LINE_BYTES;
    std::string artifact_dir = "/tmp/phonebridge-artifacts";
};

struct LogConfig {
    std::string log_path;               // empty = stderr only
    std::string level = "info";
};

struct AppConfig {
    BridgeConfig bridge;
    ForwardConfig forward;
    ClientConfig client;
    LogConfig log;
};

// Safe JSON accessor with section/key and default value
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    if (!j.is_object()) return def;
    auto sec = j.find(section);
    if (sec == j.end() || !sec->is_object()) return def;
    auto it = sec->find(key);
    if (it == sec->end() || it->is_null()) return def;
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        PBLOG_WARN("config", "%s.%s has the wrong type (%s), using default",
                   section.c_str(), key.c_str(), e.what());
    }
    return def;
}

// Apply a parsed document on top of the defaults.
inline AppConfig configFromJson(const nlohmann::json& j) {
    AppConfig config;
    const AppConfig d;

    config.bridge.host               = jsonGet<std::string>(j, "bridge", "host", d.bridge.host);
    config.bridge.port               = jsonGet<int>(j, "bridge", "port", d.bridge.port);
    config.bridge.serial             = jsonGet<std::string>(j, "bridge", "serial", d.bridge.serial);
    config.bridge.adb_path           = jsonGet<std::string>(j, "bridge", "adb_path", d.bridge.adb_path);
    config.bridge.idle_timeout_ms    = jsonGet<int>(j, "bridge", "idle_timeout_ms", d.bridge.idle_timeout_ms);
    config.bridge.accept_poll_ms     = jsonGet<int>(j, "bridge", "accept_poll_ms", d.bridge.accept_poll_ms);
    config.bridge.max_line_bytes     = jsonGet<size_t>(j, "bridge", "max_line_bytes", d.bridge.max_line_bytes);
    config.bridge.command_timeout_ms = jsonGet<int>(j, "bridge", "command_timeout_ms", d.bridge.command_timeout_ms);

    config.forward.port               = jsonGet<int>(j, "forward", "port", d.forward.port);
    config.forward.device_port        = jsonGet<int>(j, "forward", "device_port", d.forward.device_port);
    config.forward.udid               = jsonGet<std::string>(j, "forward", "udid", d.forward.udid);
    config.forward.connect_timeout_ms = jsonGet<int>(j, "forward", "connect_timeout_ms", d.forward.connect_timeout_ms);
    config.forward.hostname_suffix    = jsonGet<std::string>(j, "forward", "hostname_suffix", d.forward.hostname_suffix);
    config.forward.lister_timeout_ms  = jsonGet<int>(j, "forward", "lister_timeout_ms", d.forward.lister_timeout_ms);
    config.forward.adb_path           = jsonGet<std::string>(j, "forward", "adb_path", d.forward.adb_path);

    config.client.host               = jsonGet<std::string>(j, "client", "host", d.client.host);
    config.client.port               = jsonGet<int>(j, "client", "port", d.client.port);
    config.client.connect_timeout_ms = jsonGet<int>(j, "client", "connect_timeout_ms", d.client.connect_timeout_ms);
    config.client.read_timeout_ms    = jsonGet<int>(j, "client", "read_timeout_ms", d.client.read_timeout_ms);
    config.client.max_bytes          = jsonGet<size_t>(j, "client", "max_bytes", d.client.max_bytes);
    config.client.artifact_dir       = jsonGet<std::string>(j, "client", "artifact_dir", d.client.artifact_dir);

    config.log.log_path = jsonGet<std::string>(j, "log", "log_path", d.log.log_path);
    config.log.level    = jsonGet<std::string>(j, "log", "level", d.log.level);
    return config;
}

// @param configPath  Path to config file
// @param strict      If true, only try the exact path (no fallback search)
inline AppConfig loadConfig(const std::string& configPath = "phonebridge.json",
                            bool strict = false) {
    std::ifstream file(configPath);
    if (!file.is_open() && !strict) {
        file.open("phonebridge.json");
        if (!file.is_open()) {
            file.open("../phonebridge.json");
        }
    }
    if (!file.is_open()) {
        PBLOG_DEBUG("config", "%s not found, using defaults", configPath.c_str());
        return AppConfig{};
    }

    nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        PBLOG_ERROR("config", "JSON parse error in %s, using defaults", configPath.c_str());
        return AppConfig{};
    }

    AppConfig config = configFromJson(j);
    PBLOG_INFO("config", "Loaded: bridge=%s:%d forward_port=%d client=%s:%d",
               config.bridge.host.c_str(), config.bridge.port,
               config.forward.port,
               config.client.host.c_str(), config.client.port);
    return config;
}

// =============================================================================
// adb resolution
// =============================================================================

inline bool isExecutableFile(const std::string& path) {
    struct stat st;
    if (path.empty() || ::stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

// First executable `name` on PATH, or empty.
inline std::string findOnPath(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return isExecutableFile(name) ? name : std::string();
    }
    const char* path_env = std::getenv("PATH");
    if (!path_env) return "";

    std::string path(path_env);
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();
        std::string dir = path.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (isExecutableFile(candidate)) return candidate;
        start = end + 1;
    }
    return "";
}

/**
 * Locate the adb binary.
 * Order: explicit path, $PHONEBRIDGE_ADB, `adb` on PATH,
 * $ANDROID_HOME/platform-tools, $ANDROID_SDK_ROOT/platform-tools,
 * ~/Library/Android/sdk/platform-tools.
 *
 * @return absolute path, or empty when nothing was found
 */
inline std::string resolveAdbBinary(const std::string& explicit_path = "") {
    if (!explicit_path.empty()) {
        std::string found = findOnPath(explicit_path);
        if (!found.empty()) return found;
        PBLOG_WARN("config", "adb path '%s' is not executable", explicit_path.c_str());
        return "";
    }

    if (const char* env = std::getenv("PHONEBRIDGE_ADB")) {
        std::string found = findOnPath(env);
        if (!found.empty()) return found;
        PBLOG_WARN("config", "PHONEBRIDGE_ADB='%s' is not executable", env);
    }

    std::string on_path = findOnPath("adb");
    if (!on_path.empty()) return on_path;

    for (const char* var : {"ANDROID_HOME", "ANDROID_SDK_ROOT"}) {
        if (const char* root = std::getenv(var)) {
            std::string candidate = std::string(root) + "/platform-tools/adb";
            if (isExecutableFile(candidate)) return candidate;
        }
    }
    if (const char* home = std::getenv("HOME")) {
        std::string candidate = std::string(home) + "/Library/Android/sdk/platform-tools/adb";
        if (isExecutableFile(candidate)) return candidate;
    }
    return "";
}

} // namespace config
} // namespace phonebridge
