// =============================================================================
// PhoneBridge - ADB Device Automation
// =============================================================================

#include "adb_automation.hpp"
#include "adb_security.hpp"
#include "screen_image.hpp"
#include "phonebridge_log.hpp"

#include <algorithm>
#include <regex>
#include <sstream>

namespace phonebridge {

namespace {

// Per-command timeouts (ms)
static constexpr int TIMEOUT_WM_SIZE      = 8000;
static constexpr int TIMEOUT_UI_DUMP      = 12000;
static constexpr int TIMEOUT_SCREENCAP    = 15000;
static constexpr int TIMEOUT_INPUT_TAP    = 8000;
static constexpr int TIMEOUT_INPUT_SWIPE  = 10000;
static constexpr int TIMEOUT_INPUT_TEXT   = 10000;
static constexpr int TIMEOUT_KEYEVENT     = 8000;
static constexpr int TIMEOUT_DUMPSYS      = 12000;
static constexpr int TIMEOUT_RESOLVE      = 10000;
static constexpr int TIMEOUT_LAUNCH       = 12000;

static constexpr const char* UI_DUMP_PATH = "/sdcard/window_dump.xml";

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

} // anonymous namespace

// =============================================================================
// Parsing
// =============================================================================
namespace adb_parse {

Result<ScreenSize> screen_size(const std::string& output) {
    static const std::regex size_regex(R"((\d+)\s*x\s*(\d+))");
    std::smatch m;
    if (!std::regex_search(output, m, size_regex)) {
        return tool_error("failed to read screen size from: '" + trim(output) + "'");
    }
    try {
        ScreenSize size;
        size.width = std::stoi(m[1].str());
        size.height = std::stoi(m[2].str());
        return size;
    } catch (const std::exception&) {
        return tool_error("failed to read screen size from: '" + trim(output) + "'");
    }
}

std::string foreground_package(const std::string& output) {
    static const std::regex focus_regex(R"(mCurrentFocus=.*? ([A-Za-z0-9_.]+)/)");
    static const std::regex app_regex(R"(mFocusedApp=.*? ([A-Za-z0-9_.]+)/)");

    // dumpsys output is large; only lines carrying the key are searched
    auto search = [&output](const char* key, const std::regex& re) -> std::string {
        for (const auto& line : split_lines(output)) {
            if (line.find(key) == std::string::npos) continue;
            std::smatch m;
            if (std::regex_search(line, m, re)) return m[1].str();
        }
        return "";
    };

    std::string pkg = search("mCurrentFocus=", focus_regex);
    if (pkg.empty()) pkg = search("mFocusedApp=", app_regex);
    return pkg;
}

std::string launch_component(const std::string& output) {
    auto lines = split_lines(output);
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        std::string line = trim(*it);
        if (!line.empty() && line.find('/') != std::string::npos) return line;
    }
    return "";
}

std::vector<std::string> device_serials(const std::string& output) {
    std::vector<std::string> serials;
    auto lines = split_lines(output);
    // first line is "List of devices attached"
    for (size_t i = 1; i < lines.size(); ++i) {
        std::istringstream iss(trim(lines[i]));
        std::string serial, state;
        if (!(iss >> serial >> state)) continue;
        if (state == "device") serials.push_back(serial);
    }
    return serials;
}

} // namespace adb_parse

// =============================================================================
// AdbAutomation
// =============================================================================

AdbAutomation::AdbAutomation(Options options, CommandRunner runner)
    : options_(std::move(options)), runner_(std::move(runner)) {}

Result<CommandResult> AdbAutomation::adb(const std::vector<std::string>& args,
                                         int timeout_ms, bool check) {
    std::vector<std::string> argv{options_.adb_path, "-s", options_.serial};
    argv.insert(argv.end(), args.begin(), args.end());

    if (options_.command_timeout_ms > 0) {
        timeout_ms = timeout_ms > 0 ? std::min(timeout_ms, options_.command_timeout_ms)
                                    : options_.command_timeout_ms;
    }
    CommandResult res = runner_(argv, timeout_ms);

    if (res.timed_out) {
        PBLOG_WARN("adb", "timeout: %s", format_command(argv).c_str());
        return tool_error("adb command timed out after " + std::to_string(timeout_ms) +
                          "ms (" + format_command(argv) + ")");
    }
    if (check && res.exit_code != 0) {
        std::string detail = res.diagnostic();
        if (detail.empty()) detail = "exit=" + std::to_string(res.exit_code);
        PBLOG_WARN("adb", "rc=%d: %s", res.exit_code, format_command(argv).c_str());
        return tool_error("adb command failed (" + format_command(argv) + "): " + detail);
    }
    return res;
}

Result<std::string> AdbAutomation::capture_hierarchy() {
    auto dump = adb({"shell", "uiautomator", "dump", UI_DUMP_PATH}, TIMEOUT_UI_DUMP);
    if (dump.is_err()) return dump.error();

    auto cat = adb({"exec-out", "cat", UI_DUMP_PATH}, TIMEOUT_UI_DUMP);
    if (cat.is_err()) return cat.error();

    const std::string& raw = cat.value().out;
    size_t decl = raw.find("<?xml");
    std::string xml = (decl == std::string::npos) ? raw : raw.substr(decl);
    if (xml.find("<hierarchy") == std::string::npos) {
        return tool_error("uiautomator dump did not return XML hierarchy");
    }
    return trim(xml);
}

Result<std::string> AdbAutomation::capture_screen_image() {
    auto cap = adb({"exec-out", "screencap", "-p"}, TIMEOUT_SCREENCAP);
    if (cap.is_err()) return cap.error();

    std::string png = std::move(cap.value().out);
    if (!image::is_png(png)) {
        return tool_error("device screencap did not return PNG bytes");
    }
    return png;
}

Result<void> AdbAutomation::send_tap(int x, int y) {
    auto r = adb({"shell", "input", "tap", std::to_string(x), std::to_string(y)}, TIMEOUT_INPUT_TAP);
    if (r.is_err()) return r.error();
    return Ok();
}

Result<void> AdbAutomation::send_swipe(int x1, int y1, int x2, int y2, int duration_ms) {
    auto r = adb({"shell", "input", "swipe",
                  std::to_string(x1), std::to_string(y1),
                  std::to_string(x2), std::to_string(y2),
                  std::to_string(duration_ms)}, TIMEOUT_INPUT_SWIPE);
    if (r.is_err()) return r.error();
    return Ok();
}

Result<void> AdbAutomation::send_text(const std::string& chunk) {
    std::string escaped = security::escapeInputText(chunk);
    if (escaped.empty()) return Ok();
    auto r = adb({"shell", "input", "text", escaped}, TIMEOUT_INPUT_TEXT);
    if (r.is_err()) return r.error();
    return Ok();
}

Result<void> AdbAutomation::send_key_event(int key_code) {
    auto r = adb({"shell", "input", "keyevent", std::to_string(key_code)}, TIMEOUT_KEYEVENT);
    if (r.is_err()) return r.error();
    return Ok();
}

Result<ScreenSize> AdbAutomation::query_screen_size() {
    auto r = adb({"shell", "wm", "size"}, TIMEOUT_WM_SIZE);
    if (r.is_err()) return r.error();
    return adb_parse::screen_size(r.value().out);
}

Result<std::string> AdbAutomation::query_foreground_app() {
    auto r = adb({"shell", "dumpsys", "window", "windows"}, TIMEOUT_DUMPSYS, false);
    if (r.is_err()) return r.error();
    return adb_parse::foreground_package(r.value().out);
}

Result<std::string> AdbAutomation::resolve_launch_target(const std::string& package) {
    if (!security::isValidPackageName(package)) {
        return validation_error("bundle_identifier '" + package + "' is not a valid Android package name");
    }
    auto r = adb({"shell", "cmd", "package", "resolve-activity", "--brief", package},
                 TIMEOUT_RESOLVE, false);
    if (r.is_err()) return r.error();
    if (r.value().exit_code != 0) {
        PBLOG_DEBUG("adb", "resolve-activity %s rc=%d", package.c_str(), r.value().exit_code);
        return std::string();
    }
    return adb_parse::launch_component(r.value().out);
}

Result<void> AdbAutomation::launch_component(const std::string& component) {
    auto r = adb({"shell", "am", "start", "-W", "-n", component}, TIMEOUT_LAUNCH, false);
    if (r.is_err()) return r.error();

    const CommandResult& res = r.value();
    std::string output = res.out + "\n" + res.err;
    if (res.exit_code != 0 || output.find("Error:") != std::string::npos) {
        return tool_error("failed to start '" + component + "': " + trim(output));
    }
    return Ok();
}

Result<void> AdbAutomation::launch_package(const std::string& package) {
    if (!security::isValidPackageName(package)) {
        return validation_error("bundle_identifier '" + package + "' is not a valid Android package name");
    }
    auto r = adb({"shell", "monkey", "-p", package,
                  "-c", "android.intent.category.LAUNCHER", "1"}, TIMEOUT_LAUNCH, false);
    if (r.is_err()) return r.error();

    const CommandResult& res = r.value();
    std::string output = res.out + "\n" + res.err;
    if (res.exit_code != 0 || output.find("No activities found to run") != std::string::npos) {
        return tool_error("failed to open app '" + package + "': " + trim(output));
    }
    return Ok();
}

// =============================================================================
// Device selection
// =============================================================================

Result<std::vector<std::string>> list_adb_devices(const std::string& adb_path,
                                                  const CommandRunner& runner,
                                                  int timeout_ms) {
    CommandResult res = runner({adb_path, "devices"}, timeout_ms);
    if (!res.ok()) {
        std::string detail = res.timed_out ? "timed out" : res.diagnostic();
        if (detail.empty()) detail = "exit=" + std::to_string(res.exit_code);
        return tool_error("adb devices failed: " + detail);
    }
    return adb_parse::device_serials(res.out);
}

Result<std::string> select_adb_device(const std::string& adb_path,
                                      const std::string& requested_serial,
                                      const CommandRunner& runner) {
    std::string serial = requested_serial;
    if (serial.empty()) {
        auto devices = list_adb_devices(adb_path, runner);
        if (devices.is_err()) return devices.error();

        const auto& list = devices.value();
        if (list.empty()) {
            return tool_error("No adb devices found. Start an emulator or connect a device, then retry.");
        }
        if (list.size() > 1) {
            std::string joined;
            for (const auto& s : list) {
                if (!joined.empty()) joined += ", ";
                joined += s;
            }
            return tool_error("Multiple adb devices found (" + joined + "). Re-run with --serial.");
        }
        serial = list.front();
    }

    if (!security::isValidAdbId(serial)) {
        return validation_error("invalid adb serial '" + serial + "'");
    }

    CommandResult probe = runner({adb_path, "-s", serial, "get-state"}, 10000);
    if (probe.exit_code != 0 || trim(probe.out) != "device") {
        std::string detail = trim(probe.err);
        if (detail.empty()) detail = trim(probe.out);
        return tool_error("adb device '" + serial + "' is not ready: " + detail);
    }
    PBLOG_INFO("adb", "Using device %s", serial.c_str());
    return serial;
}

} // namespace phonebridge
