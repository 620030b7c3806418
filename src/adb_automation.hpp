#pragma once
// =============================================================================
// PhoneBridge - ADB Device Automation
// =============================================================================
// DeviceAutomation over `adb -s <serial> ...`:
//   hierarchy   shell uiautomator dump + exec-out cat
//   screenshot  exec-out screencap -p
//   input       shell input tap/swipe/text/keyevent
//   queries     shell wm size, shell dumpsys window windows
//   launch      cmd package resolve-activity / am start -W / monkey
// =============================================================================

#include <string>
#include <vector>

#include "device_automation.hpp"
#include "process_runner.hpp"

namespace phonebridge {

class AdbAutomation : public DeviceAutomation {
public:
    struct Options {
        std::string adb_path = "adb";
        std::string serial;
        // Ceiling for every adb call; <= 0 keeps the per-command timeouts
        int command_timeout_ms = 30000;
    };

    AdbAutomation(Options options, CommandRunner runner = default_command_runner());

    Result<std::string> capture_hierarchy() override;
    Result<std::string> capture_screen_image() override;

    Result<void> send_tap(int x, int y) override;
    Result<void> send_swipe(int x1, int y1, int x2, int y2, int duration_ms) override;
    Result<void> send_text(const std::string& chunk) override;
    Result<void> send_key_event(int key_code) override;

    Result<ScreenSize> query_screen_size() override;
    Result<std::string> query_foreground_app() override;

    Result<std::string> resolve_launch_target(const std::string& package) override;
    Result<void> launch_component(const std::string& component) override;
    Result<void> launch_package(const std::string& package) override;

    const std::string& serial() const { return options_.serial; }

private:
    // Runs adb -s <serial> args...; with check=true a non-zero exit is a ToolError
    Result<CommandResult> adb(const std::vector<std::string>& args, int timeout_ms, bool check = true);

    Options options_;
    CommandRunner runner_;
};

// =============================================================================
// Tool-output parsing (exposed for tests)
// =============================================================================
namespace adb_parse {

// "Physical size: 1080x2400" → {1080, 2400}
Result<ScreenSize> screen_size(const std::string& wm_size_output);

// mCurrentFocus first, then mFocusedApp; empty when neither matches
std::string foreground_package(const std::string& dumpsys_output);

// Last non-empty line containing '/', trimmed; empty when none
std::string launch_component(const std::string& resolve_activity_output);

// Serials in state "device" from `adb devices`
std::vector<std::string> device_serials(const std::string& adb_devices_output);

} // namespace adb_parse

// `adb devices` → serials that are ready
Result<std::vector<std::string>> list_adb_devices(const std::string& adb_path,
                                                  const CommandRunner& runner,
                                                  int timeout_ms = 10000);

// Chooses the serial the bridge drives: the given one, else the only
// connected device. Then requires `get-state` == "device".
Result<std::string> select_adb_device(const std::string& adb_path,
                                      const std::string& requested_serial,
                                      const CommandRunner& runner);

} // namespace phonebridge
