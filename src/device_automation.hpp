#pragma once
// =============================================================================
// PhoneBridge - Device Automation Interface
// =============================================================================
// Everything the dispatcher needs from a device. Implementations own all tool
// invocation and tool-output parsing; failures come back as ToolError with
// the tool's diagnostic text.
// =============================================================================

#include <string>

#include "result.hpp"

namespace phonebridge {

struct ScreenSize {
    int width = 0;
    int height = 0;
};

class DeviceAutomation {
public:
    virtual ~DeviceAutomation() = default;

    // Raw uiautomator XML
    virtual Result<std::string> capture_hierarchy() = 0;
    // PNG bytes
    virtual Result<std::string> capture_screen_image() = 0;

    virtual Result<void> send_tap(int x, int y) = 0;
    virtual Result<void> send_swipe(int x1, int y1, int x2, int y2, int duration_ms) = 0;
    // One already-chunked piece of text (unescaped)
    virtual Result<void> send_text(const std::string& chunk) = 0;
    virtual Result<void> send_key_event(int key_code) = 0;

    virtual Result<ScreenSize> query_screen_size() = 0;
    // Package name of the focused app; empty when it cannot be determined
    virtual Result<std::string> query_foreground_app() = 0;

    // Launchable component ("pkg/.Activity") for a package; empty when none
    virtual Result<std::string> resolve_launch_target(const std::string& package) = 0;
    virtual Result<void> launch_component(const std::string& component) = 0;
    // Generic launcher-intent start
    virtual Result<void> launch_package(const std::string& package) = 0;
};

} // namespace phonebridge
