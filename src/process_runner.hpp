#pragma once
// =============================================================================
// PhoneBridge - External Process Execution
// =============================================================================
// Runs a tool (adb, xcrun) with an argument vector, no shell in between.
// stdout is captured byte-for-byte (screencap returns PNG data).
// =============================================================================

#include <string>
#include <vector>
#include <functional>

namespace phonebridge {

static constexpr int EXIT_CODE_TIMEOUT = 124;
static constexpr int EXIT_CODE_SPAWN_FAILED = 127;

struct CommandResult {
    int exit_code = -1;
    std::string out;
    std::string err;
    bool timed_out = false;

    bool ok() const { return exit_code == 0 && !timed_out; }

    // stderr if present, otherwise stdout (trimmed); used in error messages
    std::string diagnostic() const;
};

/**
 * Run argv[0] with arguments, wait up to timeout_ms.
 * On timeout the process group gets SIGTERM, then SIGKILL after 200ms,
 * and exit_code is EXIT_CODE_TIMEOUT. timeout_ms <= 0 waits forever.
 */
CommandResult run_command(const std::vector<std::string>& argv, int timeout_ms);

// Injection point for everything that shells out (tests substitute a mock).
using CommandRunner = std::function<CommandResult(const std::vector<std::string>& argv, int timeout_ms)>;

inline CommandRunner default_command_runner() {
    return [](const std::vector<std::string>& argv, int timeout_ms) {
        return run_command(argv, timeout_ms);
    };
}

// Shell-style rendering of argv, for log lines only.
std::string format_command(const std::vector<std::string>& argv);

} // namespace phonebridge
