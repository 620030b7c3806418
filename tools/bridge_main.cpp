// =============================================================================
// phonebridge_server - Android device bridge
// =============================================================================
// Usage:
//   phonebridge_server [--host H] [--port P] [--serial S] [--adb-binary PATH]
//                      [--config FILE] [--log-file FILE] [--idle-timeout-ms N]
//
// Prints PHONEBRIDGE_RPC_READY on stdout once listening; stops on SIGINT,
// SIGTERM or the `stop` RPC.
// =============================================================================

#include "phonebridge_log.hpp"
#include "config_loader.hpp"
#include "process_runner.hpp"
#include "adb_automation.hpp"
#include "automation_dispatcher.hpp"
#include "bridge_server.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace {

phonebridge::BridgeServer* g_server = nullptr;

void onSignal(int) {
    if (g_server) g_server->request_stop();
}

void printUsage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [--host H] [--port P] [--serial S] [--adb-binary PATH]\n"
        "          [--config FILE] [--log-file FILE] [--idle-timeout-ms N]\n"
        "          [--log-level trace|debug|info|warn|error]\n", prog);
}

struct Args {
    std::string config_path = "phonebridge.json";
    bool config_explicit = false;
    std::string host, serial, adb_binary, log_file, log_level;
    int port = -1;
    int idle_timeout_ms = -1;
};

bool parseInt(const char* text, int& out) {
    char* end = nullptr;
    long v = std::strtol(text, &end, 10);
    if (!end || *end != '\0' || end == text || v < 0 || v > 0x7fffffff) return false;
    out = static_cast<int>(v);
    return true;
}

// Returns 0 to continue, otherwise the process exit code
int parseArgs(int argc, char* argv[], Args& args) {
    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        auto next = [&](const char* flag) -> const char* {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "%s requires a value\n", flag);
                return nullptr;
            }
            return argv[++i];
        };

        if (std::strcmp(a, "-h") == 0 || std::strcmp(a, "--help") == 0) {
            printUsage(argv[0]);
            return -1;
        }

        const char* v = nullptr;
        if (std::strcmp(a, "--host") == 0) {
            if (!(v = next(a))) return 2;
            args.host = v;
        } else if (std::strcmp(a, "--port") == 0) {
            if (!(v = next(a))) return 2;
            if (!parseInt(v, args.port) || args.port > 65535) {
                std::fprintf(stderr, "invalid --port: %s\n", v);
                return 2;
            }
        } else if (std::strcmp(a, "--serial") == 0) {
            if (!(v = next(a))) return 2;
            args.serial = v;
        } else if (std::strcmp(a, "--adb-binary") == 0) {
            if (!(v = next(a))) return 2;
            args.adb_binary = v;
        } else if (std::strcmp(a, "--config") == 0) {
            if (!(v = next(a))) return 2;
            args.config_path = v;
            args.config_explicit = true;
        } else if (std::strcmp(a, "--log-file") == 0) {
            if (!(v = next(a))) return 2;
            args.log_file = v;
        } else if (std::strcmp(a, "--log-level") == 0) {
            if (!(v = next(a))) return 2;
            args.log_level = v;
        } else if (std::strcmp(a, "--idle-timeout-ms") == 0) {
            if (!(v = next(a))) return 2;
            if (!parseInt(v, args.idle_timeout_ms)) {
                std::fprintf(stderr, "invalid --idle-timeout-ms: %s\n", v);
                return 2;
            }
        } else {
            std::fprintf(stderr, "unknown argument: %s\n", a);
            printUsage(argv[0]);
            return 2;
        }
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace phonebridge;

    Args args;
    int rc = parseArgs(argc, argv, args);
    if (rc < 0) return 0;
    if (rc != 0) return rc;

    config::AppConfig cfg = config::loadConfig(args.config_path, args.config_explicit);

    std::string log_path = args.log_file.empty() ? cfg.log.log_path : args.log_file;
    if (!log_path.empty() && !log::openLogFile(log_path.c_str())) {
        PBLOG_WARN("main", "cannot open log file %s", log_path.c_str());
    }
    log::setLogLevel(log::parseLevel(args.log_level.empty() ? cfg.log.level : args.log_level));

    config::BridgeConfig& bc = cfg.bridge;
    if (!args.host.empty()) bc.host = args.host;
    if (args.port >= 0) bc.port = args.port;
    if (!args.serial.empty()) bc.serial = args.serial;
    if (!args.adb_binary.empty()) bc.adb_path = args.adb_binary;
    if (args.idle_timeout_ms >= 0) bc.idle_timeout_ms = args.idle_timeout_ms;

    int exit_code = 0;
    try {
        std::string adb = config::resolveAdbBinary(bc.adb_path);
        if (adb.empty()) {
            PBLOG_ERROR("main", "adb not found. Install Android platform-tools, add adb to "
                                "PATH, or pass --adb-binary.");
            log::closeLogFile();
            return 1;
        }

        CommandRunner runner = default_command_runner();
        auto serial = select_adb_device(adb, bc.serial, runner);
        if (serial.is_err()) {
            PBLOG_ERROR("main", "%s", serial.error().message.c_str());
            log::closeLogFile();
            return 1;
        }

        AdbAutomation::Options adb_opts;
        adb_opts.adb_path = adb;
        adb_opts.serial = serial.value();
        adb_opts.command_timeout_ms = bc.command_timeout_ms;
        AdbAutomation device(adb_opts, runner);

        AutomationDispatcher dispatcher(device);

        BridgeServer::Options srv_opts;
        srv_opts.host = bc.host;
        srv_opts.port = bc.port;
        srv_opts.serial = serial.value();
        srv_opts.idle_timeout_ms = bc.idle_timeout_ms;
        srv_opts.accept_poll_ms = bc.accept_poll_ms;
        srv_opts.max_line_bytes = bc.max_line_bytes;
        BridgeServer server(dispatcher, srv_opts);

        auto started = server.start();
        if (started.is_err()) {
            log::closeLogFile();
            return 1;
        }

        g_server = &server;
        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);
        std::signal(SIGPIPE, SIG_IGN);

        server.run();
        g_server = nullptr;
    } catch (const std::exception& e) {
        g_server = nullptr;
        PBLOG_FATAL("main", "%s", e.what());
        exit_code = 1;
    }

    PBLOG_INFO("main", "phonebridge_server exiting");
    log::closeLogFile();
    return exit_code;
}
