// =============================================================================
// phonebridge_forward - loopback forwarder to a device-side bridge
// =============================================================================
// Usage:
//   phonebridge_forward --udid ID [--port P] [--device-port P]
//                       [--connect-timeout SECONDS] [--config FILE] [--log-file FILE]
//
// Listens on 127.0.0.1:<port>; each connection is paired with a fresh remote
// connection (tunnel hostnames first, then adb forward).
// =============================================================================

#include "phonebridge_log.hpp"
#include "config_loader.hpp"
#include "process_runner.hpp"
#include "connect_strategy.hpp"
#include "rpc_forwarder.hpp"

#include <cmath>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

namespace {

phonebridge::RpcForwarder* g_forwarder = nullptr;

void onSignal(int) {
    if (g_forwarder) g_forwarder->request_stop();
}

void printUsage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s --udid ID [--port P] [--device-port P] [--connect-timeout SECONDS]\n"
        "          [--config FILE] [--log-file FILE]\n"
        "          [--log-level trace|debug|info|warn|error]\n", prog);
}

struct Args {
    std::string config_path = "phonebridge.json";
    bool config_explicit = false;
    std::string udid, log_file, log_level;
    int port = -1;
    int device_port = -1;
    int connect_timeout_ms = -1;
};

bool parsePort(const char* text, int& out) {
    char* end = nullptr;
    long v = std::strtol(text, &end, 10);
    if (!end || *end != '\0' || end == text || v < 0 || v > 65535) return false;
    out = static_cast<int>(v);
    return true;
}

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
        if (std::strcmp(a, "--udid") == 0) {
            if (!(v = next(a))) return 2;
            args.udid = v;
        } else if (std::strcmp(a, "--port") == 0) {
            if (!(v = next(a))) return 2;
            if (!parsePort(v, args.port)) {
                std::fprintf(stderr, "invalid --port: %s\n", v);
                return 2;
            }
        } else if (std::strcmp(a, "--device-port") == 0) {
            if (!(v = next(a))) return 2;
            if (!parsePort(v, args.device_port) || args.device_port == 0) {
                std::fprintf(stderr, "invalid --device-port: %s\n", v);
                return 2;
            }
        } else if (std::strcmp(a, "--connect-timeout") == 0) {
            if (!(v = next(a))) return 2;
            char* end = nullptr;
            double secs = std::strtod(v, &end);
            if (!end || *end != '\0' || end == v || !(secs > 0.0) || secs > 3600.0) {
                std::fprintf(stderr, "invalid --connect-timeout: %s\n", v);
                return 2;
            }
            args.connect_timeout_ms = static_cast<int>(std::lround(secs * 1000.0));
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

    config::ForwardConfig& fc = cfg.forward;
    if (!args.udid.empty()) fc.udid = args.udid;
    if (args.port >= 0) fc.port = args.port;
    if (args.device_port > 0) fc.device_port = args.device_port;
    if (args.connect_timeout_ms > 0) fc.connect_timeout_ms = args.connect_timeout_ms;

    if (fc.udid.empty()) {
        std::fprintf(stderr, "--udid is required\n");
        printUsage(argv[0]);
        log::closeLogFile();
        return 2;
    }

    int exit_code = 0;
    try {
        CommandRunner runner = default_command_runner();

        ConnectionBroker broker;
        broker.add_strategy(std::make_unique<TunnelHostStrategy>(
            fc.hostname_suffix,
            devicectl_lister(runner, fc.lister_timeout_ms, fc.hostname_suffix)));
        // An empty path keeps the strategy listed but reports it unavailable
        broker.add_strategy(std::make_unique<AdbForwardStrategy>(
            config::resolveAdbBinary(fc.adb_path), runner));

        ForwardTarget target;
        target.device_id = fc.udid;
        target.device_port = fc.device_port;
        target.connect_timeout_ms = fc.connect_timeout_ms;

        RpcForwarder::Options fwd_opts;
        fwd_opts.port = fc.port;
        RpcForwarder forwarder(broker, target, fwd_opts);

        auto started = forwarder.start();
        if (started.is_err()) {
            log::closeLogFile();
            return 1;
        }

        g_forwarder = &forwarder;
        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);
        std::signal(SIGPIPE, SIG_IGN);

        forwarder.run();
        g_forwarder = nullptr;
    } catch (const std::exception& e) {
        g_forwarder = nullptr;
        PBLOG_FATAL("main", "%s", e.what());
        exit_code = 1;
    }

    log::closeLogFile();
    return exit_code;
}
