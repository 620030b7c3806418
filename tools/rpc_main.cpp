// =============================================================================
// phonebridge_rpc - command-line client for the bridge
// =============================================================================
// Usage:
//   phonebridge_rpc [global options] <command> [args]
//
// Global options:
//   --host H  --port P  --connect-timeout S  --read-timeout S  --max-bytes N
//   --pretty  --config FILE  --log-level L
//
// Commands:
//   call <method> [--params JSON] [--id N] [--print json|result|tree]
//   get-tree | get-context | get-screen-image [--print-metadata]
//   open-app <id> | tap <x> <y> | scroll <x> <y> <dx> <dy> | swipe <x> <y> <dir>
//   tap-element --coordinate C [--count N] [--long-press]
//   enter-text --coordinate C --text T
//   stop | repl [--print json|result|tree]
// =============================================================================

#include "phonebridge_log.hpp"
#include "config_loader.hpp"
#include "rpc_client.hpp"
#include "rpc_protocol.hpp"

#include <cmath>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace phonebridge;

namespace {

void printUsage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [--host H] [--port P] [--connect-timeout S] [--read-timeout S]\n"
        "          [--max-bytes N] [--pretty] [--config FILE] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  call <method> [--params JSON] [--id N] [--print json|result|tree]\n"
        "  get-tree [--id N]\n"
        "  get-context [--id N]             (writes the screenshot to the artifact dir)\n"
        "  get-screen-image [--id N] [--print-metadata]\n"
        "  open-app <bundle_or_package> [--id N]\n"
        "  tap <x> <y> [--id N]\n"
        "  tap-element --coordinate C [--count N] [--long-press] [--id N]\n"
        "  enter-text --coordinate C --text T [--id N]\n"
        "  scroll <x> <y> <dx> <dy> [--id N]\n"
        "  swipe <x> <y> up|down|left|right [--id N]\n"
        "  stop [--id N]\n"
        "  repl [--print json|result|tree]\n", prog);
}

// Flags that take a value; everything else starting with "--" is a switch
const char* const kValueFlags[] = {
    "--host", "--port", "--connect-timeout", "--read-timeout", "--max-bytes",
    "--config", "--log-level", "--params", "--id", "--print", "--coordinate",
    "--count", "--text",
};
const char* const kSwitches[] = { "--pretty", "--print-metadata", "--long-press" };

struct CommandLine {
    std::vector<std::string> positional;        // command first
    std::map<std::string, std::string> values;
    std::map<std::string, bool> switches;

    bool has(const std::string& flag) const { return values.count(flag) != 0; }
    bool on(const std::string& flag) const { return switches.count(flag) != 0; }
    std::string get(const std::string& flag, const std::string& def = "") const {
        auto it = values.find(flag);
        return it == values.end() ? def : it->second;
    }
};

bool isOneOf(const char* arg, const char* const* list, size_t n) {
    for (size_t i = 0; i < n; ++i) {
        if (std::strcmp(arg, list[i]) == 0) return true;
    }
    return false;
}

Result<CommandLine> parseCommandLine(int argc, char* argv[]) {
    CommandLine cl;
    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        if (isOneOf(a, kValueFlags, sizeof(kValueFlags) / sizeof(kValueFlags[0]))) {
            if (i + 1 >= argc) return validation_error(std::string(a) + " requires a value");
            cl.values[a] = argv[++i];
        } else if (isOneOf(a, kSwitches, sizeof(kSwitches) / sizeof(kSwitches[0]))) {
            cl.switches[a] = true;
        } else if (std::strncmp(a, "--", 2) == 0 && a[2] != '\0') {
            return validation_error(std::string("unknown option: ") + a);
        } else {
            // Negative numbers ("-120") are positional
            cl.positional.push_back(a);
        }
    }
    return cl;
}

Result<double> parseNumber(const std::string& text, const char* what) {
    char* end = nullptr;
    double v = std::strtod(text.c_str(), &end);
    if (text.empty() || !end || *end != '\0' || !std::isfinite(v)) {
        return validation_error(std::string("invalid ") + what + ": '" + text + "'");
    }
    return v;
}

Result<long long> parseInteger(const std::string& text, const char* what) {
    char* end = nullptr;
    long long v = std::strtoll(text.c_str(), &end, 10);
    if (text.empty() || !end || *end != '\0') {
        return validation_error(std::string("invalid ") + what + ": '" + text + "'");
    }
    return v;
}

// JSON number: integral values stay integers on the wire
json numberParam(double v) {
    if (std::nearbyint(v) == v && std::fabs(v) < 9.0e15) {
        return json(static_cast<long long>(v));
    }
    return json(v);
}

// =============================================================================
// Command runner
// =============================================================================

class Cli {
public:
    Cli(RpcClient::Options options, std::string artifact_dir, bool pretty)
        : client_(std::move(options)), artifact_dir_(std::move(artifact_dir)), pretty_(pretty) {}

    int run(const CommandLine& cl);

private:
    // Sends one request; prints transport problems and returns nullopt
    std::optional<json> send(long long id, const std::string& method, json params);

    // Prints "RPC error: ..." and returns 1 when the envelope is an error
    int ensureOk(const json& envelope);

    int treeCommand(long long id, const std::string& method, json params);
    int cmdCall(const CommandLine& cl, long long id);
    int cmdGetContext(long long id);
    int cmdGetScreenImage(long long id, bool print_metadata);
    int cmdStop(long long id);
    int cmdRepl(PrintMode mode);

    void print(const std::string& text) {
        std::fwrite(text.data(), 1, text.size(), stdout);
        std::fputc('\n', stdout);
        std::fflush(stdout);
    }

    RpcClient client_;
    std::string artifact_dir_;
    bool pretty_;
};

std::optional<json> Cli::send(long long id, const std::string& method, json params) {
    rpc::Request req;
    req.id = id;
    req.method = method;
    req.params = std::move(params);

    auto resp = client_.call_envelope(req);
    if (resp.is_err()) {
        std::fprintf(stderr, "RPC client error: %s\n", resp.error().message.c_str());
        return std::nullopt;
    }
    return std::move(resp).value();
}

int Cli::ensureOk(const json& envelope) {
    auto err = extract_error(envelope);
    if (!err) return 0;
    std::fprintf(stderr, "RPC error: %s\n", err->c_str());
    return 1;
}

int Cli::treeCommand(long long id, const std::string& method, json params) {
    auto resp = send(id, method, std::move(params));
    if (!resp) return 1;
    print(render_response(*resp, PrintMode::Tree, pretty_));
    return ensureOk(*resp);
}

int Cli::cmdCall(const CommandLine& cl, long long id) {
    if (cl.positional.size() != 2) {
        std::fprintf(stderr, "call requires exactly one <method>\n");
        return 2;
    }
    auto mode = parse_print_mode(cl.get("--print", "json"));
    if (!mode) {
        std::fprintf(stderr, "Unknown --print mode: %s\n", cl.get("--print").c_str());
        return 2;
    }
    auto params = parse_params_object(cl.get("--params"));
    if (params.is_err()) {
        std::fprintf(stderr, "%s\n", params.error().message.c_str());
        return 2;
    }

    auto resp = send(id, cl.positional[1], std::move(params).value());
    if (!resp) return 1;
    print(render_response(*resp, *mode, pretty_));
    return ensureOk(*resp);
}

int Cli::cmdGetContext(long long id) {
    auto resp = send(id, "get_context", json::object());
    if (!resp) return 1;

    auto result = resp->find("result");
    if (result != resp->end() && result->is_object()) {
        auto b64 = result->find("screenshot_base64");
        if (b64 != result->end() && b64->is_string()) {
            auto path = save_screenshot(artifact_dir_, "context", std::to_string(id),
                                        b64->get<std::string>());
            if (path.is_err()) {
                std::fprintf(stderr, "RPC client error: %s\n", path.error().message.c_str());
                return 1;
            }
            std::fprintf(stderr, "Wrote screenshot: %s\n", path.value().c_str());
        }
    }
    print(render_response(*resp, PrintMode::Tree, pretty_));
    return ensureOk(*resp);
}

int Cli::cmdGetScreenImage(long long id, bool print_metadata) {
    auto resp = send(id, "get_screen_image", json::object());
    if (!resp) return 1;

    auto result = resp->find("result");
    if (result == resp->end() || !result->is_object()) {
        print(render_response(*resp, PrintMode::Json, pretty_));
        return ensureOk(*resp);
    }

    auto b64 = result->find("screenshot_base64");
    if (b64 == result->end() || !b64->is_string()) {
        std::fprintf(stderr, "RPC response missing result.screenshot_base64\n");
        return 1;
    }
    auto path = save_screenshot(artifact_dir_, "screen", std::to_string(id), b64->get<std::string>());
    if (path.is_err()) {
        std::fprintf(stderr, "RPC client error: %s\n", path.error().message.c_str());
        return 1;
    }
    std::fprintf(stderr, "Wrote screenshot: %s\n", path.value().c_str());

    if (print_metadata) {
        auto meta = result->find("metadata");
        print(meta == result->end() ? json().dump() : meta->dump(pretty_ ? 2 : -1));
    }
    return ensureOk(*resp);
}

int Cli::cmdStop(long long id) {
    auto resp = send(id, "stop", json::object());
    if (!resp) return 1;
    print(render_response(*resp, PrintMode::Json, pretty_));
    return ensureOk(*resp);
}

int Cli::cmdRepl(PrintMode mode) {
    std::fprintf(stderr, "PhoneBridge RPC REPL. Enter: <method> [<json_params_object>]. "
                         "Use 'quit' to exit.\n");
    long long req_id = 1;
    std::string line;
    for (;;) {
        std::fprintf(stderr, "> ");
        std::fflush(stderr);
        if (!std::getline(std::cin, line)) break;

        size_t start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos) continue;
        size_t end = line.find_last_not_of(" \t\r");
        line = line.substr(start, end - start + 1);
        if (line == "quit" || line == "exit") break;

        size_t split = line.find_first_of(" \t");
        std::string method = line.substr(0, split);
        auto params = parse_params_object(split == std::string::npos ? "" : line.substr(split + 1));
        if (params.is_err()) {
            std::fprintf(stderr, "%s\n", params.error().message.c_str());
            continue;
        }

        rpc::Request req;
        req.id = req_id;
        req.method = method;
        req.params = std::move(params).value();
        auto resp = client_.call_envelope(req);
        if (resp.is_err()) {
            std::fprintf(stderr, "RPC failed: %s\n", resp.error().message.c_str());
            continue;
        }

        print(render_response(resp.value(), mode, pretty_));
        ensureOk(resp.value());
        ++req_id;
    }
    return 0;
}

int Cli::run(const CommandLine& cl) {
    const std::string& cmd = cl.positional[0];
    const size_t nargs = cl.positional.size() - 1;

    auto id_arg = parseInteger(cl.get("--id", "1"), "--id");
    if (id_arg.is_err()) {
        std::fprintf(stderr, "%s\n", id_arg.error().message.c_str());
        return 2;
    }
    const long long id = id_arg.value();

    auto expectArgs = [&](size_t n, const char* usage) {
        if (nargs == n) return true;
        std::fprintf(stderr, "usage: %s\n", usage);
        return false;
    };
    auto numbers = [&](std::vector<double>& out, const char* const* names) {
        for (size_t i = 0; i < out.size(); ++i) {
            auto v = parseNumber(cl.positional[i + 1], names[i]);
            if (v.is_err()) {
                std::fprintf(stderr, "%s\n", v.error().message.c_str());
                return false;
            }
            out[i] = v.value();
        }
        return true;
    };

    if (cmd == "call") return cmdCall(cl, id);

    if (cmd == "get-tree") {
        if (!expectArgs(0, "get-tree [--id N]")) return 2;
        return treeCommand(id, "get_tree", json::object());
    }
    if (cmd == "get-context") {
        if (!expectArgs(0, "get-context [--id N]")) return 2;
        return cmdGetContext(id);
    }
    if (cmd == "get-screen-image") {
        if (!expectArgs(0, "get-screen-image [--id N] [--print-metadata]")) return 2;
        return cmdGetScreenImage(id, cl.on("--print-metadata"));
    }
    if (cmd == "open-app") {
        if (!expectArgs(1, "open-app <bundle_or_package> [--id N]")) return 2;
        return treeCommand(id, "open_app", json{{"bundle_identifier", cl.positional[1]}});
    }
    if (cmd == "tap") {
        if (!expectArgs(2, "tap <x> <y> [--id N]")) return 2;
        static const char* const names[] = {"x", "y"};
        std::vector<double> v(2);
        if (!numbers(v, names)) return 2;
        return treeCommand(id, "tap", json{{"x", numberParam(v[0])}, {"y", numberParam(v[1])}});
    }
    if (cmd == "tap-element") {
        if (!expectArgs(0, "tap-element --coordinate C [--count N] [--long-press]")) return 2;
        if (!cl.has("--coordinate")) {
            std::fprintf(stderr, "tap-element requires --coordinate\n");
            return 2;
        }
        json params = {{"coordinate", cl.get("--coordinate")}};
        if (cl.has("--count")) {
            auto count = parseInteger(cl.get("--count"), "--count");
            if (count.is_err()) {
                std::fprintf(stderr, "%s\n", count.error().message.c_str());
                return 2;
            }
            params["count"] = count.value();
        }
        if (cl.on("--long-press")) params["longPress"] = true;
        return treeCommand(id, "tap_element", std::move(params));
    }
    if (cmd == "enter-text") {
        if (!expectArgs(0, "enter-text --coordinate C --text T")) return 2;
        if (!cl.has("--coordinate") || !cl.has("--text")) {
            std::fprintf(stderr, "enter-text requires --coordinate and --text\n");
            return 2;
        }
        return treeCommand(id, "enter_text",
                           json{{"coordinate", cl.get("--coordinate")}, {"text", cl.get("--text")}});
    }
    if (cmd == "scroll") {
        if (!expectArgs(4, "scroll <x> <y> <dx> <dy> [--id N]")) return 2;
        static const char* const names[] = {"x", "y", "distance_x", "distance_y"};
        std::vector<double> v(4);
        if (!numbers(v, names)) return 2;
        return treeCommand(id, "scroll", json{{"x", numberParam(v[0])}, {"y", numberParam(v[1])},
                                              {"distanceX", numberParam(v[2])},
                                              {"distanceY", numberParam(v[3])}});
    }
    if (cmd == "swipe") {
        if (!expectArgs(3, "swipe <x> <y> up|down|left|right [--id N]")) return 2;
        static const char* const names[] = {"x", "y"};
        std::vector<double> v(2);
        if (!numbers(v, names)) return 2;
        const std::string& dir = cl.positional[3];
        if (dir != "up" && dir != "down" && dir != "left" && dir != "right") {
            std::fprintf(stderr, "invalid direction '%s' (choose from up, down, left, right)\n",
                         dir.c_str());
            return 2;
        }
        return treeCommand(id, "swipe", json{{"x", numberParam(v[0])}, {"y", numberParam(v[1])},
                                             {"direction", dir}});
    }
    if (cmd == "stop") {
        if (!expectArgs(0, "stop [--id N]")) return 2;
        return cmdStop(id);
    }
    if (cmd == "repl") {
        auto mode = parse_print_mode(cl.get("--print", "tree"));
        if (!mode) {
            std::fprintf(stderr, "Unknown --print mode: %s\n", cl.get("--print").c_str());
            return 2;
        }
        return cmdRepl(*mode);
    }

    std::fprintf(stderr, "unknown command: %s\n", cmd.c_str());
    return 2;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::signal(SIGPIPE, SIG_IGN);

    auto parsed = parseCommandLine(argc, argv);
    if (parsed.is_err()) {
        std::fprintf(stderr, "%s\n", parsed.error().message.c_str());
        printUsage(argv[0]);
        return 2;
    }
    CommandLine cl = std::move(parsed).value();
    if (cl.positional.empty() || cl.positional[0] == "help") {
        printUsage(argv[0]);
        return cl.positional.empty() ? 2 : 0;
    }

    // The client logs to stderr only, quietly unless asked
    log::setLogLevel(log::parseLevel(cl.get("--log-level", "warn")));
    config::AppConfig cfg = cl.has("--config") ? config::loadConfig(cl.get("--config"), true)
                                               : config::loadConfig();

    RpcClient::Options opts;
    opts.host = cl.get("--host", cfg.client.host);
    opts.connect_timeout_ms = cfg.client.connect_timeout_ms;
    opts.read_timeout_ms = cfg.client.read_timeout_ms;
    opts.max_bytes = cfg.client.max_bytes;
    opts.port = cfg.client.port;

    try {
        if (cl.has("--port")) {
            opts.port = std::stoi(cl.get("--port"));
        }
        if (cl.has("--connect-timeout")) {
            opts.connect_timeout_ms = static_cast<int>(std::lround(std::stod(cl.get("--connect-timeout")) * 1000.0));
        }
        if (cl.has("--read-timeout")) {
            opts.read_timeout_ms = static_cast<int>(std::lround(std::stod(cl.get("--read-timeout")) * 1000.0));
        }
        if (cl.has("--max-bytes")) {
            opts.max_bytes = static_cast<size_t>(std::stoull(cl.get("--max-bytes")));
        }
    } catch (const std::exception& e) {
        std::fprintf(stderr, "invalid numeric option: %s\n", e.what());
        return 2;
    }
    if (opts.port <= 0 || opts.port > 65535 || opts.connect_timeout_ms <= 0 ||
        opts.read_timeout_ms <= 0 || opts.max_bytes == 0) {
        std::fprintf(stderr, "port, timeouts and --max-bytes must be positive\n");
        return 2;
    }

    try {
        Cli cli(opts, cfg.client.artifact_dir, cl.on("--pretty"));
        return cli.run(cl);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "RPC client error: %s\n", e.what());
        return 1;
    }
}
