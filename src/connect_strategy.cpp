// =============================================================================
// PhoneBridge - Remote Connection Strategies
// =============================================================================

#include "connect_strategy.hpp"
#include "adb_automation.hpp"
#include "adb_security.hpp"
#include "phonebridge_log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include <unistd.h>

namespace phonebridge {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Lower-cased string form of an optional JSON field
std::string lower_field(const nlohmann::json& obj, const char* section, const char* key) {
    const nlohmann::json* node = &obj;
    if (section) {
        auto it = obj.find(section);
        if (it == obj.end() || !it->is_object()) return "";
        node = &*it;
    }
    auto it = node->find(key);
    if (it == node->end() || it->is_null()) return "";
    return to_lower(it->is_string() ? it->get<std::string>() : it->dump());
}

} // anonymous namespace

const char* attemptOutcomeName(AttemptOutcome o) {
    switch (o) {
        case AttemptOutcome::Connected:     return "connected";
        case AttemptOutcome::Unavailable:   return "unavailable";
        case AttemptOutcome::NotFound:      return "not found";
        case AttemptOutcome::ConnectFailed: return "connect failed";
    }
    return "unknown";
}

std::string StrategyAttempt::describe() const {
    std::string s = strategy + ": " + attemptOutcomeName(outcome);
    if (!detail.empty()) s += " (" + detail + ")";
    return s;
}

HostConnector default_host_connector() {
    return [](const std::string& host, int port, int timeout_ms) {
        return net::connect_with_timeout(host, port, timeout_ms);
    };
}

// =============================================================================
// devicectl
// =============================================================================

std::vector<std::string> hostnames_from_devicectl(const nlohmann::json& doc,
                                                  const std::string& device_id,
                                                  const std::string& suffix) {
    std::vector<std::string> out;
    if (!doc.is_object()) return out;
    auto result = doc.find("result");
    if (result == doc.end() || !result->is_object()) return out;
    auto devices = result->find("devices");
    if (devices == result->end() || !devices->is_array()) return out;

    const std::string id = to_lower(device_id);
    for (const auto& dev : *devices) {
        if (!dev.is_object()) continue;

        std::vector<std::string> hostnames;
        auto conn = dev.find("connectionProperties");
        if (conn != dev.end() && conn->is_object()) {
            auto hosts = conn->find("potentialHostnames");
            if (hosts != conn->end() && hosts->is_array()) {
                for (const auto& h : *hosts) {
                    hostnames.push_back(h.is_string() ? h.get<std::string>() : h.dump());
                }
            }
        }

        bool matches = lower_field(dev, nullptr, "identifier") == id ||
                       lower_field(dev, "hardwareProperties", "udid") == id;
        for (const auto& h : hostnames) {
            if (matches) break;
            matches = to_lower(h).find(id) != std::string::npos;
        }
        if (!matches) continue;

        for (const auto& h : hostnames) {
            if (ends_with(h, suffix)) out.push_back(h);
        }
        return out;
    }
    return out;
}

DeviceLister devicectl_lister(CommandRunner runner, int timeout_ms, std::string suffix) {
    return [runner, timeout_ms, suffix](const std::string& device_id) -> std::vector<std::string> {
        std::string tmpdir = "/tmp";
        if (const char* env = std::getenv("TMPDIR")) {
            if (*env) tmpdir = env;
        }
        std::string path = tmpdir + "/phonebridge_devicectl_XXXXXX";
        std::vector<char> templ(path.begin(), path.end());
        templ.push_back('\0');
        int fd = ::mkstemp(templ.data());
        if (fd < 0) {
            PBLOG_DEBUG("forward", "mkstemp failed, skipping devicectl");
            return {};
        }
        ::close(fd);
        path = templ.data();

        // devicectl rejects --timeout below 5 seconds
        int timeout_s = std::max(5, timeout_ms / 1000);
        CommandResult res = runner({"xcrun", "devicectl", "--timeout", std::to_string(timeout_s),
                                    "list", "devices", "--json-output", path},
                                   timeout_s * 1000 + 2000);

        std::vector<std::string> hostnames;
        std::ifstream in(path);
        if (in.is_open()) {
            nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
            if (!doc.is_discarded()) {
                hostnames = hostnames_from_devicectl(doc, device_id, suffix);
            }
        }
        ::unlink(path.c_str());

        PBLOG_DEBUG("forward", "devicectl rc=%d: %zu hostname(s) for %s",
                    res.exit_code, hostnames.size(), device_id.c_str());
        return hostnames;
    };
}

// =============================================================================
// TunnelHostStrategy
// =============================================================================

TunnelHostStrategy::TunnelHostStrategy(std::string suffix, DeviceLister lister,
                                       HostConnector connector)
    : suffix_(std::move(suffix)), lister_(std::move(lister)), connector_(std::move(connector)) {}

std::string TunnelHostStrategy::describe() const {
    return "tunnel hostnames (*" + suffix_ + ")";
}

std::vector<std::string> TunnelHostStrategy::candidates(const std::string& device_id) const {
    std::vector<std::string> raw;
    raw.push_back(ends_with(device_id, suffix_) ? device_id : device_id + suffix_);
    if (lister_) {
        auto listed = lister_(device_id);
        raw.insert(raw.end(), listed.begin(), listed.end());
    }

    std::vector<std::string> out;
    for (auto& h : raw) {
        if (std::find(out.begin(), out.end(), h) == out.end()) out.push_back(h);
    }
    return out;
}

bool TunnelHostStrategy::try_connect(const ForwardTarget& target, RemoteConnection& out,
                                     StrategyAttempt& attempt) {
    attempt.strategy = name();
    std::string reasons;
    for (const auto& host : candidates(target.device_id)) {
        auto sock = connector_(host, target.device_port, target.connect_timeout_ms);
        if (sock.is_ok()) {
            out.socket = std::move(sock).value();
            out.via = "tunnel(" + host + ")";
            attempt.outcome = AttemptOutcome::Connected;
            attempt.detail = host;
            return true;
        }
        if (!reasons.empty()) reasons += "; ";
        reasons += sock.error().message;
    }
    attempt.outcome = AttemptOutcome::ConnectFailed;
    attempt.detail = reasons;
    return false;
}

// =============================================================================
// AdbForwardStrategy
// =============================================================================

AdbForwardStrategy::AdbForwardStrategy(std::string adb_path, CommandRunner runner,
                                       HostConnector connector)
    : adb_path_(std::move(adb_path)), runner_(std::move(runner)), connector_(std::move(connector)) {}

std::string AdbForwardStrategy::describe() const {
    return adb_path_.empty() ? "usb-mux via adb forward (adb not found)"
                             : "usb-mux via adb forward (" + adb_path_ + ")";
}

bool AdbForwardStrategy::try_connect(const ForwardTarget& target, RemoteConnection& out,
                                     StrategyAttempt& attempt) {
    attempt.strategy = name();
    if (adb_path_.empty()) {
        attempt.outcome = AttemptOutcome::Unavailable;
        attempt.detail = "adb not found";
        return false;
    }

    auto devices = list_adb_devices(adb_path_, runner_);
    if (devices.is_err()) {
        attempt.outcome = AttemptOutcome::Unavailable;
        attempt.detail = devices.error().message;
        return false;
    }
    const auto& serials = devices.value();
    if (std::find(serials.begin(), serials.end(), target.device_id) == serials.end() ||
        !security::isValidAdbId(target.device_id)) {
        attempt.outcome = AttemptOutcome::NotFound;
        attempt.detail = "'" + target.device_id + "' is not an attached adb device";
        return false;
    }

    CommandResult fwd = runner_({adb_path_, "-s", target.device_id, "forward", "tcp:0",
                                 "tcp:" + std::to_string(target.device_port)}, 10000);
    int local_port = 0;
    if (fwd.ok()) {
        try {
            local_port = std::stoi(trim(fwd.out));
        } catch (const std::exception&) {
            local_port = 0;
        }
    }
    if (local_port <= 0 || local_port > 65535) {
        attempt.outcome = AttemptOutcome::ConnectFailed;
        attempt.detail = "adb forward failed: " + (fwd.timed_out ? std::string("timed out") : fwd.diagnostic());
        return false;
    }

    std::string adb = adb_path_;
    std::string serial = target.device_id;
    CommandRunner runner = runner_;
    auto remove_forward = [adb, serial, runner, local_port]() {
        CommandResult rm = runner({adb, "-s", serial, "forward", "--remove",
                                   "tcp:" + std::to_string(local_port)}, 10000);
        if (!rm.ok()) {
            PBLOG_DEBUG("forward", "forward --remove tcp:%d: %s", local_port, rm.diagnostic().c_str());
        }
    };

    auto sock = connector_("127.0.0.1", local_port, target.connect_timeout_ms);
    if (sock.is_err()) {
        remove_forward();
        attempt.outcome = AttemptOutcome::ConnectFailed;
        attempt.detail = sock.error().message;
        return false;
    }

    out.socket = std::move(sock).value();
    out.via = "usb-mux(tcp:" + std::to_string(local_port) + ")";
    out.release = remove_forward;
    attempt.outcome = AttemptOutcome::Connected;
    attempt.detail = "tcp:" + std::to_string(local_port);
    return true;
}

// =============================================================================
// ConnectionBroker
// =============================================================================

Result<RemoteConnection> ConnectionBroker::connect(const ForwardTarget& target,
                                                   std::vector<StrategyAttempt>* attempts) {
    std::string summary;
    for (auto& strategy : strategies_) {
        RemoteConnection conn;
        StrategyAttempt attempt;
        bool ok = strategy->try_connect(target, conn, attempt);
        if (attempts) attempts->push_back(attempt);
        if (ok) {
            return Result<RemoteConnection>(std::move(conn));
        }
        if (!summary.empty()) summary += "; ";
        summary += attempt.describe();
    }
    if (summary.empty()) summary = "no strategies configured";
    return transport_error("unable to connect to " + target.device_id + ":" +
                           std::to_string(target.device_port) +
                           " (" + summary + ")");
}

} // namespace phonebridge
