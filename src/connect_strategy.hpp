#pragma once
// =============================================================================
// PhoneBridge - Remote Connection Strategies
// =============================================================================
// Ways to reach the RPC endpoint on a device, tried in priority order:
//   1. TunnelHostStrategy   <id>.coredevice.local + hostnames from devicectl
//   2. AdbForwardStrategy   adb forward tcp:0 tcp:<device_port> (USB)
//
// Each attempt is classified so a failed resolution can say what was tried:
//   unavailable     tool missing
//   not found       device not listed
//   connect failed  socket error (with reason)
// =============================================================================

#include <string>
#include <vector>
#include <memory>
#include <functional>

#include <nlohmann/json.hpp>

#include "result.hpp"
#include "net_socket.hpp"
#include "process_runner.hpp"

namespace phonebridge {

struct ForwardTarget {
    std::string device_id;
    int device_port = 45678;
    int connect_timeout_ms = 2000;
};

enum class AttemptOutcome { Connected, Unavailable, NotFound, ConnectFailed };

const char* attemptOutcomeName(AttemptOutcome o);

struct StrategyAttempt {
    std::string strategy;
    AttemptOutcome outcome = AttemptOutcome::Unavailable;
    std::string detail;

    // "tunnel: connect failed (x.coredevice.local:45678: timed out)"
    std::string describe() const;
};

struct RemoteConnection {
    net::UniqueSocket socket;
    std::string via;                        // e.g. "tunnel(abc.coredevice.local)"
    std::function<void()> release;          // strategy cleanup, may be empty
};

// Seam for tests: how a host:port becomes a socket
using HostConnector = std::function<Result<net::UniqueSocket>(const std::string& host, int port, int timeout_ms)>;
HostConnector default_host_connector();

class ConnectStrategy {
public:
    virtual ~ConnectStrategy() = default;

    virtual std::string name() const = 0;
    // Human-readable summary for the startup log
    virtual std::string describe() const = 0;

    // On success `out` holds the socket; `attempt` is always filled in.
    virtual bool try_connect(const ForwardTarget& target, RemoteConnection& out,
                             StrategyAttempt& attempt) = 0;
};

// =============================================================================
// Tunnel hostnames
// =============================================================================

// Hostnames reported for a device by the external device lister
using DeviceLister = std::function<std::vector<std::string>(const std::string& device_id)>;

// Parses `devicectl list devices --json-output` content. Matches on identifier,
// hardwareProperties.udid or any potentialHostnames entry containing the id
// (case-insensitive); returns that device's hostnames ending in `suffix`.
std::vector<std::string> hostnames_from_devicectl(const nlohmann::json& doc,
                                                  const std::string& device_id,
                                                  const std::string& suffix);

// Runs `xcrun devicectl --timeout N list devices --json-output <tmp>`.
// Any failure yields an empty list.
DeviceLister devicectl_lister(CommandRunner runner, int timeout_ms,
                              std::string suffix = ".coredevice.local");

class TunnelHostStrategy : public ConnectStrategy {
public:
    TunnelHostStrategy(std::string suffix, DeviceLister lister,
                       HostConnector connector = default_host_connector());

    std::string name() const override { return "tunnel"; }
    std::string describe() const override;
    bool try_connect(const ForwardTarget& target, RemoteConnection& out,
                     StrategyAttempt& attempt) override;

    // Ordered, de-duplicated candidate hostnames for a device
    std::vector<std::string> candidates(const std::string& device_id) const;

private:
    std::string suffix_;
    DeviceLister lister_;
    HostConnector connector_;
};

// =============================================================================
// USB multiplexer (adb forward)
// =============================================================================

class AdbForwardStrategy : public ConnectStrategy {
public:
    // adb_path empty = tool unavailable
    AdbForwardStrategy(std::string adb_path, CommandRunner runner = default_command_runner(),
                       HostConnector connector = default_host_connector());

    std::string name() const override { return "usb-mux"; }
    std::string describe() const override;
    bool try_connect(const ForwardTarget& target, RemoteConnection& out,
                     StrategyAttempt& attempt) override;

private:
    std::string adb_path_;
    CommandRunner runner_;
    HostConnector connector_;
};

// =============================================================================
// Broker: first strategy that connects wins
// =============================================================================

class ConnectionBroker {
public:
    void add_strategy(std::unique_ptr<ConnectStrategy> strategy) {
        strategies_.push_back(std::move(strategy));
    }
    const std::vector<std::unique_ptr<ConnectStrategy>>& strategies() const { return strategies_; }

    // TransportError listing every attempt when nothing connected
    Result<RemoteConnection> connect(const ForwardTarget& target,
                                     std::vector<StrategyAttempt>* attempts = nullptr);

private:
    std::vector<std::unique_ptr<ConnectStrategy>> strategies_;
};

} // namespace phonebridge
