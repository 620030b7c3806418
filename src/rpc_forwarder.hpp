#pragma once
// =============================================================================
// PhoneBridge - Loopback RPC Forwarder
// =============================================================================
// Binds 127.0.0.1:<port>. Every local connection gets its own remote
// connection from the ConnectionBroker, then bytes are pumped both ways until
// either side closes. A failed resolution closes only that local connection.
// =============================================================================

#include <string>
#include <thread>
#include <atomic>
#include <mutex>
#include <memory>
#include <vector>
#include <functional>

#include <sys/socket.h>

#include "result.hpp"
#include "net_socket.hpp"
#include "connect_strategy.hpp"

namespace phonebridge {

struct PumpStats {
    size_t local_to_remote = 0;
    size_t remote_to_local = 0;
};

// Relays between two connected sockets with poll(). Returns when either
// side reaches EOF/error or `stop` becomes true (checked every wake_ms).
PumpStats pump_bidirectional(int a, int b, const std::atomic<bool>& stop, int wake_ms = 1000);

class RpcForwarder {
public:
    struct Options {
        std::string host = "127.0.0.1";
        int port = 45678;                   // 0 = ephemeral (tests)
        int accept_poll_ms = 500;
        int pump_wake_ms = 1000;
        int backlog = 64;
    };

    using PeerFilter = std::function<bool(const sockaddr_storage&)>;

    RpcForwarder(ConnectionBroker& broker, ForwardTarget target, Options options);
    ~RpcForwarder();

    RpcForwarder(const RpcForwarder&) = delete;
    RpcForwarder& operator=(const RpcForwarder&) = delete;

    Result<void> start();
    void run();
    void request_stop() { stop_requested_.store(true); }

    int port() const { return bound_port_; }
    void set_peer_filter(PeerFilter filter) { peer_filter_ = std::move(filter); }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void handle_client(net::UniqueSocket client, std::string peer,
                       std::shared_ptr<std::atomic<bool>> done);
    void reap_workers(bool join_all);

    ConnectionBroker& broker_;
    ForwardTarget target_;
    Options options_;
    PeerFilter peer_filter_;

    net::UniqueSocket listener_;
    int bound_port_ = 0;
    std::atomic<bool> stop_requested_{false};

    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};

} // namespace phonebridge
