#pragma once
// =============================================================================
// PhoneBridge - Bridge Listener
// =============================================================================
// Loopback TCP server speaking the newline-delimited JSON protocol.
// One thread per connection, one Session per connection, requests on a
// connection handled strictly in order.
//
// Lifecycle: Starting -> Accepting -> Draining -> Stopped
//   start()         bind + listen, prints the PHONEBRIDGE_RPC_READY line
//   run()           accept loop; returns once every connection is joined
//   request_stop()  also triggered by a dispatched `stop` (after its response)
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
#include "rpc_protocol.hpp"
#include "automation_dispatcher.hpp"

namespace phonebridge {

class BridgeServer {
public:
    enum class State { Starting, Accepting, Draining, Stopped };

    struct Options {
        std::string host = rpc::DEFAULT_HOST;
        int port = rpc::DEFAULT_PORT;       // 0 = ephemeral (tests)
        std::string serial;                 // reported in the ready line only
        int idle_timeout_ms = 60000;        // 0 disables
        int accept_poll_ms = 500;
        int read_poll_ms = 200;             // how often a reader checks the stop flag
        size_t max_line_bytes = rpc::DEFAULT_MAX_LINE_BYTES;
        int backlog = 64;
    };

    // Decides whether an accepted peer may talk to us. Default: loopback only.
    using PeerFilter = std::function<bool(const sockaddr_storage&)>;

    BridgeServer(AutomationDispatcher& dispatcher, Options options);
    ~BridgeServer();

    BridgeServer(const BridgeServer&) = delete;
    BridgeServer& operator=(const BridgeServer&) = delete;

    Result<void> start();
    void run();
    void request_stop() { stop_requested_.store(true); }

    State state() const { return state_.load(); }
    bool stop_requested() const { return stop_requested_.load(); }
    int port() const { return bound_port_; }
    int active_connections() const;

    void set_peer_filter(PeerFilter filter) { peer_filter_ = std::move(filter); }

    // One request line → one encoded response line. Sets `stop` when the
    // dispatched method asked the listener to shut down.
    std::string handle_line(const std::string& line, Session& session, bool& stop);

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void handle_connection(net::UniqueSocket sock, std::string peer,
                           std::shared_ptr<std::atomic<bool>> done);
    void reap_workers(bool join_all);

    AutomationDispatcher& dispatcher_;
    Options options_;
    PeerFilter peer_filter_;

    net::UniqueSocket listener_;
    int bound_port_ = 0;

    std::atomic<State> state_{State::Starting};
    std::atomic<bool> stop_requested_{false};

    mutable std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};

const char* bridgeStateName(BridgeServer::State s);

} // namespace phonebridge
