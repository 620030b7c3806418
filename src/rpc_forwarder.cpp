// =============================================================================
// PhoneBridge - Loopback RPC Forwarder
// =============================================================================

#include "rpc_forwarder.hpp"
#include "phonebridge_log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iterator>

#include <poll.h>
#include <sys/socket.h>

namespace phonebridge {

// ---------------------------------------------------------------------------
// Pump
// ---------------------------------------------------------------------------
PumpStats pump_bidirectional(int a, int b, const std::atomic<bool>& stop, int wake_ms) {
    PumpStats stats;
    char buf[65536];

    while (!stop.load()) {
        pollfd fds[2] = {{a, POLLIN, 0}, {b, POLLIN, 0}};
        int pr = ::poll(fds, 2, wake_ms);
        if (pr < 0) {
            if (errno == EINTR) continue;
            PBLOG_WARN("forward", "poll failed: %s", std::strerror(errno));
            break;
        }
        if (pr == 0) continue;

        bool closed = false;
        for (int i = 0; i < 2 && !closed; ++i) {
            if (fds[i].revents == 0) continue;
            int from = fds[i].fd;
            int to = (from == a) ? b : a;

            ssize_t n = ::recv(from, buf, sizeof(buf), 0);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                closed = true;
                break;
            }
            if (!net::write_all(to, buf, static_cast<size_t>(n))) {
                closed = true;
                break;
            }
            if (from == a) stats.local_to_remote += static_cast<size_t>(n);
            else stats.remote_to_local += static_cast<size_t>(n);
        }
        if (closed) break;
    }
    return stats;
}

// ---------------------------------------------------------------------------
// RpcForwarder
// ---------------------------------------------------------------------------
RpcForwarder::RpcForwarder(ConnectionBroker& broker, ForwardTarget target, Options options)
    : broker_(broker), target_(std::move(target)), options_(std::move(options)),
      peer_filter_(&net::is_loopback_address) {}

RpcForwarder::~RpcForwarder() {
    request_stop();
    reap_workers(true);
}

Result<void> RpcForwarder::start() {
    auto listener = net::create_listener(options_.host, options_.port, options_.backlog);
    if (listener.is_err()) {
        PBLOG_ERROR("forward", "%s", listener.error().message.c_str());
        return listener.error();
    }
    listener_ = std::move(listener).value();
    bound_port_ = net::local_port(listener_.get());

    PBLOG_INFO("forward", "Forwarding %s:%d -> <device>:%d (device=%s)",
               options_.host.c_str(), bound_port_, target_.device_port,
               target_.device_id.c_str());
    std::string order;
    for (const auto& s : broker_.strategies()) {
        if (!order.empty()) order += ", then ";
        order += s->describe();
    }
    PBLOG_INFO("forward", "Strategies: %s", order.c_str());
    return Ok();
}

void RpcForwarder::run() {
    if (!listener_) {
        PBLOG_ERROR("forward", "run() called before a successful start()");
        return;
    }

    while (!stop_requested_.load()) {
        auto wait = net::wait_readable(listener_.get(), options_.accept_poll_ms);
        reap_workers(false);
        if (wait == net::WaitResult::Timeout) continue;
        if (wait == net::WaitResult::Error) {
            PBLOG_ERROR("forward", "poll on listener failed: %s", std::strerror(errno));
            break;
        }

        auto accepted = net::accept_peer(listener_.get());
        if (accepted.is_err()) {
            PBLOG_WARN("forward", "%s", accepted.error().message.c_str());
            continue;
        }
        net::AcceptedPeer peer = std::move(accepted).value();
        std::string peer_name = net::format_address(peer.address);

        if (!peer_filter_(peer.address)) {
            PBLOG_WARN("forward", "Rejected non-loopback peer %s", peer_name.c_str());
            peer.socket.reset();
            continue;
        }

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lk(workers_mutex_);
        workers_.push_back(Worker{
            std::thread(&RpcForwarder::handle_client, this,
                        std::move(peer.socket), peer_name, done),
            done});
    }

    listener_.reset();
    reap_workers(true);
    PBLOG_INFO("forward", "Forwarder stopped");
}

void RpcForwarder::reap_workers(bool join_all) {
    std::vector<Worker> finished;
    {
        std::lock_guard<std::mutex> lk(workers_mutex_);
        auto split = std::partition(workers_.begin(), workers_.end(),
            [join_all](const Worker& w) { return !(join_all || w.done->load()); });
        std::move(split, workers_.end(), std::back_inserter(finished));
        workers_.erase(split, workers_.end());
    }
    for (auto& w : finished) {
        if (w.thread.joinable()) w.thread.join();
    }
}

void RpcForwarder::handle_client(net::UniqueSocket client, std::string peer,
                                 std::shared_ptr<std::atomic<bool>> done) {
    std::vector<StrategyAttempt> attempts;
    auto remote = broker_.connect(target_, &attempts);
    if (remote.is_err()) {
        PBLOG_WARN("forward", "drop %s: %s", peer.c_str(), remote.error().message.c_str());
        client.reset();
        done->store(true);
        return;
    }

    RemoteConnection conn = std::move(remote).value();
    PBLOG_INFO("forward", "%s connected via %s", peer.c_str(), conn.via.c_str());

    PumpStats stats = pump_bidirectional(client.get(), conn.socket.get(),
                                         stop_requested_, options_.pump_wake_ms);

    client.reset();
    conn.socket.reset();
    if (conn.release) conn.release();

    PBLOG_INFO("forward", "%s closed (%zu bytes up, %zu bytes down)",
               peer.c_str(), stats.local_to_remote, stats.remote_to_local);
    done->store(true);
}

} // namespace phonebridge
