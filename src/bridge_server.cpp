// =============================================================================
// PhoneBridge - Bridge Listener
// =============================================================================

#include "bridge_server.hpp"
#include "phonebridge_log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iterator>

#include <sys/socket.h>
#include <unistd.h>

namespace phonebridge {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

} // anonymous namespace

const char* bridgeStateName(BridgeServer::State s) {
    switch (s) {
        case BridgeServer::State::Starting:  return "starting";
        case BridgeServer::State::Accepting: return "accepting";
        case BridgeServer::State::Draining:  return "draining";
        case BridgeServer::State::Stopped:   return "stopped";
    }
    return "unknown";
}

BridgeServer::BridgeServer(AutomationDispatcher& dispatcher, Options options)
    : dispatcher_(dispatcher), options_(std::move(options)),
      peer_filter_(&net::is_loopback_address) {}

BridgeServer::~BridgeServer() {
    request_stop();
    reap_workers(true);
}

int BridgeServer::active_connections() const {
    std::lock_guard<std::mutex> lk(workers_mutex_);
    return static_cast<int>(std::count_if(workers_.begin(), workers_.end(),
        [](const Worker& w) { return !w.done->load(); }));
}

// ---------------------------------------------------------------------------
// Start / accept loop
// ---------------------------------------------------------------------------
Result<void> BridgeServer::start() {
    auto listener = net::create_listener(options_.host, options_.port, options_.backlog);
    if (listener.is_err()) {
        PBLOG_ERROR("bridge", "%s", listener.error().message.c_str());
        return listener.error();
    }
    listener_ = std::move(listener).value();
    bound_port_ = net::local_port(listener_.get());
    state_ = State::Accepting;

    PBLOG_INFO("bridge", "Listening on %s:%d", options_.host.c_str(), bound_port_);
    std::fprintf(stdout, "PHONEBRIDGE_RPC_READY platform=android serial=%s host=%s port=%d\n",
                 options_.serial.c_str(), options_.host.c_str(), bound_port_);
    std::fflush(stdout);
    return Ok();
}

void BridgeServer::run() {
    if (!listener_) {
        PBLOG_ERROR("bridge", "run() called before a successful start()");
        state_ = State::Stopped;
        return;
    }

    while (!stop_requested_.load()) {
        auto wait = net::wait_readable(listener_.get(), options_.accept_poll_ms);
        reap_workers(false);
        if (wait == net::WaitResult::Timeout) continue;
        if (wait == net::WaitResult::Error) {
            PBLOG_ERROR("bridge", "poll on listener failed: %s", std::strerror(errno));
            break;
        }

        auto accepted = net::accept_peer(listener_.get());
        if (accepted.is_err()) {
            if (!stop_requested_.load()) {
                PBLOG_WARN("bridge", "%s", accepted.error().message.c_str());
            }
            continue;
        }
        net::AcceptedPeer peer = std::move(accepted).value();
        std::string peer_name = net::format_address(peer.address);

        if (!peer_filter_(peer.address)) {
            // Closed without reading or writing a byte
            PBLOG_WARN("bridge", "Rejected non-loopback peer %s", peer_name.c_str());
            peer.socket.reset();
            continue;
        }

        PBLOG_INFO("bridge", "Client connected (%s)", peer_name.c_str());
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lk(workers_mutex_);
        workers_.push_back(Worker{
            std::thread(&BridgeServer::handle_connection, this,
                        std::move(peer.socket), peer_name, done),
            done});
    }

    state_ = State::Draining;
    listener_.reset();
    PBLOG_INFO("bridge", "Draining %d connection(s)", active_connections());
    reap_workers(true);
    state_ = State::Stopped;
    PBLOG_INFO("bridge", "Bridge stopped");
}

void BridgeServer::reap_workers(bool join_all) {
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

// ---------------------------------------------------------------------------
// Per-connection loop: read, split lines, dispatch, respond
// ---------------------------------------------------------------------------
void BridgeServer::handle_connection(net::UniqueSocket sock, std::string peer,
                                     std::shared_ptr<std::atomic<bool>> done) {
    rpc::LineBuffer buffer(options_.max_line_bytes);
    Session session;
    char recv_buf[65536];
    int idle_ms = 0;
    bool open = true;

    while (open && !stop_requested_.load()) {
        auto wait = net::wait_readable(sock.get(), options_.read_poll_ms);
        if (wait == net::WaitResult::Timeout) {
            idle_ms += options_.read_poll_ms;
            if (options_.idle_timeout_ms > 0 && idle_ms >= options_.idle_timeout_ms) {
                PBLOG_INFO("bridge", "Idle timeout (%dms), closing %s",
                           options_.idle_timeout_ms, peer.c_str());
                break;
            }
            continue;
        }
        if (wait == net::WaitResult::Error) break;

        ssize_t n = ::recv(sock.get(), recv_buf, sizeof(recv_buf), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;   // peer closed; any partial line is discarded
        idle_ms = 0;
        buffer.append(recv_buf, static_cast<size_t>(n));

        // Every complete line is answered, even after a stop; the outer loop
        // then exits without another recv.
        while (auto raw = buffer.next_line()) {
            std::string line = trim(*raw);
            if (line.empty()) continue;

            bool stop = false;
            std::string response = handle_line(line, session, stop);
            if (!net::write_all(sock.get(), response)) {
                open = false;
                break;
            }
            if (stop) {
                // Response is on the wire before the flag flips
                PBLOG_INFO("bridge", "stop requested by %s", peer.c_str());
                request_stop();
            }
        }

        if (open && buffer.overflowed()) {
            PBLOG_WARN("bridge", "Request line from %s exceeds %zu bytes, closing",
                       peer.c_str(), options_.max_line_bytes);
            auto resp = rpc::Response::failure(nullptr,
                "Request line exceeds " + std::to_string(options_.max_line_bytes) + " bytes");
            if (!net::write_all(sock.get(), rpc::encode_response(resp))) {
                PBLOG_DEBUG("bridge", "%s went away before the overflow error", peer.c_str());
            }
            break;
        }
    }

    sock.reset();
    PBLOG_INFO("bridge", "Client disconnected (%s)", peer.c_str());
    done->store(true);
}

// ---------------------------------------------------------------------------
// Single line → single response
// ---------------------------------------------------------------------------
std::string BridgeServer::handle_line(const std::string& line, Session& session, bool& stop) {
    stop = false;

    auto decoded = rpc::decode_request(line);
    if (decoded.is_err()) {
        const auto& failure = decoded.error();
        PBLOG_DEBUG("bridge", "framing error: %s", failure.message.c_str());
        return rpc::encode_response(rpc::Response::failure(failure.id, failure.message));
    }

    const rpc::Request& req = decoded.value();
    PBLOG_INFO("bridge", "RPC: method=%s id=%s", req.method.c_str(), req.id.dump().c_str());

    try {
        auto outcome = dispatcher_.dispatch(req.method, req.params, session);
        if (outcome.is_err()) {
            return rpc::encode_response(rpc::Response::failure(req.id, outcome.error().message));
        }
        stop = outcome.value().stop;
        return rpc::encode_response(rpc::Response::success(req.id, outcome.value().result));
    } catch (const std::exception& e) {
        PBLOG_ERROR("bridge", "%s raised: %s", req.method.c_str(), e.what());
        return rpc::encode_response(rpc::Response::failure(req.id, std::string("Internal error: ") + e.what()));
    }
}

} // namespace phonebridge
