// =============================================================================
// PhoneBridge - POSIX Socket Helpers
// =============================================================================

#include "net_socket.hpp"
#include "phonebridge_log.hpp"

#include <chrono>
#include <memory>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <unistd.h>

namespace phonebridge::net {

namespace {

std::string errno_text(int err) {
    return std::strerror(err);
}

bool set_nonblocking(int fd, bool on) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    flags = on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(fd, F_SETFL, flags) == 0;
}

struct AddrInfoDeleter {
    void operator()(addrinfo* ai) const { if (ai) ::freeaddrinfo(ai); }
};

Result<std::unique_ptr<addrinfo, AddrInfoDeleter>> resolve(const std::string& host, int port, bool passive) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    if (passive) hints.ai_flags = AI_PASSIVE;

    addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        return transport_error("cannot resolve '" + host + "': " + ::gai_strerror(rc));
    }
    return std::unique_ptr<addrinfo, AddrInfoDeleter>(res);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// UniqueSocket
// ---------------------------------------------------------------------------
void UniqueSocket::reset(int fd) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
}

// ---------------------------------------------------------------------------
// Listener
// ---------------------------------------------------------------------------
Result<UniqueSocket> create_listener(const std::string& host, int port, int backlog) {
    auto addrs = resolve(host, port, true);
    if (addrs.is_err()) return addrs.error();

    std::string last_error = "no usable address";
    for (addrinfo* ai = addrs.value().get(); ai != nullptr; ai = ai->ai_next) {
        UniqueSocket sock(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
        if (!sock) {
            last_error = "socket: " + errno_text(errno);
            continue;
        }

        int opt = 1;
        ::setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        if (::bind(sock.get(), ai->ai_addr, ai->ai_addrlen) != 0) {
            last_error = "bind: " + errno_text(errno);
            continue;
        }
        if (::listen(sock.get(), backlog) != 0) {
            last_error = "listen: " + errno_text(errno);
            continue;
        }
        return Result<UniqueSocket>(std::move(sock));
    }
    return transport_error("cannot listen on " + host + ":" + std::to_string(port) + " (" + last_error + ")");
}

int local_port(int fd) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) return -1;
    if (addr.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
    }
    return -1;
}

Result<AcceptedPeer> accept_peer(int listen_fd) {
    AcceptedPeer peer;
    socklen_t len = sizeof(peer.address);
    int fd;
    do {
        fd = ::accept4(listen_fd, reinterpret_cast<sockaddr*>(&peer.address), &len, SOCK_CLOEXEC);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        return transport_error("accept: " + errno_text(errno));
    }
    peer.socket.reset(fd);
    return Result<AcceptedPeer>(std::move(peer));
}

// ---------------------------------------------------------------------------
// Connect
// ---------------------------------------------------------------------------
Result<UniqueSocket> connect_with_timeout(const std::string& host, int port, int timeout_ms) {
    auto addrs = resolve(host, port, false);
    if (addrs.is_err()) return addrs.error();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::string last_error = "no usable address";

    for (addrinfo* ai = addrs.value().get(); ai != nullptr; ai = ai->ai_next) {
        UniqueSocket sock(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
        if (!sock) {
            last_error = "socket: " + errno_text(errno);
            continue;
        }
        set_nonblocking(sock.get(), true);

        int rc = ::connect(sock.get(), ai->ai_addr, ai->ai_addrlen);
        if (rc != 0 && errno != EINPROGRESS) {
            last_error = errno_text(errno);
            continue;
        }

        if (rc != 0) {
            int remaining = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count());
            if (remaining <= 0) {
                last_error = "timed out";
                break;
            }

            pollfd pfd{sock.get(), POLLOUT, 0};
            int pr;
            do {
                pr = ::poll(&pfd, 1, remaining);
            } while (pr < 0 && errno == EINTR);

            if (pr == 0) {
                last_error = "timed out";
                continue;
            }
            if (pr < 0) {
                last_error = "poll: " + errno_text(errno);
                continue;
            }

            int so_error = 0;
            socklen_t len = sizeof(so_error);
            ::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &so_error, &len);
            if (so_error != 0) {
                last_error = errno_text(so_error);
                continue;
            }
        }

        set_nonblocking(sock.get(), false);
        int nodelay = 1;
        ::setsockopt(sock.get(), IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
        return Result<UniqueSocket>(std::move(sock));
    }
    return transport_error(host + ":" + std::to_string(port) + ": " + last_error);
}

// ---------------------------------------------------------------------------
// I/O
// ---------------------------------------------------------------------------
WaitResult wait_readable(int fd, int timeout_ms) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    for (;;) {
        pollfd pfd{fd, POLLIN, 0};
        int pr = ::poll(&pfd, 1, timeout_ms);
        if (pr > 0) return WaitResult::Ready;   // POLLHUP/POLLERR surface on the next read
        if (pr == 0) return WaitResult::Timeout;
        if (errno != EINTR) return WaitResult::Error;

        timeout_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count());
        if (timeout_ms <= 0) return WaitResult::Timeout;
    }
}

bool write_all(int fd, const char* data, size_t len) {
    size_t total = 0;
    while (total < len) {
        ssize_t sent = ::send(fd, data + total, len - total, MSG_NOSIGNAL);
        if (sent < 0 && errno == EINTR) continue;
        if (sent <= 0) return false;
        total += static_cast<size_t>(sent);
    }
    return true;
}

// ---------------------------------------------------------------------------
// Origin
// ---------------------------------------------------------------------------
bool is_loopback_address(const sockaddr_storage& addr) {
    if (addr.ss_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
        return (ntohl(in->sin_addr.s_addr) >> 24) == 127;
    }
    if (addr.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        if (IN6_IS_ADDR_LOOPBACK(&in6->sin6_addr)) return true;
        if (IN6_IS_ADDR_V4MAPPED(&in6->sin6_addr)) {
            return in6->sin6_addr.s6_addr[12] == 127;
        }
    }
    return false;
}

std::string format_address(const sockaddr_storage& addr) {
    char host[INET6_ADDRSTRLEN] = {0};
    if (addr.ss_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
        ::inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
        return std::string(host) + ":" + std::to_string(ntohs(in->sin_port));
    }
    if (addr.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        ::inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        return "[" + std::string(host) + "]:" + std::to_string(ntohs(in6->sin6_port));
    }
    return "<unknown>";
}

} // namespace phonebridge::net
