#pragma once
// =============================================================================
// PhoneBridge - POSIX Socket Helpers
// =============================================================================
// RAII socket handle plus the handful of operations both listeners and the
// client share: loopback listener, connect with timeout, full write,
// bounded-wait readability, peer origin check.
// =============================================================================

#include <string>
#include <cstddef>

#include <sys/socket.h>

#include "result.hpp"

namespace phonebridge::net {

class UniqueSocket {
public:
    UniqueSocket() = default;
    explicit UniqueSocket(int fd) : fd_(fd) {}
    ~UniqueSocket() { reset(); }

    UniqueSocket(const UniqueSocket&) = delete;
    UniqueSocket& operator=(const UniqueSocket&) = delete;
    UniqueSocket(UniqueSocket&& other) noexcept : fd_(other.release()) {}
    UniqueSocket& operator=(UniqueSocket&& other) noexcept {
        if (this != &other) reset(other.release());
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    explicit operator bool() const { return valid(); }

    int release() { int fd = fd_; fd_ = -1; return fd; }
    void reset(int fd = -1);

private:
    int fd_ = -1;
};

enum class WaitResult { Ready, Timeout, Error };

// Bind + listen on host:port (port 0 = ephemeral). SO_REUSEADDR set.
Result<UniqueSocket> create_listener(const std::string& host, int port, int backlog = 64);

// Port actually bound (for ephemeral listeners)
int local_port(int fd);

// Non-blocking connect bounded by timeout_ms; returned socket is blocking again.
Result<UniqueSocket> connect_with_timeout(const std::string& host, int port, int timeout_ms);

// poll() for POLLIN; EINTR is retried with the remaining time
WaitResult wait_readable(int fd, int timeout_ms);

// Writes everything (MSG_NOSIGNAL); false on peer close or error
bool write_all(int fd, const char* data, size_t len);
inline bool write_all(int fd, const std::string& data) { return write_all(fd, data.data(), data.size()); }

// 127.0.0.0/8, ::1 or ::ffff:127.x.x.x
bool is_loopback_address(const sockaddr_storage& addr);
std::string format_address(const sockaddr_storage& addr);

// accept() result
struct AcceptedPeer {
    UniqueSocket socket;
    sockaddr_storage address{};
};

Result<AcceptedPeer> accept_peer(int listen_fd);

} // namespace phonebridge::net
