// ============================================================================
// tcp_io.cpp — implementation for tcp_io.hpp
// For API/overview see the matching .hpp. For usage, see cli/main.cpp.
// ============================================================================

/**
 * @file tcp_io.cpp
 */

#include "tcp_io.hpp"

#include <sys/types.h>     // socket types
#include <sys/socket.h>    // socket(), connect(), bind(), listen(), accept(), send(), recv()
#include <netdb.h>         // getaddrinfo()
#include <netinet/in.h>    // sockaddr_in
#include <netinet/tcp.h>   // TCP_NODELAY
#include <fcntl.h>         // fcntl() for non-blocking connect
#include <unistd.h>        // ::close
#include <poll.h>          // poll(2) for every timeout below
#include <cerrno>          // errno, EINTR, EINPROGRESS
#include <cstring>         // std::memset

namespace radarlink {

// ---------------------------------------------------------------------------
// set_blocking()
// --------------
// Toggle O_NONBLOCK. Used around connect() so the connect timeout is ours,
// not the kernel's (which can be minutes).
// ---------------------------------------------------------------------------
static bool set_blocking(int fd, bool blocking) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return ::fcntl(fd, F_SETFL, flags) == 0;
}

// ---------------------------------------------------------------------------
// connect_with_timeout()
// ----------------------
// Non-blocking connect, poll for writability, then read SO_ERROR.
// Returns true if the socket is connected; the fd is left blocking again.
// ---------------------------------------------------------------------------
static bool connect_with_timeout(int fd, const sockaddr* addr, socklen_t len, int timeout_ms) {
    if (!set_blocking(fd, false)) return false;

    int rc = ::connect(fd, addr, len);
    if (rc != 0 && errno != EINPROGRESS) return false;   // immediate refusal

    if (rc != 0) {
        pollfd pfd{fd, POLLOUT, 0};
        int pr = ::poll(&pfd, 1, timeout_ms);
        if (pr <= 0) return false;                        // timeout or poll error

        int err = 0;
        socklen_t elen = sizeof(err);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen) != 0 || err != 0) return false;
    }
    return set_blocking(fd, true);
}

static addrinfo* resolve(const std::string& host, uint16_t port, bool passive) {
    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    if (passive) hints.ai_flags = AI_PASSIVE;

    addrinfo* res = nullptr;
    const std::string service = std::to_string(port);
    const char* node = (passive && host.empty()) ? nullptr : host.c_str();
    if (::getaddrinfo(node, service.c_str(), &hints, &res) != 0) return nullptr;
    return res;
}

// ---------------------------------------------------------------------------
// open_tcp_client()
// -----------------
// Try every resolved address in order; first connect wins.
// TCP_NODELAY is set: keep-alives and acks are tiny and latency matters more
// than packing.
// ---------------------------------------------------------------------------
int open_tcp_client(const std::string& host, uint16_t port, int timeout_ms) {
    addrinfo* res = resolve(host, port, false);
    if (!res) return -1;

    int fd = -1;
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;
        if (connect_with_timeout(fd, ai->ai_addr, ai->ai_addrlen, timeout_ms)) break;
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(res);

    if (fd >= 0) {
        int one = 1;
        if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) != 0) {
            ::close(fd);
            return -1;
        }
    }
    return fd;
}

int open_tcp_server(const std::string& host, uint16_t port) {
    addrinfo* res = resolve(host, port, true);
    if (!res) return -1;

    int fd = -1;
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;
        int one = 1;
        if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) == 0 &&
            ::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 &&
            ::listen(fd, 1) == 0) {
            break;
        }
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(res);
    return fd;
}

int accept_client(int listen_fd, int timeout_ms) {
    pollfd pfd{listen_fd, POLLIN, 0};
    int pr = ::poll(&pfd, 1, timeout_ms);
    if (pr <= 0) return -1;                      // timeout or poll error
    return ::accept(listen_fd, nullptr, nullptr);
}

// ---------------------------------------------------------------------------
// read_some()
// -----------
// One poll, at most one recv. EINTR is reported as Timeout so the caller's
// loop simply comes round again (and gets to send its keep-alive).
// ---------------------------------------------------------------------------
ReadResult read_some(int fd, uint8_t* buf, size_t cap, int timeout_ms, size_t& n) {
    n = 0;
    pollfd pfd{fd, POLLIN, 0};
    int pr = ::poll(&pfd, 1, timeout_ms);
    if (pr == 0) return ReadResult::Timeout;
    if (pr < 0)  return errno == EINTR ? ReadResult::Timeout : ReadResult::Error;
    if (pfd.revents & (POLLERR | POLLNVAL)) return ReadResult::Error;

    ssize_t r = ::recv(fd, buf, cap, 0);
    if (r > 0)  { n = static_cast<size_t>(r); return ReadResult::Data; }
    if (r == 0) return ReadResult::Closed;
    return errno == EINTR ? ReadResult::Timeout : ReadResult::Error;
}

bool write_all(int fd, const uint8_t* data, size_t len) {
    size_t off = 0;
    while (off < len) {
        ssize_t w = ::send(fd, data + off, len - off, MSG_NOSIGNAL);
        if (w < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(w);
    }
    return true;
}

void close_socket(int fd) {
    if (fd >= 0) ::close(fd);
}

const char* to_string(ReadResult r) {
    switch (r) {
        case ReadResult::Data:    return "data";
        case ReadResult::Timeout: return "timeout";
        case ReadResult::Closed:  return "closed";
        case ReadResult::Error:   return "error";
    }
    return "error";
}

} // namespace radarlink
