/**
 * @file tcp_io.hpp
 * @brief Public API for moving raw RadarLink bytes over POSIX TCP sockets.
 *
 * @details
 * PURPOSE
 * -------
 * The RC speaks RadarLink over a plain TCP stream. This header declares the
 * smallest surface needed to reach it (or to stand in for it): open, accept,
 * read with a timeout, write everything, close. Framing is NOT done here;
 * bytes go straight into `radarlink::Channel::add_bytes()`, which owns the
 * StreamFramer.
 *
 * ROLE IN RADARLINK
 * -----------------
 * - open_tcp_client: connect to the RC (`radarlink-cli run`).
 * - open_tcp_server / accept_client: listen as a simulated RC (`radarlink-cli sim`).
 * - read_some: poll-then-read, so a caller can interleave the 1 s keep-alive
 *   with waiting for inbound data on one thread.
 * - write_all: loop until the whole frame is out; partial writes are normal on TCP.
 * - close_socket: close the descriptor if valid.
 *
 * DESIGN CHOICES
 * --------------
 * - Free functions over file descriptors, no class hierarchy, no hidden threads.
 * - Errors are return values: -1 for descriptors, false for writes, and
 *   `ReadResult` for reads so a timeout and a closed peer are told apart.
 * - IPv4 and IPv6 via getaddrinfo(); the first address that connects wins.
 * - No reconnect policy. That is the caller's decision.
 *
 * EXAMPLE
 * -------
 * @code
 *   int fd = radarlink::open_tcp_client("10.0.0.5", 5000, 2000);
 *   if (fd < 0) { // handle connect failure }
 *   uint8_t buf[4096];
 *   size_t n = 0;
 *   auto r = radarlink::read_some(fd, buf, sizeof(buf), 100, n);
 *   if (r == radarlink::ReadResult::Data) channel.add_bytes(buf, n);
 *   radarlink::close_socket(fd);
 * @endcode
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace radarlink {

enum class ReadResult : uint8_t {
  Data = 0,   ///< n > 0 bytes read
  Timeout,    ///< nothing arrived within the timeout
  Closed,     ///< orderly shutdown by the peer
  Error,      ///< poll/recv failure; the socket should be closed
};

/**
 * @brief Connect to host:port.
 * @param timeout_ms  Connect timeout per candidate address.
 * @return socket fd, or -1 on failure.
 */
int open_tcp_client(const std::string& host, uint16_t port, int timeout_ms);

/**
 * @brief Bind and listen on host:port (SO_REUSEADDR set).
 * @return listening fd, or -1 on failure.
 */
int open_tcp_server(const std::string& host, uint16_t port);

/**
 * @brief Wait up to @p timeout_ms for one incoming connection.
 * @return connected fd, or -1 on timeout or error.
 */
int accept_client(int listen_fd, int timeout_ms);

/**
 * @brief Wait up to @p timeout_ms, then read whatever is available.
 * @param n  Set to the number of bytes read (0 unless Data).
 */
ReadResult read_some(int fd, uint8_t* buf, size_t cap, int timeout_ms, size_t& n);

/// Write every byte or fail. Retries on EINTR and short writes.
bool write_all(int fd, const uint8_t* data, size_t len);

/// Close @p fd if >= 0.
void close_socket(int fd);

/// "data", "timeout", "closed", "error".
const char* to_string(ReadResult r);

} // namespace radarlink
