/**
 * @file transport.hpp
 * @brief TaskFabric — POSIX TCP helpers
 *
 * Thin wrappers over BSD sockets shared by the channel, the dispatcher's
 * accept loop and the worker's outbound connect. All functions are
 * stateless; descriptors are owned by the caller.
 */

#ifndef TASKFABRIC_TRANSPORT_HPP
#define TASKFABRIC_TRANSPORT_HPP

#include "taskfabric/status.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace taskfabric { namespace tcp {

constexpr int kInvalidSocket = -1;

/**
 * Resolve `host` (name or literal, v4 or v6) and connect, giving up after
 * `timeout_ms` per address. TCP_NODELAY and SO_KEEPALIVE are set on the
 * returned socket.
 */
tf_status connect(const std::string& host, uint16_t port, int timeout_ms,
                  int* fd_out);

/** Bind + listen. Port 0 picks an ephemeral port, reported in *bound_port. */
tf_status listen(const std::string& bind_address, uint16_t port, int backlog,
                 int* fd_out, uint16_t* bound_port);

/**
 * Blocking accept. Returns TF_ERROR_CONNECTION_CLOSED once the listening
 * socket has been shut down.
 */
tf_status accept(int listen_fd, int* fd_out, std::string* peer);

/** Write exactly `len` bytes (MSG_NOSIGNAL). */
bool send_all(int fd, const void* data, size_t len);

/** Read exactly `len` bytes. False on EOF, error or receive timeout. */
bool recv_all(int fd, void* data, size_t len);

/** SO_RCVTIMEO; 0 restores fully blocking reads. */
void set_receive_timeout(int fd, int timeout_ms);

/** "addr:port" of the remote end, or "" if unknown. */
std::string peer_address(int fd);

/** shutdown(SHUT_RDWR): wakes any thread blocked in recv/accept. */
void shutdown_both(int fd);

void close_socket(int fd);

}} // namespace taskfabric::tcp

#endif // TASKFABRIC_TRANSPORT_HPP
