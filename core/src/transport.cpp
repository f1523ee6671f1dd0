/**
 * @file transport.cpp
 * @brief POSIX TCP helpers
 */

#include "taskfabric/transport.hpp"
#include "taskfabric/metrics.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace taskfabric { namespace tcp {

namespace {

void tune_stream(int fd) {
    /* Disable Nagle for low-latency framing */
    int flag = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
    int keepalive = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));
}

std::string format_addr(const struct sockaddr* sa) {
    char host[INET6_ADDRSTRLEN] = {0};
    uint16_t port = 0;
    if (sa->sa_family == AF_INET) {
        auto* in = reinterpret_cast<const struct sockaddr_in*>(sa);
        ::inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
        port = ntohs(in->sin_port);
    } else if (sa->sa_family == AF_INET6) {
        auto* in6 = reinterpret_cast<const struct sockaddr_in6*>(sa);
        ::inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        port = ntohs(in6->sin6_port);
    } else {
        return {};
    }
    return std::string(host) + ":" + std::to_string(port);
}

/** Non-blocking connect bounded by poll(). */
bool connect_with_timeout(int fd, const struct sockaddr* sa, socklen_t len,
                          int timeout_ms) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) return false;

    int rc = ::connect(fd, sa, len);
    if (rc != 0 && errno != EINPROGRESS) return false;

    if (rc != 0) {
        struct pollfd pfd;
        pfd.fd      = fd;
        pfd.events  = POLLOUT;
        pfd.revents = 0;
        int r = ::poll(&pfd, 1, timeout_ms > 0 ? timeout_ms : -1);
        if (r <= 0) return false;
        int so_err = 0;
        socklen_t so_len = sizeof(so_err);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_err, &so_len) != 0 ||
            so_err != 0)
            return false;
    }
    return ::fcntl(fd, F_SETFL, flags) == 0;
}

} // namespace

tf_status connect(const std::string& host, uint16_t port, int timeout_ms,
                  int* fd_out) {
    if (!fd_out || host.empty()) return TF_ERROR_INVALID_ARG;
    *fd_out = kInvalidSocket;

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int gai = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0) {
        tf_log(TF_LOG_ERROR, "transport", "resolve %s failed: %s",
               host.c_str(), ::gai_strerror(gai));
        return TF_ERROR_CONNECTION_CLOSED;
    }

    int fd = kInvalidSocket;
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;
        if (connect_with_timeout(fd, ai->ai_addr, ai->ai_addrlen, timeout_ms))
            break;
        ::close(fd);
        fd = kInvalidSocket;
    }
    ::freeaddrinfo(res);

    if (fd < 0) {
        tf_log(TF_LOG_ERROR, "transport", "connect %s:%u failed: %s",
               host.c_str(), static_cast<unsigned>(port), std::strerror(errno));
        return TF_ERROR_CONNECTION_CLOSED;
    }

    tune_stream(fd);
    *fd_out = fd;
    return TF_OK;
}

tf_status listen(const std::string& bind_address, uint16_t port, int backlog,
                 int* fd_out, uint16_t* bound_port) {
    if (!fd_out) return TF_ERROR_INVALID_ARG;
    *fd_out = kInvalidSocket;

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags    = AI_PASSIVE;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    const char* node = bind_address.empty() ? nullptr : bind_address.c_str();
    int gai = ::getaddrinfo(node, service.c_str(), &hints, &res);
    if (gai != 0) {
        tf_log(TF_LOG_ERROR, "transport", "resolve bind address %s failed: %s",
               bind_address.c_str(), ::gai_strerror(gai));
        return TF_ERROR_INVALID_ARG;
    }

    int fd = kInvalidSocket;
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;
        int opt = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
        if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 &&
            ::listen(fd, backlog) == 0)
            break;
        ::close(fd);
        fd = kInvalidSocket;
    }
    ::freeaddrinfo(res);

    if (fd < 0) {
        tf_log(TF_LOG_ERROR, "transport", "listen on %s:%u failed: %s",
               bind_address.c_str(), static_cast<unsigned>(port),
               std::strerror(errno));
        return TF_ERROR_IO;
    }

    if (bound_port) {
        struct sockaddr_storage ss;
        socklen_t len = sizeof(ss);
        *bound_port = port;
        if (::getsockname(fd, reinterpret_cast<struct sockaddr*>(&ss), &len) == 0) {
            if (ss.ss_family == AF_INET)
                *bound_port = ntohs(reinterpret_cast<struct sockaddr_in*>(&ss)->sin_port);
            else if (ss.ss_family == AF_INET6)
                *bound_port = ntohs(reinterpret_cast<struct sockaddr_in6*>(&ss)->sin6_port);
        }
    }

    *fd_out = fd;
    return TF_OK;
}

tf_status accept(int listen_fd, int* fd_out, std::string* peer) {
    if (!fd_out) return TF_ERROR_INVALID_ARG;
    for (;;) {
        struct sockaddr_storage ss;
        socklen_t len = sizeof(ss);
        int fd = ::accept(listen_fd, reinterpret_cast<struct sockaddr*>(&ss), &len);
        if (fd >= 0) {
            tune_stream(fd);
            if (peer) *peer = format_addr(reinterpret_cast<struct sockaddr*>(&ss));
            *fd_out = fd;
            return TF_OK;
        }
        if (errno == EINTR || errno == ECONNABORTED) continue;
        return TF_ERROR_CONNECTION_CLOSED;
    }
}

bool send_all(int fd, const void* data, size_t len) {
    const auto* p = static_cast<const uint8_t*>(data);
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(fd, p + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool recv_all(int fd, void* data, size_t len) {
    auto* p = static_cast<uint8_t*>(data);
    size_t got = 0;
    while (got < len) {
        ssize_t n = ::recv(fd, p + got, len - got, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        got += static_cast<size_t>(n);
    }
    return true;
}

void set_receive_timeout(int fd, int timeout_ms) {
    struct timeval tv;
    tv.tv_sec  = timeout_ms > 0 ? timeout_ms / 1000 : 0;
    tv.tv_usec = timeout_ms > 0 ? (timeout_ms % 1000) * 1000 : 0;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

std::string peer_address(int fd) {
    struct sockaddr_storage ss;
    socklen_t len = sizeof(ss);
    if (::getpeername(fd, reinterpret_cast<struct sockaddr*>(&ss), &len) != 0)
        return {};
    return format_addr(reinterpret_cast<struct sockaddr*>(&ss));
}

void shutdown_both(int fd) {
    if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
}

void close_socket(int fd) {
    if (fd >= 0) ::close(fd);
}

}} // namespace taskfabric::tcp
