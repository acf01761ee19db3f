/**
 * @file socket_listener.cpp
 * @brief POSIX TCP/unix listener.
 */
#include "csimux/transport/socket_listener.hpp"
#include "csimux/config/constants.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace csimux::transport {

using csimux::config::constants::LISTEN_BACKLOG;
using csimux::config::constants::ACCEPT_POLL_TIMEOUT_MS;

static std::string errno_text(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

/// "host:port" / "[v6]:port" / ":port" → {host, port}. Empty host means any.
static bool split_host_port(const std::string& in, std::string& host, std::string& port) {
    const auto colon = in.rfind(':');
    if (colon == std::string::npos || colon + 1 == in.size()) return false;
    host = in.substr(0, colon);
    port = in.substr(colon + 1);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    return true;
}

static std::string sockaddr_text(const sockaddr_storage& ss) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        const auto* in4 = reinterpret_cast<const sockaddr_in*>(&ss);
        ::inet_ntop(AF_INET, &in4->sin_addr, buf, sizeof(buf));
        return std::string(buf) + ":" + std::to_string(ntohs(in4->sin_port));
    }
    const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&ss);
    ::inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf));
    return "[" + std::string(buf) + "]:" + std::to_string(ntohs(in6->sin6_port));
}

static Result<int> bind_tcp(const ProtoAddr& pa, std::string& resolved) {
    std::string host, port;
    if (!split_host_port(pa.address, host, port)) {
        return make_error(ErrorCode::InvalidAddress, "expected host:port, got " + pa.address);
    }

    addrinfo hints{};
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags    = AI_PASSIVE;
    hints.ai_family   = pa.network == "tcp4" ? AF_INET
                      : pa.network == "tcp6" ? AF_INET6
                      : AF_UNSPEC;

    addrinfo* res = nullptr;
    const int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), port.c_str(), &hints, &res);
    if (rc != 0) {
        return make_error(ErrorCode::InvalidAddress,
                          "resolve " + pa.address + ": " + ::gai_strerror(rc));
    }

    std::string last_err = "no usable address";
    int fd = -1;
    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) { last_err = errno_text("socket"); continue; }
        const int one = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(fd, LISTEN_BACKLOG) == 0) {
            break;
        }
        last_err = errno_text("bind/listen");
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(res);

    if (fd < 0) {
        return make_error(ErrorCode::ListenFailed, pa.address + ": " + last_err);
    }

    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&ss), &len) == 0) {
        resolved = sockaddr_text(ss);
    } else {
        resolved = pa.address;
    }
    return fd;
}

static Result<int> bind_unix(const ProtoAddr& pa) {
    sockaddr_un sun{};
    sun.sun_family = AF_UNIX;
    if (pa.address.size() >= sizeof(sun.sun_path)) {
        return make_error(ErrorCode::InvalidAddress, "socket path too long: " + pa.address);
    }
    std::memcpy(sun.sun_path, pa.address.c_str(), pa.address.size() + 1);

    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return make_error(ErrorCode::ListenFailed, errno_text("socket"));
    if (::bind(fd, reinterpret_cast<const sockaddr*>(&sun), sizeof(sun)) != 0 ||
        ::listen(fd, LISTEN_BACKLOG) != 0) {
        auto err = make_error(ErrorCode::ListenFailed, pa.address + ": " + errno_text("bind/listen"));
        ::close(fd);
        return err;
    }
    return fd;
}

Result<std::unique_ptr<SocketListener>> SocketListener::bind(const ProtoAddr& pa) {
    std::string resolved = pa.address;
    Result<int> fd = make_error(ErrorCode::UnsupportedNetwork,
                                "cannot listen on network " + pa.network);
    std::string network = pa.network;
    if (pa.network == "tcp" || pa.network == "tcp4" || pa.network == "tcp6") {
        fd = bind_tcp(pa, resolved);
    } else if (pa.network == "unix") {
        fd = bind_unix(pa);
    }
    if (!fd) return csimux_detail::unexpected<Error>(fd.error());

    int wake[2] = {-1, -1};
    if (::pipe2(wake, O_CLOEXEC | O_NONBLOCK) != 0) {
        auto err = make_error(ErrorCode::ListenFailed, errno_text("pipe2"));
        ::close(*fd);
        return err;
    }
    return std::unique_ptr<SocketListener>(
        new SocketListener(*fd, wake[0], wake[1], std::move(network), std::move(resolved)));
}

SocketListener::SocketListener(int fd, int wake_rd, int wake_wr,
                               std::string network, std::string address) noexcept
    : fd_(fd), wake_rd_(wake_rd), wake_wr_(wake_wr),
      network_(std::move(network)), address_(std::move(address)) {}

SocketListener::~SocketListener() {
    close();
    ::close(fd_);
    ::close(wake_rd_);
    ::close(wake_wr_);
}

Result<Conn> SocketListener::accept() {
    for (;;) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_) return make_error(ErrorCode::Closed, "listener closed");
        }
        pollfd fds[2] = {{fd_, POLLIN, 0}, {wake_rd_, POLLIN, 0}};
        const int n = ::poll(fds, 2, ACCEPT_POLL_TIMEOUT_MS);
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_error(ErrorCode::AcceptFailed, errno_text("poll"));
        }
        if (fds[1].revents != 0) {
            return make_error(ErrorCode::Closed, "listener closed");
        }
        if ((fds[0].revents & POLLIN) == 0) {
            if (fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) {
                return make_error(ErrorCode::Closed, "listener closed");
            }
            continue;
        }
        const int cfd = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (cfd >= 0) return Conn(cfd);
        switch (errno) {
            case EINTR: case EAGAIN: case ECONNABORTED: case EPROTO:
                continue;
            default:
                return make_error(ErrorCode::AcceptFailed, errno_text("accept4"));
        }
    }
}

void SocketListener::close() noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_) return;
    closed_ = true;
    const char b = 'x';
    (void)!::write(wake_wr_, &b, 1);
    ::shutdown(fd_, SHUT_RDWR);
}

Result<std::unique_ptr<Listener>> listen(std::string_view endpoint) {
    auto pa = parse_proto_addr(endpoint);
    if (!pa) return csimux_detail::unexpected<Error>(pa.error());
    auto lis = SocketListener::bind(*pa);
    if (!lis) return csimux_detail::unexpected<Error>(lis.error());
    return std::unique_ptr<Listener>(std::move(*lis));
}

} // namespace csimux::transport
