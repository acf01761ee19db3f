/**
 * @file conn.cpp
 * @brief POSIX implementation of Conn.
 */
#include "csimux/transport/conn.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

namespace csimux::transport {

static std::string errno_text(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

Conn::~Conn() { close(); }

Conn& Conn::operator=(Conn&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

Result<std::pair<Conn, Conn>> Conn::pair() {
    int sv[2] = {-1, -1};
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) != 0) {
        return make_error(ErrorCode::IoFailed, errno_text("socketpair"));
    }
    return std::make_pair(Conn(sv[0]), Conn(sv[1]));
}

void Conn::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Result<void> Conn::set_nonblocking(bool on) {
    if (fd_ < 0) return make_error(ErrorCode::Closed, "connection closed");
    const int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags < 0) return make_error(ErrorCode::IoFailed, errno_text("fcntl(F_GETFL)"));
    const int next = on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (::fcntl(fd_, F_SETFL, next) != 0) {
        return make_error(ErrorCode::IoFailed, errno_text("fcntl(F_SETFL)"));
    }
    return {};
}

Result<std::size_t> Conn::write(std::span<const std::byte> data) {
    if (fd_ < 0) return make_error(ErrorCode::Closed, "connection closed");
    for (;;) {
        const ssize_t n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
        if (n >= 0) return static_cast<std::size_t>(n);
        if (errno == EINTR) continue;
        if (errno == EPIPE) return make_error(ErrorCode::Closed, "peer closed");
        return make_error(ErrorCode::IoFailed, errno_text("send"));
    }
}

Result<std::size_t> Conn::read(std::span<std::byte> data) {
    if (fd_ < 0) return make_error(ErrorCode::Closed, "connection closed");
    for (;;) {
        const ssize_t n = ::recv(fd_, data.data(), data.size(), 0);
        if (n >= 0) return static_cast<std::size_t>(n);
        if (errno == EINTR) continue;
        return make_error(ErrorCode::IoFailed, errno_text("recv"));
    }
}

} // namespace csimux::transport
