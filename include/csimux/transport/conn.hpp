#pragma once
/**
 * @file conn.hpp
 * @brief Owning handle for one end of a connected duplex byte stream.
 *
 * A Conn wraps a connected stream file descriptor (a socketpair end for the
 * in-process transport, an accepted socket for network listeners). It is
 * move-only; the descriptor is closed on destruction unless released to a new
 * owner (e.g. the gRPC transport via release()).
 */

#include <cstddef>
#include <span>
#include <utility>

#include "csimux/error.hpp"

namespace csimux::transport {

class Conn final {
public:
    Conn() noexcept = default;
    explicit Conn(int fd) noexcept : fd_(fd) {}
    ~Conn();

    Conn(const Conn&) = delete;
    Conn& operator=(const Conn&) = delete;
    Conn(Conn&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    Conn& operator=(Conn&& other) noexcept;

    /// Create a connected pair (AF_UNIX, SOCK_STREAM, close-on-exec).
    static Result<std::pair<Conn, Conn>> pair();

    [[nodiscard]] int  fd() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    /// Give up ownership of the descriptor; this Conn becomes empty.
    [[nodiscard]] int release() noexcept { return std::exchange(fd_, -1); }

    /// Close the descriptor (idempotent).
    void close() noexcept;

    /// Toggle O_NONBLOCK on the descriptor.
    Result<void> set_nonblocking(bool on);

    /// Write some bytes; returns the count written (may be short).
    Result<std::size_t> write(std::span<const std::byte> data);

    /// Read up to data.size() bytes; 0 means the peer closed its end.
    Result<std::size_t> read(std::span<std::byte> data);

private:
    int fd_{-1};
};

} // namespace csimux::transport
