#pragma once
/**
 * @file socket_listener.hpp
 * @brief Stream-socket listener (TCP or unix domain) implementing Listener.
 *
 * accept() waits in poll(2) on the listening socket and an internal wake pipe,
 * so close() from another thread reliably unblocks it.
 */

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "csimux/transport/listener.hpp"
#include "csimux/transport/proto_addr.hpp"

namespace csimux::transport {

class SocketListener final : public Listener {
public:
    /// Bind and listen on a parsed endpoint (tcp, tcp4, tcp6 or unix).
    static Result<std::unique_ptr<SocketListener>> bind(const ProtoAddr& pa);

    ~SocketListener() override;

    SocketListener(const SocketListener&) = delete;
    SocketListener& operator=(const SocketListener&) = delete;

    Result<Conn> accept() override;
    void close() noexcept override;

    [[nodiscard]] std::string network() const override { return network_; }
    /// Resolved address, e.g. "127.0.0.1:41523" or "/run/csi.sock".
    [[nodiscard]] std::string address() const override { return address_; }

private:
    SocketListener(int fd, int wake_rd, int wake_wr, std::string network, std::string address) noexcept;

    int               fd_;
    int               wake_rd_;
    int               wake_wr_;
    const std::string network_;
    const std::string address_;
    mutable std::mutex mu_;
    bool              closed_{false};
};

/// Parse `endpoint` and bind a SocketListener on it.
Result<std::unique_ptr<Listener>> listen(std::string_view endpoint);

} // namespace csimux::transport
