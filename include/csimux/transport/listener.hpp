#pragma once
/**
 * @file listener.hpp
 * @brief Listener abstraction served by the RPC dispatch layer.
 *
 * Both the in-process rendezvous channel (PipeListener) and OS sockets
 * (SocketListener) implement this interface, so rpc::GrpcHost serves on either
 * with the same accept loop.
 */

#include <string>

#include "csimux/error.hpp"
#include "csimux/transport/conn.hpp"

namespace csimux::transport {

class Listener {
public:
    virtual ~Listener() = default;

    /// Block until a connection is available. Fails with ErrorCode::Closed once closed.
    virtual Result<Conn> accept() = 0;

    /// Stop accepting; unblocks pending accept() calls. Idempotent.
    virtual void close() noexcept = 0;

    /// Network token ("pipe", "tcp", "unix", ...).
    [[nodiscard]] virtual std::string network() const = 0;

    /// Bound address in the network's own notation.
    [[nodiscard]] virtual std::string address() const = 0;
};

} // namespace csimux::transport
