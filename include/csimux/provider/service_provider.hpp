#pragma once
/**
 * @file service_provider.hpp
 * @brief Capability interface every backend provider implements.
 *
 * A provider answers the storage protocol (ProtocolHandler) and can be served on
 * a listener with the two-mode stop lifecycle.
 */

#include "csimux/error.hpp"
#include "csimux/rpc/protocol_handler.hpp"
#include "csimux/transport/listener.hpp"

namespace csimux::provider {

class ServiceProvider : public rpc::ProtocolHandler {
public:
    ~ServiceProvider() override = default;

    /// Serve the protocol on `lis` until stopped. Blocks.
    virtual Result<void> serve(transport::Listener& lis) = 0;

    /// Close connections and cancel active calls immediately.
    virtual void stop() = 0;

    /// Stop accepting and block until pending calls finish.
    virtual void graceful_stop() = 0;
};

} // namespace csimux::provider
