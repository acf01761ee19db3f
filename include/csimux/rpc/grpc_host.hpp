#pragma once
/**
 * @file grpc_host.hpp
 * @brief gRPC server that serves the storage protocol on any transport::Listener.
 *
 * Concurrency model:
 *   • serve() runs the accept loop on the caller's thread; each accepted Conn is
 *     handed to the gRPC core as an already-connected channel.
 *   • Each inbound call gets its own worker thread, so a blocking handler never
 *     stalls the gRPC callback executor.
 *   • stop() closes the listener, cancels every active call and returns once all
 *     workers have finished. graceful_stop() closes the listener and waits for
 *     in-flight calls to complete on their own.
 *   • stop() may be issued while graceful_stop() is draining; it cancels every
 *     remaining call at the gRPC level, including calls still waiting for their
 *     request, so both return promptly.
 *
 * Handler selection is delegated to a Resolver, which is how the routing server
 * picks a Service per call while a provider simply returns itself.
 */

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

#include <grpcpp/generic/async_generic_service.h>
#include <grpcpp/server.h>

#include "csimux/error.hpp"
#include "csimux/rpc/call_context.hpp"
#include "csimux/rpc/methods.hpp"
#include "csimux/transport/listener.hpp"

namespace csimux::rpc {

class GrpcHost final {
public:
    /// Pick the handler for one call; nullptr fails the call with UNAVAILABLE.
    using Resolver = std::function<ProtocolHandler*(CallContext&, const MethodEntry&)>;

    enum class State : std::uint8_t { Idle, Serving, Stopping, Stopped };

    explicit GrpcHost(Resolver resolver);
    ~GrpcHost();

    GrpcHost(const GrpcHost&) = delete;
    GrpcHost& operator=(const GrpcHost&) = delete;

    /**
     * @brief Accept connections on `lis` until stopped. Blocks.
     * @return Success after stop()/graceful_stop(); ServerStarted if already
     *         serving; ServerStopped if stopped before serving; AcceptFailed on a
     *         fatal listener error.
     */
    Result<void> serve(transport::Listener& lis);

    /// Cancel active calls and stop immediately. Idempotent.
    void stop();

    /// Stop accepting and wait for in-flight calls. Idempotent.
    void graceful_stop();

    [[nodiscard]] State state() const;

    /// Calls the gRPC core has started and not yet finished, including calls
    /// still waiting for their request message.
    [[nodiscard]] std::size_t in_flight() const;

private:
    class Reactor;
    class Generic;

    void begin_stop(bool forced);
    void launch(Reactor* r);
    void run_call(Reactor* r);
    void track(Reactor* r);
    /// Returns true when the reactor may be deleted now.
    bool untrack(Reactor* r);
    void release(Reactor* r);
    void wait_idle();

    Resolver                      resolver_;
    std::unique_ptr<Generic>      generic_;
    std::unique_ptr<grpc::Server> server_;

    mutable std::mutex            mu_;
    std::condition_variable       idle_cv_;
    State                         state_{State::Idle};
    transport::Listener*          listener_{nullptr};
    bool                          shutdown_issued_{false};
    std::unordered_set<Reactor*>  active_;
    std::size_t                   workers_{0};
};

} // namespace csimux::rpc
