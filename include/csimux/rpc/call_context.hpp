#pragma once
/**
 * @file call_context.hpp
 * @brief Per-call context: inbound metadata, deadline and cancellation.
 *
 * A CallContext either wraps the gRPC server context of an inbound call (the
 * normal case inside rpc::GrpcHost) or stands alone (in-process callers and
 * tests). Nested client calls made on behalf of the call are created through
 * child(); they inherit the deadline and are cancelled together with the call.
 *
 * Thread-safety: all members may be called concurrently.
 */

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include <grpcpp/client_context.h>
#include <grpcpp/server_context.h>

namespace csimux::rpc {

class CallContext final {
public:
    /** @class Child
     *  @brief A nested client call registered with its parent for cancellation.
     */
    class Child final {
    public:
        ~Child();
        Child(const Child&) = delete;
        Child& operator=(const Child&) = delete;

        grpc::ClientContext& client() noexcept { return *client_; }

    private:
        friend class CallContext;
        Child(CallContext& parent, std::unique_ptr<grpc::ClientContext> client);

        CallContext&                         parent_;
        std::unique_ptr<grpc::ClientContext> client_;
    };

    /// Standalone context with no deadline.
    CallContext() = default;

    /// Context of an inbound server call. `server` must outlive this object.
    explicit CallContext(grpc::CallbackServerContext* server) : server_(server) {}

    CallContext(const CallContext&) = delete;
    CallContext& operator=(const CallContext&) = delete;

    /// First value of an inbound metadata key (keys are lowercase on the wire).
    [[nodiscard]] std::optional<std::string> metadata(std::string_view key) const;

    /// Set outbound-visible metadata on a standalone context; overrides inbound values.
    void set_metadata(std::string key, std::string value);

    /// Deadline applied to nested calls (standalone contexts only).
    void set_deadline(std::chrono::system_clock::time_point deadline);

    /// Effective deadline: the standalone one, else the inbound call's; nullopt if none.
    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> deadline() const;

    [[nodiscard]] bool cancelled() const;

    /// Wait up to `d` for cancellation. Returns true if cancelled.
    bool wait_cancelled_for(std::chrono::milliseconds d) const;

    /// Mark the call cancelled and cancel every live nested call. Idempotent.
    void cancel();

    /// Create a nested client call. On a server-backed context cancellation and
    /// deadline propagate through gRPC's parent-call link as well.
    [[nodiscard]] std::unique_ptr<Child> child();

private:
    void attach(grpc::ClientContext* c);
    void detach(grpc::ClientContext* c);

    grpc::CallbackServerContext* server_{nullptr};

    mutable std::mutex                   mu_;
    mutable std::condition_variable      cv_;
    bool                                 cancelled_{false};
    std::map<std::string, std::string>   overrides_;
    std::optional<std::chrono::system_clock::time_point> deadline_;
    std::set<grpc::ClientContext*>       children_;
};

} // namespace csimux::rpc
