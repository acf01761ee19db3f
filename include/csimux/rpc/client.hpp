#pragma once
/**
 * @file client.hpp
 * @brief Typed unary client for the storage protocol over a grpc::Channel.
 *
 * The method is deduced from the request type (see MethodTraits), so one call()
 * template covers all fifteen RPCs without generated stubs.
 */

#include <memory>
#include <string>

#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>
#include <grpcpp/generic/generic_stub.h>

#include "csimux/rpc/call_context.hpp"
#include "csimux/rpc/codec.hpp"
#include "csimux/rpc/methods.hpp"

namespace csimux::rpc {

class ProtocolClient final {
public:
    explicit ProtocolClient(std::shared_ptr<grpc::Channel> channel);

    /// Issue `req` with an explicit client context; blocks until completion.
    template <class Request>
    grpc::Status call(grpc::ClientContext& cctx, const Request& req,
                      typename MethodTraits<Request>::Response* resp) {
        grpc::ByteBuffer in;
        if (auto st = encode(req, &in); !st.ok()) return st;
        grpc::ByteBuffer out;
        auto st = unary(cctx, MethodTraits<Request>::full_name, in, &out);
        if (!st.ok()) return st;
        return decode(&out, resp);
    }

    /// Issue `req` as a nested call of `ctx` (deadline and cancellation inherited).
    template <class Request>
    grpc::Status call(CallContext& ctx, const Request& req,
                      typename MethodTraits<Request>::Response* resp) {
        auto child = ctx.child();
        return call(child->client(), req, resp);
    }

    [[nodiscard]] const std::shared_ptr<grpc::Channel>& channel() const noexcept { return channel_; }

private:
    grpc::Status unary(grpc::ClientContext& cctx, const std::string& method,
                       const grpc::ByteBuffer& in, grpc::ByteBuffer* out);

    std::shared_ptr<grpc::Channel> channel_;
    grpc::GenericStub              stub_;
};

} // namespace csimux::rpc
