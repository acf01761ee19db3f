/**
 * @file client.cpp
 * @brief Blocking wrapper over GenericStub::UnaryCall.
 */
#include "csimux/rpc/client.hpp"

#include <condition_variable>
#include <mutex>

namespace csimux::rpc {

ProtocolClient::ProtocolClient(std::shared_ptr<grpc::Channel> channel)
    : channel_(channel), stub_(std::move(channel)) {}

grpc::Status ProtocolClient::unary(grpc::ClientContext& cctx, const std::string& method,
                                   const grpc::ByteBuffer& in, grpc::ByteBuffer* out) {
    std::mutex mu;
    std::condition_variable cv;
    bool done = false;
    grpc::Status result;

    stub_.UnaryCall(&cctx, method, grpc::StubOptions(), &in, out,
                    [&](grpc::Status st) {
                        std::lock_guard<std::mutex> lk(mu);
                        result = std::move(st);
                        done = true;
                        cv.notify_one();
                    });

    std::unique_lock<std::mutex> lk(mu);
    cv.wait(lk, [&] { return done; });
    return result;
}

} // namespace csimux::rpc
