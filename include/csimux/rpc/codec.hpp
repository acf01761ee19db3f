#pragma once
/**
 * @file codec.hpp
 * @brief Protobuf message <-> grpc::ByteBuffer conversion for the generic gRPC API.
 */

#include <grpcpp/impl/codegen/proto_utils.h>
#include <grpcpp/support/byte_buffer.h>
#include <grpcpp/support/status.h>

namespace csimux::rpc {

/// Serialize `msg` into `out` (replacing its contents).
template <class Msg>
grpc::Status encode(const Msg& msg, grpc::ByteBuffer* out) {
    bool own_buffer = false;
    return grpc::SerializationTraits<Msg>::Serialize(msg, out, &own_buffer);
}

/// Parse `in` into `out`. Fails with INTERNAL on malformed input.
template <class Msg>
grpc::Status decode(grpc::ByteBuffer* in, Msg* out) {
    return grpc::SerializationTraits<Msg>::Deserialize(in, out);
}

} // namespace csimux::rpc
