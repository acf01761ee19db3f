/**
 * @file grpc_provider.cpp
 * @brief GrpcProvider lifecycle.
 */
#include "csimux/provider/grpc_provider.hpp"

namespace csimux::provider {

GrpcProvider::GrpcProvider()
    : host_([this](rpc::CallContext&, const rpc::MethodEntry&) -> rpc::ProtocolHandler* { return this; }) {}

GrpcProvider::~GrpcProvider() { host_.stop(); }

Result<void> GrpcProvider::serve(transport::Listener& lis) { return host_.serve(lis); }

void GrpcProvider::stop() { host_.stop(); }

void GrpcProvider::graceful_stop() { host_.graceful_stop(); }

} // namespace csimux::provider
