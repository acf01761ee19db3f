#pragma once
/**
 * @file grpc_provider.hpp
 * @brief ServiceProvider base that implements the serve/stop lifecycle with a GrpcHost.
 *
 * Concrete providers derive from GrpcProvider and implement only the protocol methods.
 */

#include "csimux/provider/service_provider.hpp"
#include "csimux/rpc/grpc_host.hpp"

namespace csimux::provider {

class GrpcProvider : public ServiceProvider {
public:
    GrpcProvider();
    ~GrpcProvider() override;

    Result<void> serve(transport::Listener& lis) override;
    void stop() override;
    void graceful_stop() override;

private:
    rpc::GrpcHost host_;
};

} // namespace csimux::provider
